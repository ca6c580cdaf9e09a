#pragma once

#include "storage/value.hpp"

#include <string>

namespace ember {

// ── KeyspaceListener ─────────────────────────────────────────────────────────
//
// Receives change notifications from Storage.  Both callbacks run with the
// storage lock held, right after the mutation was applied, so the listener
// observes the new state before any other client can.
//
// The listener must not call back into Storage; on_list_push hands it the list
// itself so it can consume elements in place.

class KeyspaceListener {
public:
    virtual ~KeyspaceListener() = default;

    // Elements were pushed onto the list stored at `key`.  The listener may
    // pop elements from the head of `list`; Storage removes the key if the
    // list ends up empty.
    virtual void on_list_push(const std::string& key, List& list) = 0;

    // An entry with `id` was appended to the stream stored at `key`.
    virtual void on_stream_append(const std::string& key, const StreamId& id) = 0;
};

} // namespace ember
