#pragma once

#include "common/clock.hpp"
#include "storage/keyspace_listener.hpp"
#include "storage/value.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ember {

// Thread-safe typed key-value store (strings, lists, streams) with expiry.
//
// Concurrency model:
//   - Every public method runs under one recursive mutex, so each call is a
//     single indivisible step with respect to every other call.
//   - lock() hands the same mutex to callers that need several calls to be
//     one step (EXEC batches, blocking commands registering a waiter after a
//     failed pop).  Because the mutex is recursive, the individual methods can
//     still be called while holding it.
//   - Lock order: Storage before the KeyspaceListener's own lock.
//
// Expired keys are invisible to every method and are erased on the access
// that notices them; purge_expired() removes them proactively.
//
// Errors are reported as std::error_code values of the ember category
// (Errc::wrong_type, Errc::not_an_integer, ...).  Out-parameters are left
// untouched on error.
class Storage {
public:
    using Lock = std::unique_lock<std::recursive_mutex>;

    enum class ListEnd : uint8_t {
        Front,
        Back,
    };

    explicit Storage(const Clock& clock);

    // Not copyable.
    Storage(const Storage&)            = delete;
    Storage& operator=(const Storage&) = delete;

    // Acquire the store mutex for a multi-call critical section.
    [[nodiscard]] Lock lock() const;

    // Install the listener notified of list pushes and stream appends.
    // Not synchronised: call before the store is shared.
    void set_listener(KeyspaceListener* listener) noexcept { listener_ = listener; }

    [[nodiscard]] const Clock& clock() const noexcept { return clock_; }

    // ── Strings ──────────────────────────────────────────────────────────────

    // Sets `out` to the value, or std::nullopt if the key is absent.
    [[nodiscard]] std::error_code get_string(const std::string& key,
                                             std::optional<std::string>& out);

    // Inserts or overwrites `key`, replacing any previous type and deadline.
    void set_string(std::string key, std::string value,
                    std::optional<Clock::time_point> expires_at = std::nullopt);

    // Increments the integer stored at `key` (absent counts as 0).
    [[nodiscard]] std::error_code incr(const std::string& key, int64_t& out);

    // ── Lists ────────────────────────────────────────────────────────────────

    // Pushes `elements` one at a time onto `end`, creating the list if needed.
    // `new_length` is the length right after the push, before blocked clients
    // were served.
    [[nodiscard]] std::error_code list_push(const std::string& key, ListEnd end,
                                            const std::vector<std::string>& elements,
                                            std::size_t& new_length);

    // Pops up to `count` elements from `end`.  Absent key → empty `out`.
    [[nodiscard]] std::error_code list_pop(const std::string& key, ListEnd end,
                                           std::size_t count,
                                           std::vector<std::string>& out);

    // Pops the head of the first non-empty list among `keys`, in order.
    // `out` holds {key, element}, or std::nullopt if every list is empty.
    [[nodiscard]] std::error_code list_pop_first(
        const std::vector<std::string>& keys,
        std::optional<std::pair<std::string, std::string>>& out);

    // Elements in [start, stop]; negative indices count from the end and
    // out-of-range indices are clamped.
    [[nodiscard]] std::error_code list_range(const std::string& key, int64_t start,
                                             int64_t stop,
                                             std::vector<std::string>& out);

    [[nodiscard]] std::error_code list_len(const std::string& key, std::size_t& out);

    // ── Streams ──────────────────────────────────────────────────────────────

    // Appends an entry, creating the stream if needed.  `id_spec` is resolved
    // by next_stream_id(); `out` receives the assigned ID.
    [[nodiscard]] std::error_code stream_add(const std::string& key,
                                             std::string_view id_spec,
                                             FieldValues fields, StreamId& out);

    // Entries with start <= id <= end, at most `count` of them (0 = no limit).
    [[nodiscard]] std::error_code stream_range(const std::string& key,
                                               const StreamId& start,
                                               const StreamId& end, std::size_t count,
                                               std::vector<StreamEntry>& out);

    // Entries with id > after, at most `count` of them (0 = no limit).
    [[nodiscard]] std::error_code stream_read_after(const std::string& key,
                                                    const StreamId& after,
                                                    std::size_t count,
                                                    std::vector<StreamEntry>& out);

    // The stream's last ID, or 0-0 if the key is absent.
    [[nodiscard]] std::error_code stream_last_id(const std::string& key, StreamId& out);

    // ── Keyspace ─────────────────────────────────────────────────────────────

    [[nodiscard]] ValueType type_of(const std::string& key);

    // Number of keys, including expired keys not yet erased.
    [[nodiscard]] std::size_t size() const;

    // Number of keys carrying a deadline.
    [[nodiscard]] std::size_t expiring_keys() const;

    // Keys erased so far because their deadline passed.
    [[nodiscard]] uint64_t expired_total() const;

    // Erases up to `limit` keys whose deadline has passed.  Returns how many
    // were erased.
    std::size_t purge_expired(std::size_t limit);

    // Removes all entries.
    void clear();

private:
    using Map = std::unordered_map<std::string, Entry>;

    // Live entry for `key`, erasing it first if it has expired.
    [[nodiscard]] Entry* find_live(const std::string& key);

    void erase(Map::iterator it);

    const Clock& clock_;
    KeyspaceListener* listener_ = nullptr;

    mutable std::recursive_mutex mutex_;
    Map map_;
    std::set<std::pair<Clock::time_point, std::string>> deadlines_;
    uint64_t expired_total_ = 0;
};

} // namespace ember
