#pragma once

#include <cstdint>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace ember {

// ── Requests ──────────────────────────────────────────────────────────────────
//
// A decoded client request: the command name followed by its arguments, each
// an arbitrary byte string.

using Request = std::vector<std::string>;

// ── Replies ───────────────────────────────────────────────────────────────────
//
// Every value a command can produce.  Each alternative has exactly one RESP
// encoding (see network::encode_reply).

struct StatusReply {
    std::string text;       // +<text>
};

struct ErrorReply {
    std::string message;    // -<message>, prefix (ERR, WRONGTYPE, ...) included
};

struct IntegerReply {
    int64_t value = 0;
};

struct BulkReply {
    std::string value;
};

// RESP2 has two null encodings; commands pick the one Redis uses for them.
enum class NullKind : uint8_t {
    Bulk,   // $-1
    Array,  // *-1
};

struct NullReply {
    NullKind kind = NullKind::Bulk;
};

struct Reply;

struct ArrayReply {
    std::vector<Reply> items;
};

struct Reply {
    std::variant<StatusReply, ErrorReply, IntegerReply, BulkReply, NullReply, ArrayReply> value;

    [[nodiscard]] static Reply ok() { return Reply{StatusReply{"OK"}}; }
    [[nodiscard]] static Reply status(std::string text) { return Reply{StatusReply{std::move(text)}}; }
    [[nodiscard]] static Reply error(std::string message) { return Reply{ErrorReply{std::move(message)}}; }
    [[nodiscard]] static Reply error(std::error_code ec) { return Reply{ErrorReply{ec.message()}}; }
    [[nodiscard]] static Reply integer(int64_t v) { return Reply{IntegerReply{v}}; }
    [[nodiscard]] static Reply bulk(std::string v) { return Reply{BulkReply{std::move(v)}}; }
    [[nodiscard]] static Reply null_bulk() { return Reply{NullReply{NullKind::Bulk}}; }
    [[nodiscard]] static Reply null_array() { return Reply{NullReply{NullKind::Array}}; }
    [[nodiscard]] static Reply array(std::vector<Reply> items) { return Reply{ArrayReply{std::move(items)}}; }

    [[nodiscard]] bool is_error() const noexcept {
        return std::holds_alternative<ErrorReply>(value);
    }
};

} // namespace ember
