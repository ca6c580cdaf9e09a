#pragma once

#include "network/reply.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ember::network {

// ── Limits ────────────────────────────────────────────────────────────────────

inline constexpr std::size_t kMaxArrayLength  = 1024 * 1024;        // elements per request
inline constexpr std::size_t kMaxBulkLength   = 512 * 1024 * 1024;  // bytes per argument
inline constexpr std::size_t kMaxHeaderLength = 64 * 1024;          // "*N" / "$N" line without CRLF

// ── RESP request decoder ──────────────────────────────────────────────────────

// The decoder needs more bytes before it can produce a request.
struct NeedMoreBytes {};

// The byte stream is malformed.  Fatal to the connection.
struct ProtocolError {
    std::string message;
};

using DecodeResult = std::variant<Request, NeedMoreBytes, ProtocolError>;

// Incremental decoder for RESP requests (arrays of bulk strings).
//
// Bytes arrive in arbitrary chunks through feed(); next() yields one complete
// request at a time.  A partially received request stays buffered and is
// re-examined on the next call, so callers simply loop:
//
//   decoder.feed(chunk);
//   for (;;) {
//       auto r = decoder.next();
//       if (holds_alternative<NeedMoreBytes>(r)) break;   // read more
//       if (holds_alternative<ProtocolError>(r)) ...       // close
//       ... execute std::get<Request>(r) ...
//   }
//
// Expects: *N\r\n$len\r\nverb\r\n$len\r\narg\r\n...
// Inline commands are rejected.  Empty arrays (*0, *-1) are skipped.
// Once an error is reported every later call reports the same error.
//
// NOT thread-safe: one decoder per connection.
class RespDecoder {
public:
    // Append raw bytes read from the transport.
    void feed(std::string_view bytes);

    // Decode the next request from the buffered bytes.
    [[nodiscard]] DecodeResult next();

    // Bytes received but not yet consumed by a complete request.
    [[nodiscard]] std::size_t buffered() const noexcept {
        return buf_.size() - pos_;
    }

private:
    ProtocolError fail(std::string message);

    std::string buf_;
    std::size_t pos_ = 0;  // start of the first unconsumed byte
    std::optional<ProtocolError> error_;
};

// ── RESP serializer ──────────────────────────────────────────────────────────

// Serialize a Reply into RESP wire format.
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::string serialize_reply(const Reply& reply);

// Append the RESP encoding of `reply` to `out`.
void serialize_reply(const Reply& reply, std::string& out);

// ── RESP client-side helpers ─────────────────────────────────────────────────

// Serialize a request as a RESP array of bulk strings.
[[nodiscard]] std::string serialize_request(const Request& request);

} // namespace ember::network
