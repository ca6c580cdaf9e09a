#include "network/resp_protocol.hpp"

#include <charconv>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace ember::network {

namespace {

constexpr std::string_view kCrlf = "\r\n";

// Once this many consumed bytes pile up at the front of the buffer, drop them.
constexpr std::size_t kCompactThreshold = 16 * 1024;

// Parse a signed decimal integer occupying all of `sv`.
bool parse_int(std::string_view sv, int64_t& out) {
    if (sv.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

std::string printable(char c) {
    if (c >= 0x20 && c < 0x7f) {
        return std::string(1, c);
    }
    constexpr char kHex[] = "0123456789abcdef";
    const auto u = static_cast<unsigned char>(c);
    return std::string{'\\', 'x', kHex[u >> 4], kHex[u & 0x0f]};
}

// Status and error lines end at the first CRLF, so embedded CR/LF become spaces.
void append_line(std::string& out, std::string_view text) {
    for (const char c : text) {
        out += (c == '\r' || c == '\n') ? ' ' : c;
    }
    out += kCrlf;
}

void append_bulk(std::string& out, std::string_view s) {
    out += '$';
    out += std::to_string(s.size());
    out += kCrlf;
    out += s;
    out += kCrlf;
}

} // anonymous namespace

// ── RESP request decoder ──────────────────────────────────────────────────────

void RespDecoder::feed(std::string_view bytes) {
    if (pos_ == buf_.size()) {
        buf_.clear();
        pos_ = 0;
    } else if (pos_ >= kCompactThreshold) {
        buf_.erase(0, pos_);
        pos_ = 0;
    }
    buf_.append(bytes.data(), bytes.size());
}

ProtocolError RespDecoder::fail(std::string message) {
    error_ = ProtocolError{"Protocol error: " + std::move(message)};
    return *error_;
}

DecodeResult RespDecoder::next() {
    if (error_) {
        return *error_;
    }

    const std::string_view data{buf_};

    for (;;) {
        if (pos_ >= data.size()) {
            return NeedMoreBytes{};
        }

        if (data[pos_] != '*') {
            return fail("expected '*', got '" + printable(data[pos_]) + "'");
        }

        // Array header: *N\r\n
        const auto header_end = data.find(kCrlf, pos_);
        if (header_end == std::string_view::npos) {
            if (data.size() - pos_ > kMaxHeaderLength) {
                return fail("too big multibulk count string");
            }
            return NeedMoreBytes{};
        }

        int64_t count = 0;
        if (!parse_int(data.substr(pos_ + 1, header_end - pos_ - 1), count) ||
            count > static_cast<int64_t>(kMaxArrayLength)) {
            return fail("invalid multibulk length");
        }

        std::size_t cursor = header_end + kCrlf.size();

        if (count <= 0) {
            // *0 and *-1 carry no command; skip them like Redis does.
            pos_ = cursor;
            continue;
        }

        Request args;
        args.reserve(static_cast<std::size_t>(count));

        for (int64_t i = 0; i < count; ++i) {
            if (cursor >= data.size()) {
                return NeedMoreBytes{};
            }
            if (data[cursor] != '$') {
                return fail("expected '$', got '" + printable(data[cursor]) + "'");
            }

            const auto bulk_header_end = data.find(kCrlf, cursor);
            if (bulk_header_end == std::string_view::npos) {
                if (data.size() - cursor > kMaxHeaderLength) {
                    return fail("too big bulk count string");
                }
                return NeedMoreBytes{};
            }

            int64_t len = 0;
            if (!parse_int(data.substr(cursor + 1, bulk_header_end - cursor - 1), len) ||
                len < 0 || len > static_cast<int64_t>(kMaxBulkLength)) {
                return fail("invalid bulk length");
            }

            const std::size_t payload = bulk_header_end + kCrlf.size();
            const std::size_t payload_end = payload + static_cast<std::size_t>(len);
            if (data.size() < payload_end + kCrlf.size()) {
                return NeedMoreBytes{};
            }
            if (data.substr(payload_end, kCrlf.size()) != kCrlf) {
                return fail("expected CRLF after bulk data");
            }

            args.emplace_back(data.substr(payload, static_cast<std::size_t>(len)));
            cursor = payload_end + kCrlf.size();
        }

        pos_ = cursor;
        return DecodeResult{std::move(args)};
    }
}

// ── RESP serializer ──────────────────────────────────────────────────────────

void serialize_reply(const Reply& reply, std::string& out) {
    std::visit(
        [&out](const auto& r) {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, StatusReply>) {
                out += '+';
                append_line(out, r.text);
            } else if constexpr (std::is_same_v<T, ErrorReply>) {
                out += '-';
                append_line(out, r.message);
            } else if constexpr (std::is_same_v<T, IntegerReply>) {
                out += ':';
                out += std::to_string(r.value);
                out += kCrlf;
            } else if constexpr (std::is_same_v<T, BulkReply>) {
                append_bulk(out, r.value);
            } else if constexpr (std::is_same_v<T, NullReply>) {
                out += r.kind == NullKind::Array ? "*-1\r\n" : "$-1\r\n";
            } else if constexpr (std::is_same_v<T, ArrayReply>) {
                out += '*';
                out += std::to_string(r.items.size());
                out += kCrlf;
                for (const auto& item : r.items) {
                    serialize_reply(item, out);
                }
            }
        },
        reply.value);
}

std::string serialize_reply(const Reply& reply) {
    std::string out;
    serialize_reply(reply, out);
    return out;
}

// ── RESP client-side helpers ─────────────────────────────────────────────────

std::string serialize_request(const Request& request) {
    std::string out = "*" + std::to_string(request.size()) + "\r\n";
    for (const auto& arg : request) {
        append_bulk(out, arg);
    }
    return out;
}

} // namespace ember::network
