#include "storage/stream_id.hpp"

#include "common/errors.hpp"

#include <charconv>
#include <limits>

namespace ember {

namespace {

constexpr uint64_t kMaxU64 = std::numeric_limits<uint64_t>::max();

bool parse_u64(std::string_view sv, uint64_t& out) {
    if (sv.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

} // anonymous namespace

std::optional<StreamId> parse_stream_id(std::string_view text, uint64_t default_seq) {
    StreamId id;
    const auto dash = text.find('-');
    if (dash == std::string_view::npos) {
        if (!parse_u64(text, id.ms)) {
            return std::nullopt;
        }
        id.seq = default_seq;
        return id;
    }
    if (!parse_u64(text.substr(0, dash), id.ms) ||
        !parse_u64(text.substr(dash + 1), id.seq)) {
        return std::nullopt;
    }
    return id;
}

std::optional<StreamId> parse_range_bound(std::string_view text, bool is_end) {
    if (text == "-") {
        return StreamId::min();
    }
    if (text == "+") {
        return StreamId::max();
    }
    return parse_stream_id(text, is_end ? kMaxU64 : 0);
}

std::error_code next_stream_id(std::string_view spec,
                               const StreamId& last,
                               uint64_t now_ms,
                               StreamId& out) {
    if (spec == "*") {
        if (now_ms > last.ms) {
            out = {now_ms, 0};
            return {};
        }
        // Clock is behind (or equal to) the top item: stay on its millisecond.
        if (last.seq == kMaxU64) {
            if (last.ms == kMaxU64) {
                return Errc::stream_id_not_increasing;
            }
            out = {last.ms + 1, 0};
            return {};
        }
        out = {last.ms, last.seq + 1};
        return {};
    }

    const auto dash = spec.find('-');
    if (dash != std::string_view::npos && spec.substr(dash + 1) == "*") {
        uint64_t ms = 0;
        if (!parse_u64(spec.substr(0, dash), ms)) {
            return Errc::invalid_stream_id;
        }
        if (ms < last.ms) {
            return Errc::stream_id_not_increasing;
        }
        if (ms == last.ms) {
            if (last.seq == kMaxU64) {
                return Errc::stream_id_not_increasing;
            }
            out = {ms, last.seq + 1};
            return {};
        }
        out = {ms, ms == 0 ? 1u : 0u};
        return {};
    }

    auto id = parse_stream_id(spec);
    if (!id) {
        return Errc::invalid_stream_id;
    }
    if (*id == StreamId::min()) {
        return Errc::stream_id_zero;
    }
    if (*id <= last) {
        return Errc::stream_id_not_increasing;
    }
    out = *id;
    return {};
}

} // namespace ember
