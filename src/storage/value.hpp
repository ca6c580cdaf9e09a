#pragma once

#include "common/clock.hpp"

#include <compare>
#include <cstdint>
#include <deque>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ember {

// ── Stream IDs ────────────────────────────────────────────────────────────────

// <ms>-<seq>, ordered lexicographically on (ms, seq).
struct StreamId {
    uint64_t ms = 0;
    uint64_t seq = 0;

    [[nodiscard]] static constexpr StreamId min() noexcept { return {0, 0}; }
    [[nodiscard]] static constexpr StreamId max() noexcept {
        return {std::numeric_limits<uint64_t>::max(), std::numeric_limits<uint64_t>::max()};
    }

    [[nodiscard]] std::string to_string() const {
        return std::to_string(ms) + "-" + std::to_string(seq);
    }

    auto operator<=>(const StreamId&) const = default;
};

using FieldValues = std::vector<std::pair<std::string, std::string>>;

struct StreamEntry {
    StreamId id;
    FieldValues fields;  // in XADD argument order
};

// Append-only; entries are sorted by id and last_id == entries.back().id
// whenever the stream is non-empty.
struct Stream {
    std::vector<StreamEntry> entries;
    StreamId last_id;
};

// ── Values ────────────────────────────────────────────────────────────────────

using List = std::deque<std::string>;

using Value = std::variant<std::string, List, Stream>;

enum class ValueType : uint8_t {
    None,
    String,
    List,
    Stream,
};

// Name reported by TYPE.
[[nodiscard]] constexpr std::string_view type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::String: return "string";
        case ValueType::List:   return "list";
        case ValueType::Stream: return "stream";
        case ValueType::None:   break;
    }
    return "none";
}

// A stored value plus its optional absolute deadline.
struct Entry {
    Value value;
    std::optional<Clock::time_point> expires_at;
};

} // namespace ember
