#pragma once

#include "storage/value.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace ember {

// ── Stream ID parsing ─────────────────────────────────────────────────────────
//
// Accepted forms:
//   "<ms>-<seq>"  explicit
//   "<ms>"        seq taken from `default_seq`
// Both parts are unsigned 64-bit decimal numbers.

[[nodiscard]] std::optional<StreamId> parse_stream_id(std::string_view text,
                                                      uint64_t default_seq = 0);

// Parse an XRANGE bound.  "-" is the smallest ID, "+" the largest.  A bare
// "<ms>" means <ms>-0 as a start and <ms>-<max> as an end.
[[nodiscard]] std::optional<StreamId> parse_range_bound(std::string_view text, bool is_end);

// ── XADD ID assignment ────────────────────────────────────────────────────────
//
// Resolve the ID an XADD with `spec` ("*", "<ms>-*", "<ms>-<seq>", "<ms>")
// assigns on a stream whose last ID is `last`.  `now_ms` is the wall-clock
// time used by "*".
//
// Errors: Errc::invalid_stream_id, Errc::stream_id_zero,
//         Errc::stream_id_not_increasing.
[[nodiscard]] std::error_code next_stream_id(std::string_view spec,
                                             const StreamId& last,
                                             uint64_t now_ms,
                                             StreamId& out);

} // namespace ember
