#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace ember {

// ── Errc ──────────────────────────────────────────────────────────────────────
//
// Recoverable command errors.  Every value maps to the exact text sent back to
// the client as a RESP error reply (see error_category().message()), so the
// engine can turn any std::error_code from this category into a reply without
// a lookup table of its own.
//
// Protocol framing errors are not listed here: the decoder reports them as
// network::ProtocolError and the session closes the connection.

enum class Errc {
    // Key holds a different variant than the command expects.
    wrong_type = 1,

    // INCR family.
    not_an_integer,
    increment_overflow,

    // Stream IDs.
    invalid_stream_id,
    stream_id_zero,
    stream_id_not_increasing,

    // MULTI / EXEC / DISCARD misuse.
    nested_multi,
    exec_without_multi,
    discard_without_multi,
    exec_aborted,

    // Argument values.
    syntax_error,
    invalid_expire,
    value_out_of_range,
    negative_timeout,
    invalid_timeout,
    unbalanced_xread,
};

// The category shared by all Errc values.  Thread-safe (stateless singleton).
[[nodiscard]] const std::error_category& error_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

} // namespace ember

template <>
struct std::is_error_code_enum<ember::Errc> : std::true_type {};
