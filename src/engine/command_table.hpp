#pragma once

#include "network/reply.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ember::engine {

// ── Command table ────────────────────────────────────────────────────────────
//
// Static metadata for every supported command.  Arity follows the Redis
// convention and counts the command name: a positive value is the exact
// argument count, a negative value -N means "at least N".

struct CommandSpec {
    std::string_view name;  // lowercase
    int arity;
};

// Case-insensitive lookup.  Returns nullptr for unknown commands.
[[nodiscard]] const CommandSpec* find_command(std::string_view name);

// True if `argc` (including the command name) satisfies `spec.arity`.
[[nodiscard]] bool arity_ok(const CommandSpec& spec, std::size_t argc) noexcept;

// The checks MULTI applies before queuing: the command exists and has an
// acceptable number of arguments.  Returns the error reply otherwise.
[[nodiscard]] std::optional<ErrorReply> check_command(const Request& request);

// ERR unknown command 'foo', with args beginning with: 'a' 'b'
[[nodiscard]] std::string unknown_command_message(const Request& request);

// ERR wrong number of arguments for 'get' command
[[nodiscard]] std::string wrong_arity_message(std::string_view name);

// Lowercase ASCII copy, used for command names and option keywords.
[[nodiscard]] std::string to_lower(std::string_view s);

} // namespace ember::engine
