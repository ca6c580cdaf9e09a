#include "engine/command_table.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include <fmt/format.h>

namespace ember::engine {

namespace {

constexpr std::array<CommandSpec, 19> kCommands{{
    {"ping", -1},
    {"echo", 2},
    {"info", -1},
    {"set", -3},
    {"get", 2},
    {"incr", 2},
    {"lpush", -3},
    {"rpush", -3},
    {"lpop", -2},
    {"blpop", -3},
    {"lrange", 4},
    {"llen", 2},
    {"type", 2},
    {"xadd", -5},
    {"xrange", -4},
    {"xread", -4},
    {"multi", 1},
    {"exec", 1},
    {"discard", 1},
}};

// Redis quotes at most this many bytes of arguments in the unknown-command
// reply.
constexpr std::size_t kMaxQuotedArgs = 128;

} // anonymous namespace

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const CommandSpec* find_command(std::string_view name) {
    const std::string lower = to_lower(name);
    for (const auto& spec : kCommands) {
        if (spec.name == lower) {
            return &spec;
        }
    }
    return nullptr;
}

bool arity_ok(const CommandSpec& spec, std::size_t argc) noexcept {
    const auto n = static_cast<long>(argc);
    return spec.arity >= 0 ? n == spec.arity : n >= -spec.arity;
}

std::optional<ErrorReply> check_command(const Request& request) {
    if (request.empty()) {
        return ErrorReply{"ERR empty command"};
    }
    const CommandSpec* spec = find_command(request.front());
    if (spec == nullptr) {
        return ErrorReply{unknown_command_message(request)};
    }
    if (!arity_ok(*spec, request.size())) {
        return ErrorReply{wrong_arity_message(spec->name)};
    }
    return std::nullopt;
}

std::string unknown_command_message(const Request& request) {
    std::string args;
    for (std::size_t i = 1; i < request.size() && args.size() < kMaxQuotedArgs; ++i) {
        const std::size_t room = kMaxQuotedArgs - args.size();
        args += fmt::format("'{}' ", request[i].substr(0, room));
    }
    const std::string_view name = request.empty() ? std::string_view{} : request.front();
    return fmt::format("ERR unknown command '{}', with args beginning with: {}",
                       name.substr(0, kMaxQuotedArgs), args);
}

std::string wrong_arity_message(std::string_view name) {
    return fmt::format("ERR wrong number of arguments for '{}' command", name);
}

} // namespace ember::engine
