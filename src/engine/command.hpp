#pragma once

#include "network/reply.hpp"
#include "storage/storage.hpp"
#include "storage/value.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ember::engine {

// ── Typed commands ───────────────────────────────────────────────────────────
//
// parse_command() turns a Request into one of these after validating every
// argument, so execution only deals with store-level errors.

struct PingCmd {
    std::optional<std::string> message;
};

struct EchoCmd {
    std::string message;
};

struct InfoCmd {
    std::vector<std::string> sections;  // lowercase; empty = default set
};

struct SetCmd {
    std::string key;
    std::string value;
    std::optional<std::chrono::milliseconds> ttl;
};

struct GetCmd {
    std::string key;
};

struct IncrCmd {
    std::string key;
};

// LPUSH / RPUSH
struct PushCmd {
    std::string key;
    Storage::ListEnd end = Storage::ListEnd::Front;
    std::vector<std::string> elements;
};

struct LpopCmd {
    std::string key;
    std::optional<std::size_t> count;  // nullopt: single-element reply shape
};

struct BlpopCmd {
    std::vector<std::string> keys;
    std::optional<std::chrono::milliseconds> timeout;  // nullopt: wait forever
};

struct LrangeCmd {
    std::string key;
    int64_t start = 0;
    int64_t stop = 0;
};

struct LlenCmd {
    std::string key;
};

struct TypeCmd {
    std::string key;
};

struct XaddCmd {
    std::string key;
    std::string id;  // resolved by the store
    FieldValues fields;
};

struct XrangeCmd {
    std::string key;
    StreamId start;
    StreamId end;
    std::optional<int64_t> count;
};

struct XreadCmd {
    std::vector<std::string> keys;
    std::vector<std::optional<StreamId>> after;  // nullopt: '$'
    std::size_t count = 0;                       // 0: no limit
    // nullopt: do not block.  0 ms: block forever.
    std::optional<std::chrono::milliseconds> block;
};

struct MultiCmd {};
struct ExecCmd {};
struct DiscardCmd {};

using Command = std::variant<PingCmd, EchoCmd, InfoCmd, SetCmd, GetCmd, IncrCmd, PushCmd,
                             LpopCmd, BlpopCmd, LrangeCmd, LlenCmd, TypeCmd, XaddCmd,
                             XrangeCmd, XreadCmd, MultiCmd, ExecCmd, DiscardCmd>;

using ParseResult = std::variant<Command, ErrorReply>;

// Validate `request` and build the typed command.  Unknown commands, wrong
// arity and malformed arguments come back as the ErrorReply to send.
[[nodiscard]] ParseResult parse_command(const Request& request);

} // namespace ember::engine
