#include "engine/command_engine.hpp"

#include "common/errors.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <string_view>
#include <type_traits>

#include <unistd.h>

#include <fmt/format.h>

namespace ember::engine {

using boost::asio::awaitable;
using blocking::StreamWatch;
using blocking::WaiterState;

namespace {

constexpr std::string_view kVersion = "0.1.0";

Reply entries_reply(const std::vector<StreamEntry>& entries) {
    std::vector<Reply> items;
    items.reserve(entries.size());
    for (const auto& entry : entries) {
        std::vector<Reply> fields;
        fields.reserve(entry.fields.size() * 2);
        for (const auto& [field, value] : entry.fields) {
            fields.push_back(Reply::bulk(field));
            fields.push_back(Reply::bulk(value));
        }
        items.push_back(Reply::array({Reply::bulk(entry.id.to_string()),
                                      Reply::array(std::move(fields))}));
    }
    return Reply::array(std::move(items));
}

Reply key_value_reply(std::pair<std::string, std::string> kv) {
    return Reply::array({Reply::bulk(std::move(kv.first)), Reply::bulk(std::move(kv.second))});
}

Reply bulk_array(std::vector<std::string> values) {
    std::vector<Reply> items;
    items.reserve(values.size());
    for (auto& v : values) {
        items.push_back(Reply::bulk(std::move(v)));
    }
    return Reply::array(std::move(items));
}

std::string make_replication_id() {
    static constexpr char kHex[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<int> digit(0, 15);
    std::string id(40, '0');
    for (auto& c : id) {
        c = kHex[digit(gen)];
    }
    return id;
}

// Room left before `now + d` overflows the clock's representation.
template <typename TimePoint>
std::chrono::milliseconds headroom(TimePoint now) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::max() - now);
}

// A timeout too large to represent waits forever.
blocking::Deadline deadline_after(std::chrono::milliseconds timeout) {
    const auto now = std::chrono::steady_clock::now();
    if (timeout >= headroom(now)) {
        return std::nullopt;
    }
    return now + timeout;
}

} // anonymous namespace

CommandEngine::CommandEngine(Storage& storage, blocking::BlockingCoordinator& coordinator,
                             ServerStats& stats)
    : storage_(storage)
    , coordinator_(coordinator)
    , stats_(stats)
    , replication_id_(make_replication_id()) {}

// ── Blocking path ────────────────────────────────────────────────────────────

awaitable<Reply> CommandEngine::execute(const Command& command, ClientContext& client) {
    if (const auto* cmd = std::get_if<BlpopCmd>(&command)) {
        co_return co_await blpop(*cmd, client);
    }
    if (const auto* cmd = std::get_if<XreadCmd>(&command); cmd != nullptr && cmd->block) {
        co_return co_await xread(*cmd, client);
    }
    co_return execute_now(command);
}

awaitable<Reply> CommandEngine::blpop(const BlpopCmd& cmd, ClientContext& client) {
    const blocking::Deadline deadline =
        cmd.timeout ? deadline_after(*cmd.timeout) : blocking::Deadline{};

    std::shared_ptr<blocking::Waiter> waiter;
    {
        auto guard = storage_.lock();
        bool served = false;
        Reply reply = blpop_now(cmd, served);
        if (served) {
            co_return reply;
        }
        waiter = coordinator_.register_list_waiter(client.id, cmd.keys, deadline,
                                                   client.executor);
    }

    if (client.on_block) {
        client.on_block();
    }
    auto result = co_await coordinator_.wait(waiter);
    if (result.state == WaiterState::Satisfied && result.popped) {
        co_return key_value_reply(std::move(*result.popped));
    }
    co_return Reply::null_array();
}

awaitable<Reply> CommandEngine::xread(const XreadCmd& cmd, ClientContext& client) {
    const blocking::Deadline deadline =
        cmd.block->count() > 0 ? deadline_after(*cmd.block) : blocking::Deadline{};

    std::vector<StreamWatch> watches;
    for (;;) {
        std::shared_ptr<blocking::Waiter> waiter;
        {
            auto guard = storage_.lock();
            if (watches.empty()) {
                if (auto ec = resolve_watches(cmd, watches)) {
                    co_return Reply::error(ec);
                }
            }
            bool served = false;
            Reply reply = xread_now(cmd, watches, served);
            if (served) {
                co_return reply;
            }
            if (deadline && std::chrono::steady_clock::now() >= *deadline) {
                co_return Reply::null_array();
            }
            waiter = coordinator_.register_stream_waiter(client.id, watches, deadline,
                                                         client.executor);
        }

        if (client.on_block) {
            client.on_block();
        }
        auto result = co_await coordinator_.wait(waiter);
        if (result.state != WaiterState::Satisfied) {
            co_return Reply::null_array();
        }
        // Woken by an append: re-read; if the entries are gone, wait again.
    }
}

Reply CommandEngine::blpop_now(const BlpopCmd& cmd, bool& served) {
    std::optional<std::pair<std::string, std::string>> popped;
    if (auto ec = storage_.list_pop_first(cmd.keys, popped)) {
        served = true;
        return Reply::error(ec);
    }
    served = popped.has_value();
    return popped ? key_value_reply(std::move(*popped)) : Reply::null_array();
}

Reply CommandEngine::xread_now(const XreadCmd& cmd, const std::vector<StreamWatch>& watches,
                               bool& served) {
    std::vector<Reply> streams;
    std::vector<StreamEntry> entries;
    for (const auto& watch : watches) {
        if (auto ec = storage_.stream_read_after(watch.key, watch.after, cmd.count, entries)) {
            served = true;
            return Reply::error(ec);
        }
        if (!entries.empty()) {
            streams.push_back(Reply::array({Reply::bulk(watch.key), entries_reply(entries)}));
        }
    }
    served = !streams.empty();
    return served ? Reply::array(std::move(streams)) : Reply::null_array();
}

std::error_code CommandEngine::resolve_watches(const XreadCmd& cmd,
                                               std::vector<StreamWatch>& out) {
    std::vector<StreamWatch> watches;
    watches.reserve(cmd.keys.size());
    for (std::size_t i = 0; i < cmd.keys.size(); ++i) {
        StreamId after;
        if (cmd.after[i]) {
            after = *cmd.after[i];
        } else if (auto ec = storage_.stream_last_id(cmd.keys[i], after)) {
            return ec;
        }
        watches.push_back(StreamWatch{cmd.keys[i], after});
    }
    out = std::move(watches);
    return {};
}

// ── Non-blocking path ────────────────────────────────────────────────────────

Reply CommandEngine::execute_now(const Request& request) {
    auto parsed = parse_command(request);
    if (auto* err = std::get_if<ErrorReply>(&parsed)) {
        return Reply{std::move(*err)};
    }
    return execute_now(std::get<Command>(parsed));
}

Reply CommandEngine::execute_batch(const std::vector<Request>& requests) {
    auto guard = storage_.lock();
    std::vector<Reply> replies;
    replies.reserve(requests.size());
    for (const auto& request : requests) {
        replies.push_back(execute_now(request));
    }
    return Reply::array(std::move(replies));
}

Reply CommandEngine::execute_now(const Command& command) {
    return std::visit([this](const auto& cmd) -> Reply {
        using T = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<T, PingCmd>) {
            return cmd.message ? Reply::bulk(*cmd.message) : Reply::status("PONG");

        } else if constexpr (std::is_same_v<T, EchoCmd>) {
            return Reply::bulk(cmd.message);

        } else if constexpr (std::is_same_v<T, InfoCmd>) {
            return info(cmd);

        } else if constexpr (std::is_same_v<T, SetCmd>) {
            std::optional<Clock::time_point> expires_at;
            if (cmd.ttl) {
                const auto now = storage_.clock().now();
                if (*cmd.ttl >= headroom(now)) {
                    return Reply::error(make_error_code(Errc::invalid_expire));
                }
                expires_at = now + *cmd.ttl;
            }
            storage_.set_string(cmd.key, cmd.value, expires_at);
            return Reply::ok();

        } else if constexpr (std::is_same_v<T, GetCmd>) {
            std::optional<std::string> value;
            if (auto ec = storage_.get_string(cmd.key, value)) {
                return Reply::error(ec);
            }
            return value ? Reply::bulk(std::move(*value)) : Reply::null_bulk();

        } else if constexpr (std::is_same_v<T, IncrCmd>) {
            int64_t value = 0;
            if (auto ec = storage_.incr(cmd.key, value)) {
                return Reply::error(ec);
            }
            return Reply::integer(value);

        } else if constexpr (std::is_same_v<T, PushCmd>) {
            std::size_t length = 0;
            if (auto ec = storage_.list_push(cmd.key, cmd.end, cmd.elements, length)) {
                return Reply::error(ec);
            }
            return Reply::integer(static_cast<int64_t>(length));

        } else if constexpr (std::is_same_v<T, LpopCmd>) {
            auto guard = storage_.lock();
            const bool exists = storage_.type_of(cmd.key) != ValueType::None;
            std::vector<std::string> popped;
            if (auto ec = storage_.list_pop(cmd.key, Storage::ListEnd::Front,
                                            cmd.count.value_or(1), popped)) {
                return Reply::error(ec);
            }
            if (!cmd.count) {
                return popped.empty() ? Reply::null_bulk() : Reply::bulk(std::move(popped.front()));
            }
            return exists ? bulk_array(std::move(popped)) : Reply::null_array();

        } else if constexpr (std::is_same_v<T, BlpopCmd>) {
            auto guard = storage_.lock();
            bool served = false;
            return blpop_now(cmd, served);

        } else if constexpr (std::is_same_v<T, LrangeCmd>) {
            std::vector<std::string> values;
            if (auto ec = storage_.list_range(cmd.key, cmd.start, cmd.stop, values)) {
                return Reply::error(ec);
            }
            return bulk_array(std::move(values));

        } else if constexpr (std::is_same_v<T, LlenCmd>) {
            std::size_t length = 0;
            if (auto ec = storage_.list_len(cmd.key, length)) {
                return Reply::error(ec);
            }
            return Reply::integer(static_cast<int64_t>(length));

        } else if constexpr (std::is_same_v<T, TypeCmd>) {
            return Reply::status(std::string(type_name(storage_.type_of(cmd.key))));

        } else if constexpr (std::is_same_v<T, XaddCmd>) {
            StreamId id;
            if (auto ec = storage_.stream_add(cmd.key, cmd.id, cmd.fields, id)) {
                return Reply::error(ec);
            }
            return Reply::bulk(id.to_string());

        } else if constexpr (std::is_same_v<T, XrangeCmd>) {
            if (cmd.count && *cmd.count <= 0) {
                return Reply::array({});
            }
            std::vector<StreamEntry> entries;
            const auto limit = static_cast<std::size_t>(cmd.count.value_or(0));
            if (auto ec = storage_.stream_range(cmd.key, cmd.start, cmd.end, limit, entries)) {
                return Reply::error(ec);
            }
            return entries_reply(entries);

        } else if constexpr (std::is_same_v<T, XreadCmd>) {
            auto guard = storage_.lock();
            std::vector<StreamWatch> watches;
            if (auto ec = resolve_watches(cmd, watches)) {
                return Reply::error(ec);
            }
            bool served = false;
            return xread_now(cmd, watches, served);

        } else {
            // MULTI / EXEC / DISCARD are connection state, see SessionDispatcher.
            return Reply::error("ERR Command not allowed inside a transaction");
        }
    }, command);
}

// ── INFO ─────────────────────────────────────────────────────────────────────

Reply CommandEngine::info(const InfoCmd& cmd) {
    const bool all = cmd.sections.empty() ||
        std::any_of(cmd.sections.begin(), cmd.sections.end(), [](const std::string& s) {
            return s == "all" || s == "default" || s == "everything";
        });
    auto wanted = [&](std::string_view section) {
        return all || std::find(cmd.sections.begin(), cmd.sections.end(), section) !=
                          cmd.sections.end();
    };

    std::string out;
    auto begin_section = [&](std::string_view title) {
        if (!out.empty()) {
            out += "\r\n";
        }
        out += fmt::format("# {}\r\n", title);
    };

    if (wanted("server")) {
        const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - stats_.started_at).count();
        begin_section("Server");
        out += fmt::format("ember_version:{}\r\n", kVersion);
        out += "redis_mode:standalone\r\n";
        out += fmt::format("process_id:{}\r\n", ::getpid());
        out += fmt::format("tcp_port:{}\r\n", stats_.tcp_port);
        out += fmt::format("uptime_in_seconds:{}\r\n", uptime);
        out += fmt::format("uptime_in_days:{}\r\n", uptime / 86400);
    }
    if (wanted("clients")) {
        begin_section("Clients");
        out += fmt::format("connected_clients:{}\r\n", stats_.connected_clients.load());
        out += fmt::format("blocked_clients:{}\r\n", coordinator_.blocked_clients());
    }
    if (wanted("stats")) {
        begin_section("Stats");
        out += fmt::format("total_connections_received:{}\r\n", stats_.total_connections.load());
        out += fmt::format("total_commands_processed:{}\r\n", stats_.total_commands.load());
        out += fmt::format("expired_keys:{}\r\n", storage_.expired_total());
    }
    if (wanted("replication")) {
        begin_section("Replication");
        out += "role:master\r\n";
        out += "connected_slaves:0\r\n";
        out += fmt::format("master_replid:{}\r\n", replication_id_);
        out += "master_repl_offset:0\r\n";
    }
    if (wanted("keyspace")) {
        begin_section("Keyspace");
        if (const auto keys = storage_.size(); keys > 0) {
            out += fmt::format("db0:keys={},expires={},avg_ttl=0\r\n", keys,
                               storage_.expiring_keys());
        }
    }
    return Reply::bulk(std::move(out));
}

} // namespace ember::engine
