#include "engine/session_dispatcher.hpp"

#include "common/errors.hpp"
#include "engine/command_table.hpp"

namespace ember::engine {

using boost::asio::awaitable;

SessionDispatcher::SessionDispatcher(CommandEngine& engine, ServerStats& stats,
                                     ClientContext client)
    : engine_(engine)
    , stats_(stats)
    , client_(std::move(client)) {}

awaitable<Reply> SessionDispatcher::dispatch(const Request& request) {
    stats_.total_commands.fetch_add(1, std::memory_order_relaxed);

    if (txn_.queuing()) {
        co_return queue_or_control(request);
    }

    auto parsed = parse_command(request);
    if (auto* err = std::get_if<ErrorReply>(&parsed)) {
        co_return Reply{std::move(*err)};
    }
    const Command& command = std::get<Command>(parsed);

    if (std::holds_alternative<MultiCmd>(command)) {
        if (auto ec = txn_.begin()) {
            co_return Reply::error(ec);
        }
        co_return Reply::ok();
    }
    if (std::holds_alternative<ExecCmd>(command)) {
        co_return exec();
    }
    if (std::holds_alternative<DiscardCmd>(command)) {
        if (auto ec = txn_.discard()) {
            co_return Reply::error(ec);
        }
        co_return Reply::ok();
    }
    co_return co_await engine_.execute(command, client_);
}

Reply SessionDispatcher::queue_or_control(const Request& request) {
    if (auto err = check_command(request)) {
        txn_.mark_dirty();
        return Reply{std::move(*err)};
    }

    const std::string name = to_lower(request.front());
    if (name == "multi") {
        // Does not mark the transaction dirty.
        return Reply::error(make_error_code(Errc::nested_multi));
    }
    if (name == "exec") {
        return exec();
    }
    if (name == "discard") {
        if (auto ec = txn_.discard()) {
            return Reply::error(ec);
        }
        return Reply::ok();
    }

    txn_.queue(request);
    return Reply::status("QUEUED");
}

Reply SessionDispatcher::exec() {
    std::vector<Request> requests;
    if (auto ec = txn_.take(requests)) {
        return Reply::error(ec);
    }
    return engine_.execute_batch(requests);
}

} // namespace ember::engine
