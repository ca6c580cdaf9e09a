#pragma once

#include "common/server_stats.hpp"
#include "engine/command_engine.hpp"
#include "engine/transaction.hpp"
#include "network/reply.hpp"

#include <boost/asio/awaitable.hpp>

namespace ember::engine {

// ── SessionDispatcher ────────────────────────────────────────────────────────
//
// Per-connection front end of the CommandEngine: owns the connection's
// TransactionContext and decides, for each decoded request, whether to
// handle MULTI/EXEC/DISCARD, queue it, or execute it.
//
// NOT thread-safe: one dispatcher per session, used from its strand.

class SessionDispatcher {
public:
    SessionDispatcher(CommandEngine& engine, ServerStats& stats, ClientContext client);

    // Handle one request and produce its reply.  Suspends only for blocking
    // commands outside a transaction.
    [[nodiscard]] boost::asio::awaitable<Reply> dispatch(const Request& request);

    [[nodiscard]] const TransactionContext& transaction() const noexcept { return txn_; }
    [[nodiscard]] ClientContext& client() noexcept { return client_; }

private:
    Reply queue_or_control(const Request& request);
    Reply exec();

    CommandEngine& engine_;
    ServerStats& stats_;
    ClientContext client_;
    TransactionContext txn_;
};

} // namespace ember::engine
