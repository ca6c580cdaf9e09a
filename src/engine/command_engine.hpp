#pragma once

#include "blocking/blocking_coordinator.hpp"
#include "common/server_stats.hpp"
#include "engine/command.hpp"
#include "network/reply.hpp"
#include "storage/storage.hpp"

#include <functional>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace ember::engine {

// The connection a command runs on behalf of.
struct ClientContext {
    blocking::ClientId id = 0;

    // Strand of the connection; blocked commands park their timer here.
    boost::asio::any_io_executor executor;

    // Called right before a command suspends, so the transport can watch the
    // socket for a disconnect while nothing is being read.
    std::function<void()> on_block;
};

// ── CommandEngine ────────────────────────────────────────────────────────────
//
// Executes typed commands against the store.  Each non-blocking command is
// one critical section of the store; BLPOP and XREAD BLOCK release the store
// while suspended on the BlockingCoordinator.
//
// Thread-safe: shared by every session.

class CommandEngine {
public:
    CommandEngine(Storage& storage, blocking::BlockingCoordinator& coordinator,
                  ServerStats& stats);

    CommandEngine(const CommandEngine&)            = delete;
    CommandEngine& operator=(const CommandEngine&) = delete;

    // Run `command`, suspending if it blocks.
    [[nodiscard]] boost::asio::awaitable<Reply> execute(const Command& command,
                                                        ClientContext& client);

    // Run `command` without ever suspending.  Blocking commands behave as if
    // their timeout had already elapsed.
    [[nodiscard]] Reply execute_now(const Command& command);

    // Parse and run `request` without suspending.
    [[nodiscard]] Reply execute_now(const Request& request);

    // EXEC: run every request in order as one critical section.  Each slot
    // holds that command's reply, errors included.
    [[nodiscard]] Reply execute_batch(const std::vector<Request>& requests);

    [[nodiscard]] Storage& storage() noexcept { return storage_; }
    [[nodiscard]] blocking::BlockingCoordinator& coordinator() noexcept { return coordinator_; }

private:
    boost::asio::awaitable<Reply> blpop(const BlpopCmd& cmd, ClientContext& client);
    boost::asio::awaitable<Reply> xread(const XreadCmd& cmd, ClientContext& client);

    // Non-blocking attempts shared by both paths.
    Reply blpop_now(const BlpopCmd& cmd, bool& served);
    Reply xread_now(const XreadCmd& cmd, const std::vector<blocking::StreamWatch>& watches,
                    bool& served);

    // Resolve '$' thresholds to the streams' current last IDs.
    std::error_code resolve_watches(const XreadCmd& cmd,
                                    std::vector<blocking::StreamWatch>& out);

    Reply info(const InfoCmd& cmd);

    Storage& storage_;
    blocking::BlockingCoordinator& coordinator_;
    ServerStats& stats_;
    std::string replication_id_;
};

} // namespace ember::engine
