#pragma once

#include "blocking/blocking_coordinator.hpp"
#include "common/server_stats.hpp"
#include "engine/command_engine.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <array>
#include <cstdint>
#include <memory>
#include <string>

namespace ember::network {

// Handles one TCP connection for its lifetime.
//
// Each Session is co_spawned from Server::accept_loop() on its socket's strand
// and runs until the client disconnects, sends a malformed request, or an I/O
// error occurs.  Requests are decoded with RespDecoder, handed to a
// SessionDispatcher one at a time, and answered in order.
//
// While a command is blocked the session keeps reading the socket; a
// disconnect cancels the client's waiter so the blocked command finishes
// without side effects, and pipelined bytes are decoded once it returns.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(boost::asio::ip::tcp::socket socket, engine::CommandEngine& engine,
            ServerStats& stats, blocking::ClientId id);

    ~Session();

    Session(const Session&)            = delete;
    Session& operator=(const Session&) = delete;

    // Main coroutine.  Returns when the connection closes.
    boost::asio::awaitable<void> run();

    // The connection's strand.
    [[nodiscard]] boost::asio::any_io_executor get_executor() { return socket_.get_executor(); }

private:
    // Start watching the socket for a disconnect (blocked command only).
    void start_watch();

    // Stop the watcher started by start_watch(), if any, and wait for it to
    // exit.  Bytes it read are left in pending_.
    boost::asio::awaitable<void> stop_watch();

    boost::asio::awaitable<void> watch_disconnect();

    boost::asio::ip::tcp::socket socket_;
    engine::CommandEngine& engine_;
    ServerStats& stats_;
    blocking::ClientId id_;
    std::string remote_;

    // Watcher state, touched only on the strand.
    bool watching_ = false;
    bool stop_requested_ = false;
    bool peer_closed_ = false;
    boost::asio::steady_timer watch_exited_;
    std::array<char, 4096> watch_buf_{};
    std::string pending_;  // received while blocked, not yet decoded
};

} // namespace ember::network
