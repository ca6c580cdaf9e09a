#pragma once

#include "common/server_config.hpp"
#include "common/server_stats.hpp"
#include "engine/command_engine.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace ember::network {

// Owns the io_context, the TCP acceptor and the active-expiry timer.
//
// Usage:
//   Server srv{config, engine, stats};
//   srv.run();   // blocks until SIGINT/SIGTERM or stop()
class Server {
public:
    // Binds and listens immediately; throws boost::system::system_error if the
    // address is unusable.  Port 0 picks an ephemeral port (see local_port()).
    Server(const ServerConfig& config, engine::CommandEngine& engine, ServerStats& stats);

    // Starts the thread pool, begins accepting connections, and installs signal
    // handlers for graceful shutdown (SIGINT / SIGTERM).
    // Blocks until the server stops.
    void run();

    // Stops the io_context, causing run() to return.  Safe to call from any
    // thread.
    void stop();

    // The port the acceptor is bound to.
    [[nodiscard]] uint16_t local_port() const;

    [[nodiscard]] boost::asio::io_context& io_context() noexcept { return ioc_; }

private:
    // Accept loop coroutine; runs until the acceptor is closed.
    boost::asio::awaitable<void> accept_loop();

    // Periodically erases expired keys.
    boost::asio::awaitable<void> expire_loop();

    std::string host_;
    unsigned int threads_;
    std::chrono::milliseconds expire_interval_;
    engine::CommandEngine& engine_;
    ServerStats& stats_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    blocking::ClientId next_client_id_ = 1;
};

} // namespace ember::network
