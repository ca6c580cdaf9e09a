#include "network/server.hpp"
#include "network/session.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

namespace ember::network {

namespace {

using boost::asio::redirect_error;
using boost::asio::use_awaitable;

// Upper bound on keys erased per expiry tick, so one tick never holds the
// store lock for long.
constexpr std::size_t kExpireBatch = 200;

unsigned int resolve_threads(uint32_t configured) {
    if (configured != 0) {
        return configured;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace

Server::Server(const ServerConfig& config, engine::CommandEngine& engine, ServerStats& stats)
    : host_(config.host),
      threads_(resolve_threads(config.threads)),
      expire_interval_(config.expire_interval_ms),
      engine_(engine),
      stats_(stats),
      ioc_(static_cast<int>(threads_)),
      acceptor_(ioc_) {
    const auto address = boost::asio::ip::make_address(host_);
    const boost::asio::ip::tcp::endpoint endpoint{address, config.port};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    stats_.tcp_port = local_port();
    spdlog::info("Server listening on {}:{} ({} threads)", host_, local_port(), threads_);
}

uint16_t Server::local_port() const {
    return acceptor_.local_endpoint().port();
}

void Server::run() {
    // Install SIGINT / SIGTERM handler for graceful shutdown.
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            spdlog::info("Server: received signal {}, shutting down", signo);
            stop();
        }
    });

    boost::asio::co_spawn(ioc_, accept_loop(), boost::asio::detached);
    if (expire_interval_.count() > 0) {
        boost::asio::co_spawn(ioc_, expire_loop(), boost::asio::detached);
    }

    // Run the io_context across a thread pool.
    std::vector<std::thread> pool;
    pool.reserve(threads_ - 1);
    for (unsigned int i = 1; i < threads_; ++i) {
        pool.emplace_back([this] { ioc_.run(); });
    }

    ioc_.run(); // Run on the calling thread as well.

    for (auto& t : pool) {
        t.join();
    }

    spdlog::info("Server: io_context stopped, all threads joined");
}

void Server::stop() {
    boost::asio::post(ioc_, [this] {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    });
    ioc_.stop();
}

boost::asio::awaitable<void> Server::accept_loop() {
    spdlog::info("Server: accept loop started");

    for (;;) {
        // Each connection gets its own strand; the session and its blocking
        // timers all run there.
        boost::asio::ip::tcp::socket socket{boost::asio::make_strand(ioc_)};
        boost::system::error_code ec;
        co_await acceptor_.async_accept(socket, redirect_error(use_awaitable, ec));

        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                spdlog::warn("Server: accept error: {}", ec.message());
            }
            break; // Acceptor was closed.
        }

        // Disable Nagle.
        socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);

        auto session = std::make_shared<Session>(std::move(socket), engine_, stats_,
                                                 next_client_id_++);
        auto executor = session->get_executor();
        boost::asio::co_spawn(
            executor,
            [sp = std::move(session)]() -> boost::asio::awaitable<void> {
                co_await sp->run();
            },
            boost::asio::detached);
    }

    spdlog::info("Server: accept loop exited");
}

boost::asio::awaitable<void> Server::expire_loop() {
    boost::asio::steady_timer timer{ioc_};
    for (;;) {
        timer.expires_after(expire_interval_);
        boost::system::error_code ec;
        co_await timer.async_wait(redirect_error(use_awaitable, ec));
        if (ec) {
            break;
        }
        if (const auto removed = engine_.storage().purge_expired(kExpireBatch); removed > 0) {
            spdlog::debug("Server: purged {} expired keys", removed);
        }
    }
}

} // namespace ember::network
