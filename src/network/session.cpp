#include "network/session.hpp"
#include "engine/session_dispatcher.hpp"
#include "network/resp_protocol.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <string>

namespace ember::network {

namespace {

using boost::asio::redirect_error;
using boost::asio::use_awaitable;

constexpr std::size_t kReadChunk = 16 * 1024;

bool is_disconnect(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::operation_aborted;
}

} // namespace

Session::Session(boost::asio::ip::tcp::socket socket, engine::CommandEngine& engine,
                 ServerStats& stats, blocking::ClientId id)
    : socket_(std::move(socket)),
      engine_(engine),
      stats_(stats),
      id_(id),
      watch_exited_(socket_.get_executor()) {
    stats_.connected_clients.fetch_add(1, std::memory_order_relaxed);
    stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
}

Session::~Session() {
    engine_.coordinator().release_client(id_);
    stats_.connected_clients.fetch_sub(1, std::memory_order_relaxed);
}

boost::asio::awaitable<void> Session::run() {
    remote_ = [&]() -> std::string {
        boost::system::error_code ec;
        const auto ep = socket_.remote_endpoint(ec);
        return ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
    }();

    spdlog::debug("Session {}: client {} connected", remote_, id_);

    engine::ClientContext client;
    client.id = id_;
    client.executor = co_await boost::asio::this_coro::executor;
    client.on_block = [this] { start_watch(); };
    engine::SessionDispatcher dispatcher{engine_, stats_, std::move(client)};

    RespDecoder decoder;
    std::array<char, kReadChunk> chunk{};
    std::string wire;
    bool open = true;

    while (open) {
        boost::system::error_code ec;
        const std::size_t n = co_await socket_.async_read_some(
            boost::asio::buffer(chunk), redirect_error(use_awaitable, ec));

        if (ec) {
            if (!is_disconnect(ec)) {
                spdlog::warn("Session {}: read error: {}", remote_, ec.message());
            }
            break;
        }
        decoder.feed(std::string_view{chunk.data(), n});

        for (;;) {
            auto decoded = decoder.next();
            if (std::holds_alternative<NeedMoreBytes>(decoded)) {
                break;
            }

            wire.clear();
            if (const auto* err = std::get_if<ProtocolError>(&decoded)) {
                spdlog::debug("Session {}: {}", remote_, err->message);
                serialize_reply(Reply::error("ERR " + err->message), wire);
                open = false;
            } else {
                Reply reply = co_await dispatcher.dispatch(std::get<Request>(decoded));
                co_await stop_watch();
                if (peer_closed_) {
                    spdlog::debug("Session {}: client went away while blocked", remote_);
                    open = false;
                    break;
                }
                if (!pending_.empty()) {
                    decoder.feed(pending_);
                    pending_.clear();
                }
                serialize_reply(reply, wire);
            }

            boost::system::error_code wec;
            co_await boost::asio::async_write(
                socket_, boost::asio::buffer(wire), redirect_error(use_awaitable, wec));
            if (wec) {
                if (!is_disconnect(wec)) {
                    spdlog::warn("Session {}: write error: {}", remote_, wec.message());
                }
                open = false;
            }
            if (!open) {
                break;
            }
        }
    }

    boost::system::error_code ignored;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);

    spdlog::debug("Session {}: client {} disconnected", remote_, id_);
}

void Session::start_watch() {
    if (watching_) {
        return;
    }
    watching_ = true;
    stop_requested_ = false;
    watch_exited_.expires_at(boost::asio::steady_timer::time_point::max());
    boost::asio::co_spawn(
        socket_.get_executor(),
        [self = shared_from_this()]() -> boost::asio::awaitable<void> {
            co_await self->watch_disconnect();
        },
        boost::asio::detached);
}

boost::asio::awaitable<void> Session::stop_watch() {
    if (!watching_) {
        co_return;
    }
    stop_requested_ = true;
    boost::system::error_code ignored;
    // Only the watcher's read is outstanding while a command runs.
    socket_.cancel(ignored);
    co_await watch_exited_.async_wait(redirect_error(use_awaitable, ignored));
}

boost::asio::awaitable<void> Session::watch_disconnect() {
    for (;;) {
        boost::system::error_code ec;
        const std::size_t n = co_await socket_.async_read_some(
            boost::asio::buffer(watch_buf_), redirect_error(use_awaitable, ec));
        pending_.append(watch_buf_.data(), n);

        if (ec == boost::asio::error::operation_aborted || (!ec && stop_requested_)) {
            break;
        }
        if (ec) {
            spdlog::debug("Session {}: disconnect detected while blocked", remote_);
            peer_closed_ = true;
            engine_.coordinator().cancel_client(id_);
            break;
        }
    }
    watching_ = false;
    watch_exited_.cancel();
}

} // namespace ember::network
