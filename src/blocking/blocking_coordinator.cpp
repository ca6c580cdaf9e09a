#include "blocking/blocking_coordinator.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace ember::blocking {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;

const char* to_string(WaiterState state) noexcept {
    switch (state) {
        case WaiterState::Registered: return "registered";
        case WaiterState::Satisfied:  return "satisfied";
        case WaiterState::TimedOut:   return "timed out";
        case WaiterState::Cancelled:  return "cancelled";
    }
    return "unknown";
}

// ── Waiter ───────────────────────────────────────────────────────────────────

Waiter::Waiter(uint64_t id, ClientId client, Kind kind, std::vector<std::string> keys,
               std::vector<StreamWatch> watches, Deadline deadline,
               boost::asio::any_io_executor executor)
    : id_(id)
    , client_(client)
    , kind_(kind)
    , keys_(std::move(keys))
    , watches_(std::move(watches))
    , deadline_(deadline)
    , timer_(std::move(executor))
{
    if (deadline_) {
        timer_.expires_at(*deadline_);
    } else {
        timer_.expires_at(boost::asio::steady_timer::time_point::max());
    }
}

bool Waiter::wants(const std::string& key, const StreamId& id) const {
    return std::any_of(watches_.begin(), watches_.end(), [&](const StreamWatch& w) {
        return w.key == key && w.after < id;
    });
}

// ── BlockingCoordinator ──────────────────────────────────────────────────────

BlockingCoordinator::BlockingCoordinator(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

std::shared_ptr<Waiter>
BlockingCoordinator::register_list_waiter(ClientId client, std::vector<std::string> keys,
                                          Deadline deadline,
                                          boost::asio::any_io_executor executor) {
    std::lock_guard lock(mutex_);
    return add_locked(std::make_shared<Waiter>(next_id_++, client, Waiter::Kind::ListPop,
                                               std::move(keys),
                                               std::vector<StreamWatch>{}, deadline,
                                               std::move(executor)));
}

std::shared_ptr<Waiter>
BlockingCoordinator::register_stream_waiter(ClientId client,
                                            std::vector<StreamWatch> watches,
                                            Deadline deadline,
                                            boost::asio::any_io_executor executor) {
    std::vector<std::string> keys;
    keys.reserve(watches.size());
    for (const auto& w : watches) {
        if (std::find(keys.begin(), keys.end(), w.key) == keys.end()) {
            keys.push_back(w.key);
        }
    }

    std::lock_guard lock(mutex_);
    return add_locked(std::make_shared<Waiter>(next_id_++, client,
                                               Waiter::Kind::StreamRead, std::move(keys),
                                               std::move(watches), deadline,
                                               std::move(executor)));
}

std::shared_ptr<Waiter> BlockingCoordinator::add_locked(std::shared_ptr<Waiter> waiter) {
    if (auto it = by_client_.find(waiter->client()); it != by_client_.end()) {
        auto previous = it->second;
        resolve_locked(previous, WaiterState::Cancelled, true);
    }

    auto& index = index_for(waiter->kind());
    std::vector<std::string> seen;
    for (const auto& key : waiter->keys()) {
        // BLPOP a a b: queue once per key.
        if (std::find(seen.begin(), seen.end(), key) != seen.end()) {
            continue;
        }
        seen.push_back(key);
        index[key].push_back(waiter);
    }
    by_client_.emplace(waiter->client(), waiter);

    if (logger_) {
        logger_->debug("client {} blocked on {} key(s) (waiter {})", waiter->client(),
                       waiter->keys().size(), waiter->id());
    }
    return waiter;
}

void BlockingCoordinator::resolve_locked(const std::shared_ptr<Waiter>& waiter,
                                         WaiterState state, bool wake) {
    if (waiter->state_ != WaiterState::Registered) {
        return;
    }
    waiter->state_ = state;

    auto& index = index_for(waiter->kind());
    for (const auto& key : waiter->keys()) {
        auto it = index.find(key);
        if (it == index.end()) {
            continue;
        }
        it->second.remove(waiter);
        if (it->second.empty()) {
            index.erase(it);
        }
    }
    if (auto it = by_client_.find(waiter->client());
        it != by_client_.end() && it->second == waiter) {
        by_client_.erase(it);
    }

    if (logger_) {
        logger_->debug("waiter {} of client {} {}", waiter->id(), waiter->client(),
                       to_string(state));
    }

    if (wake) {
        boost::asio::post(waiter->timer_.get_executor(),
                          [waiter] { waiter->timer_.cancel(); });
    }
}

awaitable<WaitResult> BlockingCoordinator::wait(std::shared_ptr<Waiter> waiter) {
    bool pending = false;
    {
        std::lock_guard lock(mutex_);
        pending = waiter->state_ == WaiterState::Registered;
    }

    boost::system::error_code ec;
    if (pending) {
        co_await waiter->timer_.async_wait(redirect_error(use_awaitable, ec));
    }

    WaitResult result;
    {
        std::lock_guard lock(mutex_);
        // Still registered: the timer ran out on its own (or the io_context is
        // shutting down and aborted it).
        resolve_locked(waiter,
                       ec ? WaiterState::Cancelled : WaiterState::TimedOut, false);
        result.state = waiter->state_;
        result.popped = std::move(waiter->popped_);
    }
    co_return result;
}

void BlockingCoordinator::cancel_client(ClientId client) {
    std::lock_guard lock(mutex_);
    auto it = by_client_.find(client);
    if (it == by_client_.end()) {
        return;
    }
    auto waiter = it->second;
    resolve_locked(waiter, WaiterState::Cancelled, true);
}

void BlockingCoordinator::release_client(ClientId client) {
    std::lock_guard lock(mutex_);
    auto it = by_client_.find(client);
    if (it == by_client_.end()) {
        return;
    }
    auto waiter = it->second;
    resolve_locked(waiter, WaiterState::Cancelled, false);
}

std::size_t BlockingCoordinator::blocked_clients() const {
    std::lock_guard lock(mutex_);
    return by_client_.size();
}

std::size_t BlockingCoordinator::waiters_on(const std::string& key) const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    if (auto it = list_waiters_.find(key); it != list_waiters_.end()) {
        n += it->second.size();
    }
    if (auto it = stream_waiters_.find(key); it != stream_waiters_.end()) {
        n += it->second.size();
    }
    return n;
}

void BlockingCoordinator::on_list_push(const std::string& key, List& list) {
    std::lock_guard lock(mutex_);
    while (!list.empty()) {
        auto it = list_waiters_.find(key);
        if (it == list_waiters_.end()) {
            return;
        }
        auto waiter = it->second.front();
        waiter->popped_.emplace(key, std::move(list.front()));
        list.pop_front();
        resolve_locked(waiter, WaiterState::Satisfied, true);
    }
}

void BlockingCoordinator::on_stream_append(const std::string& key, const StreamId& id) {
    std::lock_guard lock(mutex_);
    auto it = stream_waiters_.find(key);
    if (it == stream_waiters_.end()) {
        return;
    }

    std::vector<std::shared_ptr<Waiter>> ready;
    for (const auto& waiter : it->second) {
        if (waiter->wants(key, id)) {
            ready.push_back(waiter);
        }
    }
    // resolve_locked() edits the queue, so wake after the scan.
    for (const auto& waiter : ready) {
        resolve_locked(waiter, WaiterState::Satisfied, true);
    }
}

} // namespace ember::blocking
