#pragma once

#include "storage/keyspace_listener.hpp"
#include "storage/value.hpp"

#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <spdlog/spdlog.h>

namespace ember::blocking {

using ClientId = uint64_t;

// Monotonic wall-time used for blocking deadlines.  std::nullopt waits forever.
using Deadline = std::optional<std::chrono::steady_clock::time_point>;

enum class WaiterState : uint8_t {
    Registered,
    Satisfied,
    TimedOut,
    Cancelled,
};

[[nodiscard]] const char* to_string(WaiterState state) noexcept;

// One XREAD stream: deliver entries strictly greater than `after`.
struct StreamWatch {
    std::string key;
    StreamId after;
};

struct WaitResult {
    WaiterState state = WaiterState::Registered;
    // BLPOP only: {key, element} handed over by the pushing client.
    std::optional<std::pair<std::string, std::string>> popped;
};

// ── Waiter ───────────────────────────────────────────────────────────────────
//
// A client suspended in BLPOP or XREAD BLOCK.  The timer lives on the owning
// session's strand and doubles as the wake-up signal: it fires on its own at
// the deadline, and the coordinator cancels it (through a post to the strand)
// when the waiter is satisfied or cancelled.

class Waiter {
public:
    enum class Kind : uint8_t {
        ListPop,
        StreamRead,
    };

    Waiter(uint64_t id, ClientId client, Kind kind, std::vector<std::string> keys,
           std::vector<StreamWatch> watches, Deadline deadline,
           boost::asio::any_io_executor executor);

    [[nodiscard]] uint64_t id() const noexcept { return id_; }
    [[nodiscard]] ClientId client() const noexcept { return client_; }
    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return keys_; }
    [[nodiscard]] Deadline deadline() const noexcept { return deadline_; }

private:
    friend class BlockingCoordinator;

    // True if an append of `id` to `key` is past this waiter's threshold.
    [[nodiscard]] bool wants(const std::string& key, const StreamId& id) const;

    uint64_t id_;
    ClientId client_;
    Kind kind_;
    std::vector<std::string> keys_;
    std::vector<StreamWatch> watches_;
    Deadline deadline_;

    // Guarded by the coordinator mutex.
    WaiterState state_ = WaiterState::Registered;
    std::optional<std::pair<std::string, std::string>> popped_;

    // Touched only on the owning strand.
    boost::asio::steady_timer timer_;
};

// ── BlockingCoordinator ──────────────────────────────────────────────────────
//
// Tracks blocked clients per key and wakes them when the store changes.
//
//   - BLPOP waiters are served first-come first-served: on_list_push pops one
//     element per waiter, in registration order, and hands it over.
//   - XREAD waiters are woken together: every waiter whose threshold for the
//     key is below the new ID is satisfied and re-reads the stream itself.
//
// A waiter leaves Registered exactly once; whichever of satisfy, timeout and
// cancel gets the coordinator mutex first decides the outcome.
//
// Thread-safe.  register_*() must be called with the storage lock held so a
// push cannot slip in between a failed read and the registration; the
// KeyspaceListener callbacks already run under that lock.

class BlockingCoordinator final : public KeyspaceListener {
public:
    explicit BlockingCoordinator(std::shared_ptr<spdlog::logger> logger = {});

    BlockingCoordinator(const BlockingCoordinator&)            = delete;
    BlockingCoordinator& operator=(const BlockingCoordinator&) = delete;

    // Register a BLPOP waiter on `keys`.  A client has at most one waiter; a
    // previous one is cancelled.
    [[nodiscard]] std::shared_ptr<Waiter>
    register_list_waiter(ClientId client, std::vector<std::string> keys,
                         Deadline deadline, boost::asio::any_io_executor executor);

    // Register an XREAD BLOCK waiter on `watches`.
    [[nodiscard]] std::shared_ptr<Waiter>
    register_stream_waiter(ClientId client, std::vector<StreamWatch> watches,
                           Deadline deadline, boost::asio::any_io_executor executor);

    // Suspend until the waiter is satisfied, times out or is cancelled.
    // Must be awaited on the executor the waiter was registered with.
    [[nodiscard]] boost::asio::awaitable<WaitResult> wait(std::shared_ptr<Waiter> waiter);

    // Cancel the waiter owned by `client`, if any (client disconnected).
    void cancel_client(ClientId client);

    // Like cancel_client(), but without waking the waiter's coroutine.  For
    // connection teardown, when nothing is awaiting any more and the strand
    // may already be gone.
    void release_client(ClientId client);

    // Number of clients currently blocked.
    [[nodiscard]] std::size_t blocked_clients() const;

    // Number of waiters registered on `key` (lists and streams).
    [[nodiscard]] std::size_t waiters_on(const std::string& key) const;

    // ── KeyspaceListener ─────────────────────────────────────────────────────

    void on_list_push(const std::string& key, List& list) override;
    void on_stream_append(const std::string& key, const StreamId& id) override;

private:
    using WaiterQueue = std::list<std::shared_ptr<Waiter>>;

    std::shared_ptr<Waiter> add_locked(std::shared_ptr<Waiter> waiter);

    // Move `waiter` out of Registered and drop it from every index.  When
    // `wake` is set the timer is cancelled on the waiter's strand.
    void resolve_locked(const std::shared_ptr<Waiter>& waiter, WaiterState state,
                        bool wake);

    [[nodiscard]] std::unordered_map<std::string, WaiterQueue>&
    index_for(Waiter::Kind kind) noexcept {
        return kind == Waiter::Kind::ListPop ? list_waiters_ : stream_waiters_;
    }

    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
    std::unordered_map<std::string, WaiterQueue> list_waiters_;
    std::unordered_map<std::string, WaiterQueue> stream_waiters_;
    std::unordered_map<ClientId, std::shared_ptr<Waiter>> by_client_;
};

} // namespace ember::blocking
