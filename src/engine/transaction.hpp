#pragma once

#include "network/reply.hpp"

#include <cstdint>
#include <system_error>
#include <vector>

namespace ember::engine {

// ── TransactionContext ───────────────────────────────────────────────────────
//
// Per-connection MULTI / EXEC / DISCARD state.
//
//   Idle ──MULTI──► Queuing ──EXEC/DISCARD──► Idle
//
// While Queuing, requests that passed the existence/arity check are queued;
// a request that failed it marks the transaction dirty, and EXEC then aborts.
//
// NOT thread-safe: owned by one session.

class TransactionContext {
public:
    enum class State : uint8_t {
        Idle,
        Queuing,
    };

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] bool queuing() const noexcept { return state_ == State::Queuing; }
    [[nodiscard]] bool dirty() const noexcept { return dirty_; }
    [[nodiscard]] std::size_t queued() const noexcept { return queue_.size(); }

    // MULTI.  Errc::nested_multi if already queuing.
    [[nodiscard]] std::error_code begin();

    void queue(Request request);

    void mark_dirty() noexcept { dirty_ = true; }

    // EXEC.  On success `out` receives the queued requests in order.  Either
    // way the context is back to Idle, except for Errc::exec_without_multi.
    [[nodiscard]] std::error_code take(std::vector<Request>& out);

    // DISCARD.  Errc::discard_without_multi if not queuing.
    [[nodiscard]] std::error_code discard();

private:
    void reset() noexcept;

    State state_ = State::Idle;
    bool dirty_ = false;
    std::vector<Request> queue_;
};

} // namespace ember::engine
