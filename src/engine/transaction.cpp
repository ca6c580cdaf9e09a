#include "engine/transaction.hpp"

#include "common/errors.hpp"

namespace ember::engine {

std::error_code TransactionContext::begin() {
    if (state_ == State::Queuing) {
        return Errc::nested_multi;
    }
    state_ = State::Queuing;
    return {};
}

void TransactionContext::queue(Request request) {
    queue_.push_back(std::move(request));
}

std::error_code TransactionContext::take(std::vector<Request>& out) {
    if (state_ != State::Queuing) {
        return Errc::exec_without_multi;
    }
    if (dirty_) {
        reset();
        return Errc::exec_aborted;
    }
    out = std::move(queue_);
    reset();
    return {};
}

std::error_code TransactionContext::discard() {
    if (state_ != State::Queuing) {
        return Errc::discard_without_multi;
    }
    reset();
    return {};
}

void TransactionContext::reset() noexcept {
    state_ = State::Idle;
    dirty_ = false;
    queue_.clear();
}

} // namespace ember::engine
