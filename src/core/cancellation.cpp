#include "chatrelay/core/cancellation.hpp"

#include <utility>
#include <vector>

namespace chatrelay {

// -- CancellationRegistration --

CancellationRegistration::~CancellationRegistration() {
    reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

CancellationRegistration& CancellationRegistration::operator=(
    CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void CancellationRegistration::reset() {
    if (id_ == 0) return;
    if (auto state = state_.lock()) {
        std::lock_guard lock(state->mtx);
        state->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

// -- CancellationToken --

auto CancellationToken::is_cancelled() const noexcept -> bool {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
}

auto CancellationToken::on_cancel(std::function<void()> callback) const
    -> CancellationRegistration {
    if (!state_) return {};

    {
        std::lock_guard lock(state_->mtx);
        if (!state_->cancelled.load(std::memory_order_acquire)) {
            auto id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return CancellationRegistration(state_, id);
        }
    }

    callback();
    return {};
}

// -- CancellationSource --

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

auto CancellationSource::token() const -> CancellationToken {
    return CancellationToken(state_);
}

void CancellationSource::cancel() {
    std::vector<std::function<void()>> pending;
    {
        std::lock_guard lock(state_->mtx);
        if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        for (auto& [_, cb] : state_->callbacks) {
            pending.push_back(std::move(cb));
        }
        state_->callbacks.clear();
    }

    // Callbacks run outside the lock so they may register or reset freely.
    for (auto& cb : pending) {
        cb();
    }
}

auto CancellationSource::is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
}

} // namespace chatrelay
