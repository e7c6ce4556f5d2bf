#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace chatrelay {

namespace detail {

struct CancellationState {
    std::mutex mtx;
    std::atomic<bool> cancelled{false};
    uint64_t next_id = 1;
    std::map<uint64_t, std::function<void()>> callbacks;
};

} // namespace detail

/// RAII handle for a callback registered on a CancellationToken.
/// Destroying it unregisters the callback if it has not run yet.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    void reset();

private:
    friend class CancellationToken;
    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::weak_ptr<detail::CancellationState> state_;
    uint64_t id_ = 0;
};

/// Observer side of a cancellation request. Copies share state.
/// A default-constructed token is never cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] auto is_cancelled() const noexcept -> bool;
    [[nodiscard]] auto can_be_cancelled() const noexcept -> bool { return state_ != nullptr; }

    /// Registers a callback run once on cancellation, on the cancelling
    /// thread. Runs immediately if the token is already cancelled.
    [[nodiscard]] auto on_cancel(std::function<void()> callback) const
        -> CancellationRegistration;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/// Owner side: hands out tokens and triggers cancellation.
class CancellationSource {
public:
    CancellationSource();

    [[nodiscard]] auto token() const -> CancellationToken;

    /// Thread-safe and idempotent.
    void cancel();

    [[nodiscard]] auto is_cancelled() const noexcept -> bool;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace chatrelay
