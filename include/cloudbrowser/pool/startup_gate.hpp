#pragma once

#include <cstddef>
#include <memory>
#include <optional>

#include <boost/asio/awaitable.hpp>

#include "cloudbrowser/core/error.hpp"

namespace cloudbrowser::pool {

using boost::asio::awaitable;

/// Counting admission control for provisioning calls.
///
/// At most capacity() permits are outstanding. Waiters are served strictly
/// in arrival order: a released permit is handed directly to the oldest
/// waiter, so a newcomer can never overtake the queue. cancel() fails every
/// queued and future acquisition with PoolShutDown.
///
/// Thread-safe.
class StartupGate {
    struct State;

public:
    /// Move-only token for one admission. Released on destruction.
    class Permit {
    public:
        Permit() = default;
        ~Permit();

        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        /// Return the permit early. No-op if already released.
        void release() noexcept;

        explicit operator bool() const noexcept { return state_ != nullptr; }

    private:
        friend class StartupGate;
        explicit Permit(std::shared_ptr<State> state) : state_(std::move(state)) {}

        std::shared_ptr<State> state_;
    };

    explicit StartupGate(std::size_t capacity);
    ~StartupGate();

    StartupGate(const StartupGate&) = delete;
    StartupGate& operator=(const StartupGate&) = delete;

    /// Suspend until a permit is available. Fails with PoolShutDown once
    /// cancel() has been called.
    auto acquire() -> awaitable<Result<Permit>>;

    /// Take a permit only if one is free and nobody is queued.
    auto try_acquire() -> std::optional<Permit>;

    /// Fail all queued and future acquisitions. Outstanding permits stay
    /// valid and are simply dropped when released.
    void cancel();

    [[nodiscard]] auto capacity() const noexcept -> std::size_t;
    [[nodiscard]] auto in_flight() const -> std::size_t;
    [[nodiscard]] auto waiting() const -> std::size_t;
    [[nodiscard]] auto cancelled() const -> bool;

private:
    std::shared_ptr<State> state_;
};

} // namespace cloudbrowser::pool
