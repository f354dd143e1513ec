#include "cloudbrowser/pool/startup_gate.hpp"

#include <deque>
#include <mutex>
#include <vector>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace cloudbrowser::pool {

namespace net = boost::asio;

namespace {

using grant_channel_t = net::experimental::concurrent_channel<void(
    boost::system::error_code, bool)>;

/// One queued acquisition. The channel has room for the single grant or
/// cancellation, so a signal sent before the waiter suspends is not lost.
struct Waiter {
    explicit Waiter(net::any_io_executor ex) : channel(std::move(ex), 1) {}
    grant_channel_t channel;
};

} // anonymous namespace

struct StartupGate::State {
    explicit State(std::size_t cap) : capacity(cap) {}

    const std::size_t capacity;
    mutable std::mutex mutex;
    std::size_t in_flight = 0;
    bool cancelled = false;
    std::deque<std::shared_ptr<Waiter>> waiters;

    void release_one() {
        std::shared_ptr<Waiter> next;
        {
            std::lock_guard lock(mutex);
            if (!waiters.empty() && !cancelled) {
                // Direct handoff: in_flight is unchanged.
                next = std::move(waiters.front());
                waiters.pop_front();
            } else if (in_flight > 0) {
                --in_flight;
            }
        }
        if (next) {
            next->channel.try_send(boost::system::error_code{}, true);
        }
    }
};

// ---------------------------------------------------------------------------
// Permit
// ---------------------------------------------------------------------------

StartupGate::Permit::~Permit() {
    release();
}

StartupGate::Permit::Permit(Permit&& other) noexcept
    : state_(std::move(other.state_)) {}

auto StartupGate::Permit::operator=(Permit&& other) noexcept -> Permit& {
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
    }
    return *this;
}

void StartupGate::Permit::release() noexcept {
    if (auto s = std::move(state_)) {
        s->release_one();
    }
}

// ---------------------------------------------------------------------------
// StartupGate
// ---------------------------------------------------------------------------

StartupGate::StartupGate(std::size_t capacity)
    : state_(std::make_shared<State>(capacity == 0 ? 1 : capacity)) {}

StartupGate::~StartupGate() {
    cancel();
}

auto StartupGate::acquire() -> awaitable<Result<Permit>> {
    auto s = state_;
    auto executor = co_await net::this_coro::executor;

    std::shared_ptr<Waiter> waiter;
    bool granted = false;
    bool cancelled = false;
    {
        std::lock_guard lock(s->mutex);
        if (s->cancelled) {
            cancelled = true;
        } else if (s->in_flight < s->capacity && s->waiters.empty()) {
            ++s->in_flight;
            granted = true;
        } else {
            waiter = std::make_shared<Waiter>(executor);
            s->waiters.push_back(waiter);
        }
    }

    if (cancelled) {
        co_return make_fail(make_error(ErrorCode::PoolShutDown,
                                       "Startup gate cancelled"));
    }
    if (granted) {
        co_return Permit(s);
    }

    auto [ec, ok] = co_await waiter->channel.async_receive(
        net::as_tuple(net::use_awaitable));
    if (ec || !ok) {
        co_return make_fail(make_error(ErrorCode::PoolShutDown,
                                       "Startup gate cancelled"));
    }
    co_return Permit(s);
}

auto StartupGate::try_acquire() -> std::optional<Permit> {
    std::lock_guard lock(state_->mutex);
    if (state_->cancelled || !state_->waiters.empty()
        || state_->in_flight >= state_->capacity) {
        return std::nullopt;
    }
    ++state_->in_flight;
    return Permit(state_);
}

void StartupGate::cancel() {
    std::deque<std::shared_ptr<Waiter>> drained;
    {
        std::lock_guard lock(state_->mutex);
        state_->cancelled = true;
        drained.swap(state_->waiters);
    }
    for (auto& w : drained) {
        w->channel.try_send(boost::system::error_code{}, false);
    }
}

auto StartupGate::capacity() const noexcept -> std::size_t {
    return state_->capacity;
}

auto StartupGate::in_flight() const -> std::size_t {
    std::lock_guard lock(state_->mutex);
    return state_->in_flight;
}

auto StartupGate::waiting() const -> std::size_t {
    std::lock_guard lock(state_->mutex);
    return state_->waiters.size();
}

auto StartupGate::cancelled() const -> bool {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
}

} // namespace cloudbrowser::pool
