#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "cloudbrowser/browser/provisioning.hpp"
#include "cloudbrowser/core/config.hpp"
#include "cloudbrowser/core/error.hpp"
#include "cloudbrowser/pool/session_handle.hpp"

namespace cloudbrowser::pool {

using boost::asio::awaitable;

namespace detail {
struct PoolState;
}

/// How a leased session fared.
enum class ReleaseOutcome {
    Succeeded,  // page fetched, counts against the budget
    Failed,     // page failed, session presumed healthy
    Broken,     // session died remotely, recycle now
};

struct SlotFailure {
    std::size_t slot = 0;
    Error error;
};

struct WarmUpReport {
    std::size_t ready = 0;
    std::vector<SlotFailure> errors;
    bool already_warm = false;
};

struct ShutdownReport {
    std::size_t torn_down = 0;
    std::size_t failed = 0;
    std::size_t abandoned = 0;
    bool already_shut_down = false;
};

struct PoolStats {
    std::size_t slots = 0;
    std::size_t ready = 0;
    std::size_t busy = 0;
    std::size_t starting = 0;
    std::size_t empty = 0;
    std::size_t waiters = 0;
    std::uint64_t sessions_created = 0;
    std::uint64_t sessions_recycled = 0;
    std::uint64_t provisioning_failures = 0;
    std::uint64_t pages_served = 0;
    bool shutting_down = false;
};

/// Exclusive use of one ready session, handed out by acquire_session().
///
/// Return it with BrowserPool::release_session(). A lease destroyed without
/// an explicit release is returned as ReleaseOutcome::Failed.
class SessionLease {
public:
    SessionLease() = default;
    ~SessionLease();

    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;
    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    [[nodiscard]] auto session_id() const -> const std::string& { return handle_->id(); }
    [[nodiscard]] auto slot_index() const -> std::size_t { return handle_->slot_index(); }
    [[nodiscard]] auto proxy() const -> const std::optional<std::string>& { return handle_->proxy(); }
    [[nodiscard]] auto pages_served() const -> std::uint64_t { return handle_->pages_served(); }

    explicit operator bool() const noexcept { return handle_ != nullptr; }

private:
    friend class BrowserPool;
    SessionLease(std::shared_ptr<SessionHandle> handle,
                 std::weak_ptr<detail::PoolState> pool);

    std::shared_ptr<SessionHandle> handle_;
    std::weak_ptr<detail::PoolState> pool_;
};

/// A fixed number of slots, each holding at most one live remote browser
/// session.
///
/// Sessions are provisioned through a StartupGate that bounds concurrent
/// provisioning calls, handed out to one caller at a time, and recycled
/// (torn down and re-provisioned in the same slot) when they reach their
/// page budget or break. Waiting callers are served in arrival order.
///
/// All coroutines run on an internal strand over the given io_context.
/// release_session() and stats() may be called from any thread.
class BrowserPool {
public:
    /// Validate the configuration and build the pool. No session is
    /// provisioned until warm_up() or the first acquire_session().
    static auto create(boost::asio::io_context& ioc, PoolConfig config,
                       std::shared_ptr<browser::ProvisioningApi> api)
        -> Result<std::unique_ptr<BrowserPool>>;

    ~BrowserPool();

    BrowserPool(const BrowserPool&) = delete;
    BrowserPool& operator=(const BrowserPool&) = delete;

    /// Provision every empty slot concurrently and wait until each is ready
    /// or has exhausted its attempts. Starts the heartbeat. Subsequent calls
    /// return an empty report with already_warm set.
    auto warm_up() -> awaitable<WarmUpReport>;

    /// Lease a ready session, waiting for one if necessary.
    /// Errors: PoolShutDown, Timeout, ProvisioningError (every slot failed
    /// while waiting).
    auto acquire_session(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> awaitable<Result<SessionLease>>;

    /// Return a leased session and account for the page.
    void release_session(SessionLease lease, ReleaseOutcome outcome);

    /// Stop handing out sessions, wake all waiters, tear down every live
    /// session and wait for the teardowns up to the deadline
    /// (SHUTDOWN_TIMEOUT_MS when not given).
    auto shutdown(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> awaitable<ShutdownReport>;

    [[nodiscard]] auto stats() const -> PoolStats;
    [[nodiscard]] auto config() const -> const PoolConfig&;
    [[nodiscard]] auto is_shutting_down() const -> bool;

private:
    friend class SessionLease;

    explicit BrowserPool(std::shared_ptr<detail::PoolState> state);

    static auto acquire_impl(std::shared_ptr<detail::PoolState> s,
                             std::optional<std::chrono::milliseconds> timeout)
        -> awaitable<Result<SessionLease>>;

    static void release_handle(const std::shared_ptr<detail::PoolState>& s,
                               std::shared_ptr<SessionHandle> handle,
                               ReleaseOutcome outcome);

    std::shared_ptr<detail::PoolState> state_;
};

auto to_string(ReleaseOutcome outcome) -> std::string_view;

} // namespace cloudbrowser::pool
