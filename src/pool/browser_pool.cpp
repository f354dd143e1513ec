#include "cloudbrowser/pool/browser_pool.hpp"
#include "cloudbrowser/core/logger.hpp"
#include "cloudbrowser/core/utils.hpp"
#include "cloudbrowser/pool/proxy_assigner.hpp"
#include "cloudbrowser/pool/startup_gate.hpp"

#include <algorithm>
#include <deque>
#include <exception>
#include <mutex>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace cloudbrowser::pool {

namespace net = boost::asio;
using clock_type = std::chrono::steady_clock;

namespace detail {

/// A suspended acquire_session() call. Woken by cancelling its timer on the
/// pool strand; the outcome is left in the fields under the pool mutex.
struct Waiter {
    explicit Waiter(net::any_io_executor ex)
        : timer(std::move(ex), net::steady_timer::time_point::max()) {}

    net::steady_timer timer;
    std::uint64_t ticket = 0;
    bool notified = false;
    std::shared_ptr<SessionHandle> handle;
    std::optional<Error> failure;
};

struct Slot {
    std::shared_ptr<SessionHandle> handle;
    bool refilling = false;
    std::optional<Error> last_error;
};

/// Completion counter for fanned-out tasks. Only touched on the strand.
struct Join {
    Join(net::any_io_executor ex, std::size_t n)
        : timer(std::move(ex), net::steady_timer::time_point::max()), remaining(n) {}

    void done() {
        if (remaining > 0 && --remaining == 0) {
            timer.cancel();
        }
    }

    net::steady_timer timer;
    std::size_t remaining;
};

struct PoolState {
    PoolState(net::io_context& ioc, PoolConfig cfg,
              std::shared_ptr<browser::ProvisioningApi> provisioning)
        : strand(net::make_strand(ioc))
        , config(std::move(cfg))
        , api(std::move(provisioning))
        , gate(static_cast<std::size_t>(config.start_semaphores))
        , proxies(config.proxies, config.proxy_ordering)
        , slots(static_cast<std::size_t>(config.num_browsers))
        , heartbeat_timer(strand) {}

    net::strand<net::io_context::executor_type> strand;
    const PoolConfig config;
    std::shared_ptr<browser::ProvisioningApi> api;
    StartupGate gate;

    mutable std::mutex mutex;
    ProxyAssigner proxies;
    std::vector<Slot> slots;
    std::deque<std::shared_ptr<Waiter>> waiters;  // ordered by ticket
    std::uint64_t next_ticket = 0;
    bool shutting_down = false;
    bool shutdown_started = false;
    bool warmed = false;
    net::steady_timer heartbeat_timer;

    std::uint64_t sessions_created = 0;
    std::uint64_t sessions_recycled = 0;
    std::uint64_t provisioning_failures = 0;
    std::uint64_t pages_served = 0;

    // --- everything below expects mutex to be held ---

    void enqueue_locked(const std::shared_ptr<Waiter>& w) {
        auto pos = std::ranges::upper_bound(
            waiters, w->ticket, {}, [](const std::shared_ptr<Waiter>& other) {
                return other->ticket;
            });
        waiters.insert(pos, w);
    }

    static void wake(const std::shared_ptr<Waiter>& w, net::any_io_executor ex) {
        w->notified = true;
        net::post(ex, [w] { w->timer.cancel(); });
    }

    /// Hand a ready handle to the oldest waiter, or leave it ready.
    void offer_locked(const std::shared_ptr<SessionHandle>& handle) {
        if (waiters.empty()) return;
        auto w = std::move(waiters.front());
        waiters.pop_front();
        handle->mark_busy();
        w->handle = handle;
        wake(w, strand);
    }

    void fail_waiters_locked(const Error& error) {
        auto drained = std::move(waiters);
        waiters.clear();
        for (auto& w : drained) {
            w->failure = error;
            wake(w, strand);
        }
    }

    void wake_all_locked() {
        auto drained = std::move(waiters);
        waiters.clear();
        for (auto& w : drained) {
            wake(w, strand);
        }
    }

    auto take_ready_locked() -> std::shared_ptr<SessionHandle> {
        for (auto& slot : slots) {
            if (slot.handle && slot.handle->mark_busy()) {
                return slot.handle;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto any_live_locked() const -> bool {
        return std::ranges::any_of(slots, [](const Slot& slot) {
            return slot.refilling || (slot.handle && !slot.handle->is_dead());
        });
    }

    [[nodiscard]] auto last_failure_locked() const -> Error {
        for (const auto& slot : slots) {
            if (slot.last_error) return *slot.last_error;
        }
        return make_error(ErrorCode::ProvisioningError, "All browser slots are empty");
    }
};

} // namespace detail

namespace {

using detail::PoolState;

void log_task_failure(std::exception_ptr ep, std::string_view task) {
    if (!ep) return;
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        LOG_ERROR("Pool task '{}' threw: {}", task, e.what());
    }
}

auto teardown(std::shared_ptr<browser::ProvisioningApi> api, std::string session_id)
    -> awaitable<Result<void>> {
    auto result = co_await api->destroy_session(session_id);
    if (!result) {
        LOG_WARN("Teardown of session {} failed: {}", session_id, result.error().what());
    } else {
        LOG_DEBUG("Session {} torn down", session_id);
    }
    co_return result;
}

void spawn_teardown_locked(PoolState& s, std::string session_id) {
    net::co_spawn(s.strand, teardown(s.api, std::move(session_id)),
                  [](std::exception_ptr ep, Result<void>) {
                      log_task_failure(ep, "teardown");
                  });
}

auto create_handle(std::shared_ptr<PoolState> s, std::size_t slot_index)
    -> awaitable<Result<void>>;

void spawn_refill_locked(const std::shared_ptr<PoolState>& s, std::size_t slot_index) {
    s->slots[slot_index].refilling = true;
    net::co_spawn(s->strand, create_handle(s, slot_index),
                  [](std::exception_ptr ep, Result<void>) {
                      log_task_failure(ep, "refill");
                  });
}

/// Retire the slot's handle and start provisioning its replacement.
void recycle_locked(const std::shared_ptr<PoolState>& s,
                    const std::shared_ptr<SessionHandle>& handle,
                    std::string_view reason) {
    if (!handle->mark_dead()) return;

    auto& slot = s->slots[handle->slot_index()];
    if (slot.handle == handle) {
        slot.handle.reset();
    }
    ++s->sessions_recycled;
    LOG_INFO("Recycling session {} in slot {} ({}, {} pages)", handle->id(),
             handle->slot_index(), reason, handle->pages_served());

    if (!handle->id().empty()) {
        spawn_teardown_locked(*s, handle->id());
    }
    if (!s->shutting_down && !slot.refilling) {
        spawn_refill_locked(s, handle->slot_index());
    }
}

auto create_handle(std::shared_ptr<PoolState> s, std::size_t slot_index)
    -> awaitable<Result<void>> {
    const auto attempts = std::max(1, s->config.provision_attempts);
    Error last_error = make_error(ErrorCode::ProvisioningError,
                                  "No provisioning attempt made");

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto permit = co_await s->gate.acquire();
        if (!permit) {
            std::lock_guard lock(s->mutex);
            s->slots[slot_index].refilling = false;
            co_return make_fail(permit.error());
        }

        std::shared_ptr<SessionHandle> handle;
        browser::SessionRequest request;
        {
            std::lock_guard lock(s->mutex);
            if (s->shutting_down) {
                s->slots[slot_index].refilling = false;
            } else {
                handle = std::make_shared<SessionHandle>(
                    slot_index, s->proxies.assign(slot_index));
                s->slots[slot_index].handle = handle;
                request.proxy = handle->proxy();
                request.browser_settings = s->config.browser_settings;
                request.fingerprint = s->config.fingerprint;
            }
        }
        if (!handle) {
            co_return make_fail(make_error(ErrorCode::PoolShutDown,
                                           "Pool is shutting down"));
        }

        LOG_DEBUG("Provisioning slot {} attempt {}/{} (proxy={})", slot_index,
                  attempt, attempts,
                  handle->proxy() ? utils::redact_url_credentials(*handle->proxy())
                                  : std::string("none"));

        auto session_id = co_await s->api->create_session(std::move(request));

        bool orphaned = false;
        {
            std::lock_guard lock(s->mutex);
            auto& slot = s->slots[slot_index];
            if (session_id) {
                if (s->shutting_down || handle->is_dead()) {
                    orphaned = true;
                    slot.refilling = false;
                } else {
                    handle->mark_ready(*session_id);
                    slot.refilling = false;
                    slot.last_error.reset();
                    ++s->sessions_created;
                    // Visible to waiters before the permit admits the next refill.
                    s->offer_locked(handle);
                }
            } else {
                handle->mark_dead();
                if (slot.handle == handle) {
                    slot.handle.reset();
                }
                ++s->provisioning_failures;
                last_error = session_id.error();
                slot.last_error = last_error;
            }
        }
        permit->release();

        if (session_id && orphaned) {
            LOG_DEBUG("Slot {} provisioned during shutdown, releasing {}",
                      slot_index, *session_id);
            co_await teardown(s->api, *session_id);
            co_return make_fail(make_error(ErrorCode::PoolShutDown,
                                           "Pool is shutting down"));
        }
        if (session_id) {
            LOG_INFO("Slot {} ready with session {}", slot_index, *session_id);
            co_return ok_result();
        }

        LOG_WARN("Slot {} provisioning attempt {}/{} failed: {}", slot_index,
                 attempt, attempts, last_error.what());

        if (attempt < attempts) {
            net::steady_timer delay(s->strand);
            delay.expires_after(std::chrono::milliseconds(
                static_cast<long long>(s->config.provision_retry_delay_ms) * attempt));
            co_await delay.async_wait(net::as_tuple(net::use_awaitable));
        }
    }

    {
        std::lock_guard lock(s->mutex);
        s->slots[slot_index].refilling = false;
        s->fail_waiters_locked(last_error);
    }
    LOG_ERROR("Slot {} could not be provisioned: {}", slot_index, last_error.what());
    co_return make_fail(last_error);
}

auto heartbeat_loop(std::weak_ptr<PoolState> weak) -> awaitable<void> {
    for (;;) {
        auto s = weak.lock();
        if (!s) co_return;

        s->heartbeat_timer.expires_after(
            std::chrono::seconds(s->config.heartbeat_interval_seconds));
        auto [ec] = co_await s->heartbeat_timer.async_wait(
            net::as_tuple(net::use_awaitable));

        std::vector<std::shared_ptr<SessionHandle>> targets;
        {
            std::lock_guard lock(s->mutex);
            if (ec || s->shutting_down) co_return;
            for (const auto& slot : s->slots) {
                if (slot.handle && slot.handle->state() == SessionState::Ready) {
                    targets.push_back(slot.handle);
                }
            }
        }

        for (const auto& handle : targets) {
            auto ping = co_await s->api->ping_session(handle->id());
            if (ping) continue;

            LOG_WARN("Heartbeat failed for session {}: {}", handle->id(),
                     ping.error().what());
            std::lock_guard lock(s->mutex);
            if (s->shutting_down) co_return;
            if (handle->state() == SessionState::Ready) {
                recycle_locked(s, handle, "heartbeat");
            } else if (handle->state() == SessionState::Busy) {
                handle->mark_suspect();
            }
        }
    }
}

} // anonymous namespace

auto to_string(ReleaseOutcome outcome) -> std::string_view {
    switch (outcome) {
        case ReleaseOutcome::Succeeded: return "succeeded";
        case ReleaseOutcome::Failed: return "failed";
        case ReleaseOutcome::Broken: return "broken";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// SessionLease
// ---------------------------------------------------------------------------

SessionLease::SessionLease(std::shared_ptr<SessionHandle> handle,
                           std::weak_ptr<detail::PoolState> pool)
    : handle_(std::move(handle)), pool_(std::move(pool)) {}

SessionLease::~SessionLease() {
    if (!handle_) return;
    if (auto s = pool_.lock()) {
        BrowserPool::release_handle(s, std::move(handle_), ReleaseOutcome::Failed);
    }
}

SessionLease::SessionLease(SessionLease&& other) noexcept
    : handle_(std::move(other.handle_)), pool_(std::move(other.pool_)) {}

auto SessionLease::operator=(SessionLease&& other) noexcept -> SessionLease& {
    if (this != &other) {
        if (handle_) {
            if (auto s = pool_.lock()) {
                BrowserPool::release_handle(s, std::move(handle_), ReleaseOutcome::Failed);
            }
        }
        handle_ = std::move(other.handle_);
        pool_ = std::move(other.pool_);
    }
    return *this;
}

// ---------------------------------------------------------------------------
// BrowserPool
// ---------------------------------------------------------------------------

auto BrowserPool::create(boost::asio::io_context& ioc, PoolConfig config,
                         std::shared_ptr<browser::ProvisioningApi> api)
    -> Result<std::unique_ptr<BrowserPool>> {
    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    if (!api) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "Provisioning API is required"));
    }

    LOG_INFO("Browser pool: {} browsers, {} pages each, {} concurrent starts, "
             "{} proxies ({})",
             config.num_browsers, config.pages_per_browser, config.start_semaphores,
             config.proxies.size(), to_string(config.proxy_ordering));

    auto state = std::make_shared<detail::PoolState>(ioc, std::move(config), std::move(api));
    return std::unique_ptr<BrowserPool>(new BrowserPool(std::move(state)));
}

BrowserPool::BrowserPool(std::shared_ptr<detail::PoolState> state)
    : state_(std::move(state)) {}

BrowserPool::~BrowserPool() {
    auto s = state_;
    std::size_t live = 0;
    {
        std::lock_guard lock(s->mutex);
        s->shutting_down = true;
        s->wake_all_locked();
        for (const auto& slot : s->slots) {
            if (slot.handle && !slot.handle->is_dead()) ++live;
        }
    }
    s->gate.cancel();
    net::post(s->strand, [s] { s->heartbeat_timer.cancel(); });

    if (live > 0 && !s->shutdown_started) {
        LOG_WARN("Browser pool destroyed with {} live sessions; call shutdown() first", live);
    }
}

auto BrowserPool::warm_up() -> awaitable<WarmUpReport> {
    auto s = state_;
    co_return co_await net::co_spawn(
        s->strand,
        [s]() -> awaitable<WarmUpReport> {
            WarmUpReport report;
            std::vector<std::size_t> to_fill;
            {
                std::lock_guard lock(s->mutex);
                if (s->warmed || s->shutting_down) {
                    report.already_warm = true;
                    co_return report;
                }
                s->warmed = true;
                for (std::size_t i = 0; i < s->slots.size(); ++i) {
                    auto& slot = s->slots[i];
                    if (!slot.handle && !slot.refilling) {
                        slot.refilling = true;
                        to_fill.push_back(i);
                    }
                }
            }

            if (s->config.heartbeat_interval_seconds > 0) {
                net::co_spawn(s->strand, heartbeat_loop(s),
                              [](std::exception_ptr ep) {
                                  log_task_failure(ep, "heartbeat");
                              });
            }

            LOG_INFO("Warming up {} browser slots", to_fill.size());

            auto join = std::make_shared<detail::Join>(s->strand, to_fill.size());
            for (auto index : to_fill) {
                net::co_spawn(
                    s->strand, create_handle(s, index),
                    net::bind_executor(
                        s->strand,
                        [join, &report, index](std::exception_ptr ep, Result<void> result) {
                            log_task_failure(ep, "warm-up");
                            if (!result) {
                                report.errors.push_back({index, result.error()});
                            }
                            join->done();
                        }));
            }

            while (join->remaining > 0) {
                co_await join->timer.async_wait(net::as_tuple(net::use_awaitable));
            }

            {
                std::lock_guard lock(s->mutex);
                for (const auto& slot : s->slots) {
                    if (slot.handle && (slot.handle->state() == SessionState::Ready
                                        || slot.handle->state() == SessionState::Busy)) {
                        ++report.ready;
                    }
                }
            }

            LOG_INFO("Warm-up finished: {} ready, {} failed", report.ready,
                     report.errors.size());
            co_return report;
        },
        net::use_awaitable);
}

auto BrowserPool::acquire_session(std::optional<std::chrono::milliseconds> timeout)
    -> awaitable<Result<SessionLease>> {
    auto s = state_;
    co_return co_await net::co_spawn(s->strand, acquire_impl(s, timeout),
                                     net::use_awaitable);
}

auto BrowserPool::acquire_impl(std::shared_ptr<detail::PoolState> s,
                               std::optional<std::chrono::milliseconds> timeout)
    -> awaitable<Result<SessionLease>> {
    const auto deadline = timeout ? clock_type::now() + *timeout
                                  : clock_type::time_point::max();
    auto executor = co_await net::this_coro::executor;
    bool refill_requested = false;
    bool retry_failed_slots = false;
    std::optional<std::uint64_t> ticket;

    for (;;) {
        std::shared_ptr<detail::Waiter> waiter;
        std::shared_ptr<SessionHandle> picked;
        std::optional<Error> failure;
        bool shut_down = false;
        {
            std::lock_guard lock(s->mutex);
            if (s->shutting_down) {
                shut_down = true;
            } else if (retry_failed_slots || s->waiters.empty()) {
                picked = s->take_ready_locked();
            }
            if (!shut_down && !picked) {
                if (!refill_requested || retry_failed_slots) {
                    refill_requested = true;
                    for (std::size_t i = 0; i < s->slots.size(); ++i) {
                        const auto& slot = s->slots[i];
                        if (!slot.handle && !slot.refilling) {
                            LOG_DEBUG("Slot {} empty, provisioning on demand", i);
                            spawn_refill_locked(s, i);
                        }
                    }
                } else if (!s->any_live_locked()) {
                    // Every slot gave up while this caller was re-queueing.
                    failure = s->last_failure_locked();
                }
                if (!failure) {
                    waiter = std::make_shared<detail::Waiter>(executor);
                    waiter->timer.expires_at(deadline);
                    // A re-queued caller keeps its original place in line.
                    if (!ticket) ticket = s->next_ticket++;
                    waiter->ticket = *ticket;
                    s->enqueue_locked(waiter);
                }
            }
        }
        retry_failed_slots = false;

        if (shut_down) {
            co_return make_fail(make_error(ErrorCode::PoolShutDown,
                                           "Pool is shutting down"));
        }
        if (picked) {
            co_return SessionLease(std::move(picked), s);
        }
        if (failure) {
            co_return make_fail(make_error(ErrorCode::ProvisioningError,
                                           "No browser could be provisioned",
                                           failure->what()));
        }

        co_await waiter->timer.async_wait(net::as_tuple(net::use_awaitable));

        bool timed_out = false;
        {
            std::lock_guard lock(s->mutex);
            if (waiter->handle) {
                picked = std::move(waiter->handle);
            } else if (s->shutting_down) {
                shut_down = true;
            } else if (waiter->failure) {
                if (!s->any_live_locked()) {
                    failure = waiter->failure;
                } else {
                    retry_failed_slots = true;
                }
            } else if (!waiter->notified) {
                std::erase(s->waiters, waiter);
                timed_out = true;
            }
        }

        if (picked) {
            co_return SessionLease(std::move(picked), s);
        }
        if (shut_down) {
            co_return make_fail(make_error(ErrorCode::PoolShutDown,
                                           "Pool is shutting down"));
        }
        if (failure) {
            co_return make_fail(make_error(ErrorCode::ProvisioningError,
                                           "No browser could be provisioned",
                                           failure->what()));
        }
        if (timed_out) {
            co_return make_fail(make_error(ErrorCode::Timeout,
                                           "Timed out waiting for a browser session"));
        }
    }
}

void BrowserPool::release_session(SessionLease lease, ReleaseOutcome outcome) {
    auto handle = std::move(lease.handle_);
    lease.pool_.reset();
    release_handle(state_, std::move(handle), outcome);
}

void BrowserPool::release_handle(const std::shared_ptr<detail::PoolState>& s,
                                 std::shared_ptr<SessionHandle> handle,
                                 ReleaseOutcome outcome) {
    if (!s || !handle) return;

    std::lock_guard lock(s->mutex);
    if (handle->state() != SessionState::Busy) {
        // Retired by shutdown while leased.
        return;
    }

    if (outcome == ReleaseOutcome::Succeeded) {
        handle->record_page();
        ++s->pages_served;
    }

    const auto budget = static_cast<std::uint64_t>(s->config.pages_per_browser);
    if (outcome == ReleaseOutcome::Broken) {
        recycle_locked(s, handle, "broken");
    } else if (handle->budget_reached(budget)) {
        recycle_locked(s, handle, "page budget reached");
    } else if (handle->suspect()) {
        recycle_locked(s, handle, "failed heartbeat");
    } else if (outcome == ReleaseOutcome::Failed && s->config.recycle_on_fetch_error) {
        recycle_locked(s, handle, "fetch error");
    } else {
        handle->mark_idle();
        s->offer_locked(handle);
    }
}

auto BrowserPool::shutdown(std::optional<std::chrono::milliseconds> timeout)
    -> awaitable<ShutdownReport> {
    auto s = state_;
    auto wait = timeout.value_or(std::chrono::milliseconds(s->config.shutdown_timeout_ms));
    co_return co_await net::co_spawn(
        s->strand,
        [s, wait]() -> awaitable<ShutdownReport> {
            ShutdownReport report;
            std::vector<std::string> session_ids;
            {
                std::lock_guard lock(s->mutex);
                if (s->shutdown_started) {
                    report.already_shut_down = true;
                    co_return report;
                }
                s->shutdown_started = true;
                s->shutting_down = true;
                s->wake_all_locked();

                for (auto& slot : s->slots) {
                    if (slot.handle && slot.handle->mark_dead()) {
                        // Starting handles have no remote session yet; the
                        // provisioning coroutine releases it when it returns.
                        if (!slot.handle->id().empty()) {
                            session_ids.push_back(slot.handle->id());
                        }
                    }
                    slot.handle.reset();
                }
            }
            s->gate.cancel();
            s->heartbeat_timer.cancel();

            LOG_INFO("Shutting down browser pool, tearing down {} sessions",
                     session_ids.size());

            auto join = std::make_shared<detail::Join>(s->strand, session_ids.size());
            auto failed = std::make_shared<std::size_t>(0);
            for (auto& id : session_ids) {
                net::co_spawn(
                    s->strand, teardown(s->api, std::move(id)),
                    net::bind_executor(
                        s->strand,
                        [join, failed](std::exception_ptr ep, Result<void> result) {
                            log_task_failure(ep, "shutdown teardown");
                            if (ep || !result) ++*failed;
                            join->done();
                        }));
            }

            join->timer.expires_after(wait);
            while (join->remaining > 0) {
                auto [ec] = co_await join->timer.async_wait(
                    net::as_tuple(net::use_awaitable));
                if (!ec) break;  // deadline
            }

            report.abandoned = join->remaining;
            report.failed = *failed;
            report.torn_down = session_ids.size() - report.abandoned - report.failed;
            if (report.abandoned > 0) {
                LOG_WARN("Shutdown deadline elapsed with {} teardowns pending",
                         report.abandoned);
            }
            LOG_INFO("Browser pool shut down: {} torn down, {} failed, {} abandoned",
                     report.torn_down, report.failed, report.abandoned);
            co_return report;
        },
        net::use_awaitable);
}

auto BrowserPool::stats() const -> PoolStats {
    std::lock_guard lock(state_->mutex);
    PoolStats st;
    st.slots = state_->slots.size();
    for (const auto& slot : state_->slots) {
        if (!slot.handle || slot.handle->is_dead()) {
            ++st.empty;
            continue;
        }
        switch (slot.handle->state()) {
            case SessionState::Starting: ++st.starting; break;
            case SessionState::Ready: ++st.ready; break;
            case SessionState::Busy: ++st.busy; break;
            case SessionState::Dead: break;
        }
    }
    st.waiters = state_->waiters.size();
    st.sessions_created = state_->sessions_created;
    st.sessions_recycled = state_->sessions_recycled;
    st.provisioning_failures = state_->provisioning_failures;
    st.pages_served = state_->pages_served;
    st.shutting_down = state_->shutting_down;
    return st;
}

auto BrowserPool::config() const -> const PoolConfig& {
    return state_->config;
}

auto BrowserPool::is_shutting_down() const -> bool {
    std::lock_guard lock(state_->mutex);
    return state_->shutting_down;
}

} // namespace cloudbrowser::pool
