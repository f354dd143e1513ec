#include "cloudbrowser/dispatch/request_dispatch_extension.hpp"
#include "cloudbrowser/core/logger.hpp"

namespace cloudbrowser::dispatch {

namespace {

auto outcome_for(const Result<browser::PageResponse>& result, bool recycle_on_server_error)
    -> pool::ReleaseOutcome {
    if (result) {
        if (recycle_on_server_error && result->is_server_error()) {
            return pool::ReleaseOutcome::Broken;
        }
        return pool::ReleaseOutcome::Succeeded;
    }
    if (result.error().code() == ErrorCode::SessionBroken) {
        return pool::ReleaseOutcome::Broken;
    }
    return pool::ReleaseOutcome::Failed;
}

} // anonymous namespace

auto is_retryable(const Error& error) -> bool {
    switch (error.code()) {
        case ErrorCode::SessionBroken:
        case ErrorCode::FetchError:
        case ErrorCode::Timeout:
        case ErrorCode::ProvisioningError:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionClosed:
            return true;
        default:
            return false;
    }
}

auto RequestDispatchExtension::create(boost::asio::io_context& ioc, PoolConfig config,
                                      std::shared_ptr<browser::ProvisioningApi> api)
    -> Result<std::unique_ptr<RequestDispatchExtension>> {
    auto pool = pool::BrowserPool::create(ioc, std::move(config), api);
    if (!pool) {
        return std::unexpected(pool.error());
    }
    return std::unique_ptr<RequestDispatchExtension>(
        new RequestDispatchExtension(std::move(*pool), std::move(api)));
}

RequestDispatchExtension::RequestDispatchExtension(
    std::unique_ptr<pool::BrowserPool> pool,
    std::shared_ptr<browser::ProvisioningApi> api)
    : pool_(std::move(pool)), api_(std::move(api)) {}

RequestDispatchExtension::~RequestDispatchExtension() = default;

auto RequestDispatchExtension::on_start() -> awaitable<pool::WarmUpReport> {
    auto report = co_await pool_->warm_up();
    for (const auto& failure : report.errors) {
        LOG_WARN("Browser slot {} failed to start: {}", failure.slot,
                 failure.error.what());
    }
    co_return report;
}

auto RequestDispatchExtension::on_stop() -> awaitable<pool::ShutdownReport> {
    co_return co_await pool_->shutdown();
}

auto RequestDispatchExtension::fetch(browser::PageRequest req,
                                     std::optional<std::chrono::milliseconds> acquire_timeout)
    -> awaitable<Result<browser::PageResponse>> {
    auto lease = co_await pool_->acquire_session(acquire_timeout);
    if (!lease) {
        if (lease.error().code() != ErrorCode::PoolShutDown) {
            LOG_WARN("No browser session for {}: {}", req.url, lease.error().what());
        }
        co_return make_fail(lease.error());
    }

    auto session_id = lease->session_id();
    auto url = req.url;
    auto result = co_await api_->fetch_page(session_id, std::move(req));

    auto outcome = outcome_for(result, pool_->config().recycle_on_server_error);
    if (!result) {
        LOG_WARN("Fetch of {} on session {} failed: {}", url, session_id,
                 result.error().what());
    } else if (outcome == pool::ReleaseOutcome::Broken) {
        LOG_WARN("Fetch of {} on session {} returned status {}, recycling",
                 url, session_id, result->status);
    }
    pool_->release_session(std::move(*lease), outcome);

    co_return result;
}

} // namespace cloudbrowser::dispatch
