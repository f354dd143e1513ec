#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "cloudbrowser/browser/provisioning.hpp"
#include "cloudbrowser/core/config.hpp"
#include "cloudbrowser/core/error.hpp"
#include "cloudbrowser/pool/browser_pool.hpp"

namespace cloudbrowser::dispatch {

using boost::asio::awaitable;

/// Lifecycle surface a crawling pipeline drives: start, one call per page
/// that needs a browser, stop.
class RequestDispatchExtension {
public:
    static auto create(boost::asio::io_context& ioc, PoolConfig config,
                       std::shared_ptr<browser::ProvisioningApi> api)
        -> Result<std::unique_ptr<RequestDispatchExtension>>;

    ~RequestDispatchExtension();

    RequestDispatchExtension(const RequestDispatchExtension&) = delete;
    RequestDispatchExtension& operator=(const RequestDispatchExtension&) = delete;

    /// Pipeline start: warm the pool.
    auto on_start() -> awaitable<pool::WarmUpReport>;

    /// Pipeline stop: shut the pool down.
    auto on_stop() -> awaitable<pool::ShutdownReport>;

    /// Fetch one page on a pooled session. acquire_timeout bounds the wait
    /// for a free session; the page itself is bounded by req.timeout.
    /// PoolShutDown is returned as is and must be treated as terminal.
    auto fetch(browser::PageRequest req,
               std::optional<std::chrono::milliseconds> acquire_timeout = std::nullopt)
        -> awaitable<Result<browser::PageResponse>>;

    [[nodiscard]] auto pool() -> pool::BrowserPool& { return *pool_; }
    [[nodiscard]] auto pool() const -> const pool::BrowserPool& { return *pool_; }

private:
    RequestDispatchExtension(std::unique_ptr<pool::BrowserPool> pool,
                             std::shared_ptr<browser::ProvisioningApi> api);

    std::unique_ptr<pool::BrowserPool> pool_;
    std::shared_ptr<browser::ProvisioningApi> api_;
};

/// Whether the pipeline may retry a request that failed with this error.
/// PoolShutDown and configuration errors are terminal.
[[nodiscard]] auto is_retryable(const Error& error) -> bool;

} // namespace cloudbrowser::dispatch
