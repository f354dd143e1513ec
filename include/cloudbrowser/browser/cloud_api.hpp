#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include "cloudbrowser/browser/provisioning.hpp"
#include "cloudbrowser/core/config.hpp"

namespace cloudbrowser::browser {

/// ProvisioningApi backed by the cloud browser service.
///
/// Sessions are created with POST {API_HOST}/profiles/one_time; the returned
/// DevTools endpoint is connected and kept open for the session lifetime.
/// Pages are fetched in a fresh target per request.
class CloudBrowserApi : public ProvisioningApi {
public:
    CloudBrowserApi(boost::asio::io_context& ioc, const PoolConfig& config);
    ~CloudBrowserApi() override;

    CloudBrowserApi(const CloudBrowserApi&) = delete;
    CloudBrowserApi& operator=(const CloudBrowserApi&) = delete;

    auto create_session(SessionRequest req)
        -> awaitable<Result<std::string>> override;

    auto destroy_session(std::string session_id)
        -> awaitable<Result<void>> override;

    auto fetch_page(std::string session_id, PageRequest req)
        -> awaitable<Result<PageResponse>> override;

    auto ping_session(std::string session_id)
        -> awaitable<Result<void>> override;

    /// Number of sessions with an open DevTools connection.
    [[nodiscard]] auto open_sessions() const -> std::size_t;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cloudbrowser::browser
