#include "cloudbrowser/browser/cloud_api.hpp"
#include "cloudbrowser/browser/cdp_client.hpp"
#include "cloudbrowser/browser/page.hpp"
#include "cloudbrowser/core/logger.hpp"
#include "cloudbrowser/core/utils.hpp"
#include "cloudbrowser/infra/http_client.hpp"

#include <chrono>
#include <mutex>
#include <unordered_map>

namespace cloudbrowser::browser {

namespace {

constexpr std::string_view kProvisionPath = "/profiles/one_time";
constexpr std::string_view kTokenHeader = "x-cloud-api-token";
constexpr std::size_t kMaxErrorBody = 256;

auto make_http_config(const PoolConfig& config) -> infra::HttpClientConfig {
    infra::HttpClientConfig http;
    http.base_url = config.api_host;
    http.timeout_seconds = config.provision_timeout_seconds;
    http.default_headers.emplace(std::string(kTokenHeader), config.api_token);
    // One worker per concurrently admitted provisioning call.
    http.worker_threads = static_cast<std::size_t>(config.start_semaphores);
    return http;
}

auto provisioning_error(std::string message, std::string detail = {}) -> Error {
    return make_error(ErrorCode::ProvisioningError, std::move(message), std::move(detail));
}

} // anonymous namespace

struct CloudBrowserApi::Impl {
    boost::asio::io_context& ioc;
    infra::HttpClient http;
    std::chrono::seconds connect_timeout;

    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<CdpClient>> sessions;

    Impl(boost::asio::io_context& ctx, const PoolConfig& config)
        : ioc(ctx)
        , http(make_http_config(config))
        , connect_timeout(config.connect_timeout_seconds) {}

    auto find(const std::string& session_id) const -> std::shared_ptr<CdpClient> {
        std::lock_guard lock(mutex);
        auto it = sessions.find(session_id);
        return it != sessions.end() ? it->second : nullptr;
    }

    auto take(const std::string& session_id) -> std::shared_ptr<CdpClient> {
        std::lock_guard lock(mutex);
        auto it = sessions.find(session_id);
        if (it == sessions.end()) return nullptr;
        auto cdp = std::move(it->second);
        sessions.erase(it);
        return cdp;
    }

    auto request_ws_url(const SessionRequest& req) -> awaitable<Result<std::string>> {
        json body = json::object();
        if (req.proxy) body["proxy"] = *req.proxy;
        if (req.browser_settings.is_object() && !req.browser_settings.empty()) {
            body["browser_settings"] = req.browser_settings;
        }
        if (req.fingerprint.is_object() && !req.fingerprint.empty()) {
            body["fingerprint"] = req.fingerprint;
        }

        auto resp = co_await http.post(kProvisionPath, body.dump());
        if (!resp) {
            co_return make_fail(provisioning_error(
                "Provisioning request failed", resp.error().what()));
        }
        if (resp->status == 401 || resp->status == 403) {
            co_return make_fail(provisioning_error(
                "Provisioning API rejected the token",
                "status " + std::to_string(resp->status)));
        }
        if (!resp->is_success()) {
            co_return make_fail(provisioning_error(
                "Provisioning API returned status " + std::to_string(resp->status),
                resp->body.substr(0, kMaxErrorBody)));
        }

        try {
            auto j = json::parse(resp->body);
            auto ws_url = j.value("ws_url", "");
            if (ws_url.empty()) {
                co_return make_fail(provisioning_error(
                    "Provisioning response has no ws_url"));
            }
            co_return ws_url;
        } catch (const json::exception& e) {
            co_return make_fail(provisioning_error(
                "Malformed provisioning response", e.what()));
        }
    }
};

CloudBrowserApi::CloudBrowserApi(boost::asio::io_context& ioc,
                                 const PoolConfig& config)
    : impl_(std::make_unique<Impl>(ioc, config)) {
    LOG_DEBUG("Cloud browser API at {}", config.api_host);
}

CloudBrowserApi::~CloudBrowserApi() = default;

auto CloudBrowserApi::create_session(SessionRequest req)
    -> awaitable<Result<std::string>> {
    auto proxy_label = req.proxy ? utils::redact_url_credentials(*req.proxy)
                                 : std::string("none");

    auto ws_url = co_await impl_->request_ws_url(req);
    if (!ws_url) {
        LOG_WARN("Session provisioning failed (proxy={}): {}",
                 proxy_label, ws_url.error().what());
        co_return make_fail(ws_url.error());
    }

    auto cdp = std::make_shared<CdpClient>(impl_->ioc);
    auto connected = co_await cdp->connect(*ws_url, impl_->connect_timeout);
    if (!connected) {
        co_return make_fail(provisioning_error(
            "Failed to connect to provisioned browser", connected.error().what()));
    }

    auto version = co_await cdp->send_command("Browser.getVersion");
    if (!version) {
        co_await cdp->disconnect();
        co_return make_fail(provisioning_error(
            "Provisioned browser did not answer", version.error().what()));
    }

    auto session_id = "cb-" + utils::generate_id(12);
    {
        std::lock_guard lock(impl_->mutex);
        impl_->sessions.emplace(session_id, cdp);
    }

    LOG_INFO("Session {} ready ({}, proxy={})", session_id,
             version->value("product", "unknown"), proxy_label);
    co_return session_id;
}

auto CloudBrowserApi::destroy_session(std::string session_id)
    -> awaitable<Result<void>> {
    auto cdp = impl_->take(session_id);
    if (!cdp) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Unknown session", session_id));
    }

    Result<void> result = ok_result();
    if (cdp->is_connected()) {
        auto closed = co_await cdp->send_command("Browser.close");
        if (!closed) {
            result = std::unexpected(closed.error());
        }
    }
    co_await cdp->disconnect();

    LOG_DEBUG("Session {} destroyed", session_id);
    co_return result;
}

auto CloudBrowserApi::fetch_page(std::string session_id, PageRequest req)
    -> awaitable<Result<PageResponse>> {
    auto cdp = impl_->find(session_id);
    if (!cdp || !cdp->is_connected()) {
        co_return make_fail(make_error(ErrorCode::SessionBroken,
                                       "Browser connection lost", session_id));
    }

    auto page = co_await Page::open(cdp);
    if (!page) {
        co_return make_fail(page.error());
    }

    auto response = co_await page->fetch(req);

    auto closed = co_await page->close();
    if (!closed) {
        LOG_DEBUG("Failed to close page {}: {}", page->target_id(),
                  closed.error().what());
    }

    if (response) {
        LOG_DEBUG("Fetched {} -> {} ({} bytes) via {}", req.url,
                  response->status, response->body.size(), session_id);
    }
    co_return response;
}

auto CloudBrowserApi::ping_session(std::string session_id)
    -> awaitable<Result<void>> {
    auto cdp = impl_->find(session_id);
    if (!cdp || !cdp->is_connected()) {
        co_return make_fail(make_error(ErrorCode::SessionBroken,
                                       "Browser connection lost", session_id));
    }

    auto version = co_await cdp->send_command("Browser.getVersion");
    if (!version) {
        co_return make_fail(to_fetch_error(version.error()));
    }
    co_return ok_result();
}

auto CloudBrowserApi::open_sessions() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->sessions.size();
}

} // namespace cloudbrowser::browser
