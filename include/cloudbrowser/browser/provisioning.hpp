#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "cloudbrowser/core/error.hpp"

namespace cloudbrowser::browser {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Parameters of one remote browser session.
struct SessionRequest {
    std::optional<std::string> proxy;
    json browser_settings;  // null when unset
    json fingerprint;       // null when unset
};

/// A page to load through a provisioned browser.
struct PageRequest {
    std::string url;
    std::string method = "GET";
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
};

/// The main document response captured from the browser.
struct PageResponse {
    std::string url;
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    [[nodiscard]] auto is_server_error() const noexcept -> bool {
        return status >= 500;
    }
};

/// Abstract boundary to the browser-as-a-service backend.
///
/// The pool only ever talks to remote sessions through this interface.
/// Implementations must be safe to call from concurrent coroutines.
class ProvisioningApi {
public:
    virtual ~ProvisioningApi() = default;

    /// Create a remote session and return its identifier.
    /// Fails with ProvisioningError on network, auth or quota failures.
    virtual auto create_session(SessionRequest req)
        -> awaitable<Result<std::string>> = 0;

    /// Tear a session down. Best effort; callers log and ignore failures.
    virtual auto destroy_session(std::string session_id)
        -> awaitable<Result<void>> = 0;

    /// Load a page in the session. Fails with SessionBroken when the remote
    /// browser is gone and FetchError for retryable page failures.
    virtual auto fetch_page(std::string session_id, PageRequest req)
        -> awaitable<Result<PageResponse>> = 0;

    /// Liveness check used by the pool heartbeat.
    virtual auto ping_session(std::string session_id)
        -> awaitable<Result<void>> = 0;
};

} // namespace cloudbrowser::browser
