#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>

#include "cloudbrowser/core/error.hpp"

namespace cloudbrowser::infra {

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::string base_url;
    int timeout_seconds = 30;
    std::map<std::string, std::string> default_headers;
    std::size_t worker_threads = 4;
};

/// Asynchronous HTTP client wrapping cpp-httplib.
/// Blocking httplib calls run on an internal worker pool; the awaiting
/// coroutine resumes on its own executor.
class HttpClient {
public:
    explicit HttpClient(HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Performs an asynchronous HTTP POST request.
    auto post(std::string_view path,
              std::string_view body,
              std::string_view content_type = "application/json")
        -> boost::asio::awaitable<cloudbrowser::Result<HttpResponse>>;

    /// Returns the base URL.
    [[nodiscard]] auto base_url() const -> const std::string&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cloudbrowser::infra
