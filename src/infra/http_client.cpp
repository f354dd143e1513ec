#include "cloudbrowser/infra/http_client.hpp"
#include "cloudbrowser/core/logger.hpp"

#include <httplib.h>

#include <memory>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace cloudbrowser::infra {

namespace {

auto to_http_response(const httplib::Result& result)
    -> cloudbrowser::Result<HttpResponse> {
    if (!result) {
        auto err = result.error();
        std::string detail;
        switch (err) {
            case httplib::Error::Connection:
                detail = "Connection failed";
                break;
            case httplib::Error::BindIPAddress:
                detail = "Bind IP address failed";
                break;
            case httplib::Error::Read:
                detail = "Read error";
                break;
            case httplib::Error::Write:
                detail = "Write error";
                break;
            case httplib::Error::ExceedRedirectCount:
                detail = "Exceeded redirect count";
                break;
            case httplib::Error::Canceled:
                detail = "Request canceled";
                break;
            case httplib::Error::SSLConnection:
                detail = "SSL connection error";
                break;
            case httplib::Error::SSLLoadingCerts:
                detail = "SSL certificate loading error";
                break;
            case httplib::Error::SSLServerVerification:
                detail = "SSL server verification failed";
                break;
            case httplib::Error::ConnectionTimeout:
                return std::unexpected(
                    cloudbrowser::make_error(ErrorCode::Timeout,
                                             "HTTP request timed out",
                                             "Connection timeout"));
            default:
                detail = "Unknown HTTP error";
                break;
        }
        return std::unexpected(
            cloudbrowser::make_error(ErrorCode::ConnectionFailed,
                                     "HTTP request failed", detail));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;

    for (const auto& [key, value] : result->headers) {
        response.headers[key] = value;
    }

    return response;
}

} // anonymous namespace

struct HttpClient::Impl {
    HttpClientConfig config;
    boost::asio::thread_pool workers;

    explicit Impl(HttpClientConfig config_)
        : config(std::move(config_)),
          workers(config.worker_threads == 0 ? 1 : config.worker_threads) {
        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }

    ~Impl() {
        workers.join();
    }

    // httplib::Client is not thread-safe; every request gets its own.
    auto make_client() const -> std::unique_ptr<httplib::Client> {
        auto client = std::make_unique<httplib::Client>(config.base_url);
        client->set_connection_timeout(config.timeout_seconds);
        client->set_read_timeout(config.timeout_seconds);
        client->set_write_timeout(config.timeout_seconds);

        httplib::Headers hdrs;
        for (const auto& [key, value] : config.default_headers) {
            hdrs.emplace(key, value);
        }
        client->set_default_headers(hdrs);
        return client;
    }

    template <typename Call>
    auto run(Call call) -> boost::asio::awaitable<cloudbrowser::Result<HttpResponse>> {
        co_return co_await boost::asio::co_spawn(
            workers.get_executor(),
            [this, call = std::move(call)]()
                -> boost::asio::awaitable<cloudbrowser::Result<HttpResponse>> {
                auto client = make_client();
                co_return to_http_response(call(*client));
            },
            boost::asio::use_awaitable);
    }
};

HttpClient::HttpClient(HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

auto HttpClient::post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type)
    -> boost::asio::awaitable<cloudbrowser::Result<HttpResponse>> {
    LOG_DEBUG("POST {}{}", impl_->config.base_url, path);
    co_return co_await impl_->run(
        [p = std::string(path), b = std::string(body),
         ct = std::string(content_type)](httplib::Client& c) {
            return c.Post(p, b, ct);
        });
}

auto HttpClient::base_url() const -> const std::string& {
    return impl_->config.base_url;
}

} // namespace cloudbrowser::infra
