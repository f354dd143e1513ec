#include "cloudbrowser/browser/page.hpp"
#include "cloudbrowser/core/logger.hpp"
#include "cloudbrowser/core/utils.hpp"

#include <algorithm>
#include <array>
#include <optional>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace cloudbrowser::browser {

namespace net = boost::asio;

namespace {

constexpr std::array<int, 5> kRedirectStatusCodes{301, 302, 303, 307, 308};

/// Shared between the interception handlers and the waiting fetch().
/// Only touched from the strand.
struct FetchState {
    explicit FetchState(net::strand<net::any_io_executor> s)
        : strand(s), timer(s, net::steady_timer::time_point::max()) {}

    net::strand<net::any_io_executor> strand;
    net::steady_timer timer;
    std::optional<Result<PageResponse>> result;
    bool overrides_applied = false;
};

void complete(FetchState& state, Result<PageResponse> result) {
    if (state.result) return;
    state.result = std::move(result);
    state.timer.cancel();
}

auto find_header(const json& headers, std::string_view name) -> std::optional<std::string> {
    if (!headers.is_array()) return std::nullopt;
    for (const auto& entry : headers) {
        if (utils::to_lower(entry.value("name", "")) == name) {
            return entry.value("value", "");
        }
    }
    return std::nullopt;
}

auto to_header_map(const json& headers) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> result;
    if (!headers.is_array()) return result;
    for (const auto& entry : headers) {
        auto name = entry.value("name", "");
        // The body handed back is already decoded.
        if (utils::to_lower(name) == "content-encoding") continue;
        auto value = entry.value("value", "");
        auto [it, inserted] = result.emplace(name, value);
        if (!inserted) {
            it->second += ", " + value;
        }
    }
    return result;
}

auto continue_params(const std::string& request_id, const PageRequest& req,
                     bool apply_overrides) -> json {
    json params = {{"requestId", request_id}};
    if (!apply_overrides) return params;

    params["method"] = req.method;
    if (!req.body.empty()) {
        params["postData"] = utils::base64_encode(req.body);
    }
    if (!req.headers.empty()) {
        auto headers = json::array();
        for (const auto& [name, value] : req.headers) {
            headers.push_back({{"name", name}, {"value", value}});
        }
        params["headers"] = std::move(headers);
    }
    return params;
}

auto handle_paused(std::weak_ptr<CdpClient> weak_cdp, std::string session_id,
                   std::shared_ptr<FetchState> state, PageRequest req,
                   json params) -> awaitable<void> {
    auto cdp = weak_cdp.lock();
    if (!cdp) co_return;

    auto request_id = params.value("requestId", "");
    bool is_document = params.value("resourceType", "") == "Document";

    if (params.contains("responseErrorReason")) {
        if (is_document) {
            complete(*state, std::unexpected(make_error(
                ErrorCode::FetchError, "Page request failed",
                params.value("responseErrorReason", ""))));
        }
    } else if (params.contains("responseStatusCode")) {
        int status = params.value("responseStatusCode", 0);
        const auto& headers = params.contains("responseHeaders")
                                  ? params["responseHeaders"]
                                  : json::array();
        bool is_redirect =
            std::ranges::find(kRedirectStatusCodes, status) != kRedirectStatusCodes.end()
            && find_header(headers, "location").has_value();

        if (!is_redirect && !state->result) {
            auto body = co_await cdp->send_command(
                "Fetch.getResponseBody", {{"requestId", request_id}}, session_id);
            if (!body) {
                complete(*state, std::unexpected(to_fetch_error(body.error())));
            } else {
                PageResponse response;
                response.url = params.contains("request")
                                   ? params["request"].value("url", req.url)
                                   : req.url;
                response.status = status;
                response.headers = to_header_map(headers);
                auto raw = body->value("body", "");
                response.body = body->value("base64Encoded", false)
                                    ? utils::base64_decode(raw)
                                    : std::move(raw);
                complete(*state, std::move(response));
            }
        }
    }

    bool apply_overrides = false;
    if (!params.contains("responseStatusCode") && is_document
        && !state->overrides_applied) {
        apply_overrides = true;
        state->overrides_applied = true;
    }

    auto cont = co_await cdp->send_command(
        "Fetch.continueRequest",
        continue_params(request_id, req, apply_overrides), session_id);
    if (!cont) {
        LOG_DEBUG("Fetch.continueRequest failed for {}: {}",
                  request_id, cont.error().what());
    }
}

auto navigate(std::weak_ptr<CdpClient> weak_cdp, std::string session_id,
              std::string url, std::shared_ptr<FetchState> state)
    -> awaitable<void> {
    auto cdp = weak_cdp.lock();
    if (!cdp) {
        complete(*state, std::unexpected(make_error(
            ErrorCode::SessionBroken, "Browser connection released")));
        co_return;
    }

    auto nav = co_await cdp->send_command("Page.navigate", {{"url", url}}, session_id);
    if (!nav) {
        complete(*state, std::unexpected(to_fetch_error(nav.error())));
        co_return;
    }
    auto error_text = nav->value("errorText", "");
    if (!error_text.empty()) {
        complete(*state, std::unexpected(make_error(
            ErrorCode::FetchError, "Navigation failed", error_text)));
    }
}

auto wait_for_response(std::shared_ptr<FetchState> state,
                       net::steady_timer::time_point deadline,
                       std::string url) -> awaitable<Result<PageResponse>> {
    state->timer.expires_at(deadline);
    while (!state->result) {
        auto [ec] = co_await state->timer.async_wait(
            net::as_tuple(net::use_awaitable));
        if (!ec) break;
    }
    if (!state->result) {
        co_return make_fail(make_error(
            ErrorCode::FetchError, "Timed out waiting for page response", url));
    }
    co_return std::move(*state->result);
}

/// Best-effort close of a target that could not be set up.
auto discard_target(CdpClient& cdp, const std::string& target_id) -> awaitable<void> {
    auto closed = co_await cdp.send_command("Target.closeTarget", {{"targetId", target_id}});
    if (!closed) {
        LOG_DEBUG("Failed to close target {}: {}", target_id, closed.error().what());
    }
}

} // anonymous namespace

auto to_fetch_error(const Error& error) -> Error {
    switch (error.code()) {
        case ErrorCode::SessionBroken:
        case ErrorCode::FetchError:
            return error;
        case ErrorCode::ConnectionClosed:
        case ErrorCode::ConnectionFailed:
            return make_error(ErrorCode::SessionBroken,
                              std::string(error.message()),
                              std::string(error.detail()));
        default:
            return make_error(ErrorCode::FetchError,
                              std::string(error.message()),
                              std::string(error.detail()));
    }
}

Page::Page(std::shared_ptr<CdpClient> cdp, std::string target_id,
           std::string session_id)
    : cdp_(std::move(cdp))
    , target_id_(std::move(target_id))
    , session_id_(std::move(session_id)) {}

auto Page::open(std::shared_ptr<CdpClient> cdp) -> awaitable<Result<Page>> {
    auto target = co_await cdp->send_command(
        "Target.createTarget", {{"url", "about:blank"}});
    if (!target) {
        co_return make_fail(to_fetch_error(target.error()));
    }
    auto target_id = target->value("targetId", "");

    auto attached = co_await cdp->send_command(
        "Target.attachToTarget", {{"targetId", target_id}, {"flatten", true}});
    if (!attached) {
        co_await discard_target(*cdp, target_id);
        co_return make_fail(to_fetch_error(attached.error()));
    }
    auto session_id = attached->value("sessionId", "");

    auto enabled = co_await cdp->send_command(
        "Fetch.enable",
        {{"patterns", json::array({
             {{"requestStage", "Request"}},
             {{"requestStage", "Response"}},
         })}},
        session_id);
    if (!enabled) {
        co_await discard_target(*cdp, target_id);
        co_return make_fail(to_fetch_error(enabled.error()));
    }

    LOG_DEBUG("Opened page target={} session={}", target_id, session_id);
    co_return Page(std::move(cdp), std::move(target_id), std::move(session_id));
}

auto Page::fetch(const PageRequest& req) -> awaitable<Result<PageResponse>> {
    auto executor = co_await net::this_coro::executor;
    auto state = std::make_shared<FetchState>(net::make_strand(executor));
    std::weak_ptr<CdpClient> weak_cdp = cdp_;

    cdp_->subscribe(
        "Fetch.requestPaused",
        [weak_cdp, session = session_id_, state, req](json params) {
            net::co_spawn(state->strand,
                          handle_paused(weak_cdp, session, state, req,
                                        std::move(params)),
                          net::detached);
        },
        session_id_);

    auto deadline = net::steady_timer::clock_type::now() + req.timeout;
    net::co_spawn(state->strand,
                  navigate(weak_cdp, session_id_, req.url, state),
                  net::detached);
    auto result = co_await net::co_spawn(
        state->strand, wait_for_response(state, deadline, req.url),
        net::use_awaitable);

    cdp_->unsubscribe("Fetch.requestPaused", session_id_);
    co_return result;
}

auto Page::close() -> awaitable<Result<void>> {
    cdp_->unsubscribe("Fetch.requestPaused", session_id_);
    auto closed = co_await cdp_->send_command(
        "Target.closeTarget", {{"targetId", target_id_}});
    if (!closed) {
        co_return make_fail(to_fetch_error(closed.error()));
    }
    co_return ok_result();
}

} // namespace cloudbrowser::browser
