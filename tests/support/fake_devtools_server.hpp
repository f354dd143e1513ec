#pragma once

#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "cloudbrowser/core/utils.hpp"

namespace cloudbrowser::testing {

/// One response of a navigation chain. Redirect hops carry a Location header.
struct FakeHop {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

/// Loopback DevTools endpoint that answers the commands the page fetcher
/// sends and replays a scripted document navigation through Fetch
/// interception. Runs its own io_context on a background thread.
class FakeDevToolsServer {
public:
    using json = nlohmann::json;

    FakeDevToolsServer()
        : acceptor_(ioc_, boost::asio::ip::tcp::endpoint(
                              boost::asio::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        boost::asio::co_spawn(ioc_, accept_loop(), boost::asio::detached);
        thread_ = std::thread([this] { ioc_.run(); });
    }

    ~FakeDevToolsServer() {
        ioc_.stop();
        if (thread_.joinable()) thread_.join();
    }

    FakeDevToolsServer(const FakeDevToolsServer&) = delete;
    FakeDevToolsServer& operator=(const FakeDevToolsServer&) = delete;

    [[nodiscard]] auto url() const -> std::string {
        return "ws://127.0.0.1:" + std::to_string(port_) + "/devtools/browser/fake";
    }

    // --- scenario, set before the client connects ---

    void set_hops(std::vector<FakeHop> hops) {
        std::lock_guard lock(mutex_);
        hops_ = std::move(hops);
    }

    void fail_command(std::string method) {
        std::lock_guard lock(mutex_);
        failing_.push_back(std::move(method));
    }

    /// Page.navigate answers but no request is ever paused.
    void stall_navigation() {
        std::lock_guard lock(mutex_);
        stall_ = true;
    }

    void navigation_error(std::string text) {
        std::lock_guard lock(mutex_);
        navigation_error_ = std::move(text);
    }

    // --- recorded traffic ---

    [[nodiscard]] auto methods() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return methods_;
    }

    [[nodiscard]] auto count(const std::string& method) const -> int {
        std::lock_guard lock(mutex_);
        int n = 0;
        for (const auto& m : methods_) {
            if (m == method) ++n;
        }
        return n;
    }

    /// Params of every Fetch.continueRequest, in arrival order.
    [[nodiscard]] auto continued() const -> std::vector<json> {
        std::lock_guard lock(mutex_);
        return continued_;
    }

private:
    using websocket_t = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    /// Per-connection navigation progress, keyed by request id "r<hop>".
    struct Connection {
        std::string url;
        std::map<std::string, bool> at_response_stage;
    };

    auto accept_loop() -> boost::asio::awaitable<void> {
        for (;;) {
            auto [ec, socket] = co_await acceptor_.async_accept(
                boost::asio::as_tuple(boost::asio::use_awaitable));
            if (ec) co_return;
            boost::asio::co_spawn(ioc_, serve(std::move(socket)), boost::asio::detached);
        }
    }

    auto serve(boost::asio::ip::tcp::socket socket) -> boost::asio::awaitable<void> {
        websocket_t ws(std::move(socket));
        auto [accept_ec] = co_await ws.async_accept(
            boost::asio::as_tuple(boost::asio::use_awaitable));
        if (accept_ec) co_return;

        Connection conn;
        boost::beast::flat_buffer buffer;
        for (;;) {
            auto [ec, n] = co_await ws.async_read(
                buffer, boost::asio::as_tuple(boost::asio::use_awaitable));
            if (ec) co_return;
            auto msg = json::parse(boost::beast::buffers_to_string(buffer.data()));
            buffer.consume(n);

            std::vector<json> out;
            handle(conn, msg, out);
            for (const auto& frame : out) {
                auto text = frame.dump();
                auto [write_ec, written] = co_await ws.async_write(
                    boost::asio::buffer(text),
                    boost::asio::as_tuple(boost::asio::use_awaitable));
                if (write_ec) co_return;
            }
        }
    }

    static auto reply(const json& msg, json result) -> json {
        json frame = {{"id", msg["id"]}, {"result", std::move(result)}};
        if (msg.contains("sessionId")) frame["sessionId"] = msg["sessionId"];
        return frame;
    }

    static auto paused(const std::string& request_id, const std::string& url) -> json {
        return {{"method", "Fetch.requestPaused"},
                {"sessionId", "S1"},
                {"params", {{"requestId", request_id},
                            {"resourceType", "Document"},
                            {"request", {{"url", url}, {"method", "GET"}}}}}};
    }

    auto paused_response(std::size_t hop, const std::string& url) const -> json {
        auto event = paused("r" + std::to_string(hop), url);
        auto headers = json::array();
        for (const auto& [name, value] : hops_[hop].headers) {
            headers.push_back({{"name", name}, {"value", value}});
        }
        event["params"]["responseStatusCode"] = hops_[hop].status;
        event["params"]["responseHeaders"] = std::move(headers);
        return event;
    }

    auto location_of(std::size_t hop) const -> std::string {
        for (const auto& [name, value] : hops_[hop].headers) {
            if (utils::to_lower(name) == "location") return value;
        }
        return {};
    }

    static auto hop_of(const std::string& request_id) -> std::size_t {
        return static_cast<std::size_t>(std::stoul(request_id.substr(1)));
    }

    void handle(Connection& conn, const json& msg, std::vector<json>& out) {
        std::lock_guard lock(mutex_);
        auto method = msg.value("method", "");
        const auto params = msg.value("params", json::object());
        methods_.push_back(method);

        for (const auto& failing : failing_) {
            if (failing == method) {
                out.push_back({{"id", msg["id"]},
                               {"error", {{"code", -32000}, {"message", method + " refused"}}}});
                return;
            }
        }

        if (method == "Browser.getVersion") {
            out.push_back(reply(msg, {{"product", "HeadlessChrome/124.0"}}));
        } else if (method == "Target.createTarget") {
            out.push_back(reply(msg, {{"targetId", "T1"}}));
        } else if (method == "Target.attachToTarget") {
            out.push_back(reply(msg, {{"sessionId", "S1"}}));
        } else if (method == "Page.navigate") {
            conn.url = params.value("url", "");
            json result = {{"frameId", "F1"}};
            if (!navigation_error_.empty()) result["errorText"] = navigation_error_;
            out.push_back(reply(msg, std::move(result)));
            if (!stall_ && navigation_error_.empty() && !hops_.empty()) {
                conn.at_response_stage["r0"] = false;
                out.push_back(paused("r0", conn.url));
            }
        } else if (method == "Fetch.continueRequest") {
            continued_.push_back(params);
            out.push_back(reply(msg, json::object()));

            auto request_id = params.value("requestId", "");
            auto hop = hop_of(request_id);
            if (!conn.at_response_stage[request_id]) {
                conn.at_response_stage[request_id] = true;
                out.push_back(paused_response(hop, conn.url));
            } else if (hop + 1 < hops_.size()) {
                conn.url = location_of(hop);
                auto next = "r" + std::to_string(hop + 1);
                conn.at_response_stage[next] = false;
                out.push_back(paused(next, conn.url));
            }
        } else if (method == "Fetch.getResponseBody") {
            auto hop = hop_of(params.value("requestId", "r0"));
            out.push_back(reply(msg, {{"body", utils::base64_encode(hops_[hop].body)},
                                      {"base64Encoded", true}}));
        } else {
            // Fetch.enable, Target.closeTarget, Browser.close
            out.push_back(reply(msg, json::object()));
        }
    }

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    unsigned short port_ = 0;

    mutable std::mutex mutex_;
    std::vector<FakeHop> hops_;
    std::vector<std::string> failing_;
    bool stall_ = false;
    std::string navigation_error_;
    std::vector<std::string> methods_;
    std::vector<json> continued_;
};

} // namespace cloudbrowser::testing
