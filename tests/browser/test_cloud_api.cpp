#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "cloudbrowser/browser/cdp_client.hpp"
#include "cloudbrowser/browser/cloud_api.hpp"
#include "cloudbrowser/browser/page.hpp"
#include "../support/fake_devtools_server.hpp"
#include "../support/fake_provisioning_api.hpp"

using namespace cloudbrowser;
using namespace cloudbrowser::browser;
using cloudbrowser::testing::FakeDevToolsServer;
using cloudbrowser::testing::run_test;
using boost::asio::awaitable;
using json = nlohmann::json;

namespace {

/// Provisioning endpoint on a loopback port answering with a fixed reply.
struct FakeProvisioningServer {
    httplib::Server server;
    std::thread thread;
    int port = 0;

    std::mutex mutex;
    int status = 200;
    std::string reply = "{}";
    std::string last_token;
    std::string last_body;

    FakeProvisioningServer() {
        server.Post("/profiles/one_time",
                    [this](const httplib::Request& req, httplib::Response& res) {
                        std::lock_guard lock(mutex);
                        last_token = req.get_header_value("x-cloud-api-token");
                        last_body = req.body;
                        res.status = status;
                        res.set_content(reply, "application/json");
                    });
        port = server.bind_to_any_port("127.0.0.1");
        thread = std::thread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    ~FakeProvisioningServer() {
        server.stop();
        if (thread.joinable()) thread.join();
    }

    void respond(int code, std::string body) {
        std::lock_guard lock(mutex);
        status = code;
        reply = std::move(body);
    }

    auto config() const -> PoolConfig {
        auto c = cloudbrowser::testing::test_config(1);
        c.api_host = "http://127.0.0.1:" + std::to_string(port);
        c.api_token = "secret-token";
        c.provision_timeout_seconds = 5;
        c.connect_timeout_seconds = 2;
        return c;
    }
};

} // anonymous namespace

TEST_CASE("PageResponse classifies server errors", "[browser]") {
    PageResponse resp;
    resp.status = 200;
    CHECK_FALSE(resp.is_server_error());
    resp.status = 404;
    CHECK_FALSE(resp.is_server_error());
    resp.status = 500;
    CHECK(resp.is_server_error());
    resp.status = 503;
    CHECK(resp.is_server_error());
}

TEST_CASE("to_fetch_error maps transport failures", "[browser]") {
    auto closed = to_fetch_error(make_error(ErrorCode::ConnectionClosed, "gone", "ws"));
    CHECK(closed.code() == ErrorCode::SessionBroken);
    CHECK(closed.what() == "gone: ws");

    CHECK(to_fetch_error(make_error(ErrorCode::ConnectionFailed, "x")).code()
          == ErrorCode::SessionBroken);
    CHECK(to_fetch_error(make_error(ErrorCode::ProtocolError, "x")).code()
          == ErrorCode::FetchError);
    CHECK(to_fetch_error(make_error(ErrorCode::Timeout, "x")).code()
          == ErrorCode::FetchError);
    CHECK(to_fetch_error(make_error(ErrorCode::SessionBroken, "x")).code()
          == ErrorCode::SessionBroken);
}

TEST_CASE("CdpClient accepts ws and wss endpoints only", "[browser][cdp]") {
    boost::asio::io_context ioc;
    CdpClient client(ioc);

    // A port nothing listens on.
    int port = 0;
    {
        httplib::Server listener;
        port = listener.bind_to_any_port("127.0.0.1");
    }

    run_test(ioc, [&]() -> awaitable<void> {
        auto http = co_await client.connect("http://127.0.0.1/devtools");
        REQUIRE_FALSE(http.has_value());
        CHECK(http.error().code() == ErrorCode::ConnectionFailed);
        CHECK(http.error().message() == "Unsupported DevTools endpoint scheme");

        // wss goes as far as the TCP connect.
        auto secure = co_await client.connect(
            "wss://127.0.0.1:" + std::to_string(port) + "/devtools",
            std::chrono::seconds(2));
        REQUIRE_FALSE(secure.has_value());
        CHECK(secure.error().code() == ErrorCode::ConnectionFailed);
        CHECK(secure.error().message() == "Failed to connect to CDP");
        CHECK_FALSE(client.is_connected());

        auto cmd = co_await client.send_command("Browser.getVersion");
        REQUIRE_FALSE(cmd.has_value());
        CHECK(cmd.error().code() == ErrorCode::ConnectionClosed);
    });
}

TEST_CASE("CloudBrowserApi rejects unknown sessions", "[browser][cloud]") {
    boost::asio::io_context ioc;
    auto config = cloudbrowser::testing::test_config(1);
    CloudBrowserApi api(ioc, config);

    run_test(ioc, [&]() -> awaitable<void> {
        auto destroyed = co_await api.destroy_session("cb-missing");
        REQUIRE_FALSE(destroyed.has_value());
        CHECK(destroyed.error().code() == ErrorCode::InvalidArgument);

        PageRequest req;
        req.url = "https://example.com/";
        auto page = co_await api.fetch_page("cb-missing", req);
        REQUIRE_FALSE(page.has_value());
        CHECK(page.error().code() == ErrorCode::SessionBroken);

        auto ping = co_await api.ping_session("cb-missing");
        REQUIRE_FALSE(ping.has_value());
        CHECK(ping.error().code() == ErrorCode::SessionBroken);
    });
    CHECK(api.open_sessions() == 0);
}

TEST_CASE("CloudBrowserApi reports provisioning failures", "[browser][cloud]") {
    FakeProvisioningServer server;
    boost::asio::io_context ioc;
    CloudBrowserApi api(ioc, server.config());

    SessionRequest req;
    req.proxy = "http://user:pw@proxy.example:8000";
    req.browser_settings = json{{"blockAds", true}};

    SECTION("request carries the token and session parameters") {
        server.respond(200, "{}");
        run_test(ioc, [&]() -> awaitable<void> {
            auto session = co_await api.create_session(req);
            REQUIRE_FALSE(session.has_value());
            CHECK(session.error().code() == ErrorCode::ProvisioningError);
        });

        std::lock_guard lock(server.mutex);
        CHECK(server.last_token == "secret-token");
        auto body = json::parse(server.last_body);
        CHECK(body["proxy"] == "http://user:pw@proxy.example:8000");
        CHECK(body["browser_settings"]["blockAds"] == true);
        CHECK_FALSE(body.contains("fingerprint"));
    }

    SECTION("rejected token") {
        server.respond(401, R"({"error": "unauthorized"})");
        run_test(ioc, [&]() -> awaitable<void> {
            auto session = co_await api.create_session(req);
            REQUIRE_FALSE(session.has_value());
            CHECK(session.error().code() == ErrorCode::ProvisioningError);
            CHECK(session.error().what().find("token") != std::string::npos);
        });
    }

    SECTION("quota exhausted") {
        server.respond(429, R"({"error": "too many sessions"})");
        run_test(ioc, [&]() -> awaitable<void> {
            auto session = co_await api.create_session(req);
            REQUIRE_FALSE(session.has_value());
            CHECK(session.error().what().find("429") != std::string::npos);
        });
    }

    SECTION("malformed reply") {
        server.respond(200, "not json");
        run_test(ioc, [&]() -> awaitable<void> {
            auto session = co_await api.create_session(req);
            REQUIRE_FALSE(session.has_value());
            CHECK(session.error().code() == ErrorCode::ProvisioningError);
        });
    }

    SECTION("unreachable browser endpoint") {
        server.respond(200, R"({"ws_url": "ws://127.0.0.1:1/devtools/abc"})");
        run_test(ioc, [&]() -> awaitable<void> {
            auto session = co_await api.create_session(req);
            REQUIRE_FALSE(session.has_value());
            CHECK(session.error().code() == ErrorCode::ProvisioningError);
        });
        CHECK(api.open_sessions() == 0);
    }
}

TEST_CASE("CloudBrowserApi drives a provisioned browser", "[browser][cloud]") {
    FakeProvisioningServer provisioning;
    FakeDevToolsServer devtools;
    devtools.set_hops({{200, {{"Content-Type", "text/html"}}, "<p>hi</p>"}});
    provisioning.respond(200, json{{"ws_url", devtools.url()}}.dump());

    boost::asio::io_context ioc;
    CloudBrowserApi api(ioc, provisioning.config());

    run_test(ioc, [&]() -> awaitable<void> {
        auto session = co_await api.create_session(SessionRequest{});
        REQUIRE(session.has_value());
        CHECK(session->starts_with("cb-"));
        CHECK(api.open_sessions() == 1);

        auto ping = co_await api.ping_session(*session);
        CHECK(ping.has_value());

        PageRequest req;
        req.url = "https://example.com/";
        req.timeout = std::chrono::seconds(2);
        auto page = co_await api.fetch_page(*session, req);
        REQUIRE(page.has_value());
        CHECK(page->status == 200);
        CHECK(page->body == "<p>hi</p>");
        CHECK(page->url == "https://example.com/");

        auto destroyed = co_await api.destroy_session(*session);
        CHECK(destroyed.has_value());
        CHECK(api.open_sessions() == 0);

        auto after = co_await api.fetch_page(*session, req);
        REQUIRE_FALSE(after.has_value());
        CHECK(after.error().code() == ErrorCode::SessionBroken);
    });

    CHECK(devtools.count("Browser.getVersion") == 2);
    CHECK(devtools.count("Target.createTarget") == 1);
    CHECK(devtools.count("Target.closeTarget") == 1);
    CHECK(devtools.count("Browser.close") == 1);
}
