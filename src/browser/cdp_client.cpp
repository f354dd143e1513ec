#include "cloudbrowser/browser/cdp_client.hpp"
#include "cloudbrowser/core/logger.hpp"

#include <boost/asio.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <mutex>
#include <unordered_map>

namespace cloudbrowser::browser {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

using result_channel_t = net::experimental::concurrent_channel<void(
    boost::system::error_code, Result<json>)>;
using outgoing_channel_t = net::experimental::concurrent_channel<void(
    boost::system::error_code, std::string)>;

using plain_ws_t = websocket::stream<beast::tcp_stream>;
using tls_ws_t = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

constexpr std::size_t kOutgoingQueueDepth = 256;

auto handler_key(std::string_view event, std::string_view session_id) -> std::string {
    if (session_id.empty()) return std::string(event);
    return std::string(event) + ":" + std::string(session_id);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// CdpClient::Impl
// ---------------------------------------------------------------------------

struct CdpClient::Impl : std::enable_shared_from_this<CdpClient::Impl> {
    net::io_context& ioc;
    std::unique_ptr<ssl::context> ssl_ctx;
    std::unique_ptr<plain_ws_t> ws;
    std::unique_ptr<tls_ws_t> tls_ws;
    std::string url;
    std::atomic<bool> connected{false};
    std::atomic<int> next_id{1};
    outgoing_channel_t outgoing;

    std::mutex pending_mutex;
    std::unordered_map<int, std::function<void(Result<json>)>> pending_commands;

    std::mutex handler_mutex;
    std::unordered_map<std::string, EventHandler> event_handlers;

    explicit Impl(net::io_context& ctx)
        : ioc(ctx), outgoing(ctx, kOutgoingQueueDepth) {}

    /// Apply op to whichever stream connect() opened.
    template <typename Op>
    decltype(auto) on_stream(Op&& op) {
        if (tls_ws) return op(*tls_ws);
        return op(*ws);
    }

    [[nodiscard]] auto has_stream() const -> bool { return ws || tls_ws; }

    void close_socket() {
        if (!has_stream()) return;
        on_stream([](auto& stream) {
            beast::error_code ignored;
            beast::get_lowest_layer(stream).socket().close(ignored);
        });
    }

    auto allocate_id() -> int {
        return next_id.fetch_add(1, std::memory_order_relaxed);
    }

    void fail_pending(const Error& error) {
        std::unordered_map<int, std::function<void(Result<json>)>> drained;
        {
            std::lock_guard lock(pending_mutex);
            drained.swap(pending_commands);
        }
        for (auto& [id, callback] : drained) {
            callback(std::unexpected(error));
        }
    }

    void dispatch_message(const std::string& msg) {
        try {
            auto j = json::parse(msg);

            // Command responses carry the id of the request.
            if (j.contains("id")) {
                int id = j["id"].get<int>();

                std::function<void(Result<json>)> callback;
                {
                    std::lock_guard lock(pending_mutex);
                    auto it = pending_commands.find(id);
                    if (it != pending_commands.end()) {
                        callback = std::move(it->second);
                        pending_commands.erase(it);
                    }
                }

                if (callback) {
                    if (j.contains("error")) {
                        auto& err = j["error"];
                        callback(std::unexpected(
                            make_error(ErrorCode::ProtocolError,
                                       err.value("message", "CDP error"),
                                       err.contains("data")
                                           ? err["data"].dump()
                                           : "")));
                    } else {
                        callback(j.value("result", json::object()));
                    }
                }
                return;
            }

            if (j.contains("method")) {
                auto method = j["method"].get<std::string>();
                auto session_id = j.value("sessionId", std::string());
                EventHandler handler;
                {
                    std::lock_guard lock(handler_mutex);
                    auto it = event_handlers.find(handler_key(method, session_id));
                    if (it == event_handlers.end() && !session_id.empty()) {
                        it = event_handlers.find(method);
                    }
                    if (it != event_handlers.end()) {
                        handler = it->second;
                    }
                }
                if (handler) {
                    handler(j.value("params", json::object()));
                }
            }
        } catch (const json::exception& e) {
            LOG_WARN("Failed to parse CDP message: {}", e.what());
        }
    }

    auto read_loop() -> net::awaitable<void> {
        auto self = shared_from_this();
        beast::flat_buffer buffer;
        while (connected) {
            auto [ec, n] = co_await on_stream([&buffer](auto& stream) {
                return stream.async_read(buffer, net::as_tuple(net::use_awaitable));
            });
            if (ec) {
                if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
                    LOG_WARN("CDP read error on {}: {}", url, ec.message());
                }
                break;
            }
            auto msg = beast::buffers_to_string(buffer.data());
            buffer.consume(n);
            dispatch_message(msg);
        }

        connected = false;
        outgoing.close();
        fail_pending(make_error(ErrorCode::ConnectionClosed, "CDP connection closed", url));
    }

    auto write_loop() -> net::awaitable<void> {
        auto self = shared_from_this();
        while (connected) {
            auto [ec, msg] = co_await outgoing.async_receive(
                net::as_tuple(net::use_awaitable));
            if (ec) break;

            auto [write_ec, written] = co_await on_stream([&msg](auto& stream) {
                return stream.async_write(net::buffer(msg),
                                          net::as_tuple(net::use_awaitable));
            });
            if (write_ec) {
                LOG_WARN("CDP write error on {}: {}", url, write_ec.message());
                connected = false;
                close_socket();
                break;
            }
        }
    }
};

// ---------------------------------------------------------------------------
// CdpClient
// ---------------------------------------------------------------------------

CdpClient::CdpClient(boost::asio::io_context& ioc)
    : impl_(std::make_shared<Impl>(ioc)) {}

CdpClient::~CdpClient() {
    if (impl_ && impl_->connected) {
        impl_->connected = false;
        impl_->outgoing.close();
        impl_->close_socket();
    }
}

CdpClient::CdpClient(CdpClient&&) noexcept = default;
CdpClient& CdpClient::operator=(CdpClient&&) noexcept = default;

auto CdpClient::connect(std::string_view ws_url, std::chrono::seconds timeout)
    -> awaitable<Result<void>> {
    impl_->url = std::string(ws_url);

    std::string url_str(ws_url);
    bool secure = false;
    std::size_t start = 0;
    if (url_str.starts_with("wss://")) {
        secure = true;
        start = 6;
    } else if (url_str.starts_with("ws://")) {
        start = 5;
    } else {
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed,
                       "Unsupported DevTools endpoint scheme", url_str));
    }

    try {
        // Parse the WebSocket URL: ws[s]://host:port/path
        std::string host;
        std::string port;
        std::string target;

        auto path_pos = url_str.find('/', start);
        auto host_port = url_str.substr(start, path_pos - start);
        target = (path_pos != std::string::npos) ? url_str.substr(path_pos) : "/";

        auto colon_pos = host_port.find(':');
        if (colon_pos != std::string::npos) {
            host = host_port.substr(0, colon_pos);
            port = host_port.substr(colon_pos + 1);
        } else {
            host = host_port;
            port = secure ? "443" : "80";
        }
        if (host.empty()) {
            co_return make_fail(
                make_error(ErrorCode::ConnectionFailed,
                           "DevTools endpoint has no host", url_str));
        }

        tcp::resolver resolver(impl_->ioc);
        auto results = co_await resolver.async_resolve(
            host, port, net::use_awaitable);

        impl_->ws.reset();
        impl_->tls_ws.reset();
        if (secure) {
            impl_->ssl_ctx = std::make_unique<ssl::context>(ssl::context::tlsv12_client);
            impl_->ssl_ctx->set_default_verify_paths();
            impl_->ssl_ctx->set_verify_mode(ssl::verify_peer);
            impl_->tls_ws = std::make_unique<tls_ws_t>(impl_->ioc, *impl_->ssl_ctx);
            auto& tls = impl_->tls_ws->next_layer();
            if (!SSL_set_tlsext_host_name(tls.native_handle(), host.c_str())) {
                co_return make_fail(
                    make_error(ErrorCode::ConnectionFailed,
                               "Failed to set TLS server name", host));
            }
            tls.set_verify_callback(ssl::host_name_verification(host));
        } else {
            impl_->ws = std::make_unique<plain_ws_t>(impl_->ioc);
        }

        // One deadline covers TCP connect and the TLS and WebSocket handshakes.
        auto& tcp_layer = impl_->on_stream(
            [](auto& stream) -> beast::tcp_stream& { return beast::get_lowest_layer(stream); });
        tcp_layer.expires_after(timeout);

        auto ep = co_await tcp_layer.async_connect(results, net::use_awaitable);

        if (secure) {
            co_await impl_->tls_ws->next_layer().async_handshake(
                ssl::stream_base::client, net::use_awaitable);
        }

        auto host_str = host + ":" + std::to_string(ep.port());

        co_await impl_->on_stream([&](auto& stream) {
            stream.set_option(websocket::stream_base::decorator(
                [](websocket::request_type& req) {
                    req.set(beast::http::field::user_agent,
                            "cloudbrowser-cdp/1.0");
                }));

            // Remote browsers answer with large response bodies.
            stream.read_message_max(std::uint64_t{1} << 32);

            return stream.async_handshake(host_str, target, net::use_awaitable);
        });

        // The WebSocket layer has its own keep-alive from here on.
        tcp_layer.expires_never();
        impl_->on_stream([](auto& stream) {
            stream.set_option(websocket::stream_base::timeout::suggested(
                beast::role_type::client));
        });

        impl_->connected = true;
        LOG_DEBUG("CDP connected to {}", url_str);

        net::co_spawn(impl_->ioc, impl_->read_loop(), net::detached);
        net::co_spawn(impl_->ioc, impl_->write_loop(), net::detached);

        co_return ok_result();
    } catch (const beast::system_error& se) {
        auto code = se.code() == beast::error::timeout ? ErrorCode::Timeout
                                                        : ErrorCode::ConnectionFailed;
        co_return make_fail(
            make_error(code, "Failed to connect to CDP", se.what()));
    } catch (const std::exception& e) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionFailed,
                       "Failed to connect to CDP",
                       e.what()));
    }
}

auto CdpClient::send_command(std::string_view method, json params,
                             std::string_view session_id)
    -> awaitable<Result<json>> {
    if (!impl_->connected) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionClosed,
                       "CDP client not connected"));
    }

    auto impl = impl_;
    int id = impl->allocate_id();

    json message = {
        {"id", id},
        {"method", std::string(method)},
        {"params", std::move(params)},
    };
    if (!session_id.empty()) {
        message["sessionId"] = std::string(session_id);
    }

    auto channel = std::make_shared<result_channel_t>(impl->ioc, 1);
    {
        std::lock_guard lock(impl->pending_mutex);
        impl->pending_commands[id] = [channel](Result<json> result) {
            channel->try_send(boost::system::error_code{}, std::move(result));
        };
    }

    auto [send_ec] = co_await impl->outgoing.async_send(
        boost::system::error_code{}, message.dump(),
        net::as_tuple(net::use_awaitable));
    if (send_ec) {
        {
            std::lock_guard lock(impl->pending_mutex);
            impl->pending_commands.erase(id);
        }
        co_return make_fail(
            make_error(ErrorCode::ConnectionClosed,
                       "Failed to send CDP command",
                       std::string(method)));
    }

    auto [recv_ec, result] = co_await channel->async_receive(
        net::as_tuple(net::use_awaitable));
    if (recv_ec) {
        co_return make_fail(
            make_error(ErrorCode::ConnectionClosed,
                       "CDP command abandoned", std::string(method)));
    }
    co_return result;
}

void CdpClient::subscribe(std::string_view event, EventHandler handler,
                          std::string_view session_id) {
    std::lock_guard lock(impl_->handler_mutex);
    impl_->event_handlers[handler_key(event, session_id)] = std::move(handler);
    LOG_TRACE("Subscribed to CDP event: {}", handler_key(event, session_id));
}

void CdpClient::unsubscribe(std::string_view event, std::string_view session_id) {
    std::lock_guard lock(impl_->handler_mutex);
    impl_->event_handlers.erase(handler_key(event, session_id));
}

auto CdpClient::disconnect() -> awaitable<void> {
    if (!impl_->connected.exchange(false)) {
        co_return;
    }

    auto impl = impl_;
    impl->outgoing.close();

    if (impl->has_stream()) {
        auto [ec] = co_await impl->on_stream([](auto& stream) {
            return stream.async_close(websocket::close_code::normal,
                                      net::as_tuple(net::use_awaitable));
        });
        if (ec) {
            LOG_DEBUG("CDP close on {}: {}", impl->url, ec.message());
        }
    }

    impl->fail_pending(make_error(ErrorCode::ConnectionClosed, "CDP client disconnected"));
    LOG_DEBUG("CDP disconnected from {}", impl->url);
}

auto CdpClient::is_connected() const -> bool {
    return impl_ && impl_->connected;
}

auto CdpClient::ws_url() const -> std::string_view {
    return impl_->url;
}

} // namespace cloudbrowser::browser
