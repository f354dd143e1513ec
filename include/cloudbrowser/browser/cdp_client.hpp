#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>

#include "cloudbrowser/core/error.hpp"

namespace cloudbrowser::browser {

using boost::asio::awaitable;
using json = nlohmann::json;

/// Callback type for CDP event subscriptions.
using EventHandler = std::function<void(json)>;

/// Chrome DevTools Protocol WebSocket client.
/// Communicates with a remote browser over the CDP WebSocket interface.
/// Commands may target a flattened target session via session_id; outgoing
/// frames are serialised through a single writer.
class CdpClient {
public:
    explicit CdpClient(boost::asio::io_context& ioc);
    ~CdpClient();

    CdpClient(const CdpClient&) = delete;
    CdpClient& operator=(const CdpClient&) = delete;
    CdpClient(CdpClient&&) noexcept;
    CdpClient& operator=(CdpClient&&) noexcept;

    /// Connect to the DevTools WebSocket endpoint (ws:// or wss://host:port/path).
    /// The TCP connect and handshake must complete within timeout.
    auto connect(std::string_view ws_url,
                 std::chrono::seconds timeout = std::chrono::seconds(10))
        -> awaitable<Result<void>>;

    /// Send a CDP command and await its result.
    /// method: CDP method name (e.g. "Page.navigate", "Browser.getVersion").
    /// params: optional JSON parameters for the command.
    /// session_id: target session for flattened mode, empty for the browser.
    auto send_command(std::string_view method, json params = json::object(),
                      std::string_view session_id = {})
        -> awaitable<Result<json>>;

    /// Subscribe to a CDP event, optionally scoped to one target session.
    /// The handler runs on the read loop and must not block.
    void subscribe(std::string_view event, EventHandler handler,
                   std::string_view session_id = {});

    /// Unsubscribe from a CDP event.
    void unsubscribe(std::string_view event, std::string_view session_id = {});

    /// Disconnect from the DevTools endpoint. Pending commands fail with
    /// ConnectionClosed.
    auto disconnect() -> awaitable<void>;

    /// Returns true if the client is currently connected.
    [[nodiscard]] auto is_connected() const -> bool;

    /// Get the WebSocket URL this client is connected to.
    [[nodiscard]] auto ws_url() const -> std::string_view;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace cloudbrowser::browser
