#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cloudbrowser::pool {

enum class SessionState {
    Starting,
    Ready,
    Busy,
    Dead,
};

auto to_string(SessionState state) -> std::string_view;

/// The pool's record of one provisioned remote browser session.
///
/// The proxy is bound at construction. The session id is set once the
/// provisioning call returns. All mutation happens under the pool lock.
class SessionHandle {
public:
    SessionHandle(std::size_t slot_index, std::optional<std::string> proxy);

    [[nodiscard]] auto id() const -> const std::string& { return id_; }
    [[nodiscard]] auto proxy() const -> const std::optional<std::string>& { return proxy_; }
    [[nodiscard]] auto slot_index() const noexcept -> std::size_t { return slot_index_; }
    [[nodiscard]] auto pages_served() const noexcept -> std::uint64_t { return pages_served_; }
    [[nodiscard]] auto state() const noexcept -> SessionState { return state_; }
    [[nodiscard]] auto is_dead() const noexcept -> bool { return state_ == SessionState::Dead; }

    /// Flagged by a failed heartbeat while the handle was busy.
    [[nodiscard]] auto suspect() const noexcept -> bool { return suspect_; }
    void mark_suspect() noexcept { suspect_ = true; }

    /// Starting -> Ready once the remote session exists.
    void mark_ready(std::string session_id);

    /// Ready -> Busy. Returns false if the handle was not ready.
    auto mark_busy() -> bool;

    /// Busy -> Ready.
    void mark_idle();

    /// Returns true only for the call that performed the transition.
    auto mark_dead() -> bool;

    void record_page() noexcept { ++pages_served_; }

    [[nodiscard]] auto budget_reached(std::uint64_t pages_per_browser) const noexcept -> bool {
        return pages_served_ >= pages_per_browser;
    }

private:
    std::string id_;
    std::optional<std::string> proxy_;
    std::size_t slot_index_;
    std::uint64_t pages_served_ = 0;
    SessionState state_ = SessionState::Starting;
    bool suspect_ = false;
};

} // namespace cloudbrowser::pool
