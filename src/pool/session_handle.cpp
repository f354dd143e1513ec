#include "cloudbrowser/pool/session_handle.hpp"

namespace cloudbrowser::pool {

auto to_string(SessionState state) -> std::string_view {
    switch (state) {
        case SessionState::Starting: return "starting";
        case SessionState::Ready: return "ready";
        case SessionState::Busy: return "busy";
        case SessionState::Dead: return "dead";
    }
    return "unknown";
}

SessionHandle::SessionHandle(std::size_t slot_index, std::optional<std::string> proxy)
    : proxy_(std::move(proxy)), slot_index_(slot_index) {}

void SessionHandle::mark_ready(std::string session_id) {
    if (state_ != SessionState::Starting) return;
    id_ = std::move(session_id);
    state_ = SessionState::Ready;
}

auto SessionHandle::mark_busy() -> bool {
    if (state_ != SessionState::Ready) return false;
    state_ = SessionState::Busy;
    return true;
}

void SessionHandle::mark_idle() {
    if (state_ == SessionState::Busy) {
        state_ = SessionState::Ready;
    }
}

auto SessionHandle::mark_dead() -> bool {
    if (state_ == SessionState::Dead) return false;
    state_ = SessionState::Dead;
    return true;
}

} // namespace cloudbrowser::pool
