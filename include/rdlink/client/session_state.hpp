#pragma once
#include <cstdint>
#include <string_view>
namespace rdlink::client {
enum class SessionState : uint8_t {
    Idle,
    Connecting,
    WaitingPassword,
    Authenticating,
    Streaming,
    Disconnected,
    Error
};
[[nodiscard]] constexpr std::string_view ToString(const SessionState state) noexcept {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Connecting: return "connecting";
        case SessionState::WaitingPassword: return "waiting_password";
        case SessionState::Authenticating: return "authenticating";
        case SessionState::Streaming: return "streaming";
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Error: return "error";
    }
    return "unknown";
}
[[nodiscard]] constexpr bool IsTerminal(const SessionState state) noexcept {
    return state == SessionState::Disconnected || state == SessionState::Error;
}
}
