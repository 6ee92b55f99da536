#pragma once

#include <cstdint>
#include <string_view>

namespace ember {

enum class ConnectionStatus : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Subscribed,
    ShuttingDown,
};

inline std::string_view to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::Subscribed: return "subscribed";
        case ConnectionStatus::ShuttingDown: return "shutting_down";
    }
    return "unknown";
}

inline bool is_link_up(ConnectionStatus status) {
    return status == ConnectionStatus::Connected || status == ConnectionStatus::Subscribed;
}

enum class SessionState : uint8_t {
    Running,
    Restarting,
    Stopped,
};

inline std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Running: return "running";
        case SessionState::Restarting: return "restarting";
        case SessionState::Stopped: return "stopped";
    }
    return "unknown";
}

} // namespace ember
