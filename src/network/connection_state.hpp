#pragma once

#include <string_view>

namespace crossbook::network {

/// Connection state of a WebSocket channel
enum class ConnectionState {
    Disconnected,    // Not connected
    Resolving,       // DNS resolution in progress
    Connecting,      // TCP connection in progress
    SslHandshake,    // TLS handshake in progress
    WsHandshake,     // WebSocket upgrade in progress
    Connected,       // Open; frames flow both ways
    Closing,         // Local close in progress
    Closed,          // Ended (locally, by the peer, or by an error)
};

/// Convert ConnectionState to string for logging
[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Resolving:    return "Resolving";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::SslHandshake: return "SslHandshake";
        case ConnectionState::WsHandshake:  return "WsHandshake";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Closing:      return "Closing";
        case ConnectionState::Closed:       return "Closed";
    }
    return "Unknown";
}

}  // namespace crossbook::network
