#pragma once

#include <string_view>

namespace crossbook::dydx {

/// Feed handler state machine states
enum class FeedState {
    Idle,            // Not started
    AwaitConnected,  // Channel opening, waiting for {"type":"connected"}
    AwaitSnapshot,   // Subscribe sent, waiting for {"type":"subscribed"}
    StreamDeltas,    // Snapshot emitted, forwarding channel_data
    Terminated,      // Terminal error emitted; nothing more will be emitted
    Stopped          // Stopped locally
};

/// Convert FeedState to string for logging
[[nodiscard]] constexpr std::string_view to_string(FeedState state) noexcept {
    switch (state) {
        case FeedState::Idle:           return "Idle";
        case FeedState::AwaitConnected: return "AwaitConnected";
        case FeedState::AwaitSnapshot:  return "AwaitSnapshot";
        case FeedState::StreamDeltas:   return "StreamDeltas";
        case FeedState::Terminated:     return "Terminated";
        case FeedState::Stopped:        return "Stopped";
    }
    return "Unknown";
}

}  // namespace crossbook::dydx
