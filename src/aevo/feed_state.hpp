#pragma once

#include <string_view>

namespace crossbook::aevo {

/// Feed handler state machine states
enum class FeedState {
    Idle,           // Not started
    Subscribing,    // Channel opening; subscribe goes out as soon as it is open
    AwaitSnapshot,  // Subscribe sent, waiting for the first snapshot
    AwaitAck,       // Snapshot held back until the acknowledgement is consumed
    StreamUpdates,  // Snapshot emitted, forwarding updates
    Terminated,     // Terminal error emitted; nothing more will be emitted
    Stopped         // Stopped locally
};

/// Convert FeedState to string for logging
[[nodiscard]] constexpr std::string_view to_string(FeedState state) noexcept {
    switch (state) {
        case FeedState::Idle:          return "Idle";
        case FeedState::Subscribing:   return "Subscribing";
        case FeedState::AwaitSnapshot: return "AwaitSnapshot";
        case FeedState::AwaitAck:      return "AwaitAck";
        case FeedState::StreamUpdates: return "StreamUpdates";
        case FeedState::Terminated:    return "Terminated";
        case FeedState::Stopped:       return "Stopped";
    }
    return "Unknown";
}

}  // namespace crossbook::aevo
