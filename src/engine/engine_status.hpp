#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string_view>

namespace crossbook {

/// Lifecycle of an ArbitrageEngine run
enum class EngineStatus : std::uint8_t {
    Idle,
    Running,
    Interrupted,  // stopped by the user
    Failed,       // a feed failed under the fail-fast policy
    Exhausted     // every feed ended
};

[[nodiscard]] constexpr std::string_view to_string(EngineStatus status) noexcept {
    switch (status) {
        case EngineStatus::Idle:        return "Idle";
        case EngineStatus::Running:     return "Running";
        case EngineStatus::Interrupted: return "Interrupted";
        case EngineStatus::Failed:      return "Failed";
        case EngineStatus::Exhausted:   return "Exhausted";
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool is_finished(EngineStatus status) noexcept {
    return status == EngineStatus::Interrupted ||
           status == EngineStatus::Failed ||
           status == EngineStatus::Exhausted;
}

/// Process exit code for a finished run
[[nodiscard]] constexpr int exit_code(EngineStatus status) noexcept {
    return status == EngineStatus::Interrupted ? 0 : 1;
}

/// Counters kept over a run
struct EngineStats {
    std::uint64_t dydx_events = 0;
    std::uint64_t aevo_events = 0;
    std::uint64_t opportunities = 0;
    std::uint64_t needless_removals = 0;
    std::uint64_t feed_errors = 0;
    std::uint64_t pricing_errors = 0;
    Notional balance;

    [[nodiscard]] std::uint64_t events(Venue venue) const noexcept {
        return venue == Venue::Dydx ? dydx_events : aevo_events;
    }
};

}  // namespace crossbook
