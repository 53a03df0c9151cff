#pragma once

#include "arbitrage/arbitrage_ledger.hpp"
#include "core/messages.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace crossbook {

/// Side of the book an incoming event was recorded on
enum class Side : std::uint8_t {
    Bid,
    Ask
};

[[nodiscard]] constexpr std::string_view to_string(Side side) noexcept {
    switch (side) {
        case Side::Bid: return "bid";
        case Side::Ask: return "ask";
    }
    return "unknown";
}

[[nodiscard]] inline Side side_of(const OrderEvent& event) noexcept {
    return std::holds_alternative<Buy>(event) ? Side::Bid : Side::Ask;
}

using VenueLedger = ArbitrageLedger<Venue>;
using VenueCrossing = VenueLedger::CrossingT;

/// A cross-venue price crossing as reported to the user
struct Opportunity {
    Venue incoming_venue;
    Side incoming_side;
    Price incoming_price;
    Venue resting_venue;
    Price resting_price;
    Price spread;           // |incoming_price - resting_price|
    Quantity matched;       // min(incoming quantity, resting quantity)
    Notional balance;       // running total of spread x matched, this one included

    bool operator==(const Opportunity&) const = default;
};

/// Price the first crossing candidate of an update
/// @param venue Venue the event came from
/// @param event Event that produced the crossing
/// @param candidate Best resting entry on the opposite side
/// @param balance_before Running balance before this opportunity
/// @return The opportunity, or an error when spread, product or balance overflow
[[nodiscard]] Result<Opportunity, std::string> evaluate(
    Venue venue,
    const OrderEvent& event,
    const VenueCrossing& candidate,
    const Notional& balance_before
);

}  // namespace crossbook
