#pragma once

#include "core/fixed_point.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace crossbook {

// 8 decimal places covers the tick and lot sizes of both venues
constexpr int kPriceDecimals = 8;
constexpr int kQuantityDecimals = 8;

// Price in quote currency (e.g., USD)
using Price = FixedPoint<kPriceDecimals>;

// Quantity in base currency (e.g., BTC); zero means "remove"
using Quantity = FixedPoint<kQuantityDecimals>;

// Running arbitrage balance in quote currency (spread x quantity)
using Notional = FixedPoint<kPriceDecimals>;

// Instrument identifier as the venue spells it ("BTC-USD", "BTC-PERP")
using Instrument = std::string;

/// Venues the engine can subscribe to
enum class Venue : std::uint8_t {
    Dydx,
    Aevo
};

/// Convert Venue to string for logging
[[nodiscard]] constexpr std::string_view to_string(Venue venue) noexcept {
    switch (venue) {
        case Venue::Dydx: return "dydx";
        case Venue::Aevo: return "aevo";
    }
    return "unknown";
}

namespace convert {

/// Parse price from decimal string
[[nodiscard]] inline Price parse_price(std::string_view s) {
    return Price::parse(s);
}

/// Parse quantity from decimal string
[[nodiscard]] inline Quantity parse_quantity(std::string_view s) {
    return Quantity::parse(s);
}

}  // namespace convert

}  // namespace crossbook
