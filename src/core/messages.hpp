#pragma once

#include "core/errors.hpp"
#include "core/types.hpp"
#include <string_view>
#include <variant>

namespace crossbook {

/// Venue is bidding at price
struct Buy {
    Price price;
    Quantity quantity;

    bool operator==(const Buy&) const = default;
};

/// Venue is asking at price
struct Sell {
    Price price;
    Quantity quantity;

    bool operator==(const Sell&) const = default;
};

/// Normalized order book row, identical for every venue
using OrderEvent = std::variant<Buy, Sell>;

/// What an event does to the (side, price, venue) entry it names
enum class LevelAction {
    Set,     // record quantity, replacing any previous one
    Remove   // quantity zero: drop the venue from the level
};

[[nodiscard]] inline LevelAction action(const OrderEvent& event) noexcept {
    return std::visit([](const auto& e) {
        return e.quantity.is_zero() ? LevelAction::Remove : LevelAction::Set;
    }, event);
}

[[nodiscard]] inline Price price_of(const OrderEvent& event) noexcept {
    return std::visit([](const auto& e) { return e.price; }, event);
}

[[nodiscard]] inline Quantity quantity_of(const OrderEvent& event) noexcept {
    return std::visit([](const auto& e) { return e.quantity; }, event);
}

/// Output contract shared by every venue feed handler
using FeedMessage = std::variant<OrderEvent, FeedError>;

/// Helper to get message type name for logging
[[nodiscard]] inline std::string_view message_type_name(const OrderEvent& event) {
    return std::visit([](const auto& e) -> std::string_view {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Buy>) return "Buy";
        else return "Sell";
    }, event);
}

}  // namespace crossbook
