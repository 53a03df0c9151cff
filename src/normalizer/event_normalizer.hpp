#pragma once

#include "aevo/types.hpp"
#include "core/messages.hpp"
#include "dydx/types.hpp"
#include <vector>

namespace crossbook::normalizer {

// Venue rows -> OrderEvent. Bids become Buy events and come first, asks
// become Sell events and follow, each side in wire order.

[[nodiscard]] std::vector<OrderEvent> to_events(const dydx::Subscribed& snapshot);
[[nodiscard]] std::vector<OrderEvent> to_events(const dydx::ChannelData& delta);
[[nodiscard]] std::vector<OrderEvent> to_events(const aevo::Snapshot& snapshot);
[[nodiscard]] std::vector<OrderEvent> to_events(const aevo::Update& update);

}  // namespace crossbook::normalizer
