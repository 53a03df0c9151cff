#pragma once

#include "core/types.hpp"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace crossbook::dydx {

/// Delta row: ["price", "quantity"], quantity "0" removes the level
using PriceLevel = std::pair<Price, Quantity>;

/// Snapshot row: one individual resting order, not aggregated per price
struct RestingOrder {
    Price price;
    Quantity size;
};

/// {"type":"connected"}, sent by the indexer before anything else
struct Connected {};

/// {"type":"subscribed","contents":{"bids":[{price,size}...],"asks":[...]}}
struct Subscribed {
    std::vector<RestingOrder> bids;
    std::vector<RestingOrder> asks;
};

/// {"type":"channel_data","contents":{"bids":[[p,q]...],"asks":[...]}}
/// Either side is omitted when it has no changes
struct ChannelData {
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
};

/// Any other "type" the indexer may send ("error", "unsubscribed", ...)
struct Other {
    std::string type;
};

using Message = std::variant<Connected, Subscribed, ChannelData, Other>;

}  // namespace crossbook::dydx
