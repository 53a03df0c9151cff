#pragma once

#include "core/types.hpp"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace crossbook::aevo {

/// ["price", "quantity"], already aggregated per price by the venue
using PriceLevel = std::pair<Price, Quantity>;

/// {"data":{"type":"snapshot","bids":[...],"asks":[...]}}
struct Snapshot {
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
};

/// {"data":{"type":"update","bids":[...],"asks":[...]}}
struct Update {
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
};

/// Any other "type" inside "data"
struct Other {
    std::string type;
};

using Message = std::variant<Snapshot, Update, Other>;

/// {"data":["orderbook:BTC-PERP"]}, sent once right after the first snapshot
struct SubscribeAck {
    std::vector<std::string> channels;
};

}  // namespace crossbook::aevo
