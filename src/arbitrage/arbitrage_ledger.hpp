#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace crossbook {

/// A venue reported zero quantity for a (price, venue) entry that was not in the ledger
/// The ledger is unaffected; the venue may have lost an earlier update.
template <typename ExchangeIdT>
struct NeedlessRemoval {
    ExchangeIdT exchange;

    bool operator==(const NeedlessRemoval&) const = default;
};

/// Opposite-side entry that an incoming order crosses
template <typename ExchangeIdT, typename PriceT, typename QuantityT>
struct Crossing {
    ExchangeIdT exchange;
    PriceT price;
    QuantityT quantity;

    bool operator==(const Crossing&) const = default;
};

/// Consolidated order ledger across venues, used only to find crossings
///
/// Each side maps price -> (venue -> quantity). A level exists only while some
/// venue has a non-zero quantity there; every (side, price, venue) entry keeps
/// only the last reported quantity. Single-threaded; no locking.
template <typename ExchangeIdT,
          typename PriceT = Price,
          typename QuantityT = Quantity,
          typename Hash = std::hash<ExchangeIdT>>
class ArbitrageLedger {
public:
    using VenueQuantities = std::unordered_map<ExchangeIdT, QuantityT, Hash>;

    /// Highest bid first
    using BidSide = std::map<PriceT, VenueQuantities, std::greater<PriceT>>;

    /// Lowest ask first
    using AskSide = std::map<PriceT, VenueQuantities>;

    using CrossingT = Crossing<ExchangeIdT, PriceT, QuantityT>;
    using Crossings = std::vector<CrossingT>;
    using UpdateResult = Result<Crossings, NeedlessRemoval<ExchangeIdT>>;

    /// @param max_crossings Cap on candidates returned per update, 0 = no cap
    explicit ArbitrageLedger(std::size_t max_crossings = 0)
        : max_crossings_(max_crossings)
    {}

    /// Record a bid; zero quantity removes the venue from that bid level
    /// @return Asks strictly below price from other venues, cheapest first,
    ///         or NeedlessRemoval if a removal named an unknown entry
    [[nodiscard]] UpdateResult buy(const ExchangeIdT& exchange, const PriceT& price,
                                   const QuantityT& quantity) {
        if (quantity == QuantityT{}) {
            return remove(bids_, price, exchange);
        }
        bids_[price][exchange] = quantity;
        return UpdateResult::Ok(scan(asks_, exchange, [&price](const PriceT& ask) {
            return ask < price;
        }));
    }

    /// Record an ask; zero quantity removes the venue from that ask level
    /// @return Bids strictly above price from other venues, highest first,
    ///         or NeedlessRemoval if a removal named an unknown entry
    [[nodiscard]] UpdateResult sell(const ExchangeIdT& exchange, const PriceT& price,
                                    const QuantityT& quantity) {
        if (quantity == QuantityT{}) {
            return remove(asks_, price, exchange);
        }
        asks_[price][exchange] = quantity;
        return UpdateResult::Ok(scan(bids_, exchange, [&price](const PriceT& bid) {
            return bid > price;
        }));
    }

    /// Quantity recorded for a venue at a bid price
    [[nodiscard]] std::optional<QuantityT> bid_quantity(const PriceT& price,
                                                        const ExchangeIdT& exchange) const {
        return lookup(bids_, price, exchange);
    }

    /// Quantity recorded for a venue at an ask price
    [[nodiscard]] std::optional<QuantityT> ask_quantity(const PriceT& price,
                                                        const ExchangeIdT& exchange) const {
        return lookup(asks_, price, exchange);
    }

    [[nodiscard]] std::optional<PriceT> best_bid() const {
        if (bids_.empty()) {
            return std::nullopt;
        }
        return bids_.begin()->first;
    }

    [[nodiscard]] std::optional<PriceT> best_ask() const {
        if (asks_.empty()) {
            return std::nullopt;
        }
        return asks_.begin()->first;
    }

    [[nodiscard]] std::size_t bid_levels() const noexcept { return bids_.size(); }
    [[nodiscard]] std::size_t ask_levels() const noexcept { return asks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return bids_.empty() && asks_.empty(); }
    [[nodiscard]] std::size_t max_crossings() const noexcept { return max_crossings_; }

    [[nodiscard]] const BidSide& bids() const noexcept { return bids_; }
    [[nodiscard]] const AskSide& asks() const noexcept { return asks_; }

    void clear() {
        bids_.clear();
        asks_.clear();
    }

private:
    template <typename Side>
    static UpdateResult remove(Side& side, const PriceT& price, const ExchangeIdT& exchange) {
        auto level = side.find(price);
        if (level == side.end()) {
            return UpdateResult::Err(NeedlessRemoval<ExchangeIdT>{exchange});
        }

        bool erased = level->second.erase(exchange) > 0;
        if (level->second.empty()) {
            side.erase(level);
        }

        if (!erased) {
            return UpdateResult::Err(NeedlessRemoval<ExchangeIdT>{exchange});
        }
        return UpdateResult::Ok(Crossings{});
    }

    /// Walk levels in side order while crosses(price) holds, skipping own entries
    template <typename Side, typename CrossesFn>
    Crossings scan(const Side& side, const ExchangeIdT& own, CrossesFn crosses) const {
        Crossings out;
        for (auto level = side.begin(); level != side.end() && crosses(level->first); ++level) {
            for (const auto& [exchange, quantity] : level->second) {
                if (exchange == own) {
                    continue;
                }
                out.push_back(CrossingT{exchange, level->first, quantity});
                if (max_crossings_ != 0 && out.size() >= max_crossings_) {
                    return out;
                }
            }
        }
        return out;
    }

    template <typename Side>
    static std::optional<QuantityT> lookup(const Side& side, const PriceT& price,
                                           const ExchangeIdT& exchange) {
        auto level = side.find(price);
        if (level == side.end()) {
            return std::nullopt;
        }
        auto entry = level->second.find(exchange);
        if (entry == level->second.end()) {
            return std::nullopt;
        }
        return entry->second;
    }

    BidSide bids_;
    AskSide asks_;
    std::size_t max_crossings_;
};

}  // namespace crossbook
