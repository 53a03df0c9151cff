#include <gtest/gtest.h>
#include "arbitrage/arbitrage_ledger.hpp"
#include <random>
#include <string>

using namespace crossbook;

namespace {

Price p(const char* s) { return Price::parse(s); }
Quantity q(const char* s) { return Quantity::parse(s); }

}  // namespace

class ArbitrageLedgerTest : public ::testing::Test {
protected:
    using Ledger = ArbitrageLedger<Venue>;
    using Cross = Ledger::CrossingT;

    Ledger ledger;
};

// ============================================================================
// Recording
// ============================================================================

TEST_F(ArbitrageLedgerTest, StartsEmpty) {
    EXPECT_TRUE(ledger.empty());
    EXPECT_EQ(ledger.bid_levels(), 0u);
    EXPECT_EQ(ledger.ask_levels(), 0u);
    EXPECT_FALSE(ledger.best_bid().has_value());
    EXPECT_FALSE(ledger.best_ask().has_value());
}

TEST_F(ArbitrageLedgerTest, BuyRecordsBid) {
    auto result = ledger.buy(Venue::Dydx, p("100"), q("2"));

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
    EXPECT_EQ(ledger.bid_quantity(p("100"), Venue::Dydx), q("2"));
    EXPECT_FALSE(ledger.ask_quantity(p("100"), Venue::Dydx).has_value());
    EXPECT_EQ(ledger.bid_levels(), 1u);
}

TEST_F(ArbitrageLedgerTest, LastWriteWins) {
    (void)ledger.sell(Venue::Aevo, p("60"), q("1"));
    (void)ledger.sell(Venue::Aevo, p("60"), q("7"));

    EXPECT_EQ(ledger.ask_quantity(p("60"), Venue::Aevo), q("7"));
    EXPECT_EQ(ledger.ask_levels(), 1u);
}

TEST_F(ArbitrageLedgerTest, VenuesShareALevel) {
    (void)ledger.buy(Venue::Dydx, p("100"), q("1"));
    (void)ledger.buy(Venue::Aevo, p("100"), q("3"));

    EXPECT_EQ(ledger.bid_levels(), 1u);
    EXPECT_EQ(ledger.bid_quantity(p("100"), Venue::Dydx), q("1"));
    EXPECT_EQ(ledger.bid_quantity(p("100"), Venue::Aevo), q("3"));
}

TEST_F(ArbitrageLedgerTest, BestPrices) {
    (void)ledger.buy(Venue::Dydx, p("99"), q("1"));
    (void)ledger.buy(Venue::Dydx, p("100"), q("1"));
    (void)ledger.sell(Venue::Dydx, p("102"), q("1"));
    (void)ledger.sell(Venue::Dydx, p("101"), q("1"));

    EXPECT_EQ(ledger.best_bid(), p("100"));
    EXPECT_EQ(ledger.best_ask(), p("101"));
    EXPECT_EQ(ledger.bids().begin()->first, p("100"));
    EXPECT_EQ(ledger.asks().begin()->first, p("101"));
}

TEST_F(ArbitrageLedgerTest, ClearEmptiesBothSides) {
    (void)ledger.buy(Venue::Dydx, p("99"), q("1"));
    (void)ledger.sell(Venue::Aevo, p("101"), q("1"));

    ledger.clear();

    EXPECT_TRUE(ledger.empty());
}

// ============================================================================
// Removal
// ============================================================================

TEST_F(ArbitrageLedgerTest, ZeroQuantityRemovesVenue) {
    (void)ledger.buy(Venue::Dydx, p("100"), q("1"));
    (void)ledger.buy(Venue::Aevo, p("100"), q("2"));

    auto result = ledger.buy(Venue::Dydx, p("100"), Quantity{});

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
    EXPECT_FALSE(ledger.bid_quantity(p("100"), Venue::Dydx).has_value());
    EXPECT_EQ(ledger.bid_quantity(p("100"), Venue::Aevo), q("2"));
    EXPECT_EQ(ledger.bid_levels(), 1u);
}

TEST_F(ArbitrageLedgerTest, RemovingLastVenueDeletesLevel) {
    (void)ledger.buy(Venue::Dydx, p("100"), q("1"));

    ASSERT_TRUE(ledger.buy(Venue::Dydx, p("100"), Quantity{}).is_ok());

    EXPECT_EQ(ledger.bid_levels(), 0u);
    EXPECT_TRUE(ledger.empty());
}

TEST_F(ArbitrageLedgerTest, SecondRemovalIsNeedless) {
    (void)ledger.buy(Venue::Dydx, p("100"), q("1"));

    auto first = ledger.buy(Venue::Dydx, p("100"), Quantity{});
    auto second = ledger.buy(Venue::Dydx, p("100"), Quantity{});

    EXPECT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.error().exchange, Venue::Dydx);
}

TEST_F(ArbitrageLedgerTest, RemovalOfUnknownVenueAtLiveLevelIsNeedless) {
    (void)ledger.buy(Venue::Dydx, p("100"), q("1"));

    auto result = ledger.buy(Venue::Aevo, p("100"), Quantity{});

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), NeedlessRemoval<Venue>{Venue::Aevo});
    // Ledger unaffected
    EXPECT_EQ(ledger.bid_quantity(p("100"), Venue::Dydx), q("1"));
}

TEST_F(ArbitrageLedgerTest, SellRemovalTouchesAsksOnly) {
    (void)ledger.buy(Venue::Aevo, p("60"), q("1"));
    (void)ledger.sell(Venue::Aevo, p("60"), q("1"));

    ASSERT_TRUE(ledger.sell(Venue::Aevo, p("60"), Quantity{}).is_ok());

    EXPECT_FALSE(ledger.ask_quantity(p("60"), Venue::Aevo).has_value());
    EXPECT_EQ(ledger.bid_quantity(p("60"), Venue::Aevo), q("1"));
}

TEST_F(ArbitrageLedgerTest, SellRemovalWithOnlyABidIsNeedless) {
    (void)ledger.buy(Venue::Aevo, p("60"), q("1"));

    auto result = ledger.sell(Venue::Aevo, p("60"), Quantity{});

    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(ledger.bid_quantity(p("60"), Venue::Aevo), q("1"));
}

// ============================================================================
// Crossing detection
// ============================================================================

TEST_F(ArbitrageLedgerTest, BuyCrossesCheapestAskFirst) {
    (void)ledger.sell(Venue::Dydx, p("90"), q("5"));
    (void)ledger.sell(Venue::Dydx, p("100"), q("5"));

    auto result = ledger.buy(Venue::Aevo, p("95"), q("3"));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0], (Cross{Venue::Dydx, p("90"), q("5")}));
}

TEST_F(ArbitrageLedgerTest, BuyCollectsEveryLowerAskInOrder) {
    (void)ledger.sell(Venue::Dydx, p("92"), q("1"));
    (void)ledger.sell(Venue::Dydx, p("90"), q("2"));
    (void)ledger.sell(Venue::Dydx, p("91"), q("3"));

    auto result = ledger.buy(Venue::Aevo, p("95"), q("1"));

    ASSERT_TRUE(result.is_ok());
    const auto& crossings = result.value();
    ASSERT_EQ(crossings.size(), 3u);
    EXPECT_EQ(crossings[0].price, p("90"));
    EXPECT_EQ(crossings[1].price, p("91"));
    EXPECT_EQ(crossings[2].price, p("92"));
}

TEST_F(ArbitrageLedgerTest, EqualPriceDoesNotCross) {
    (void)ledger.sell(Venue::Dydx, p("95"), q("1"));

    auto result = ledger.buy(Venue::Aevo, p("95"), q("1"));

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(ArbitrageLedgerTest, SellCrossesHighestBidFirst) {
    (void)ledger.buy(Venue::Aevo, p("105"), q("1"));
    (void)ledger.buy(Venue::Aevo, p("110"), q("2"));
    (void)ledger.buy(Venue::Aevo, p("99"), q("9"));

    auto result = ledger.sell(Venue::Dydx, p("100"), q("4"));

    ASSERT_TRUE(result.is_ok());
    const auto& crossings = result.value();
    ASSERT_EQ(crossings.size(), 2u);
    EXPECT_EQ(crossings[0], (Cross{Venue::Aevo, p("110"), q("2")}));
    EXPECT_EQ(crossings[1], (Cross{Venue::Aevo, p("105"), q("1")}));
}

TEST_F(ArbitrageLedgerTest, OwnOrdersNeverCross) {
    (void)ledger.sell(Venue::Dydx, p("90"), q("5"));

    auto result = ledger.buy(Venue::Dydx, p("95"), q("3"));

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(ArbitrageLedgerTest, OwnEntriesSkippedAtSharedLevel) {
    (void)ledger.sell(Venue::Dydx, p("90"), q("5"));
    (void)ledger.sell(Venue::Aevo, p("90"), q("2"));

    auto result = ledger.buy(Venue::Dydx, p("95"), q("3"));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0], (Cross{Venue::Aevo, p("90"), q("2")}));
}

TEST_F(ArbitrageLedgerTest, RemovalNeverScans) {
    (void)ledger.sell(Venue::Dydx, p("90"), q("5"));
    (void)ledger.buy(Venue::Aevo, p("95"), q("1"));

    auto result = ledger.buy(Venue::Aevo, p("95"), Quantity{});

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(ArbitrageLedgerTest, MaxCrossingsBoundsTheList) {
    Ledger bounded(2);
    (void)bounded.sell(Venue::Dydx, p("90"), q("1"));
    (void)bounded.sell(Venue::Dydx, p("91"), q("1"));
    (void)bounded.sell(Venue::Dydx, p("92"), q("1"));

    auto result = bounded.buy(Venue::Aevo, p("100"), q("1"));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[0].price, p("90"));
    EXPECT_EQ(result.value()[1].price, p("91"));
    EXPECT_EQ(bounded.max_crossings(), 2u);
}

TEST_F(ArbitrageLedgerTest, CandidatesAreCopies) {
    (void)ledger.sell(Venue::Dydx, p("90"), q("5"));

    auto crossings = ledger.buy(Venue::Aevo, p("95"), q("3")).value();
    (void)ledger.sell(Venue::Dydx, p("90"), Quantity{});

    ASSERT_EQ(crossings.size(), 1u);
    EXPECT_EQ(crossings[0].quantity, q("5"));
}

// ============================================================================
// Generic exchange ids
// ============================================================================

TEST(ArbitrageLedgerGenericTest, StringExchangeIds) {
    ArbitrageLedger<std::string> ledger;

    (void)ledger.sell("kraken", p("10"), q("1"));
    auto result = ledger.buy("coinbase", p("11"), q("1"));

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].exchange, "kraken");

    auto needless = ledger.buy("bitstamp", p("11"), Quantity{});
    ASSERT_TRUE(needless.is_err());
    EXPECT_EQ(needless.error().exchange, "bitstamp");
}

// ============================================================================
// Invariants under random updates
// ============================================================================

TEST_F(ArbitrageLedgerTest, LevelsNeverEmptyAfterRandomUpdates) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> price_dist(90, 110);
    std::uniform_int_distribution<int> qty_dist(0, 3);
    std::uniform_int_distribution<int> coin(0, 1);

    for (int i = 0; i < 5000; ++i) {
        Venue venue = coin(rng) ? Venue::Dydx : Venue::Aevo;
        Price price(price_dist(rng));
        Quantity quantity(qty_dist(rng));

        auto result = coin(rng) ? ledger.buy(venue, price, quantity)
                                : ledger.sell(venue, price, quantity);

        if (result.is_ok()) {
            for (const auto& crossing : result.value()) {
                EXPECT_NE(crossing.exchange, venue);
                EXPECT_FALSE(crossing.quantity.is_zero());
            }
        }
    }

    for (const auto& [price, venues] : ledger.bids()) {
        EXPECT_FALSE(venues.empty()) << "empty bid level " << price.to_string();
        for (const auto& [venue, quantity] : venues) {
            EXPECT_TRUE(quantity.is_positive());
        }
    }
    for (const auto& [price, venues] : ledger.asks()) {
        EXPECT_FALSE(venues.empty()) << "empty ask level " << price.to_string();
        for (const auto& [venue, quantity] : venues) {
            EXPECT_TRUE(quantity.is_positive());
        }
    }
}
