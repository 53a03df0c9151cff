#include <gtest/gtest.h>
#include "engine/engine_status.hpp"
#include "engine/opportunity.hpp"
#include <cstdint>
#include <limits>
#include <string>

using namespace crossbook;

namespace {

Price p(const char* s) { return Price::parse(s); }
Quantity q(const char* s) { return Quantity::parse(s); }

}  // namespace

TEST(OpportunityTest, SellIntoHigherBid) {
    // dYdX bids 100 x 5, Aevo then asks 90 x 7
    VenueCrossing resting{Venue::Dydx, p("100"), q("5")};

    auto opportunity = evaluate(Venue::Aevo, Sell{p("90"), q("7")}, resting, Notional{}).value();

    EXPECT_EQ(opportunity.incoming_venue, Venue::Aevo);
    EXPECT_EQ(opportunity.incoming_side, Side::Ask);
    EXPECT_EQ(opportunity.incoming_price, p("90"));
    EXPECT_EQ(opportunity.resting_venue, Venue::Dydx);
    EXPECT_EQ(opportunity.resting_price, p("100"));
    EXPECT_EQ(opportunity.spread, p("10"));
    EXPECT_EQ(opportunity.matched, q("5"));
    EXPECT_EQ(opportunity.balance, Notional::parse("50"));
}

TEST(OpportunityTest, BuyAboveLowerAsk) {
    VenueCrossing resting{Venue::Aevo, p("60"), q("1")};

    auto opportunity = evaluate(Venue::Dydx, Buy{p("60.5"), q("0.25")}, resting, Notional{}).value();

    EXPECT_EQ(opportunity.incoming_side, Side::Bid);
    EXPECT_EQ(opportunity.spread, p("0.5"));
    EXPECT_EQ(opportunity.matched, q("0.25"));
    EXPECT_EQ(opportunity.balance, Notional::parse("0.125"));
}

TEST(OpportunityTest, BalanceAccumulates) {
    VenueCrossing resting{Venue::Dydx, p("100"), q("2")};

    auto first = evaluate(Venue::Aevo, Sell{p("99"), q("2")}, resting, Notional{}).value();
    auto second = evaluate(Venue::Aevo, Sell{p("98"), q("1")}, resting, first.balance).value();

    EXPECT_EQ(first.balance, Notional::parse("2"));
    EXPECT_EQ(second.spread, p("2"));
    EXPECT_EQ(second.balance, Notional::parse("4"));
}

TEST(OpportunityTest, SpreadIsAlwaysPositive) {
    VenueCrossing low{Venue::Aevo, p("10"), q("1")};
    VenueCrossing high{Venue::Aevo, p("12"), q("1")};

    EXPECT_EQ(evaluate(Venue::Dydx, Buy{p("12"), q("1")}, low, Notional{}).value().spread, p("2"));
    EXPECT_EQ(evaluate(Venue::Dydx, Sell{p("10"), q("1")}, high, Notional{}).value().spread, p("2"));
}

TEST(OpportunityTest, ProductOverflowIsAnError) {
    // 100000 x 2000000 does not fit in 8-decimal fixed point
    VenueCrossing resting{Venue::Aevo, p("100000"), q("2000000")};

    auto result = evaluate(Venue::Dydx, Buy{p("200000"), q("2000000")}, resting, Notional{});

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("overflow"), std::string::npos);
}

TEST(OpportunityTest, BalanceOverflowIsAnError) {
    VenueCrossing resting{Venue::Aevo, p("10"), q("1")};
    auto near_max = Notional::from_raw(std::numeric_limits<std::int64_t>::max() - 1);

    auto result = evaluate(Venue::Dydx, Buy{p("11"), q("1")}, resting, near_max);

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("addition overflow"), std::string::npos);
}

TEST(OpportunityTest, ProductRoundsHalfAwayFromZero) {
    // The balance keeps 8 decimals; half of the last unit rounds up
    VenueCrossing resting{Venue::Aevo, p("1.00000001"), q("1")};

    auto opportunity = evaluate(Venue::Dydx, Buy{p("1.00000002"), q("0.5")}, resting, Notional{}).value();

    EXPECT_EQ(opportunity.spread, p("0.00000001"));
    EXPECT_EQ(opportunity.balance, Notional::parse("0.00000001"));
}

TEST(OpportunityTest, SideNames) {
    EXPECT_EQ(to_string(Side::Bid), "bid");
    EXPECT_EQ(to_string(Side::Ask), "ask");
    EXPECT_EQ(side_of(Buy{p("1"), q("1")}), Side::Bid);
    EXPECT_EQ(side_of(Sell{p("1"), q("1")}), Side::Ask);
}

// ============================================================================
// Engine status
// ============================================================================

TEST(EngineStatusTest, FinishedStates) {
    EXPECT_FALSE(is_finished(EngineStatus::Idle));
    EXPECT_FALSE(is_finished(EngineStatus::Running));
    EXPECT_TRUE(is_finished(EngineStatus::Interrupted));
    EXPECT_TRUE(is_finished(EngineStatus::Failed));
    EXPECT_TRUE(is_finished(EngineStatus::Exhausted));
}

TEST(EngineStatusTest, OnlyInterruptExitsCleanly) {
    EXPECT_EQ(exit_code(EngineStatus::Interrupted), 0);
    EXPECT_EQ(exit_code(EngineStatus::Failed), 1);
    EXPECT_EQ(exit_code(EngineStatus::Exhausted), 1);
}

TEST(EngineStatusTest, EventsPerVenue) {
    EngineStats stats;
    stats.dydx_events = 3;
    stats.aevo_events = 5;

    EXPECT_EQ(stats.events(Venue::Dydx), 3u);
    EXPECT_EQ(stats.events(Venue::Aevo), 5u);
}
