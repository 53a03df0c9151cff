#include <gtest/gtest.h>
#include "output/json_formatter.hpp"

using namespace crossbook;
using crossbook::output::JsonFormatter;

TEST(JsonFormatterTest, OpportunityFields) {
    Opportunity opportunity{
        .incoming_venue = Venue::Aevo,
        .incoming_side = Side::Ask,
        .incoming_price = Price::parse("90"),
        .resting_venue = Venue::Dydx,
        .resting_price = Price::parse("100.25"),
        .spread = Price::parse("10.25"),
        .matched = Quantity::parse("0.5"),
        .balance = Notional::parse("5.125")
    };

    auto json = JsonFormatter::format_opportunity(opportunity);

    EXPECT_EQ(json["type"], "opportunity");
    EXPECT_EQ(json["incoming"]["venue"], "aevo");
    EXPECT_EQ(json["incoming"]["side"], "ask");
    EXPECT_EQ(json["incoming"]["price"], "90");
    EXPECT_EQ(json["resting"]["venue"], "dydx");
    EXPECT_EQ(json["resting"]["price"], "100.25");
    EXPECT_EQ(json["spread"], "10.25");
    EXPECT_EQ(json["matched"], "0.5");
    EXPECT_EQ(json["balance"], "5.125");
    EXPECT_TRUE(json["timestamp"].is_string());
}

TEST(JsonFormatterTest, AmountsAreExactStrings) {
    Opportunity opportunity{
        .incoming_venue = Venue::Dydx,
        .incoming_side = Side::Bid,
        .incoming_price = Price::parse("0.00000003"),
        .resting_venue = Venue::Aevo,
        .resting_price = Price::parse("0.00000001"),
        .spread = Price::parse("0.00000002"),
        .matched = Quantity::parse("123456789.1"),
        .balance = Notional::parse("2.46913578")
    };

    auto json = JsonFormatter::format_opportunity(opportunity);

    EXPECT_TRUE(json["spread"].is_string());
    EXPECT_EQ(json["spread"], "0.00000002");
    EXPECT_EQ(json["matched"], "123456789.1");
    EXPECT_EQ(json["balance"], "2.46913578");
}

TEST(JsonFormatterTest, FeedError) {
    FeedError error = ProtocolViolation{"\"connected\"", "subscribed"};

    auto json = JsonFormatter::format_feed_error(Venue::Dydx, error);

    EXPECT_EQ(json["type"], "feed_error");
    EXPECT_EQ(json["venue"], "dydx");
    EXPECT_EQ(json["kind"], "ProtocolViolation");
    EXPECT_EQ(json["message"], "protocol violation: expected \"connected\", received subscribed");
}

TEST(JsonFormatterTest, InvalidUtf8InErrorIsReplaced) {
    FeedError error = DecodeFailure{
        .path = ".",
        .excerpt = "{\"type\":\"\xff\"}",
        .expected_type = "dydx::Message",
        .detail = "invalid UTF-8 byte"
    };

    std::string line;
    ASSERT_NO_THROW(line = JsonFormatter::to_line(JsonFormatter::format_feed_error(Venue::Dydx, error)));

    EXPECT_NE(line.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(line)["kind"], "DecodeFailure");
}

TEST(JsonFormatterTest, Summary) {
    EngineStats stats;
    stats.dydx_events = 12;
    stats.aevo_events = 7;
    stats.opportunities = 2;
    stats.needless_removals = 1;
    stats.feed_errors = 1;
    stats.balance = Notional::parse("42.5");

    auto json = JsonFormatter::format_summary(stats, EngineStatus::Failed);

    EXPECT_EQ(json["type"], "summary");
    EXPECT_EQ(json["status"], "Failed");
    EXPECT_EQ(json["events"]["dydx"], 12);
    EXPECT_EQ(json["events"]["aevo"], 7);
    EXPECT_EQ(json["opportunities"], 2);
    EXPECT_EQ(json["needlessRemovals"], 1);
    EXPECT_EQ(json["feedErrors"], 1);
    EXPECT_EQ(json["balance"], "42.5");
}

TEST(JsonFormatterTest, TimestampFormat) {
    auto ts = JsonFormatter::iso_timestamp();

    // YYYY-MM-DDTHH:MM:SS.mmmZ
    ASSERT_EQ(ts.size(), 24u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts[19], '.');
    EXPECT_EQ(ts.back(), 'Z');
}
