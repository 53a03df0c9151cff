#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "core/messages.hpp"
#include <string>

using namespace crossbook;

TEST(FeedErrorTest, KindNames) {
    EXPECT_EQ(kind_name(TransportFailure{"eof"}), "TransportFailure");
    EXPECT_EQ(kind_name(ProtocolViolation{"\"connected\"", "channel_data"}), "ProtocolViolation");
    EXPECT_EQ(kind_name(DecodeFailure{}), "DecodeFailure");
}

TEST(FeedErrorTest, DescribeTransportFailure) {
    FeedError error = TransportFailure{"stream closed by peer"};
    EXPECT_EQ(describe(error), "transport failure: stream closed by peer");
}

TEST(FeedErrorTest, DescribeProtocolViolation) {
    FeedError error = ProtocolViolation{"\"subscribed\"", "channel_data"};
    EXPECT_EQ(describe(error), "protocol violation: expected \"subscribed\", received channel_data");
}

TEST(FeedErrorTest, DescribeDecodeFailureNamesEveryPart) {
    FeedError error = DecodeFailure{
        "contents.bids[0].price",
        R"({"type":"subscribed"})",
        "dydx::Message",
        "missing field `price`"
    };

    auto text = describe(error);
    EXPECT_NE(text.find("dydx::Message"), std::string::npos);
    EXPECT_NE(text.find("contents.bids[0].price"), std::string::npos);
    EXPECT_NE(text.find("missing field `price`"), std::string::npos);
    EXPECT_NE(text.find(R"({"type":"subscribed"})"), std::string::npos);
}

TEST(FeedErrorTest, ExcerptKeepsShortPayloads) {
    EXPECT_EQ(excerpt("short"), "short");
    EXPECT_EQ(excerpt(std::string(256, 'a')), std::string(256, 'a'));
}

TEST(FeedErrorTest, ExcerptTruncatesLongPayloads) {
    auto text = excerpt(std::string(1000, 'a'));
    EXPECT_EQ(text, std::string(256, 'a') + "...");
    EXPECT_EQ(excerpt("abcdef", 3), "abc...");
}

TEST(FeedErrorTest, ExcerptKeepsMultiByteCharactersWhole) {
    // U+00E9 is two bytes; the limit falls between them
    auto text = excerpt(std::string(255, 'a') + "\xC3\xA9" + "tail");
    EXPECT_EQ(text, std::string(255, 'a') + "...");

    // U+20AC is three bytes and straddles the limit
    EXPECT_EQ(excerpt("ab\xE2\x82\xAC", 3), "ab...");
    EXPECT_EQ(excerpt("ab\xE2\x82\xAC", 5), "ab\xE2\x82\xAC");
}

// ============================================================================
// OrderEvent helpers
// ============================================================================

TEST(OrderEventTest, ActionClassifiesZeroAsRemove) {
    EXPECT_EQ(action(Buy{Price(100), Quantity(2)}), LevelAction::Set);
    EXPECT_EQ(action(Sell{Price(100), Quantity{}}), LevelAction::Remove);
}

TEST(OrderEventTest, Accessors) {
    OrderEvent event = Sell{Price::parse("60.5"), Quantity::parse("1.25")};

    EXPECT_EQ(price_of(event), Price::parse("60.5"));
    EXPECT_EQ(quantity_of(event), Quantity::parse("1.25"));
    EXPECT_EQ(message_type_name(event), "Sell");
    EXPECT_EQ(message_type_name(OrderEvent{Buy{}}), "Buy");
}
