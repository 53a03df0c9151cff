#include <gtest/gtest.h>
#include "aevo/feed_handler.hpp"
#include "arbitrage/arbitrage_ledger.hpp"
#include "support/mock_channel.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <vector>

using namespace crossbook;
using namespace crossbook::aevo;
using test_support::MockChannel;

namespace {

constexpr const char* kSnapshot =
    R"({"channel":"orderbook:BTC-PERP","data":{"type":"snapshot","bids":[["50","1"]],"asks":[["60","1"]]}})";
constexpr const char* kAck = R"({"data":["orderbook:BTC-PERP"]})";
constexpr const char* kUpdate =
    R"({"channel":"orderbook:BTC-PERP","data":{"type":"update","bids":[],"asks":[["60","0"]]}})";

Price p(const char* s) { return Price::parse(s); }
Quantity q(const char* s) { return Quantity::parse(s); }

}  // namespace

class AevoFeedTest : public ::testing::Test {
protected:
    std::shared_ptr<MockChannel> channel = std::make_shared<MockChannel>();
    std::vector<OrderEvent> events;
    std::vector<FeedError> errors;
    std::shared_ptr<FeedHandler> feed;

    void SetUp() override {
        feed = std::make_shared<FeedHandler>(
            channel, "BTC-PERP", test_support::null_logger(),
            [this](FeedMessage msg) {
                if (auto* event = std::get_if<OrderEvent>(&msg)) {
                    events.push_back(*event);
                } else {
                    errors.push_back(std::get<FeedError>(msg));
                }
            });
    }

    void handshake() {
        feed->start();
        channel->connect();
        channel->deliver(kSnapshot);
        channel->deliver(kAck);
    }

    const ProtocolViolation& only_violation() {
        EXPECT_EQ(errors.size(), 1u);
        const auto* error = std::get_if<ProtocolViolation>(&errors.at(0));
        EXPECT_NE(error, nullptr) << "got " << kind_name(errors.at(0));
        static const ProtocolViolation empty{};
        return error ? *error : empty;
    }
};

// ============================================================================
// Handshake
// ============================================================================

TEST_F(AevoFeedTest, SubscribesAsSoonAsOpen) {
    feed->start();
    EXPECT_EQ(feed->state(), FeedState::Subscribing);
    EXPECT_TRUE(channel->sent.empty());

    channel->connect();

    EXPECT_EQ(feed->state(), FeedState::AwaitSnapshot);
    ASSERT_EQ(channel->sent.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(channel->sent[0]), (nlohmann::json{
        {"op", "subscribe"},
        {"data", nlohmann::json::array({"orderbook:BTC-PERP"})}
    }));
}

TEST_F(AevoFeedTest, SnapshotHeldUntilAck) {
    feed->start();
    channel->connect();
    channel->deliver(kSnapshot);

    EXPECT_EQ(feed->state(), FeedState::AwaitAck);
    EXPECT_TRUE(events.empty());

    channel->deliver(kAck);

    EXPECT_EQ(feed->state(), FeedState::StreamUpdates);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], OrderEvent(Buy{p("50"), q("1")}));
    EXPECT_EQ(events[1], OrderEvent(Sell{p("60"), q("1")}));
}

TEST_F(AevoFeedTest, UpdatesEmitDeltas) {
    handshake();
    events.clear();

    channel->deliver(kUpdate);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], OrderEvent(Sell{p("60"), Quantity{}}));
    EXPECT_TRUE(errors.empty());
}

TEST_F(AevoFeedTest, LaterSnapshotIsIgnored) {
    handshake();
    events.clear();

    channel->deliver(kSnapshot);

    EXPECT_TRUE(events.empty());
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(feed->state(), FeedState::StreamUpdates);
}

// ============================================================================
// Protocol violations
// ============================================================================

TEST_F(AevoFeedTest, UpdateBeforeSnapshotIsViolation) {
    feed->start();
    channel->connect();
    channel->deliver(kUpdate);

    const auto& error = only_violation();
    EXPECT_EQ(error.expected, "\"snapshot\"");
    EXPECT_EQ(error.received, "update");
    EXPECT_EQ(feed->state(), FeedState::Terminated);
    EXPECT_TRUE(channel->is_closed());
}

TEST_F(AevoFeedTest, MissingAckIsViolation) {
    feed->start();
    channel->connect();
    channel->deliver(kSnapshot);
    channel->deliver(kUpdate);

    const auto& error = only_violation();
    EXPECT_EQ(error.expected, "subscription acknowledgement");
    EXPECT_TRUE(events.empty());
}

TEST_F(AevoFeedTest, UnknownTypeWhileStreamingIsViolation) {
    handshake();

    channel->deliver(R"({"data":{"type":"trade"}})");

    const auto& error = only_violation();
    EXPECT_EQ(error.expected, "\"update\"");
    EXPECT_EQ(error.received, "trade");
}

TEST_F(AevoFeedTest, MessageBeforeOpenIsViolation) {
    feed->start();
    channel->deliver(kSnapshot);

    EXPECT_EQ(errors.size(), 1u);
    EXPECT_EQ(feed->state(), FeedState::Terminated);
}

// ============================================================================
// Decode and transport failures
// ============================================================================

TEST_F(AevoFeedTest, MalformedSnapshotIsDecodeFailure) {
    feed->start();
    channel->connect();
    channel->deliver(R"({"data":{"type":"snapshot","bids":[["50","1"]]}})");

    ASSERT_EQ(errors.size(), 1u);
    const auto* error = std::get_if<DecodeFailure>(&errors[0]);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->path, "data");
    EXPECT_EQ(error->detail, "missing field `asks`");
}

TEST_F(AevoFeedTest, PeerCloseDuringAckWaitIsTransportFailure) {
    feed->start();
    channel->connect();
    channel->deliver(kSnapshot);

    channel->end("stream closed by peer: going away");

    ASSERT_EQ(errors.size(), 1u);
    const auto* error = std::get_if<TransportFailure>(&errors[0]);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->reason, "stream closed by peer: going away");
    EXPECT_TRUE(events.empty());
}

TEST_F(AevoFeedTest, StopEmitsNothing) {
    handshake();
    events.clear();

    feed->stop();
    channel->deliver(kUpdate);

    EXPECT_EQ(feed->state(), FeedState::Stopped);
    EXPECT_TRUE(events.empty());
    EXPECT_TRUE(errors.empty());
}

// ============================================================================
// End-to-end through the ledger
// ============================================================================

TEST_F(AevoFeedTest, UpdateRemovesAskFromLedger) {
    ArbitrageLedger<Venue> ledger;
    feed = std::make_shared<FeedHandler>(
        channel, "BTC-PERP", test_support::null_logger(),
        [&ledger](FeedMessage msg) {
            const auto& event = std::get<OrderEvent>(msg);
            if (const auto* buy = std::get_if<Buy>(&event)) {
                (void)ledger.buy(Venue::Aevo, buy->price, buy->quantity);
            } else {
                const auto& sell = std::get<Sell>(event);
                (void)ledger.sell(Venue::Aevo, sell.price, sell.quantity);
            }
        });

    handshake();
    ASSERT_EQ(ledger.ask_quantity(p("60"), Venue::Aevo), q("1"));

    channel->deliver(kUpdate);

    EXPECT_FALSE(ledger.ask_quantity(p("60"), Venue::Aevo).has_value());
    EXPECT_EQ(ledger.ask_levels(), 0u);
    EXPECT_EQ(ledger.bid_quantity(p("50"), Venue::Aevo), q("1"));
}
