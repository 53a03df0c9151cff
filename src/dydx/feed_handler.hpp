#pragma once

#include "core/messages.hpp"
#include "core/types.hpp"
#include "dydx/feed_state.hpp"
#include "dydx/types.hpp"
#include "network/transport_channel.hpp"
#include <spdlog/logger.h>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace crossbook::dydx {

/// dYdX v4 indexer order book feed
///
/// connected -> subscribe -> subscribed (snapshot) -> channel_data (deltas).
/// Emits normalized order events in arrival order; any failure ends the feed
/// with exactly one FeedError.
class FeedHandler : public std::enable_shared_from_this<FeedHandler> {
public:
    /// Receives every event and the terminal error
    using MessageCallback = std::function<void(FeedMessage)>;

    /// @param channel Channel owned exclusively by this handler, not yet opened
    /// @param instrument Market id, e.g. "BTC-USD"
    /// @param log Diagnostics logger
    /// @param on_message Sink for events and the terminal error
    FeedHandler(
        std::shared_ptr<network::TransportChannel> channel,
        Instrument instrument,
        std::shared_ptr<spdlog::logger> log,
        MessageCallback on_message
    );

    ~FeedHandler();

    FeedHandler(const FeedHandler&) = delete;
    FeedHandler& operator=(const FeedHandler&) = delete;

    /// Open the channel and run the handshake
    void start();

    /// Close the channel; nothing is emitted afterwards
    void stop();

    [[nodiscard]] FeedState state() const noexcept;
    [[nodiscard]] const Instrument& instrument() const noexcept;

private:
    void on_channel_open();
    void on_channel_message(std::string_view message);
    void on_channel_closed(std::string_view reason);

    void handle_connected(const Message& message);
    void handle_snapshot(const Message& message);
    void handle_delta(const Message& message);

    void emit_events(const std::vector<OrderEvent>& events);
    void terminate(FeedError error);
    void set_state(FeedState new_state);

    std::shared_ptr<network::TransportChannel> channel_;
    Instrument instrument_;
    std::shared_ptr<spdlog::logger> log_;
    MessageCallback on_message_;

    FeedState state_{FeedState::Idle};
};

}  // namespace crossbook::dydx
