#pragma once

#include "aevo/feed_state.hpp"
#include "aevo/types.hpp"
#include "core/messages.hpp"
#include "core/types.hpp"
#include "network/transport_channel.hpp"
#include <spdlog/logger.h>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace crossbook::aevo {

/// Aevo order book feed
///
/// subscribe -> snapshot -> one acknowledgement -> updates. The snapshot is
/// held back until the acknowledgement has been consumed. Later snapshots are
/// ignored. Any failure ends the feed with exactly one FeedError.
class FeedHandler : public std::enable_shared_from_this<FeedHandler> {
public:
    using MessageCallback = std::function<void(FeedMessage)>;

    /// @param channel Channel owned exclusively by this handler, not yet opened
    /// @param instrument Market id, e.g. "BTC-PERP"
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

    void start();
    void stop();

    [[nodiscard]] FeedState state() const noexcept;
    [[nodiscard]] const Instrument& instrument() const noexcept;

private:
    void on_channel_open();
    void on_channel_message(std::string_view message);
    void on_channel_closed(std::string_view reason);

    void handle_snapshot(std::string_view message);
    void handle_ack(std::string_view message);
    void handle_update(std::string_view message);

    void emit_events(const std::vector<OrderEvent>& events);
    void terminate(FeedError error);
    void set_state(FeedState new_state);

    std::shared_ptr<network::TransportChannel> channel_;
    Instrument instrument_;
    std::shared_ptr<spdlog::logger> log_;
    MessageCallback on_message_;

    FeedState state_{FeedState::Idle};
    std::optional<Snapshot> pending_snapshot_;
};

}  // namespace crossbook::aevo
