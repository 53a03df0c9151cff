#pragma once

#include "aevo/feed_handler.hpp"
#include "core/config.hpp"
#include "core/messages.hpp"
#include "dydx/feed_handler.hpp"
#include "engine/engine_status.hpp"
#include "engine/opportunity.hpp"
#include "network/transport_channel.hpp"
#include "output/console_logger.hpp"
#include "output/logging.hpp"
#include <array>
#include <functional>
#include <memory>
#include <string_view>
#include <variant>

namespace crossbook {

/// Merges both venue feeds into one ledger and reports crossings
///
/// Runs entirely inside the io_context that drives the channels: events are
/// applied in the order the channels deliver them, with no queue in between.
class ArbitrageEngine {
public:
    /// Called once per reported opportunity, after it has been logged
    using ReportHandler = std::function<void(const Opportunity&)>;

    /// Called once when the run finishes
    using FinishHandler = std::function<void(EngineStatus)>;

    /// Create an engine over two unopened channels
    /// @param config Instruments, error policy and ledger bound
    /// @param loggers Diagnostics and reports loggers
    /// @param dydx_channel Channel to the dYdX indexer
    /// @param aevo_channel Channel to Aevo
    /// @param on_report Optional extra sink for opportunities
    ArbitrageEngine(
        const Config& config,
        output::Loggers loggers,
        std::shared_ptr<network::TransportChannel> dydx_channel,
        std::shared_ptr<network::TransportChannel> aevo_channel,
        ReportHandler on_report = {}
    );

    /// Stops both feeds without invoking the finish handler
    ~ArbitrageEngine();

    // Non-copyable, non-movable
    ArbitrageEngine(const ArbitrageEngine&) = delete;
    ArbitrageEngine& operator=(const ArbitrageEngine&) = delete;

    /// Start both feeds
    void start(FinishHandler on_finish = {});

    /// User shutdown: stop both feeds and finish as Interrupted
    void stop();

    /// Unrecoverable fault outside the feeds: stop both feeds and finish as Failed
    void fail(std::string_view reason);

    [[nodiscard]] EngineStatus status() const noexcept;
    [[nodiscard]] const EngineStats& stats() const noexcept;
    [[nodiscard]] Notional balance() const noexcept;
    [[nodiscard]] const VenueLedger& ledger() const noexcept;
    [[nodiscard]] ErrorPolicy error_policy() const noexcept;

    /// Process exit code; 1 while the run has not finished
    [[nodiscard]] int exit_code() const noexcept;

private:
    using FeedPtr = std::variant<
        std::shared_ptr<dydx::FeedHandler>,
        std::shared_ptr<aevo::FeedHandler>
    >;

    struct Source {
        Venue venue{Venue::Dydx};
        FeedPtr feed;
        bool ended = false;
    };

    void on_feed_message(Venue venue, FeedMessage message);
    void on_order_event(Venue venue, const OrderEvent& event);
    void on_feed_error(Venue venue, const FeedError& error);

    void stop_feeds();
    void finish(EngineStatus status);

    [[nodiscard]] Source& source(Venue venue) noexcept;

    ErrorPolicy error_policy_;
    std::shared_ptr<spdlog::logger> log_;
    output::ConsoleLogger console_;
    ReportHandler on_report_;
    FinishHandler on_finish_;

    VenueLedger ledger_;
    EngineStats stats_;
    EngineStatus status_{EngineStatus::Idle};

    std::array<Source, 2> sources_;
};

}  // namespace crossbook
