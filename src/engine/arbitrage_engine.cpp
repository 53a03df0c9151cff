#include "engine/arbitrage_engine.hpp"
#include <algorithm>
#include <type_traits>

namespace crossbook {

ArbitrageEngine::ArbitrageEngine(
    const Config& config,
    output::Loggers loggers,
    std::shared_ptr<network::TransportChannel> dydx_channel,
    std::shared_ptr<network::TransportChannel> aevo_channel,
    ReportHandler on_report
)
    : error_policy_(config.engine.error_policy)
    , log_(loggers.diagnostics)
    , console_(loggers.reports, loggers.diagnostics, config.output.json_reports)
    , on_report_(std::move(on_report))
    , ledger_(config.engine.max_crossings)
{
    sources_[0] = Source{
        Venue::Dydx,
        std::make_shared<dydx::FeedHandler>(
            std::move(dydx_channel),
            config.network.dydx.instrument,
            log_,
            [this](FeedMessage msg) { on_feed_message(Venue::Dydx, std::move(msg)); }
        )
    };

    sources_[1] = Source{
        Venue::Aevo,
        std::make_shared<aevo::FeedHandler>(
            std::move(aevo_channel),
            config.network.aevo.instrument,
            log_,
            [this](FeedMessage msg) { on_feed_message(Venue::Aevo, std::move(msg)); }
        )
    };
}

ArbitrageEngine::~ArbitrageEngine() {
    on_finish_ = nullptr;
    on_report_ = nullptr;
    stop_feeds();
}

void ArbitrageEngine::start(FinishHandler on_finish) {
    if (status_ != EngineStatus::Idle) {
        return;
    }

    on_finish_ = std::move(on_finish);
    status_ = EngineStatus::Running;

    log_->info("Starting arbitrage engine (error policy: {}, max crossings: {})",
               to_string(error_policy_), ledger_.max_crossings());

    for (auto& src : sources_) {
        // A fail-fast error from the first feed may already have finished the run
        if (status_ != EngineStatus::Running) {
            break;
        }
        std::visit([](const auto& feed) { feed->start(); }, src.feed);
    }
}

void ArbitrageEngine::stop() {
    if (is_finished(status_)) {
        return;
    }

    log_->info("Shutdown requested");
    stop_feeds();
    finish(EngineStatus::Interrupted);
}

void ArbitrageEngine::fail(std::string_view reason) {
    if (is_finished(status_)) {
        return;
    }

    log_->error("Arbitrage engine failed: {}", reason);
    stop_feeds();
    finish(EngineStatus::Failed);
}

void ArbitrageEngine::on_feed_message(Venue venue, FeedMessage message) {
    if (status_ != EngineStatus::Running) {
        return;
    }

    std::visit([this, venue](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;

        if constexpr (std::is_same_v<T, OrderEvent>) {
            on_order_event(venue, msg);
        } else if constexpr (std::is_same_v<T, FeedError>) {
            on_feed_error(venue, msg);
        }
    }, message);
}

void ArbitrageEngine::on_order_event(Venue venue, const OrderEvent& event) {
    if (venue == Venue::Dydx) {
        ++stats_.dydx_events;
    } else {
        ++stats_.aevo_events;
    }

    log_->trace("{} {} {} x {}", to_string(venue), message_type_name(event),
                price_of(event).to_string(), quantity_of(event).to_string());

    auto result = std::visit([this, venue](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, Buy>) {
            return ledger_.buy(venue, e.price, e.quantity);
        } else {
            return ledger_.sell(venue, e.price, e.quantity);
        }
    }, event);

    if (result.is_err()) {
        ++stats_.needless_removals;
        console_.log_needless_removal(venue, event);
        return;
    }

    const auto& crossings = result.value();
    if (crossings.empty()) {
        return;
    }

    log_->debug("{} {} {} crosses {} resting entr{}", to_string(venue),
                to_string(side_of(event)), price_of(event).to_string(),
                crossings.size(), crossings.size() == 1 ? "y" : "ies");

    auto priced = evaluate(venue, event, crossings.front(), stats_.balance);
    if (priced.is_err()) {
        // The ledger already holds the event; only the report is lost
        ++stats_.pricing_errors;
        console_.log_pricing_error(venue, priced.error());
        return;
    }

    const auto& opportunity = priced.value();
    stats_.balance = opportunity.balance;
    ++stats_.opportunities;

    console_.log_opportunity(opportunity);
    if (on_report_) {
        on_report_(opportunity);
    }
}

void ArbitrageEngine::on_feed_error(Venue venue, const FeedError& error) {
    auto& src = source(venue);
    if (src.ended) {
        return;
    }
    src.ended = true;
    ++stats_.feed_errors;

    console_.log_feed_error(venue, error);

    if (error_policy_ == ErrorPolicy::FailFast) {
        stop_feeds();
        finish(EngineStatus::Failed);
        return;
    }

    auto live = std::count_if(sources_.begin(), sources_.end(),
                              [](const Source& s) { return !s.ended; });
    if (live == 0) {
        log_->error("All feeds have ended");
        finish(EngineStatus::Exhausted);
        return;
    }

    log_->warn("Continuing with {} remaining feed(s)", live);
}

void ArbitrageEngine::stop_feeds() {
    for (auto& src : sources_) {
        std::visit([](const auto& feed) {
            if (feed) {
                feed->stop();
            }
        }, src.feed);
    }
}

void ArbitrageEngine::finish(EngineStatus status) {
    if (is_finished(status_)) {
        return;
    }

    status_ = status;
    log_->info("Arbitrage engine finished: {}", to_string(status));
    console_.log_summary(stats_, status_);

    if (auto handler = std::move(on_finish_)) {
        on_finish_ = nullptr;
        handler(status_);
    }
}

ArbitrageEngine::Source& ArbitrageEngine::source(Venue venue) noexcept {
    return venue == Venue::Dydx ? sources_[0] : sources_[1];
}

EngineStatus ArbitrageEngine::status() const noexcept {
    return status_;
}

const EngineStats& ArbitrageEngine::stats() const noexcept {
    return stats_;
}

Notional ArbitrageEngine::balance() const noexcept {
    return stats_.balance;
}

const VenueLedger& ArbitrageEngine::ledger() const noexcept {
    return ledger_;
}

ErrorPolicy ArbitrageEngine::error_policy() const noexcept {
    return error_policy_;
}

int ArbitrageEngine::exit_code() const noexcept {
    return is_finished(status_) ? crossbook::exit_code(status_) : 1;
}

}  // namespace crossbook
