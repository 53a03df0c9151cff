#include "output/console_logger.hpp"
#include "output/json_formatter.hpp"

namespace crossbook::output {

ConsoleLogger::ConsoleLogger(
    std::shared_ptr<spdlog::logger> reports,
    std::shared_ptr<spdlog::logger> diagnostics,
    bool json_reports
)
    : reports_(std::move(reports))
    , diagnostics_(std::move(diagnostics))
    , json_reports_(json_reports)
{}

void ConsoleLogger::log_opportunity(const Opportunity& opportunity) {
    if (json_reports_) {
        reports_->info("{}", JsonFormatter::to_line(JsonFormatter::format_opportunity(opportunity)));
        return;
    }

    // Format: ARB: <venue> <side> @ <price> x <venue> @ <price> | SPREAD: X | QTY: X | BALANCE: X
    reports_->info(
        "ARB: {} {} @ {} x {} @ {} | SPREAD: {} | QTY: {} | BALANCE: {}",
        to_string(opportunity.incoming_venue),
        to_string(opportunity.incoming_side),
        opportunity.incoming_price.to_string(),
        to_string(opportunity.resting_venue),
        opportunity.resting_price.to_string(),
        opportunity.spread.to_string(),
        opportunity.matched.to_string(),
        opportunity.balance.to_string()
    );
}

void ConsoleLogger::log_feed_error(Venue venue, const FeedError& error) {
    if (json_reports_) {
        reports_->info("{}", JsonFormatter::to_line(JsonFormatter::format_feed_error(venue, error)));
    }
    diagnostics_->error("{} feed failed ({}): {}", to_string(venue), kind_name(error), describe(error));
}

void ConsoleLogger::log_needless_removal(Venue venue, const OrderEvent& event) {
    diagnostics_->warn(
        "{} removed {} {} that was never recorded",
        to_string(venue),
        to_string(side_of(event)),
        price_of(event).to_string()
    );
}

void ConsoleLogger::log_pricing_error(Venue venue, std::string_view reason) {
    diagnostics_->error("{} crossing not reported: {}", to_string(venue), reason);
}

void ConsoleLogger::log_summary(const EngineStats& stats, EngineStatus status) {
    if (json_reports_) {
        reports_->info("{}", JsonFormatter::to_line(JsonFormatter::format_summary(stats, status)));
        return;
    }

    reports_->info(
        "SUMMARY: {} | EVENTS: dydx={} aevo={} | OPPORTUNITIES: {} | NEEDLESS REMOVALS: {} | "
        "FEED ERRORS: {} | PRICING ERRORS: {} | BALANCE: {}",
        to_string(status),
        stats.dydx_events,
        stats.aevo_events,
        stats.opportunities,
        stats.needless_removals,
        stats.feed_errors,
        stats.pricing_errors,
        stats.balance.to_string()
    );
}

}  // namespace crossbook::output
