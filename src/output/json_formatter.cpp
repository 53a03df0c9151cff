#include "output/json_formatter.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace crossbook::output {

nlohmann::json JsonFormatter::format_opportunity(const Opportunity& opportunity) {
    return nlohmann::json{
        {"type", "opportunity"},
        {"timestamp", iso_timestamp()},
        {"incoming", {
            {"venue", to_string(opportunity.incoming_venue)},
            {"side", to_string(opportunity.incoming_side)},
            {"price", opportunity.incoming_price.to_string()}
        }},
        {"resting", {
            {"venue", to_string(opportunity.resting_venue)},
            {"price", opportunity.resting_price.to_string()}
        }},
        {"spread", opportunity.spread.to_string()},
        {"matched", opportunity.matched.to_string()},
        {"balance", opportunity.balance.to_string()}
    };
}

nlohmann::json JsonFormatter::format_feed_error(Venue venue, const FeedError& error) {
    return nlohmann::json{
        {"type", "feed_error"},
        {"timestamp", iso_timestamp()},
        {"venue", to_string(venue)},
        {"kind", kind_name(error)},
        {"message", describe(error)}
    };
}

nlohmann::json JsonFormatter::format_summary(
    const EngineStats& stats,
    EngineStatus status
) {
    return nlohmann::json{
        {"type", "summary"},
        {"timestamp", iso_timestamp()},
        {"status", to_string(status)},
        {"events", {
            {"dydx", stats.dydx_events},
            {"aevo", stats.aevo_events}
        }},
        {"opportunities", stats.opportunities},
        {"needlessRemovals", stats.needless_removals},
        {"feedErrors", stats.feed_errors},
        {"pricingErrors", stats.pricing_errors},
        {"balance", stats.balance.to_string()}
    };
}

std::string JsonFormatter::to_line(const nlohmann::json& report) {
    // Error messages quote raw venue payloads, which need not be valid UTF-8
    return report.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string JsonFormatter::iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time_t_now), "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace crossbook::output
