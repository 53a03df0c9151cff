#pragma once

#include "core/errors.hpp"
#include "core/types.hpp"
#include "engine/engine_status.hpp"
#include "engine/opportunity.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace crossbook::output {

/// Formats reports as JSON; prices and quantities are exact decimal strings
class JsonFormatter {
public:
    /// Format an arbitrage opportunity as JSON
    [[nodiscard]] static nlohmann::json format_opportunity(const Opportunity& opportunity);

    /// Format a terminal feed error as JSON
    [[nodiscard]] static nlohmann::json format_feed_error(Venue venue, const FeedError& error);

    /// Format the end-of-run summary as JSON
    [[nodiscard]] static nlohmann::json format_summary(
        const EngineStats& stats,
        EngineStatus status
    );

    /// Serialize one report as a single line; invalid UTF-8 is replaced with U+FFFD
    [[nodiscard]] static std::string to_line(const nlohmann::json& report);

    /// Get current ISO8601 timestamp string
    [[nodiscard]] static std::string iso_timestamp();
};

}  // namespace crossbook::output
