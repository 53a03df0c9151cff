#pragma once

#include "core/errors.hpp"
#include "core/messages.hpp"
#include "core/types.hpp"
#include "engine/engine_status.hpp"
#include "engine/opportunity.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <string_view>

namespace crossbook::output {

/// User-facing output of the engine
///
/// Opportunities and the summary go to the reports logger so they stay
/// visible when diagnostics are quietened; everything else is diagnostics.
class ConsoleLogger {
public:
    /// @param reports Logger for opportunities and the final summary
    /// @param diagnostics Logger for feed errors and ledger warnings
    /// @param json_reports Write reports as JSON lines instead of text
    ConsoleLogger(
        std::shared_ptr<spdlog::logger> reports,
        std::shared_ptr<spdlog::logger> diagnostics,
        bool json_reports
    );

    /// Log a detected opportunity (never rate limited)
    void log_opportunity(const Opportunity& opportunity);

    /// Log the terminal error of a venue feed
    void log_feed_error(Venue venue, const FeedError& error);

    /// Log a zero-quantity event that named no recorded entry
    void log_needless_removal(Venue venue, const OrderEvent& event);

    /// Log a crossing whose spread or balance could not be represented
    void log_pricing_error(Venue venue, std::string_view reason);

    /// Log the end-of-run summary
    void log_summary(const EngineStats& stats, EngineStatus status);

private:
    std::shared_ptr<spdlog::logger> reports_;
    std::shared_ptr<spdlog::logger> diagnostics_;
    bool json_reports_;
};

}  // namespace crossbook::output
