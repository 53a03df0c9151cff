#pragma once

#include "core/config.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <optional>
#include <string_view>

namespace crossbook::output {

/// The two loggers every component is built with
struct Loggers {
    std::shared_ptr<spdlog::logger> diagnostics;  // stderr, async, configurable level
    std::shared_ptr<spdlog::logger> reports;      // stdout, always info
};

/// Map a config log level name to spdlog's level
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

/// Build the diagnostics and reports loggers
/// Initializes the shared spdlog thread pool on first use.
[[nodiscard]] Loggers make_loggers(const Config::Output& output);

}  // namespace crossbook::output
