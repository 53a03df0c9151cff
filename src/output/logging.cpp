#include "output/logging.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace crossbook::output {

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info")  return spdlog::level::info;
    if (name == "warn")  return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off")   return spdlog::level::off;
    return std::nullopt;
}

Loggers make_loggers(const Config::Output& output) {
    // Initialize async logging to avoid blocking the event loop
    if (!spdlog::thread_pool()) {
        spdlog::init_thread_pool(8192, 1);
    }

    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto diagnostics = std::make_shared<spdlog::async_logger>(
        "diagnostics",
        stderr_sink,
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest
    );
    diagnostics->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
    diagnostics->set_level(parse_log_level(output.log_level).value_or(spdlog::level::info));
    diagnostics->flush_on(spdlog::level::err);

    // Reports are the program's output: synchronous, never dropped
    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    auto reports = std::make_shared<spdlog::logger>("reports", stdout_sink);
    reports->set_pattern(output.json_reports ? "%v" : "[%Y-%m-%d %H:%M:%S.%e] %v");
    reports->set_level(spdlog::level::info);
    reports->flush_on(spdlog::level::info);

    return Loggers{std::move(diagnostics), std::move(reports)};
}

}  // namespace crossbook::output
