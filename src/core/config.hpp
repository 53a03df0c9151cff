#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace crossbook {

/// What the engine does when one venue feed terminates with an error
enum class ErrorPolicy {
    FailFast,        // stop every feed and exit
    ContinueOnError  // keep consuming the surviving feeds until all end
};

[[nodiscard]] constexpr std::string_view to_string(ErrorPolicy policy) noexcept {
    switch (policy) {
        case ErrorPolicy::FailFast:        return "fail_fast";
        case ErrorPolicy::ContinueOnError: return "continue";
    }
    return "unknown";
}

/// Accepts "fail_fast"/"fail-fast" and "continue"/"continue_on_error"/"continue-on-error"
[[nodiscard]] std::optional<ErrorPolicy> parse_error_policy(std::string_view text);

/// Immutable configuration for crossbook
struct Config {
    /// One WebSocket endpoint plus the instrument to subscribe to
    struct Endpoint {
        std::string host;
        std::string port = "443";
        std::string path = "/";
        Instrument instrument;

        [[nodiscard]] std::string url() const {
            return "wss://" + host + ":" + port + path;
        }
    };

    /// Network configuration
    struct Network {
        Endpoint dydx{"indexer.dydx.trade", "443", "/v4/ws", "BTC-USD"};
        Endpoint aevo{"ws.aevo.xyz", "443", "/", "BTC-PERP"};

        bool verify_peer = true;
        std::chrono::milliseconds handshake_timeout{30000};
    };

    /// Engine configuration
    struct Engine {
        ErrorPolicy error_policy = ErrorPolicy::ContinueOnError;
        std::size_t max_crossings = 16;  // 0 = unbounded
    };

    /// Output configuration
    struct Output {
        std::string log_level = "info";
        bool json_reports = false;
    };

    Network network;
    Engine engine;
    Output output;

    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Endpoint for a venue
    [[nodiscard]] const Endpoint& endpoint(Venue venue) const noexcept {
        return venue == Venue::Dydx ? network.dydx : network.aevo;
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    /// @param config_path Optional path to JSON config file
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);
};

}  // namespace crossbook
