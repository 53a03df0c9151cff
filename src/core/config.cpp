#include "core/config.hpp"
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace crossbook {

using json = nlohmann::json;

namespace {

// Accepted ranges, shared by the config file and the environment
constexpr int kMinHandshakeTimeoutMs = 1000;
constexpr int kMaxHandshakeTimeoutMs = 300000;
constexpr int kMinMaxCrossings = 0;
constexpr int kMaxMaxCrossings = 100000;

bool in_range(std::int64_t value, int min_val, int max_val) {
    return value >= min_val && value <= max_val;
}

std::string out_of_range(const char* field, std::int64_t value, int min_val, int max_val) {
    return std::string(field) + " value " + std::to_string(value) + " out of range [" +
           std::to_string(min_val) + ", " + std::to_string(max_val) + "]";
}

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer (with optional range validation)
std::optional<int> get_env_int(const char* name, int min_val = std::numeric_limits<int>::min(),
                               int max_val = std::numeric_limits<int>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        int result = std::stoi(*value);
        if (result < min_val || result > max_val) {
            std::cerr << "Warning: " << name << " value " << result
                      << " out of range [" << min_val << ", " << max_val
                      << "], ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid integer value for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Get environment variable as boolean ("1"/"0", "true"/"false")
std::optional<bool> get_env_bool(const char* name) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    if (*value == "1" || *value == "true") {
        return true;
    }
    if (*value == "0" || *value == "false") {
        return false;
    }
    std::cerr << "Warning: Invalid boolean value for " << name
              << ": " << *value << ", ignoring" << std::endl;
    return std::nullopt;
}

bool is_log_level(std::string_view level) {
    return level == "trace" || level == "debug" || level == "info" ||
           level == "warn" || level == "error" || level == "off";
}

void apply_endpoint_env(Config::Endpoint& endpoint, const std::string& prefix) {
    if (auto v = get_env((prefix + "_HOST").c_str())) {
        endpoint.host = *v;
    }
    if (auto v = get_env((prefix + "_PORT").c_str())) {
        endpoint.port = *v;
    }
    if (auto v = get_env((prefix + "_PATH").c_str())) {
        endpoint.path = *v;
    }
    if (auto v = get_env((prefix + "_MARKET").c_str())) {
        endpoint.instrument = *v;
    }
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    apply_endpoint_env(config.network.dydx, "CROSSBOOK_DYDX");
    apply_endpoint_env(config.network.aevo, "CROSSBOOK_AEVO");

    if (auto v = get_env_bool("CROSSBOOK_VERIFY_PEER")) {
        config.network.verify_peer = *v;
    }
    // Handshake timeout: 1s to 5 minutes
    if (auto v = get_env_int("CROSSBOOK_HANDSHAKE_TIMEOUT_MS",
                             kMinHandshakeTimeoutMs, kMaxHandshakeTimeoutMs)) {
        config.network.handshake_timeout = std::chrono::milliseconds(*v);
    }

    if (auto v = get_env("CROSSBOOK_ERROR_POLICY")) {
        if (auto policy = parse_error_policy(*v)) {
            config.engine.error_policy = *policy;
        } else {
            std::cerr << "Warning: Invalid CROSSBOOK_ERROR_POLICY: " << *v
                      << ", ignoring" << std::endl;
        }
    }
    if (auto v = get_env_int("CROSSBOOK_MAX_CROSSINGS", kMinMaxCrossings, kMaxMaxCrossings)) {
        config.engine.max_crossings = static_cast<std::size_t>(*v);
    }

    if (auto v = get_env("CROSSBOOK_LOG_LEVEL")) {
        if (is_log_level(*v)) {
            config.output.log_level = *v;
        } else {
            std::cerr << "Warning: Invalid CROSSBOOK_LOG_LEVEL: " << *v
                      << ", ignoring" << std::endl;
        }
    }
}

void read_endpoint(const json& j, Config::Endpoint& endpoint) {
    if (j.contains("host")) {
        endpoint.host = j["host"].get<std::string>();
    }
    if (j.contains("port")) {
        endpoint.port = j["port"].get<std::string>();
    }
    if (j.contains("path")) {
        endpoint.path = j["path"].get<std::string>();
    }
    if (j.contains("instrument")) {
        endpoint.instrument = j["instrument"].get<std::string>();
    }
}

}  // namespace

std::optional<ErrorPolicy> parse_error_policy(std::string_view text) {
    if (text == "fail_fast" || text == "fail-fast") {
        return ErrorPolicy::FailFast;
    }
    if (text == "continue" || text == "continue_on_error" || text == "continue-on-error") {
        return ErrorPolicy::ContinueOnError;
    }
    return std::nullopt;
}

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    Config config = Config::defaults();

    try {
        if (j.contains("network")) {
            const auto& net = j["network"];
            if (net.contains("dydx")) {
                read_endpoint(net["dydx"], config.network.dydx);
            }
            if (net.contains("aevo")) {
                read_endpoint(net["aevo"], config.network.aevo);
            }
            if (net.contains("verify_peer")) {
                config.network.verify_peer = net["verify_peer"].get<bool>();
            }
            if (net.contains("handshake_timeout_ms")) {
                auto ms = net["handshake_timeout_ms"].get<std::int64_t>();
                if (!in_range(ms, kMinHandshakeTimeoutMs, kMaxHandshakeTimeoutMs)) {
                    return Result<Config, std::string>::Err(
                        out_of_range("handshake_timeout_ms", ms,
                                     kMinHandshakeTimeoutMs, kMaxHandshakeTimeoutMs));
                }
                config.network.handshake_timeout = std::chrono::milliseconds(ms);
            }
        }

        if (j.contains("engine")) {
            const auto& eng = j["engine"];
            if (eng.contains("error_policy")) {
                auto text = eng["error_policy"].get<std::string>();
                auto policy = parse_error_policy(text);
                if (!policy) {
                    return Result<Config, std::string>::Err("Unknown error_policy: " + text);
                }
                config.engine.error_policy = *policy;
            }
            if (eng.contains("max_crossings")) {
                // Read signed so a negative count is rejected instead of wrapping
                auto count = eng["max_crossings"].get<std::int64_t>();
                if (!in_range(count, kMinMaxCrossings, kMaxMaxCrossings)) {
                    return Result<Config, std::string>::Err(
                        out_of_range("max_crossings", count, kMinMaxCrossings, kMaxMaxCrossings));
                }
                config.engine.max_crossings = static_cast<std::size_t>(count);
            }
        }

        if (j.contains("output")) {
            const auto& out = j["output"];
            if (out.contains("log_level")) {
                auto level = out["log_level"].get<std::string>();
                if (!is_log_level(level)) {
                    return Result<Config, std::string>::Err("Unknown log_level: " + level);
                }
                config.output.log_level = level;
            }
            if (out.contains("json_reports")) {
                config.output.json_reports = out["json_reports"].get<bool>();
            }
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            std::cerr << "Warning: Failed to load config from '" << *config_path
                      << "': " << result.error()
                      << " (using defaults with env overrides)" << std::endl;
        }
    }

    apply_env_overrides(config);

    return config;
}

}  // namespace crossbook
