#include "core/config.hpp"
#include "engine/application.hpp"
#include "output/logging.hpp"
#include <iostream>
#include <optional>
#include <string>

namespace {

void print_banner() {
    std::cout << "\ncrossbook\n" << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>      Load configuration from JSON file\n"
              << "  -q, --quiet              Only warnings and errors on stderr\n"
              << "  -d, --debug              Per-event diagnostics\n"
              << "      --fail-fast          Stop everything when one feed fails\n"
              << "      --continue-on-error  Keep the surviving feed running (default)\n"
              << "      --dydx-market <id>   dYdX instrument (e.g., BTC-USD)\n"
              << "      --aevo-market <id>   Aevo instrument (e.g., BTC-PERP)\n"
              << "      --json               Write reports as JSON lines\n"
              << "  -h, --help               Show this help message\n"
              << "  -v, --version            Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  CROSSBOOK_DYDX_HOST, CROSSBOOK_DYDX_PORT, CROSSBOOK_DYDX_PATH, CROSSBOOK_DYDX_MARKET\n"
              << "  CROSSBOOK_AEVO_HOST, CROSSBOOK_AEVO_PORT, CROSSBOOK_AEVO_PATH, CROSSBOOK_AEVO_MARKET\n"
              << "  CROSSBOOK_VERIFY_PEER          Verify TLS certificates (true/false)\n"
              << "  CROSSBOOK_HANDSHAKE_TIMEOUT_MS Connect and handshake timeout\n"
              << "  CROSSBOOK_ERROR_POLICY         fail_fast or continue\n"
              << "  CROSSBOOK_MAX_CROSSINGS        Crossing candidates kept per update\n"
              << "  CROSSBOOK_LOG_LEVEL            trace, debug, info, warn, error, off\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << "\nExit status: 0 after Ctrl-C, 1 when a feed fails or every feed has ended\n"
              << std::endl;
}

void print_version() {
    std::cout << "crossbook v1.0.0\n"
              << "Cross-venue order book arbitrage detector for dYdX and Aevo\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> dydx_market;
    std::optional<std::string> aevo_market;
    std::optional<crossbook::ErrorPolicy> error_policy;
    bool quiet = false;
    bool debug = false;
    bool json = false;
    bool show_help = false;
    bool show_version = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-d" || arg == "--debug") {
            args.debug = true;
        } else if (arg == "--json") {
            args.json = true;
        } else if (arg == "--fail-fast") {
            args.error_policy = crossbook::ErrorPolicy::FailFast;
        } else if (arg == "--continue-on-error") {
            args.error_policy = crossbook::ErrorPolicy::ContinueOnError;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--dydx-market" && i + 1 < argc) {
            args.dydx_market = argv[++i];
        } else if (arg == "--aevo-market" && i + 1 < argc) {
            args.aevo_market = argv[++i];
        } else {
            std::cerr << "Warning: ignoring unknown argument '" << arg << "'" << std::endl;
        }
    }

    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Load configuration with priority: CLI > env > file > defaults
    auto config = crossbook::Config::load(args.config_path);

    // CLI argument overrides (highest priority)
    if (args.dydx_market) {
        config.network.dydx.instrument = *args.dydx_market;
    }
    if (args.aevo_market) {
        config.network.aevo.instrument = *args.aevo_market;
    }
    if (args.error_policy) {
        config.engine.error_policy = *args.error_policy;
    }
    if (args.json) {
        config.output.json_reports = true;
    }
    if (args.debug) {
        config.output.log_level = "debug";
    } else if (args.quiet) {
        config.output.log_level = "warn";
    }

    if (!config.output.json_reports) {
        print_banner();

        // Print active configuration
        std::cout << "Configuration:\n"
                  << "  dYdX: " << config.network.dydx.url() << " " << config.network.dydx.instrument << "\n"
                  << "  Aevo: " << config.network.aevo.url() << " " << config.network.aevo.instrument << "\n"
                  << "  Error policy: " << crossbook::to_string(config.engine.error_policy) << "\n"
                  << "  Max crossings: " << config.engine.max_crossings << "\n"
                  << std::endl;
    }

    try {
        crossbook::Application app(config, crossbook::output::make_loggers(config.output));
        return app.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
