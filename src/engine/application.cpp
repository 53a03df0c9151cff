#include "engine/application.hpp"
#include "network/ssl_context.hpp"
#include <csignal>

namespace crossbook {

Application::Application(Config config, output::Loggers loggers)
    : config_(std::move(config))
    , loggers_(std::move(loggers))
    , ssl_ctx_(network::create_ssl_context(config_.network.verify_peer))
    , signals_(ioc_, SIGINT, SIGTERM)
{}

Application::~Application() {
    engine_.reset();
    loggers_.diagnostics->flush();
}

std::shared_ptr<network::WebSocketClient> Application::make_channel(Venue venue) {
    const auto& endpoint = config_.endpoint(venue);

    return std::make_shared<network::WebSocketClient>(
        ioc_,
        ssl_ctx_,
        network::WebSocketClient::Options{
            .host = endpoint.host,
            .port = endpoint.port,
            .path = endpoint.path,
            .handshake_timeout = config_.network.handshake_timeout,
            .verify_host = config_.network.verify_peer
        },
        loggers_.diagnostics
    );
}

int Application::run() {
    auto& log = *loggers_.diagnostics;
    log.info("Starting crossbook");
    log.info("dydx: {} {}", config_.network.dydx.url(), config_.network.dydx.instrument);
    log.info("aevo: {} {}", config_.network.aevo.url(), config_.network.aevo.instrument);

    engine_ = std::make_unique<ArbitrageEngine>(
        config_,
        loggers_,
        make_channel(Venue::Dydx),
        make_channel(Venue::Aevo)
    );

    signals_.async_wait([this](const boost::system::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        loggers_.diagnostics->info("Received signal {}", signal);
        engine_->stop();
    });

    engine_->start([this](EngineStatus /*status*/) {
        // Let the channels finish closing, then io_context runs out of work
        boost::system::error_code ignored;
        signals_.cancel(ignored);
    });

    while (!ioc_.stopped()) {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            log.error("Event loop exception: {}", e.what());
            engine_->fail(e.what());
        }
    }

    int code = engine_->exit_code();
    log.info("Engine shutdown complete (exit code {})", code);
    return code;
}

}  // namespace crossbook
