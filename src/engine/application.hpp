#pragma once

#include "core/config.hpp"
#include "engine/arbitrage_engine.hpp"
#include "network/websocket_client.hpp"
#include "output/logging.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>
#include <memory>

namespace crossbook {

/// Process-level wiring: event loop, TLS, both venue channels and the engine
class Application {
public:
    /// @param config Fully resolved configuration
    /// @param loggers Diagnostics and reports loggers
    Application(Config config, output::Loggers loggers);

    ~Application();

    // Non-copyable, non-movable
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /// Run until the engine finishes (blocks)
    /// @return Process exit code
    int run();

private:
    [[nodiscard]] std::shared_ptr<network::WebSocketClient> make_channel(Venue venue);

    Config config_;
    output::Loggers loggers_;

    boost::asio::io_context ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    boost::asio::signal_set signals_;

    std::unique_ptr<ArbitrageEngine> engine_;
};

}  // namespace crossbook
