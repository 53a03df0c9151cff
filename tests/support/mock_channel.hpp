#pragma once

#include "network/transport_channel.hpp"
#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace crossbook::test_support {

/// Synchronous in-memory TransportChannel
///
/// Tests drive it by hand: connect() fires on_open, deliver() feeds one
/// inbound frame, end() simulates the peer going away. close() reports
/// "closed locally" through on_closed, just like the WebSocket client.
class MockChannel : public network::TransportChannel {
public:
    void open(Handlers handlers) override {
        handlers_ = std::move(handlers);
        opened_ = true;
        ++open_calls;
    }

    void send(std::string message) override {
        if (!opened_ || closed_) {
            return;
        }
        sent.push_back(std::move(message));
    }

    void close() override {
        ++close_calls;
        finish("closed locally");
    }

    [[nodiscard]] std::string describe() const override {
        return "mock://" + name;
    }

    /// Peer accepted the connection
    void connect() {
        if (opened_ && !closed_ && handlers_.on_open) {
            handlers_.on_open();
        }
    }

    /// One inbound frame; dropped after the channel closed
    void deliver(std::string_view frame) {
        if (opened_ && !closed_ && handlers_.on_message) {
            auto on_message = handlers_.on_message;
            on_message(frame);
        }
    }

    /// Peer ended the stream or the connection broke
    void end(std::string_view reason = "stream closed by peer") {
        finish(reason);
    }

    [[nodiscard]] bool is_open() const noexcept { return opened_ && !closed_; }
    [[nodiscard]] bool is_closed() const noexcept { return closed_; }

    std::string name = "test";
    std::vector<std::string> sent;
    int open_calls = 0;
    int close_calls = 0;

private:
    void finish(std::string_view reason) {
        if (!opened_ || closed_) {
            return;
        }
        closed_ = true;
        auto handlers = std::move(handlers_);
        handlers_ = {};
        if (handlers.on_closed) {
            handlers.on_closed(reason);
        }
    }

    Handlers handlers_;
    bool opened_ = false;
    bool closed_ = false;
};

/// Logger that discards everything
inline std::shared_ptr<spdlog::logger> null_logger(const std::string& name = "test") {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

/// Logger that writes bare messages into a string stream for inspection
inline std::shared_ptr<spdlog::logger> capture_logger(std::ostringstream& out,
                                                      const std::string& name = "capture") {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_pattern("%l %v");
    logger->set_level(spdlog::level::trace);
    return logger;
}

}  // namespace crossbook::test_support
