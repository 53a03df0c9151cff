#pragma once

#include "network/connection_state.hpp"
#include "network/transport_channel.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <spdlog/logger.h>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

namespace crossbook::network {

/// Async WebSocket channel over TLS, driven by a single io_context
class WebSocketClient final
    : public TransportChannel
    , public std::enable_shared_from_this<WebSocketClient> {
public:
    using tcp = boost::asio::ip::tcp;
    using tcp_stream = boost::beast::tcp_stream;
    using ssl_stream = boost::asio::ssl::stream<tcp_stream>;
    using ws_stream = boost::beast::websocket::stream<ssl_stream>;

    struct Options {
        std::string host;
        std::string port = "443";
        std::string path = "/";
        std::chrono::milliseconds handshake_timeout{30000};
        bool verify_host = true;
        std::string user_agent = "crossbook/1.0";
    };

    /// Create a new WebSocket channel
    /// @param ioc IO context for async operations
    /// @param ssl_ctx Shared TLS context
    /// @param options Peer address and handshake settings
    /// @param log Diagnostics logger
    WebSocketClient(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        Options options,
        std::shared_ptr<spdlog::logger> log
    );

    ~WebSocketClient() override;

    // Non-copyable, non-movable
    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    void open(Handlers handlers) override;
    void send(std::string message) override;
    void close() override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] ConnectionState state() const noexcept;
    [[nodiscard]] bool is_connected() const noexcept;

private:
    void do_resolve();
    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
    void do_connect(const tcp::resolver::results_type& results);
    void on_connect(boost::system::error_code ec);
    void do_ssl_handshake();
    void on_ssl_handshake(boost::system::error_code ec);
    void do_ws_handshake();
    void on_ws_handshake(boost::system::error_code ec);
    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void enqueue(std::string message);
    void do_write();
    void on_write(boost::system::error_code ec, std::size_t bytes_transferred);
    void do_close();
    void on_close(boost::system::error_code ec);
    void fail(boost::system::error_code ec, std::string_view what);
    void finish(std::string reason);
    void set_state(ConnectionState new_state);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    Options options_;
    std::shared_ptr<spdlog::logger> log_;
    tcp::resolver resolver_;
    std::unique_ptr<ws_stream> ws_;
    boost::beast::flat_buffer buffer_;

    Handlers handlers_;
    std::deque<std::string> outbox_;
    bool writing_{false};
    bool close_requested_{false};
    bool finished_{false};

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
};

}  // namespace crossbook::network
