#include "network/websocket_client.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

namespace crossbook::network {

namespace websocket = boost::beast::websocket;

WebSocketClient::WebSocketClient(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    Options options,
    std::shared_ptr<spdlog::logger> log
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , options_(std::move(options))
    , log_(std::move(log))
    , resolver_(ioc)
{}

WebSocketClient::~WebSocketClient() {
    if (ws_ && ws_->is_open()) {
        boost::system::error_code ec;
        boost::beast::get_lowest_layer(*ws_).socket().close(ec);
    }
}

void WebSocketClient::open(Handlers handlers) {
    handlers_ = std::move(handlers);
    finished_ = false;
    close_requested_ = false;

    log_->info("WebSocket connecting to {}", describe());
    set_state(ConnectionState::Resolving);
    do_resolve();
}

std::string WebSocketClient::describe() const {
    return options_.host + ":" + options_.port + options_.path;
}

void WebSocketClient::do_resolve() {
    resolver_.async_resolve(
        options_.host,
        options_.port,
        [self = shared_from_this()](auto ec, auto results) {
            self->on_resolve(ec, std::move(results));
        }
    );
}

void WebSocketClient::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
    // cancel() cannot recall a completion that was already queued
    if (close_requested_) {
        return finish("closed locally");
    }
    if (ec) {
        return fail(ec, "resolve");
    }

    log_->debug("Resolved {} endpoints for {}", results.size(), options_.host);

    ws_ = std::make_unique<ws_stream>(ioc_, *ssl_ctx_);

    // SNI is required by both venues' CDNs
    if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), options_.host.c_str())) {
        boost::system::error_code ssl_ec{
            static_cast<int>(::ERR_get_error()),
            boost::asio::error::get_ssl_category()
        };
        return fail(ssl_ec, "ssl_sni");
    }

    if (options_.verify_host) {
        ws_->next_layer().set_verify_callback(
            boost::asio::ssl::host_name_verification(options_.host)
        );
    }

    set_state(ConnectionState::Connecting);
    do_connect(results);
}

void WebSocketClient::do_connect(const tcp::resolver::results_type& results) {
    boost::beast::get_lowest_layer(*ws_).expires_after(options_.handshake_timeout);

    boost::beast::get_lowest_layer(*ws_).async_connect(
        results,
        [self = shared_from_this()](auto ec, auto /*endpoint*/) {
            self->on_connect(ec);
        }
    );
}

void WebSocketClient::on_connect(boost::system::error_code ec) {
    if (close_requested_) {
        return finish("closed locally");
    }
    if (ec) {
        return fail(ec, "connect");
    }

    log_->debug("TCP connected to {}:{}", options_.host, options_.port);

    set_state(ConnectionState::SslHandshake);
    do_ssl_handshake();
}

void WebSocketClient::do_ssl_handshake() {
    boost::beast::get_lowest_layer(*ws_).expires_after(options_.handshake_timeout);

    ws_->next_layer().async_handshake(
        boost::asio::ssl::stream_base::client,
        [self = shared_from_this()](auto ec) {
            self->on_ssl_handshake(ec);
        }
    );
}

void WebSocketClient::on_ssl_handshake(boost::system::error_code ec) {
    if (close_requested_) {
        return finish("closed locally");
    }
    if (ec) {
        return fail(ec, "ssl_handshake");
    }

    log_->debug("TLS handshake complete with {}", options_.host);

    // The websocket layer manages its own timeouts from here on
    boost::beast::get_lowest_layer(*ws_).expires_never();

    auto timeouts = websocket::stream_base::timeout::suggested(boost::beast::role_type::client);
    timeouts.handshake_timeout = options_.handshake_timeout;
    ws_->set_option(timeouts);

    ws_->set_option(websocket::stream_base::decorator(
        [agent = options_.user_agent](websocket::request_type& req) {
            req.set(boost::beast::http::field::user_agent, agent);
        }
    ));

    // Pings are answered by the stream itself; only note them
    ws_->control_callback(
        [log = log_](websocket::frame_type kind, boost::beast::string_view payload) {
            if (kind == websocket::frame_type::ping) {
                log->trace("ping ({} bytes)", payload.size());
            } else if (kind == websocket::frame_type::pong) {
                log->trace("pong ({} bytes)", payload.size());
            }
        }
    );

    set_state(ConnectionState::WsHandshake);
    do_ws_handshake();
}

void WebSocketClient::do_ws_handshake() {
    ws_->async_handshake(
        options_.host,
        options_.path,
        [self = shared_from_this()](auto ec) {
            self->on_ws_handshake(ec);
        }
    );
}

void WebSocketClient::on_ws_handshake(boost::system::error_code ec) {
    if (close_requested_) {
        return finish("closed locally");
    }
    if (ec) {
        return fail(ec, "ws_handshake");
    }

    log_->info("WebSocket connected to {}", describe());

    set_state(ConnectionState::Connected);

    do_read();

    if (handlers_.on_open) {
        handlers_.on_open();
    }
}

void WebSocketClient::do_read() {
    ws_->async_read(
        buffer_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void WebSocketClient::on_read(boost::system::error_code ec, std::size_t bytes_transferred) {
    if (ec) {
        if (close_requested_) {
            return finish("closed locally");
        }
        if (ec == websocket::error::closed) {
            const auto& close_reason = ws_->reason();
            log_->info("WebSocket {} closed by peer (code {})", describe(),
                       static_cast<unsigned>(close_reason.code));
            std::string reason = "stream closed by peer";
            if (!close_reason.reason.empty()) {
                reason += ": ";
                reason += std::string(close_reason.reason.data(), close_reason.reason.size());
            }
            return finish(std::move(reason));
        }
        return fail(ec, "read");
    }

    if (finished_) {
        return;
    }

    auto data = boost::beast::buffers_to_string(buffer_.data());
    buffer_.consume(bytes_transferred);

    log_->trace("{} frame from {} ({} bytes)", ws_->got_text() ? "text" : "binary",
                options_.host, bytes_transferred);

    if (handlers_.on_message) {
        handlers_.on_message(data);
    }

    // The handler may have closed us
    if (!finished_ && state() == ConnectionState::Connected) {
        do_read();
    }
}

void WebSocketClient::send(std::string message) {
    if (!is_connected()) {
        log_->warn("Cannot send to {}: not connected", describe());
        return;
    }

    boost::asio::post(ioc_, [self = shared_from_this(), msg = std::move(message)]() mutable {
        self->enqueue(std::move(msg));
    });
}

void WebSocketClient::enqueue(std::string message) {
    if (!is_connected()) {
        return;
    }
    outbox_.push_back(std::move(message));
    if (!writing_) {
        do_write();
    }
}

void WebSocketClient::do_write() {
    writing_ = true;
    ws_->text(true);
    ws_->async_write(
        boost::asio::buffer(outbox_.front()),
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_write(ec, bytes);
        }
    );
}

void WebSocketClient::on_write(boost::system::error_code ec, std::size_t bytes_transferred) {
    writing_ = false;

    if (ec) {
        return fail(ec, "write");
    }

    log_->trace("Sent {} bytes to {}", bytes_transferred, options_.host);
    outbox_.pop_front();

    if (close_requested_) {
        outbox_.clear();
        return do_close();
    }
    if (!outbox_.empty()) {
        do_write();
    }
}

void WebSocketClient::close() {
    if (finished_ || close_requested_) {
        return;
    }
    close_requested_ = true;

    auto current = state();
    switch (current) {
        case ConnectionState::Disconnected:
            finish("closed locally");
            return;
        case ConnectionState::Resolving:
            resolver_.cancel();
            return;
        case ConnectionState::Connecting:
        case ConnectionState::SslHandshake:
        case ConnectionState::WsHandshake:
            if (ws_) {
                boost::beast::get_lowest_layer(*ws_).cancel();
            }
            return;
        case ConnectionState::Connected:
            set_state(ConnectionState::Closing);
            // A write in flight must complete before the close frame goes out
            if (!writing_) {
                do_close();
            }
            return;
        case ConnectionState::Closing:
        case ConnectionState::Closed:
            return;
    }
}

void WebSocketClient::do_close() {
    set_state(ConnectionState::Closing);
    ws_->async_close(
        websocket::close_code::normal,
        [self = shared_from_this()](auto ec) {
            self->on_close(ec);
        }
    );
}

void WebSocketClient::on_close(boost::system::error_code ec) {
    if (ec) {
        log_->warn("WebSocket close error on {}: {}", describe(), ec.message());
    }

    log_->info("WebSocket connection to {} closed", describe());
    finish("closed locally");
}

void WebSocketClient::fail(boost::system::error_code ec, std::string_view what) {
    if (finished_) {
        return;
    }
    if (close_requested_) {
        log_->debug("WebSocket {} aborted during {}: {}", describe(), what, ec.message());
        return finish("closed locally");
    }

    log_->error("WebSocket {} error on {}: {}", what, describe(), ec.message());
    finish(std::string(what) + ": " + ec.message());
}

void WebSocketClient::finish(std::string reason) {
    if (finished_) {
        return;
    }
    finished_ = true;
    set_state(ConnectionState::Closed);

    if (ws_ && boost::beast::get_lowest_layer(*ws_).socket().is_open()) {
        boost::system::error_code ignored;
        boost::beast::get_lowest_layer(*ws_).socket().shutdown(tcp::socket::shutdown_both, ignored);
    }

    // Release the handlers (and whatever they captured) once they have run
    auto handlers = std::move(handlers_);
    handlers_ = Handlers{};
    if (handlers.on_closed) {
        handlers.on_closed(reason);
    }
}

void WebSocketClient::set_state(ConnectionState new_state) {
    auto old_state = state_.exchange(new_state, std::memory_order_acq_rel);
    if (old_state != new_state) {
        log_->trace("WebSocket {}: {} -> {}", options_.host, to_string(old_state), to_string(new_state));
    }
}

ConnectionState WebSocketClient::state() const noexcept {
    return state_.load(std::memory_order_acquire);
}

bool WebSocketClient::is_connected() const noexcept {
    return state() == ConnectionState::Connected;
}

}  // namespace crossbook::network
