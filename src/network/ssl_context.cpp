#include "network/ssl_context.hpp"

namespace crossbook::network {

std::shared_ptr<boost::asio::ssl::context> create_ssl_context(bool verify_peer) {
    auto ctx = std::make_shared<boost::asio::ssl::context>(
        boost::asio::ssl::context::tls_client
    );

    ctx->set_options(
        boost::asio::ssl::context::default_workarounds |
        boost::asio::ssl::context::no_sslv2 |
        boost::asio::ssl::context::no_sslv3 |
        boost::asio::ssl::context::no_tlsv1 |
        boost::asio::ssl::context::no_tlsv1_1
    );

    if (verify_peer) {
        ctx->set_default_verify_paths();
        ctx->set_verify_mode(boost::asio::ssl::verify_peer);
    } else {
        ctx->set_verify_mode(boost::asio::ssl::verify_none);
    }

    return ctx;
}

}  // namespace crossbook::network
