#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>

namespace crossbook::network {

/// Create the TLS client context shared by every venue channel
/// @param verify_peer Verify server certificates against the system store
[[nodiscard]] std::shared_ptr<boost::asio::ssl::context> create_ssl_context(bool verify_peer = true);

}  // namespace crossbook::network
