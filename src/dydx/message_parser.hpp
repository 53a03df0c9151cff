#pragma once

#include "core/errors.hpp"
#include "core/status.hpp"
#include "dydx/types.hpp"
#include <string>
#include <string_view>

namespace crossbook::dydx {

/// Order book channel on the v4 indexer
constexpr std::string_view kOrderbookChannel = "v4_orderbook";

/// Parser for dYdX v4 indexer WebSocket messages
class MessageParser {
public:
    /// Type name reported in DecodeFailure
    static constexpr std::string_view kMessageTypeName = "dydx::Message";

    /// Decode any indexer message, dispatching on "type"
    [[nodiscard]] static Result<Message, DecodeFailure> parse(std::string_view json);

    /// {"type":"subscribe","channel":"v4_orderbook","id":<instrument>}
    [[nodiscard]] static std::string subscribe_request(std::string_view instrument);

    /// Name of the message type for protocol errors and logs
    [[nodiscard]] static std::string type_name(const Message& message);
};

}  // namespace crossbook::dydx
