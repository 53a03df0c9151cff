#pragma once

#include "aevo/types.hpp"
#include "core/errors.hpp"
#include "core/status.hpp"
#include <string>
#include <string_view>

namespace crossbook::aevo {

/// Parser for Aevo public WebSocket order book messages
class MessageParser {
public:
    static constexpr std::string_view kMessageTypeName = "aevo::Data<aevo::Book>";
    static constexpr std::string_view kAckTypeName = "aevo::Data<Vec<String>>";

    /// Decode a book message ({"data":{"type":...}})
    [[nodiscard]] static Result<Message, DecodeFailure> parse(std::string_view json);

    /// Decode the subscription acknowledgement ({"data":[<string>...]})
    [[nodiscard]] static Result<SubscribeAck, DecodeFailure> parse_ack(std::string_view json);

    /// {"op":"subscribe","data":["orderbook:<instrument>"]}
    [[nodiscard]] static std::string subscribe_request(std::string_view instrument);

    /// "orderbook:<instrument>"
    [[nodiscard]] static std::string channel_name(std::string_view instrument);

    [[nodiscard]] static std::string type_name(const Message& message);
};

}  // namespace crossbook::aevo
