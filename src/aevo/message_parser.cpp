#include "aevo/message_parser.hpp"
#include "codec/json_reader.hpp"
#include <nlohmann/json.hpp>

namespace crossbook::aevo {

using codec::JsonReader;

namespace {

std::vector<PriceLevel> read_levels(const JsonReader& book, std::string_view side) {
    std::vector<PriceLevel> levels;
    for (const auto& row : book.field(side).elements()) {
        levels.emplace_back(row.element(0).price(), row.element(1).quantity());
    }
    return levels;
}

Message read_message(const JsonReader& root) {
    auto data = root.field("data");
    auto type = data.field("type").string();

    if (type == "snapshot") {
        return Snapshot{read_levels(data, "bids"), read_levels(data, "asks")};
    }
    if (type == "update") {
        return Update{read_levels(data, "bids"), read_levels(data, "asks")};
    }
    return Other{std::move(type)};
}

SubscribeAck read_ack(const JsonReader& root) {
    SubscribeAck ack;
    for (const auto& channel : root.field("data").elements()) {
        ack.channels.push_back(channel.string());
    }
    return ack;
}

}  // namespace

Result<Message, DecodeFailure> MessageParser::parse(std::string_view json) {
    return codec::decode<Message>(json, kMessageTypeName, read_message);
}

Result<SubscribeAck, DecodeFailure> MessageParser::parse_ack(std::string_view json) {
    return codec::decode<SubscribeAck>(json, kAckTypeName, read_ack);
}

std::string MessageParser::subscribe_request(std::string_view instrument) {
    nlohmann::json request{
        {"op", "subscribe"},
        {"data", nlohmann::json::array({channel_name(instrument)})}
    };
    return request.dump();
}

std::string MessageParser::channel_name(std::string_view instrument) {
    return "orderbook:" + std::string(instrument);
}

std::string MessageParser::type_name(const Message& message) {
    return std::visit([](const auto& m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Snapshot>) return "snapshot";
        else if constexpr (std::is_same_v<T, Update>) return "update";
        else return m.type;
    }, message);
}

}  // namespace crossbook::aevo
