#include "dydx/message_parser.hpp"
#include "codec/json_reader.hpp"
#include <nlohmann/json.hpp>

namespace crossbook::dydx {

using codec::JsonReader;

namespace {

std::vector<RestingOrder> read_orders(const JsonReader& contents, std::string_view side) {
    std::vector<RestingOrder> orders;
    auto arr = contents.optional_field(side);
    if (!arr) {
        return orders;
    }
    for (const auto& row : arr->elements()) {
        orders.push_back(RestingOrder{
            row.field("price").price(),
            row.field("size").quantity()
        });
    }
    return orders;
}

std::vector<PriceLevel> read_levels(const JsonReader& contents, std::string_view side) {
    std::vector<PriceLevel> levels;
    auto arr = contents.optional_field(side);
    if (!arr) {
        return levels;
    }
    for (const auto& row : arr->elements()) {
        levels.emplace_back(row.element(0).price(), row.element(1).quantity());
    }
    return levels;
}

Message read_message(const JsonReader& root) {
    auto type = root.field("type").string();

    if (type == "connected") {
        return Connected{};
    }
    if (type == "subscribed") {
        auto contents = root.field("contents");
        return Subscribed{read_orders(contents, "bids"), read_orders(contents, "asks")};
    }
    if (type == "channel_data") {
        auto contents = root.field("contents");
        return ChannelData{read_levels(contents, "bids"), read_levels(contents, "asks")};
    }
    return Other{std::move(type)};
}

}  // namespace

Result<Message, DecodeFailure> MessageParser::parse(std::string_view json) {
    return codec::decode<Message>(json, kMessageTypeName, read_message);
}

std::string MessageParser::subscribe_request(std::string_view instrument) {
    nlohmann::json request{
        {"type", "subscribe"},
        {"channel", std::string(kOrderbookChannel)},
        {"id", std::string(instrument)}
    };
    return request.dump();
}

std::string MessageParser::type_name(const Message& message) {
    return std::visit([](const auto& m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Connected>) return "connected";
        else if constexpr (std::is_same_v<T, Subscribed>) return "subscribed";
        else if constexpr (std::is_same_v<T, ChannelData>) return "channel_data";
        else return m.type;
    }, message);
}

}  // namespace crossbook::dydx
