#include "core/errors.hpp"
#include <type_traits>

namespace crossbook {

std::string_view kind_name(const FeedError& error) noexcept {
    return std::visit([](const auto& e) -> std::string_view {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TransportFailure>) return "TransportFailure";
        else if constexpr (std::is_same_v<T, ProtocolViolation>) return "ProtocolViolation";
        else return "DecodeFailure";
    }, error);
}

std::string describe(const FeedError& error) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TransportFailure>) {
            return "transport failure: " + e.reason;
        } else if constexpr (std::is_same_v<T, ProtocolViolation>) {
            return "protocol violation: expected " + e.expected + ", received " + e.received;
        } else {
            return "couldn't decode a " + e.expected_type + " at '" + e.path + "': " +
                   e.detail + " (source text: " + e.excerpt + ")";
        }
    }, error);
}

std::string excerpt(std::string_view raw, std::size_t max_bytes) {
    if (raw.size() <= max_bytes) {
        return std::string(raw);
    }
    // Never split a UTF-8 sequence: back up over continuation bytes
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(raw[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    std::string out(raw.substr(0, cut));
    out += "...";
    return out;
}

}  // namespace crossbook
