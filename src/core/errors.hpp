#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace crossbook {

/// Connection or I/O failure, including the peer ending the stream early
struct TransportFailure {
    std::string reason;
};

/// A well-formed message arrived in a state that does not accept it
struct ProtocolViolation {
    std::string expected;
    std::string received;
};

/// A payload did not match the venue schema
struct DecodeFailure {
    std::string path;           // e.g. "contents.bids[0].price"
    std::string excerpt;        // leading bytes of the raw payload
    std::string expected_type;  // e.g. "dydx::Message"
    std::string detail;         // what was wrong at path
};

/// Terminal error of a venue feed; emitted exactly once, then the feed ends
using FeedError = std::variant<TransportFailure, ProtocolViolation, DecodeFailure>;

/// Error category name for logs ("TransportFailure", ...)
[[nodiscard]] std::string_view kind_name(const FeedError& error) noexcept;

/// Single-line human readable rendering
[[nodiscard]] std::string describe(const FeedError& error);

/// Bound a raw payload for inclusion in an error; the cut falls on a UTF-8 boundary
[[nodiscard]] std::string excerpt(std::string_view raw, std::size_t max_bytes = 256);

}  // namespace crossbook
