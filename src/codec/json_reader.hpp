#pragma once

#include "core/errors.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace crossbook::codec {

/// Schema mismatch at a location inside a JSON document
/// Thrown by JsonReader, converted to DecodeFailure at the parser boundary
class SchemaError : public std::runtime_error {
public:
    SchemaError(std::string path, const std::string& detail)
        : std::runtime_error(detail)
        , path_(std::move(path))
    {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/// Read-only cursor over a parsed JSON value that remembers how it got there
/// Every accessor throws SchemaError naming the path on mismatch
class JsonReader {
public:
    explicit JsonReader(const nlohmann::json& node, std::string path = {})
        : node_(&node)
        , path_(std::move(path))
    {}

    /// Required object member
    [[nodiscard]] JsonReader field(std::string_view key) const;

    /// Optional object member; absent and null both yield nullopt
    [[nodiscard]] std::optional<JsonReader> optional_field(std::string_view key) const;

    /// Elements of a required array
    [[nodiscard]] std::vector<JsonReader> elements() const;

    /// Element of a fixed-size array (tuples such as ["price", "qty"])
    [[nodiscard]] JsonReader element(std::size_t index) const;

    [[nodiscard]] std::string string() const;

    /// Decimal string parsed exactly into fixed point
    [[nodiscard]] Price price() const;
    [[nodiscard]] Quantity quantity() const;

    /// "." for the document root, otherwise e.g. "contents.bids[0]"
    [[nodiscard]] std::string path() const { return path_.empty() ? "." : path_; }

    [[nodiscard]] const nlohmann::json& node() const noexcept { return *node_; }

private:
    [[nodiscard]] std::string child_path(std::string_view key) const;
    [[noreturn]] void mismatch(std::string_view expected) const;

    const nlohmann::json* node_;
    std::string path_;
};

/// Parse raw text and run decode on the root reader
/// Syntax errors, schema errors and number errors all become DecodeFailure
template <typename T, typename DecodeFn>
[[nodiscard]] Result<T, DecodeFailure> decode(std::string_view raw,
                                              std::string_view type_name,
                                              DecodeFn&& decode_fn) {
    auto failure = [&](std::string path, std::string detail) {
        return Result<T, DecodeFailure>::Err(DecodeFailure{
            std::move(path), excerpt(raw), std::string(type_name), std::move(detail)
        });
    };

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(raw.begin(), raw.end());
    } catch (const nlohmann::json::parse_error& e) {
        return failure(".", e.what());
    }

    try {
        return Result<T, DecodeFailure>::Ok(decode_fn(JsonReader(document)));
    } catch (const SchemaError& e) {
        return failure(e.path(), e.what());
    }
}

}  // namespace crossbook::codec
