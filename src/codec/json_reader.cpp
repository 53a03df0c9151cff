#include "codec/json_reader.hpp"

namespace crossbook::codec {

std::string JsonReader::child_path(std::string_view key) const {
    std::string out = path_;
    if (!out.empty()) {
        out += '.';
    }
    out += key;
    return out;
}

void JsonReader::mismatch(std::string_view expected) const {
    throw SchemaError(path(), "invalid type: " + std::string(node_->type_name()) +
                                  ", expected " + std::string(expected));
}

JsonReader JsonReader::field(std::string_view key) const {
    if (!node_->is_object()) {
        mismatch("an object");
    }
    auto it = node_->find(std::string(key));
    if (it == node_->end()) {
        throw SchemaError(path(), "missing field `" + std::string(key) + "`");
    }
    return JsonReader(*it, child_path(key));
}

std::optional<JsonReader> JsonReader::optional_field(std::string_view key) const {
    if (!node_->is_object()) {
        mismatch("an object");
    }
    auto it = node_->find(std::string(key));
    if (it == node_->end() || it->is_null()) {
        return std::nullopt;
    }
    return JsonReader(*it, child_path(key));
}

std::vector<JsonReader> JsonReader::elements() const {
    if (!node_->is_array()) {
        mismatch("a sequence");
    }
    std::vector<JsonReader> out;
    out.reserve(node_->size());
    for (std::size_t i = 0; i < node_->size(); ++i) {
        out.emplace_back((*node_)[i], path_ + "[" + std::to_string(i) + "]");
    }
    return out;
}

JsonReader JsonReader::element(std::size_t index) const {
    if (!node_->is_array()) {
        mismatch("a sequence");
    }
    if (index >= node_->size()) {
        throw SchemaError(path(), "invalid length " + std::to_string(node_->size()) +
                                      ", expected at least " + std::to_string(index + 1) +
                                      " elements");
    }
    return JsonReader((*node_)[index], path_ + "[" + std::to_string(index) + "]");
}

std::string JsonReader::string() const {
    if (!node_->is_string()) {
        mismatch("a string");
    }
    return node_->get<std::string>();
}

Price JsonReader::price() const {
    auto text = string();
    try {
        return convert::parse_price(text);
    } catch (const std::exception& e) {
        throw SchemaError(path(), "invalid decimal \"" + text + "\": " + e.what());
    }
}

Quantity JsonReader::quantity() const {
    auto text = string();
    try {
        return convert::parse_quantity(text);
    } catch (const std::exception& e) {
        throw SchemaError(path(), "invalid decimal \"" + text + "\": " + e.what());
    }
}

}  // namespace crossbook::codec
