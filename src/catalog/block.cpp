// VoxStruct Block Catalog
// block.cpp - Block and catalog defaults, identity formatting

#include <nlohmann/json.hpp>

#include <spdlog/fmt/fmt.h>
#include <voxstruct/catalog/block.hpp>
#include <voxstruct/catalog/block_catalog.hpp>

namespace voxstruct::catalog {

std::string property_value_to_string(const PropertyValue& value) {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag ? "true" : "false";
    }
    if (const auto* number = std::get_if<int32_t>(&value)) {
        return std::to_string(*number);
    }
    return fmt::format("\"{}\"", std::get<std::string>(value));
}

std::string identity_to_string(const BlockIdentity& identity) {
    if (identity.properties.empty()) {
        return identity.name;
    }

    std::string result = identity.name + "[";
    bool first = true;
    for (const auto& [key, value] : identity.properties) {
        if (!first) {
            result += ",";
        }
        first = false;
        result += key + "=" + property_value_to_string(value);
    }
    result += "]";
    return result;
}

nlohmann::json Block::encode_payload() const {
    return nlohmann::json::object();
}

BlockPtr Block::decode_payload(const nlohmann::json&) const {
    return nullptr;
}

BlockPtr Block::rotate(RotationDirection) const {
    return nullptr;
}

BlockIdentity BlockCatalog::upgrade(const BlockIdentity& identity, int32_t) const {
    return identity;
}

}  // namespace voxstruct::catalog
