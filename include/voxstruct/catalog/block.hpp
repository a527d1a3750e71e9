// VoxStruct Block Catalog
// block.hpp - Runtime block values and their identity encoding

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>

namespace voxstruct::catalog {

// ============================================================================
// Block Identity
// ============================================================================

// Scalar state value: byte-flag, int or string
using PropertyValue = std::variant<bool, int32_t, std::string>;

// Property maps compare by full equality; insertion order is irrelevant
using BlockProperties = std::map<std::string, PropertyValue>;

// Canonical (name, properties) pair a block is stored under
struct BlockIdentity {
    std::string name;
    BlockProperties properties;

    bool operator==(const BlockIdentity& other) const = default;
};

[[nodiscard]] std::string property_value_to_string(const PropertyValue& value);
[[nodiscard]] std::string identity_to_string(const BlockIdentity& identity);

// ============================================================================
// Rotation
// ============================================================================

// Quarter turn around the Y axis, seen from above
enum class RotationDirection : uint8_t {
    Left,   // Counter-clockwise
    Right,  // Clockwise
};

[[nodiscard]] inline const char* rotation_direction_to_string(RotationDirection direction) {
    return direction == RotationDirection::Left ? "left" : "right";
}

// ============================================================================
// Block
// ============================================================================

class Block;
using BlockPtr = std::shared_ptr<const Block>;

// Runtime block value handed out by a BlockCatalog. Values are immutable;
// every transform returns a new block.
class Block {
public:
    virtual ~Block() = default;

    [[nodiscard]] virtual BlockIdentity encode_identity() const = 0;

    [[nodiscard]] virtual bool is_liquid() const { return false; }

    // Auxiliary per-position payload (block entity data)
    [[nodiscard]] virtual bool has_payload() const { return false; }
    [[nodiscard]] virtual nlohmann::json encode_payload() const;
    // Returns nullptr when the payload cannot be applied
    [[nodiscard]] virtual BlockPtr decode_payload(const nlohmann::json& payload) const;

    // Orientation carried in properties (facing, axis). rotate() returns
    // nullptr for blocks without one.
    [[nodiscard]] virtual bool is_rotatable() const { return false; }
    [[nodiscard]] virtual BlockPtr rotate(RotationDirection direction) const;
};

}  // namespace voxstruct::catalog
