// VoxStruct Block Catalog
// block_registry.hpp - Registry-backed BlockCatalog implementation

#pragma once

#include "block_catalog.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace voxstruct::catalog {

// Schema version written into new palette entries (1.18.10 block states)
inline constexpr int32_t CURRENT_BLOCK_VERSION = 17959425;

// ============================================================================
// Block Flags
// ============================================================================

enum class BlockFlags : uint32_t {
    None = 0,
    Air = 1 << 0,         // Empty space
    Solid = 1 << 1,       // Occupies the cell
    Liquid = 1 << 2,      // May sit on the overlay layer
    HasPayload = 1 << 3,  // Carries block entity data
};

inline BlockFlags operator|(BlockFlags a, BlockFlags b) {
    return static_cast<BlockFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline BlockFlags operator&(BlockFlags a, BlockFlags b) {
    return static_cast<BlockFlags>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline BlockFlags& operator|=(BlockFlags& a, BlockFlags b) {
    a = a | b;
    return a;
}

[[nodiscard]] inline bool has_flag(BlockFlags flags, BlockFlags flag) {
    return (flags & flag) == flag;
}

// ============================================================================
// Property Rotation
// ============================================================================

// How a property value changes under a quarter turn
enum class PropertyRotation : uint8_t {
    FacingDirection,    // int 0..5: down, up, north, south, west, east
    CardinalDirection,  // "north", "east", "south", "west"
    Direction,          // int 0..3: south, west, north, east
    PillarAxis,         // "x", "y", "z"; x and z swap
};

// Unknown values are returned unchanged
[[nodiscard]] PropertyValue rotate_property(PropertyRotation kind, const PropertyValue& value,
                                            RotationDirection direction);

// ============================================================================
// Block Type Descriptor (for registration)
// ============================================================================

struct BlockTypeDesc {
    std::string name;          // Namespaced identifier "minecraft:stone"
    BlockFlags flags = BlockFlags::Solid;
    BlockProperties states;    // Every accepted property with its default value
    std::map<std::string, PropertyRotation> rotations;
};

// ============================================================================
// Block Type (immutable, registered)
// ============================================================================

class BlockType {
public:
    explicit BlockType(const BlockTypeDesc& desc);

    [[nodiscard]] const std::string& get_name() const { return name_; }
    [[nodiscard]] BlockFlags get_flags() const { return flags_; }
    [[nodiscard]] const BlockProperties& get_default_states() const { return states_; }
    [[nodiscard]] const std::map<std::string, PropertyRotation>& get_rotations() const { return rotations_; }

    [[nodiscard]] bool is_air() const { return has_flag(flags_, BlockFlags::Air); }
    [[nodiscard]] bool is_solid() const { return has_flag(flags_, BlockFlags::Solid); }
    [[nodiscard]] bool is_liquid() const { return has_flag(flags_, BlockFlags::Liquid); }
    [[nodiscard]] bool has_payload() const { return has_flag(flags_, BlockFlags::HasPayload); }
    [[nodiscard]] bool is_rotatable() const { return !rotations_.empty(); }

    // Fills in defaults. Returns nullopt for unknown keys or a value whose
    // type differs from the default's.
    [[nodiscard]] std::optional<BlockProperties> complete_states(const BlockProperties& properties) const;

private:
    std::string name_;
    BlockFlags flags_;
    BlockProperties states_;
    std::map<std::string, PropertyRotation> rotations_;
};

// ============================================================================
// Block Registry
// ============================================================================

class BlockRegistry final : public BlockCatalog {
public:
    BlockRegistry();
    ~BlockRegistry() override;

    // Non-copyable, non-movable (blocks keep pointers into it)
    BlockRegistry(const BlockRegistry&) = delete;
    BlockRegistry& operator=(const BlockRegistry&) = delete;
    BlockRegistry(BlockRegistry&&) = delete;
    BlockRegistry& operator=(BlockRegistry&&) = delete;

    // Registration. Returns false if the name is already taken.
    bool register_block(const BlockTypeDesc& desc);
    void register_defaults();

    // Entries written with a version below below_version and named
    // legacy_name are renamed to current_name before resolution
    void register_alias(std::string_view legacy_name, std::string_view current_name, int32_t below_version);

    void set_current_version(int32_t version);

    // Lookup
    [[nodiscard]] const BlockType* get(std::string_view name) const;
    [[nodiscard]] size_t count() const;
    void for_each(const std::function<void(const BlockType&)>& callback) const;

    // Convenience constructors, nullptr if the type or a property is unknown
    [[nodiscard]] BlockPtr make_block(std::string_view name, const BlockProperties& properties = {}) const;
    [[nodiscard]] BlockPtr make_block(std::string_view name, const BlockProperties& properties,
                                      const nlohmann::json& payload) const;

    // BlockCatalog
    [[nodiscard]] BlockPtr resolve(const BlockIdentity& identity) const override;
    [[nodiscard]] BlockIdentity upgrade(const BlockIdentity& identity, int32_t version) const override;
    [[nodiscard]] int32_t current_version() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace voxstruct::catalog
