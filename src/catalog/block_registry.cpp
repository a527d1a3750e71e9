// VoxStruct Block Catalog
// block_registry.cpp - Registry-backed BlockCatalog implementation

#include <nlohmann/json.hpp>

#include <array>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <voxstruct/catalog/block_registry.hpp>
#include <voxstruct/core/logger.hpp>

namespace voxstruct::catalog {

// ============================================================================
// Property Rotation
// ============================================================================

namespace {

// Clockwise order seen from above
constexpr std::array<const char*, 4> CARDINAL_ORDER = {"north", "east", "south", "west"};

// facing_direction values in clockwise order: north, east, south, west
constexpr std::array<int32_t, 4> FACING_ORDER = {2, 5, 3, 4};

int32_t step(RotationDirection direction) {
    return direction == RotationDirection::Right ? 1 : 3;
}

PropertyValue rotate_facing(int32_t facing, RotationDirection direction) {
    for (size_t i = 0; i < FACING_ORDER.size(); ++i) {
        if (FACING_ORDER[i] == facing) {
            return FACING_ORDER[(i + step(direction)) % FACING_ORDER.size()];
        }
    }
    return facing;  // Up, down or unknown
}

PropertyValue rotate_cardinal(const std::string& cardinal, RotationDirection direction) {
    for (size_t i = 0; i < CARDINAL_ORDER.size(); ++i) {
        if (cardinal == CARDINAL_ORDER[i]) {
            return std::string(CARDINAL_ORDER[(i + step(direction)) % CARDINAL_ORDER.size()]);
        }
    }
    return cardinal;
}

}  // namespace

PropertyValue rotate_property(PropertyRotation kind, const PropertyValue& value, RotationDirection direction) {
    switch (kind) {
        case PropertyRotation::FacingDirection:
            if (const auto* facing = std::get_if<int32_t>(&value)) {
                return rotate_facing(*facing, direction);
            }
            break;
        case PropertyRotation::CardinalDirection:
            if (const auto* cardinal = std::get_if<std::string>(&value)) {
                return rotate_cardinal(*cardinal, direction);
            }
            break;
        case PropertyRotation::Direction:
            // 0 south, 1 west, 2 north, 3 east: already clockwise
            if (const auto* dir = std::get_if<int32_t>(&value)) {
                if (*dir >= 0 && *dir < 4) {
                    return (*dir + step(direction)) % 4;
                }
            }
            break;
        case PropertyRotation::PillarAxis:
            if (const auto* axis = std::get_if<std::string>(&value)) {
                if (*axis == "x") {
                    return std::string("z");
                }
                if (*axis == "z") {
                    return std::string("x");
                }
            }
            break;
    }
    return value;
}

// ============================================================================
// BlockType Implementation
// ============================================================================

BlockType::BlockType(const BlockTypeDesc& desc)
    : name_(desc.name), flags_(desc.flags), states_(desc.states), rotations_(desc.rotations) {}

std::optional<BlockProperties> BlockType::complete_states(const BlockProperties& properties) const {
    BlockProperties result = states_;
    for (const auto& [key, value] : properties) {
        auto it = result.find(key);
        if (it == result.end() || it->second.index() != value.index()) {
            return std::nullopt;
        }
        it->second = value;
    }
    return result;
}

// ============================================================================
// Registered Block
// ============================================================================

namespace {

class RegisteredBlock final : public Block {
public:
    RegisteredBlock(std::shared_ptr<const BlockType> type, BlockProperties properties, nlohmann::json payload)
        : type_(std::move(type)), properties_(std::move(properties)), payload_(std::move(payload)) {}

    BlockIdentity encode_identity() const override { return {type_->get_name(), properties_}; }

    bool is_liquid() const override { return type_->is_liquid(); }

    bool has_payload() const override { return type_->has_payload(); }

    nlohmann::json encode_payload() const override { return payload_; }

    BlockPtr decode_payload(const nlohmann::json& payload) const override {
        if (!payload.is_object()) {
            return nullptr;
        }
        return std::make_shared<RegisteredBlock>(type_, properties_, payload);
    }

    bool is_rotatable() const override { return type_->is_rotatable(); }

    BlockPtr rotate(RotationDirection direction) const override {
        if (!type_->is_rotatable()) {
            return nullptr;
        }
        BlockProperties rotated = properties_;
        for (const auto& [key, kind] : type_->get_rotations()) {
            auto it = rotated.find(key);
            if (it != rotated.end()) {
                it->second = rotate_property(kind, it->second, direction);
            }
        }
        return std::make_shared<RegisteredBlock>(type_, std::move(rotated), payload_);
    }

private:
    std::shared_ptr<const BlockType> type_;
    BlockProperties properties_;
    nlohmann::json payload_;
};

}  // namespace

// ============================================================================
// BlockRegistry Implementation
// ============================================================================

struct BlockRegistry::Impl {
    std::vector<std::shared_ptr<const BlockType>> blocks;
    std::unordered_map<std::string, size_t> name_to_index;

    struct Alias {
        std::string current_name;
        int32_t below_version = 0;
    };
    std::unordered_map<std::string, Alias> aliases;

    int32_t current_version = CURRENT_BLOCK_VERSION;
    bool defaults_registered = false;

    mutable std::mutex mutex;

    std::shared_ptr<const BlockType> find(std::string_view name) const {
        auto it = name_to_index.find(std::string(name));
        if (it == name_to_index.end()) {
            return nullptr;
        }
        return blocks[it->second];
    }

    bool add(const BlockTypeDesc& desc) {
        if (name_to_index.count(desc.name) > 0) {
            VOXSTRUCT_LOG_WARN(core::log_category::CATALOG, "Block '{}' already registered", desc.name);
            return false;
        }
        name_to_index[desc.name] = blocks.size();
        blocks.push_back(std::make_shared<BlockType>(desc));
        VOXSTRUCT_LOG_DEBUG(core::log_category::CATALOG, "Registered block '{}'", desc.name);
        return true;
    }
};

BlockRegistry::BlockRegistry() : impl_(std::make_unique<Impl>()) {
    // Air is always present, new structures are filled with it
    BlockTypeDesc air;
    air.name = "minecraft:air";
    air.flags = BlockFlags::Air;
    impl_->add(air);
}

BlockRegistry::~BlockRegistry() = default;

bool BlockRegistry::register_block(const BlockTypeDesc& desc) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->add(desc);
}

void BlockRegistry::register_defaults() {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    if (impl_->defaults_registered) {
        return;
    }
    impl_->defaults_registered = true;

    VOXSTRUCT_LOG_DEBUG(core::log_category::CATALOG, "Registering default block types");

    {
        BlockTypeDesc desc;
        desc.name = "minecraft:stone";
        desc.states = {{"stone_type", std::string("stone")}};
        impl_->add(desc);
    }

    {
        BlockTypeDesc desc;
        desc.name = "minecraft:dirt";
        desc.states = {{"dirt_type", std::string("normal")}};
        impl_->add(desc);
    }

    {
        BlockTypeDesc desc;
        desc.name = "minecraft:grass_block";
        impl_->add(desc);
        impl_->aliases["minecraft:grass"] = {"minecraft:grass_block", CURRENT_BLOCK_VERSION};
    }

    {
        BlockTypeDesc desc;
        desc.name = "minecraft:glass";
        impl_->add(desc);
    }

    // Liquids
    for (const char* name : {"minecraft:water", "minecraft:flowing_water", "minecraft:lava"}) {
        BlockTypeDesc desc;
        desc.name = name;
        desc.flags = BlockFlags::Liquid;
        desc.states = {{"liquid_depth", int32_t{0}}};
        impl_->add(desc);
    }

    // Containers carry block entity data
    {
        BlockTypeDesc desc;
        desc.name = "minecraft:chest";
        desc.flags = BlockFlags::Solid | BlockFlags::HasPayload;
        desc.states = {{"facing_direction", int32_t{2}}};
        desc.rotations = {{"facing_direction", PropertyRotation::FacingDirection}};
        impl_->add(desc);
    }

    {
        BlockTypeDesc desc;
        desc.name = "minecraft:barrel";
        desc.flags = BlockFlags::Solid | BlockFlags::HasPayload;
        desc.states = {{"facing_direction", int32_t{1}}, {"open_bit", false}};
        desc.rotations = {{"facing_direction", PropertyRotation::FacingDirection}};
        impl_->add(desc);
    }

    {
        BlockTypeDesc desc;
        desc.name = "minecraft:furnace";
        desc.flags = BlockFlags::Solid | BlockFlags::HasPayload;
        desc.states = {{"minecraft:cardinal_direction", std::string("south")}};
        desc.rotations = {{"minecraft:cardinal_direction", PropertyRotation::CardinalDirection}};
        impl_->add(desc);
    }

    // Oriented blocks without payload
    {
        BlockTypeDesc desc;
        desc.name = "minecraft:oak_log";
        desc.states = {{"pillar_axis", std::string("y")}};
        desc.rotations = {{"pillar_axis", PropertyRotation::PillarAxis}};
        impl_->add(desc);
    }

    {
        BlockTypeDesc desc;
        desc.name = "minecraft:fence_gate";
        desc.states = {{"direction", int32_t{0}}, {"in_wall_bit", false}, {"open_bit", false}};
        desc.rotations = {{"direction", PropertyRotation::Direction}};
        impl_->add(desc);
    }
}

void BlockRegistry::register_alias(std::string_view legacy_name, std::string_view current_name,
                                   int32_t below_version) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->aliases[std::string(legacy_name)] = {std::string(current_name), below_version};
}

void BlockRegistry::set_current_version(int32_t version) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->current_version = version;
}

const BlockType* BlockRegistry::get(std::string_view name) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->find(name).get();
}

size_t BlockRegistry::count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->blocks.size();
}

void BlockRegistry::for_each(const std::function<void(const BlockType&)>& callback) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (const auto& block : impl_->blocks) {
        callback(*block);
    }
}

BlockPtr BlockRegistry::make_block(std::string_view name, const BlockProperties& properties) const {
    return make_block(name, properties, nlohmann::json::object());
}

BlockPtr BlockRegistry::make_block(std::string_view name, const BlockProperties& properties,
                                   const nlohmann::json& payload) const {
    std::shared_ptr<const BlockType> type;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        type = impl_->find(name);
    }
    if (!type) {
        VOXSTRUCT_LOG_DEBUG(core::log_category::CATALOG, "Unknown block '{}'", name);
        return nullptr;
    }

    auto states = type->complete_states(properties);
    if (!states) {
        VOXSTRUCT_LOG_DEBUG(core::log_category::CATALOG, "Invalid states for block '{}'", name);
        return nullptr;
    }
    return std::make_shared<RegisteredBlock>(std::move(type), std::move(*states), payload);
}

BlockPtr BlockRegistry::resolve(const BlockIdentity& identity) const {
    return make_block(identity.name, identity.properties);
}

BlockIdentity BlockRegistry::upgrade(const BlockIdentity& identity, int32_t version) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto it = impl_->aliases.find(identity.name);
    if (it == impl_->aliases.end() || version >= it->second.below_version) {
        return identity;
    }

    VOXSTRUCT_LOG_TRACE(core::log_category::CATALOG, "Upgrading '{}' (version {}) to '{}'", identity.name,
                        version, it->second.current_name);
    return {it->second.current_name, identity.properties};
}

int32_t BlockRegistry::current_version() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->current_version;
}

}  // namespace voxstruct::catalog
