// VoxStruct Structure
// codec.hpp - Structure document to and from the generic tagged tree

#pragma once

#include "structure.hpp"

#include <nlohmann/json.hpp>

#include <memory>

namespace voxstruct::structure {

// ============================================================================
// Field Names
// ============================================================================

namespace field {
    inline constexpr const char* FORMAT_VERSION = "format_version";
    inline constexpr const char* SIZE = "size";
    inline constexpr const char* WORLD_ORIGIN = "structure_world_origin";
    inline constexpr const char* STRUCTURE = "structure";
    inline constexpr const char* BLOCK_INDICES = "block_indices";
    inline constexpr const char* ENTITIES = "entities";
    inline constexpr const char* PALETTE = "palette";
    inline constexpr const char* BLOCK_PALETTE = "block_palette";
    inline constexpr const char* BLOCK_POSITION_DATA = "block_position_data";
    inline constexpr const char* BLOCK_ENTITY_DATA = "block_entity_data";
    inline constexpr const char* NAME = "name";
    inline constexpr const char* STATES = "states";
    inline constexpr const char* VERSION = "version";
}  // namespace field

// ============================================================================
// Structure Codec
// ============================================================================

// Tree layout:
//   format_version: int
//   size: [int, int, int]
//   structure_world_origin: [int, int, int]
//   structure:
//     block_indices: [[int...], [int...]]
//     entities: [object...]
//     palette:
//       <name>:
//         block_palette: [{name, states, version}...]
//         block_position_data: {"<offset>": {block_entity_data: object}}
class StructureCodec {
public:
    // Wrong shapes and types are Decode errors; the decoded fields then go
    // through validate(). settings.default_palette is activated.
    [[nodiscard]] static DecodeResult decode(const nlohmann::json& tree,
                                             std::shared_ptr<const catalog::BlockCatalog> catalog,
                                             const StructureSettings& settings = {});

    // Commits the active palette; the document itself is not changed
    [[nodiscard]] static nlohmann::json encode(const StructureDocument& document);

    // Property value encoding shared with the palette entries
    [[nodiscard]] static nlohmann::json encode_properties(const catalog::BlockProperties& properties);
};

}  // namespace voxstruct::structure
