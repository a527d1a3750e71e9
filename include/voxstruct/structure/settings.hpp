// VoxStruct Structure
// settings.hpp - Typed view of the structure configuration section

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace voxstruct::core {
class Config;
}

namespace voxstruct::structure {

// Byte encodings of the tagged tree
enum class BinaryFormat : uint8_t {
    Cbor,
    MessagePack,
    Bson,
    Ubjson,
    Json,  // Text, for debugging
};

[[nodiscard]] std::optional<BinaryFormat> parse_binary_format(std::string_view name);
[[nodiscard]] const char* binary_format_to_string(BinaryFormat format);

struct StructureSettings {
    std::string default_palette = "default";  // Palette activated on creation and decode
    std::string air_block = "minecraft:air";  // Fill entry of new structures
    bool overlay_layer = true;                // New structures get a liquid layer
    BinaryFormat binary_format = BinaryFormat::Cbor;

    // Missing or malformed keys keep the defaults above
    [[nodiscard]] static StructureSettings from_config(const core::Config& config);
};

}  // namespace voxstruct::structure
