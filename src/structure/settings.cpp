// VoxStruct Structure
// settings.cpp - Structure settings from the config file

#include <voxstruct/core/config.hpp>
#include <voxstruct/core/logger.hpp>
#include <voxstruct/structure/settings.hpp>

namespace voxstruct::structure {

std::optional<BinaryFormat> parse_binary_format(std::string_view name) {
    if (name == "cbor") {
        return BinaryFormat::Cbor;
    }
    if (name == "msgpack") {
        return BinaryFormat::MessagePack;
    }
    if (name == "bson") {
        return BinaryFormat::Bson;
    }
    if (name == "ubjson") {
        return BinaryFormat::Ubjson;
    }
    if (name == "json") {
        return BinaryFormat::Json;
    }
    return std::nullopt;
}

const char* binary_format_to_string(BinaryFormat format) {
    switch (format) {
        case BinaryFormat::Cbor:
            return "cbor";
        case BinaryFormat::MessagePack:
            return "msgpack";
        case BinaryFormat::Bson:
            return "bson";
        case BinaryFormat::Ubjson:
            return "ubjson";
        case BinaryFormat::Json:
            return "json";
        default:
            return "unknown";
    }
}

StructureSettings StructureSettings::from_config(const core::Config& config) {
    using core::config_key::AIR_BLOCK;
    using core::config_key::BINARY_FORMAT;
    using core::config_key::DEFAULT_PALETTE;
    using core::config_key::OVERLAY_LAYER;
    using core::config_section::STRUCTURE;

    StructureSettings settings;
    settings.default_palette = config.get_string(STRUCTURE, DEFAULT_PALETTE, settings.default_palette);
    settings.air_block = config.get_string(STRUCTURE, AIR_BLOCK, settings.air_block);
    settings.overlay_layer = config.get_bool(STRUCTURE, OVERLAY_LAYER, settings.overlay_layer);

    std::string format = config.get_string(STRUCTURE, BINARY_FORMAT, binary_format_to_string(settings.binary_format));
    if (auto parsed = parse_binary_format(format)) {
        settings.binary_format = *parsed;
    } else {
        VOXSTRUCT_LOG_WARN(core::log_category::CONFIG, "Unknown binary format '{}', using {}", format,
                           binary_format_to_string(settings.binary_format));
    }

    if (settings.default_palette.empty()) {
        VOXSTRUCT_LOG_WARN(core::log_category::CONFIG, "Empty default palette name, using 'default'");
        settings.default_palette = "default";
    }
    return settings;
}

}  // namespace voxstruct::structure
