// VoxStruct Structure
// codec.cpp - StructureCodec implementation

#include <charconv>
#include <limits>
#include <voxstruct/core/logger.hpp>
#include <voxstruct/structure/codec.hpp>

namespace voxstruct::structure {

namespace {

using nlohmann::json;

// Thrown while walking the tree, turned into a Decode error at the boundary
struct DecodeFailure {
    std::string message;
};

const json& require(const json& object, const char* key, const std::string& where) {
    if (!object.is_object()) {
        throw DecodeFailure{fmt::format("{} must be a compound, got {}", where, object.type_name())};
    }
    auto it = object.find(key);
    if (it == object.end()) {
        throw DecodeFailure{fmt::format("{} is missing field '{}'", where, key)};
    }
    return *it;
}

int32_t to_int32(const json& value, const std::string& where) {
    if (value.is_number_unsigned()) {
        const auto number = value.get<uint64_t>();
        if (number > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
            throw DecodeFailure{fmt::format("{} = {} does not fit in 32 bits", where, number)};
        }
        return static_cast<int32_t>(number);
    }
    if (value.is_number_integer()) {
        const auto number = value.get<int64_t>();
        if (number < std::numeric_limits<int32_t>::min() || number > std::numeric_limits<int32_t>::max()) {
            throw DecodeFailure{fmt::format("{} = {} does not fit in 32 bits", where, number)};
        }
        return static_cast<int32_t>(number);
    }
    throw DecodeFailure{fmt::format("{} must be an integer, got {}", where, value.type_name())};
}

std::vector<int32_t> to_int32_list(const json& value, const std::string& where) {
    if (!value.is_array()) {
        throw DecodeFailure{fmt::format("{} must be a list, got {}", where, value.type_name())};
    }
    std::vector<int32_t> result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        result.push_back(to_int32(value[i], fmt::format("{}[{}]", where, i)));
    }
    return result;
}

catalog::PropertyValue to_property(const json& value, const std::string& where) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return to_int32(value, where);
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    throw DecodeFailure{fmt::format("{} must be a byte, int or string, got {}", where, value.type_name())};
}

int64_t to_offset(const std::string& key, const std::string& where) {
    int64_t offset = 0;
    const char* first = key.data();
    const char* last = key.data() + key.size();
    auto [ptr, ec] = std::from_chars(first, last, offset);
    if (key.empty() || ec != std::errc{} || ptr != last || offset < 0) {
        throw DecodeFailure{fmt::format("{} key '{}' is not a cell offset", where, key)};
    }
    return offset;
}

Palette decode_palette(const json& value, const std::string& where) {
    Palette palette;

    const json& entries = require(value, field::BLOCK_PALETTE, where);
    if (!entries.is_array()) {
        throw DecodeFailure{fmt::format("{}.block_palette must be a list", where)};
    }
    for (size_t i = 0; i < entries.size(); ++i) {
        const std::string entry_where = fmt::format("{}.block_palette[{}]", where, i);
        const json& entry = entries[i];

        PaletteEntry decoded;
        const json& name = require(entry, field::NAME, entry_where);
        if (!name.is_string()) {
            throw DecodeFailure{fmt::format("{}.name must be a string", entry_where)};
        }
        decoded.name = name.get<std::string>();
        decoded.version = to_int32(require(entry, field::VERSION, entry_where), entry_where + ".version");

        const json& states = require(entry, field::STATES, entry_where);
        if (!states.is_object()) {
            throw DecodeFailure{fmt::format("{}.states must be a compound", entry_where)};
        }
        for (const auto& [key, state] : states.items()) {
            decoded.properties.emplace(key, to_property(state, fmt::format("{}.states.{}", entry_where, key)));
        }
        palette.append(std::move(decoded));
    }

    // Structures without block entities may omit the payload map
    auto data = value.find(field::BLOCK_POSITION_DATA);
    if (data != value.end()) {
        if (!data->is_object()) {
            throw DecodeFailure{fmt::format("{}.block_position_data must be a compound", where)};
        }
        for (const auto& [key, payload] : data->items()) {
            const std::string data_where = fmt::format("{}.block_position_data", where);
            const int64_t offset = to_offset(key, data_where);
            palette.set_payload(offset, require(payload, field::BLOCK_ENTITY_DATA, data_where + "." + key));
        }
    }
    return palette;
}

StructureData decode_data(const json& tree) {
    StructureData data;

    data.format_version = to_int32(require(tree, field::FORMAT_VERSION, "root"), field::FORMAT_VERSION);
    data.size = to_int32_list(require(tree, field::SIZE, "root"), field::SIZE);
    data.origin = to_int32_list(require(tree, field::WORLD_ORIGIN, "root"), field::WORLD_ORIGIN);

    const json& structure = require(tree, field::STRUCTURE, "root");

    const json& indices = require(structure, field::BLOCK_INDICES, field::STRUCTURE);
    if (!indices.is_array()) {
        throw DecodeFailure{"structure.block_indices must be a list"};
    }
    for (size_t i = 0; i < indices.size(); ++i) {
        data.block_indices.push_back(to_int32_list(indices[i], fmt::format("structure.block_indices[{}]", i)));
    }

    auto entities = structure.find(field::ENTITIES);
    if (entities != structure.end()) {
        if (!entities->is_array()) {
            throw DecodeFailure{"structure.entities must be a list"};
        }
        data.entities = *entities;
    }

    const json& palettes = require(structure, field::PALETTE, field::STRUCTURE);
    if (!palettes.is_object()) {
        throw DecodeFailure{"structure.palette must be a compound"};
    }
    for (const auto& [name, palette] : palettes.items()) {
        data.palettes.emplace(name, decode_palette(palette, "structure.palette." + name));
    }
    return data;
}

json encode_palette(const Palette& palette) {
    json entries = json::array();
    for (const auto& entry : palette.entries()) {
        entries.push_back({
            {field::NAME, entry.name},
            {field::STATES, StructureCodec::encode_properties(entry.properties)},
            {field::VERSION, entry.version},
        });
    }

    json data = json::object();
    for (const auto& [offset, payload] : palette.payloads()) {
        data[std::to_string(offset)] = {{field::BLOCK_ENTITY_DATA, payload}};
    }

    return {
        {field::BLOCK_PALETTE, std::move(entries)},
        {field::BLOCK_POSITION_DATA, std::move(data)},
    };
}

}  // namespace

DecodeResult StructureCodec::decode(const nlohmann::json& tree, std::shared_ptr<const catalog::BlockCatalog> catalog,
                                    const StructureSettings& settings) {
    StructureData data;
    try {
        data = decode_data(tree);
    } catch (const DecodeFailure& failure) {
        VOXSTRUCT_LOG_ERROR(core::log_category::CODEC, "Cannot decode structure: {}", failure.message);
        DecodeResult result;
        result.error = StructureError{StructureErrorKind::Decode, failure.message};
        return result;
    } catch (const nlohmann::json::exception& e) {
        VOXSTRUCT_LOG_ERROR(core::log_category::CODEC, "Cannot decode structure: {}", e.what());
        DecodeResult result;
        result.error = StructureError{StructureErrorKind::Decode, e.what()};
        return result;
    }

    VOXSTRUCT_LOG_DEBUG(core::log_category::CODEC, "Decoded structure with {} layer(s) and {} palette(s)",
                        data.block_indices.size(), data.palettes.size());
    return StructureDocument::from_data(std::move(data), std::move(catalog), settings);
}

nlohmann::json StructureCodec::encode(const StructureDocument& document) {
    const Extent& extent = document.dimensions();
    const WorldOrigin& origin = document.origin();

    json layers = json::array();
    for (const auto& layer : document.grid().layers()) {
        layers.push_back(layer);
    }

    json palettes = json::object();
    for (const auto& [name, palette] : document.committed_palettes()) {
        palettes[name] = encode_palette(palette);
    }

    json tree = {
        {field::FORMAT_VERSION, document.format_version()},
        {field::SIZE, {extent.x, extent.y, extent.z}},
        {field::WORLD_ORIGIN, {origin.x, origin.y, origin.z}},
        {field::STRUCTURE,
         {
             {field::BLOCK_INDICES, std::move(layers)},
             {field::ENTITIES, document.entities()},
             {field::PALETTE, std::move(palettes)},
         }},
    };

    VOXSTRUCT_LOG_DEBUG(core::log_category::CODEC, "Encoded {}x{}x{} structure", extent.x, extent.y, extent.z);
    return tree;
}

nlohmann::json StructureCodec::encode_properties(const catalog::BlockProperties& properties) {
    json states = json::object();
    for (const auto& [key, value] : properties) {
        std::visit([&states, &key](const auto& v) { states[key] = v; }, value);
    }
    return states;
}

}  // namespace voxstruct::structure
