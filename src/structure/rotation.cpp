// VoxStruct Structure
// rotation.cpp - Structure rotation implementation

#include <voxstruct/core/logger.hpp>
#include <voxstruct/structure/rotation.hpp>

namespace voxstruct::structure {

namespace {

Rotation from_quarter_turns(int32_t turns) {
    switch (((turns % 4) + 4) % 4) {
        case 1:
            return Rotation::Clockwise90;
        case 2:
            return Rotation::Clockwise180;
        case 3:
            return Rotation::CounterClockwise90;
        default:
            return Rotation::None;
    }
}

// Cell of the rotated structure that source cell (x, y, z) moves to
CellPos rotated_cell(const Extent& source, int32_t x, int32_t y, int32_t z, catalog::RotationDirection direction) {
    if (direction == catalog::RotationDirection::Right) {
        return CellPos(source.z - 1 - z, y, x);
    }
    return CellPos(z, y, source.x - 1 - x);
}

// Cells whose entry the catalog cannot resolve read as no block. Copy those
// entries (and their payload) across as stored so they are not lost.
void carry_unresolved(const StructureDocument& source, StructureDocument& result, int32_t x, int32_t y, int32_t z,
                      const CellPos& target, const StructureCell& cell) {
    const Palette& palette = source.active_palette();
    for (size_t layer : {BLOCK_LAYER, LIQUID_LAYER}) {
        const catalog::BlockPtr& resolved = layer == BLOCK_LAYER ? cell.block : cell.liquid;
        if (resolved) {
            continue;
        }
        auto pointer = source.grid().read(layer, x, y, z);
        if (!pointer || *pointer == EMPTY_CELL || *pointer < 0 || static_cast<size_t>(*pointer) >= palette.size()) {
            continue;
        }

        const PaletteEntry& entry = palette.entry(static_cast<size_t>(*pointer));
        const nlohmann::json* payload = layer == BLOCK_LAYER ? palette.payload_at(source.offset(x, y, z)) : nullptr;
        VOXSTRUCT_LOG_TRACE(core::log_category::ROTATION, "Carrying unresolved {} to ({}, {}, {})",
                            catalog::identity_to_string(entry.identity()), target.x, target.y, target.z);
        result.place_entry(layer, target.x, target.y, target.z, entry, payload);
    }
}

// Rewrites orientation properties of every entry in the active palette
size_t rotate_palette(StructureDocument& document, catalog::RotationDirection direction) {
    const Palette& palette = document.active_palette();
    size_t rotated_count = 0;

    for (size_t i = 0; i < palette.size(); ++i) {
        const ResolvedEntry* resolved = palette.resolved(static_cast<int32_t>(i));
        if (resolved == nullptr || !resolved->block || !resolved->block->is_rotatable()) {
            continue;
        }
        catalog::BlockPtr rotated = resolved->block->rotate(direction);
        if (!rotated) {
            continue;
        }

        catalog::BlockIdentity identity = rotated->encode_identity();
        VOXSTRUCT_LOG_TRACE(core::log_category::ROTATION, "Palette entry {}: {} -> {}", i,
                            catalog::identity_to_string(palette.entry(i).identity()),
                            catalog::identity_to_string(identity));
        const int32_t version = palette.entry(i).version;
        document.replace_palette_entry(i, PaletteEntry{std::move(identity.name), std::move(identity.properties),
                                                       version});
        ++rotated_count;
    }
    return rotated_count;
}

}  // namespace

const char* rotation_to_string(Rotation rotation) {
    switch (rotation) {
        case Rotation::None:
            return "none";
        case Rotation::Clockwise90:
            return "clockwise_90";
        case Rotation::Clockwise180:
            return "clockwise_180";
        case Rotation::CounterClockwise90:
            return "counterclockwise_90";
        default:
            return "unknown";
    }
}

int32_t quarter_turns(Rotation rotation) {
    switch (rotation) {
        case Rotation::Clockwise90:
            return 1;
        case Rotation::Clockwise180:
            return 2;
        case Rotation::CounterClockwise90:
            return 3;
        case Rotation::None:
        default:
            return 0;
    }
}

Rotation compose(Rotation a, Rotation b) {
    return from_quarter_turns(quarter_turns(a) + quarter_turns(b));
}

StructureDocument rotate(const StructureDocument& document, catalog::RotationDirection direction) {
    const Extent& source = document.dimensions();
    const Extent extent(source.z, source.y, source.x);

    StructureSettings settings;
    settings.default_palette = document.palette_name();
    settings.overlay_layer = document.grid().has_overlay();

    StructureDocument result(extent, document.catalog(), settings);
    result.set_origin(document.origin());

    if (!document.entities().empty()) {
        VOXSTRUCT_LOG_DEBUG(core::log_category::ROTATION, "Dropping {} entities, their positions are opaque",
                            document.entities().size());
    }

    for (int32_t x = 0; x < source.x; ++x) {
        for (int32_t y = 0; y < source.y; ++y) {
            for (int32_t z = 0; z < source.z; ++z) {
                auto cell = document.at(x, y, z);
                if (!cell) {
                    continue;
                }
                const CellPos target = rotated_cell(source, x, y, z, direction);
                result.set(target.x, target.y, target.z, cell->block, cell->liquid);
                carry_unresolved(document, result, x, y, z, target, *cell);
            }
        }
    }

    const size_t rotated_entries = rotate_palette(result, direction);

    VOXSTRUCT_LOG_DEBUG(core::log_category::ROTATION, "Rotated {}x{}x{} structure {}: {} palette entries reoriented",
                        source.x, source.y, source.z, catalog::rotation_direction_to_string(direction),
                        rotated_entries);
    return result;
}

StructureDocument rotate(const StructureDocument& document, Rotation rotation) {
    switch (rotation) {
        case Rotation::Clockwise90:
            return rotate(document, catalog::RotationDirection::Right);
        case Rotation::Clockwise180:
            return rotate(rotate(document, catalog::RotationDirection::Right), catalog::RotationDirection::Right);
        case Rotation::CounterClockwise90:
            return rotate(document, catalog::RotationDirection::Left);
        case Rotation::None:
        default:
            return document;
    }
}

}  // namespace voxstruct::structure
