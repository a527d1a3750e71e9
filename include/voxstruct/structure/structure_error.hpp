// VoxStruct Structure
// structure_error.hpp - Error kinds reported by decoding, validation and IO

#pragma once

#include <cstdint>
#include <string>

namespace voxstruct::structure {

enum class StructureErrorKind : uint8_t {
    Decode,               // Malformed tree, missing field, wrong type or arity
    UnsupportedVersion,   // format_version != FORMAT_VERSION
    BadExtent,            // size is not three non-negative integers
    BadOrigin,            // structure_world_origin is not three integers
    NoLayers,             // block_indices is empty
    NoPalettes,           // palette map is empty
    LayerSizeMismatch,    // A layer's length differs from the volume
    PaletteSizeMismatch,  // Palettes disagree on their entry count
    OutOfBounds,          // Cell coordinate outside the extent
    Io,                   // Stream or file failure
};

[[nodiscard]] inline const char* to_string(StructureErrorKind kind) {
    switch (kind) {
        case StructureErrorKind::Decode:
            return "Decode";
        case StructureErrorKind::UnsupportedVersion:
            return "UnsupportedVersion";
        case StructureErrorKind::BadExtent:
            return "BadExtent";
        case StructureErrorKind::BadOrigin:
            return "BadOrigin";
        case StructureErrorKind::NoLayers:
            return "NoLayers";
        case StructureErrorKind::NoPalettes:
            return "NoPalettes";
        case StructureErrorKind::LayerSizeMismatch:
            return "LayerSizeMismatch";
        case StructureErrorKind::PaletteSizeMismatch:
            return "PaletteSizeMismatch";
        case StructureErrorKind::OutOfBounds:
            return "OutOfBounds";
        case StructureErrorKind::Io:
            return "Io";
        default:
            return "Unknown";
    }
}

struct StructureError {
    StructureErrorKind kind = StructureErrorKind::Decode;
    std::string message;
};

// True for the kinds produced by StructureDocument::check()
[[nodiscard]] inline bool is_validation_error(StructureErrorKind kind) {
    return kind != StructureErrorKind::Decode && kind != StructureErrorKind::OutOfBounds &&
           kind != StructureErrorKind::Io;
}

}  // namespace voxstruct::structure
