// VoxStruct Structure
// rotation.hpp - Quarter-turn rotation of structures around the Y axis

#pragma once

#include "structure.hpp"

#include <cstdint>

namespace voxstruct::structure {

// Rotation seen from above
enum class Rotation : uint8_t {
    None,
    Clockwise90,
    Clockwise180,
    CounterClockwise90,
};

[[nodiscard]] const char* rotation_to_string(Rotation rotation);

// Rotation after applying a then b
[[nodiscard]] Rotation compose(Rotation a, Rotation b);

// Number of clockwise quarter turns, 0..3
[[nodiscard]] int32_t quarter_turns(Rotation rotation);

// New document holding the input turned a quarter around Y. The extent
// becomes (sz, sy, sx); the origin, format version and active palette name
// carry over. Orientation properties are rotated in the output palette.
// The input is never modified.
[[nodiscard]] StructureDocument rotate(const StructureDocument& document, catalog::RotationDirection direction);

// Rotation::None returns a copy of the input
[[nodiscard]] StructureDocument rotate(const StructureDocument& document, Rotation rotation);

[[nodiscard]] inline StructureDocument rotate_left(const StructureDocument& document) {
    return rotate(document, catalog::RotationDirection::Left);
}

[[nodiscard]] inline StructureDocument rotate_right(const StructureDocument& document) {
    return rotate(document, catalog::RotationDirection::Right);
}

}  // namespace voxstruct::structure
