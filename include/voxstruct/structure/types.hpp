// VoxStruct Structure
// types.hpp - Constants, extents and the cell addressing scheme

#pragma once

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>

namespace voxstruct::structure {

// ============================================================================
// Format Constants
// ============================================================================

// The only format_version the codec accepts and writes
inline constexpr int32_t FORMAT_VERSION = 1;

// Cell value meaning "nothing here", distinct from an air entry
inline constexpr int32_t EMPTY_CELL = -1;

// Layer 0 holds blocks, layer 1 the liquid overlay (waterlogging)
inline constexpr size_t BLOCK_LAYER = 0;
inline constexpr size_t LIQUID_LAYER = 1;
inline constexpr size_t MAX_LAYERS = 2;

// ============================================================================
// Coordinates
// ============================================================================

// (size_x, size_y, size_z), each >= 0
using Extent = glm::ivec3;

// Cell position inside a structure, [0, extent)
using CellPos = glm::ivec3;

// World-space placement offset, carried through unexamined
using WorldOrigin = glm::ivec3;

// Cell count, or -1 when an axis is negative or the count does not fit in
// int64. A -1 volume never equals a layer length.
[[nodiscard]] inline int64_t volume(const Extent& extent) {
    if (extent.x < 0 || extent.y < 0 || extent.z < 0) {
        return -1;
    }
    if (extent.x == 0 || extent.y == 0 || extent.z == 0) {
        return 0;
    }
    // x * y is below 2^62 and cannot overflow
    const int64_t area = static_cast<int64_t>(extent.x) * extent.y;
    if (area > std::numeric_limits<int64_t>::max() / extent.z) {
        return -1;
    }
    return area * extent.z;
}

// Non-negative axes whose cell count fits in int64
[[nodiscard]] inline bool is_valid_extent(const Extent& extent) {
    return volume(extent) >= 0;
}

[[nodiscard]] inline bool in_bounds(const Extent& extent, int32_t x, int32_t y, int32_t z) {
    return x >= 0 && x < extent.x && y >= 0 && y < extent.y && z >= 0 && z < extent.z;
}

// Z is fastest-varying, then Y, then X. Part of the file format.
[[nodiscard]] inline int64_t cell_offset(const Extent& extent, int32_t x, int32_t y, int32_t z) {
    return static_cast<int64_t>(x) * extent.z * extent.y + static_cast<int64_t>(y) * extent.z + z;
}

[[nodiscard]] inline CellPos offset_to_cell(const Extent& extent, int64_t offset) {
    const int64_t plane = static_cast<int64_t>(extent.z) * extent.y;
    const auto x = static_cast<int32_t>(offset / plane);
    const auto y = static_cast<int32_t>((offset % plane) / extent.z);
    const auto z = static_cast<int32_t>(offset % extent.z);
    return CellPos(x, y, z);
}

}  // namespace voxstruct::structure
