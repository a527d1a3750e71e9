// VoxStruct Structure
// voxel_grid.hpp - Parallel palette-index layers over a 3-D extent

#pragma once

#include "types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace voxstruct::structure {

// One or two equal-length int32 layers indexed by cell_offset(). Layer 0
// holds block pointers, the optional layer 1 the liquid overlay; both use
// EMPTY_CELL for "nothing here".
class VoxelGrid {
public:
    VoxelGrid() = default;

    // Layer 0 filled with block_fill, an optional overlay filled with EMPTY_CELL
    VoxelGrid(const Extent& extent, int32_t block_fill, bool with_overlay);

    // Takes decoded layers as they are; sizes are checked by validation
    VoxelGrid(const Extent& extent, std::vector<std::vector<int32_t>> layers);

    [[nodiscard]] const Extent& extent() const { return extent_; }
    [[nodiscard]] int64_t volume() const { return structure::volume(extent_); }
    [[nodiscard]] size_t layer_count() const { return layers_.size(); }
    [[nodiscard]] bool has_overlay() const { return layers_.size() > LIQUID_LAYER; }

    [[nodiscard]] bool in_bounds(int32_t x, int32_t y, int32_t z) const {
        return structure::in_bounds(extent_, x, y, z);
    }
    [[nodiscard]] int64_t offset(int32_t x, int32_t y, int32_t z) const {
        return cell_offset(extent_, x, y, z);
    }

    // nullopt when the layer is missing or the cell is out of bounds
    [[nodiscard]] std::optional<int32_t> read(size_t layer, int32_t x, int32_t y, int32_t z) const;

    // False when the layer is missing or the cell is out of bounds
    bool write(size_t layer, int32_t x, int32_t y, int32_t z, int32_t value);

    void fill(size_t layer, int32_t value);

    // Adds the overlay layer (all EMPTY_CELL) if absent
    void add_overlay();

    [[nodiscard]] std::span<const int32_t> layer(size_t index) const { return layers_.at(index); }
    [[nodiscard]] const std::vector<std::vector<int32_t>>& layers() const { return layers_; }

private:
    Extent extent_{0, 0, 0};
    std::vector<std::vector<int32_t>> layers_;
};

}  // namespace voxstruct::structure
