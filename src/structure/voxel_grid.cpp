// VoxStruct Structure
// voxel_grid.cpp - VoxelGrid implementation

#include <algorithm>
#include <voxstruct/structure/voxel_grid.hpp>

namespace voxstruct::structure {

VoxelGrid::VoxelGrid(const Extent& extent, int32_t block_fill, bool with_overlay) : extent_(extent) {
    const auto cells = static_cast<size_t>(std::max<int64_t>(volume(), 0));
    layers_.emplace_back(cells, block_fill);
    if (with_overlay) {
        layers_.emplace_back(cells, EMPTY_CELL);
    }
}

VoxelGrid::VoxelGrid(const Extent& extent, std::vector<std::vector<int32_t>> layers)
    : extent_(extent), layers_(std::move(layers)) {}

std::optional<int32_t> VoxelGrid::read(size_t layer, int32_t x, int32_t y, int32_t z) const {
    if (layer >= layers_.size() || !in_bounds(x, y, z)) {
        return std::nullopt;
    }
    const auto index = static_cast<size_t>(offset(x, y, z));
    if (index >= layers_[layer].size()) {
        return std::nullopt;
    }
    return layers_[layer][index];
}

bool VoxelGrid::write(size_t layer, int32_t x, int32_t y, int32_t z, int32_t value) {
    if (layer >= layers_.size() || !in_bounds(x, y, z)) {
        return false;
    }
    const auto index = static_cast<size_t>(offset(x, y, z));
    if (index >= layers_[layer].size()) {
        return false;
    }
    layers_[layer][index] = value;
    return true;
}

void VoxelGrid::fill(size_t layer, int32_t value) {
    if (layer < layers_.size()) {
        std::fill(layers_[layer].begin(), layers_[layer].end(), value);
    }
}

void VoxelGrid::add_overlay() {
    if (has_overlay()) {
        return;
    }
    while (layers_.size() <= LIQUID_LAYER) {
        layers_.emplace_back(static_cast<size_t>(std::max<int64_t>(volume(), 0)), EMPTY_CELL);
    }
}

}  // namespace voxstruct::structure
