// VoxStruct Structure Tests
// voxel_grid_test.cpp - Tests for cell addressing and VoxelGrid layers

#include <gtest/gtest.h>

#include <voxstruct/structure/voxel_grid.hpp>

#include <set>

namespace voxstruct::structure {
namespace {

// ============================================================================
// Addressing
// ============================================================================

TEST(CellAddressingTest, ZIsFastestVarying) {
    const Extent extent(2, 3, 4);
    EXPECT_EQ(cell_offset(extent, 0, 0, 0), 0);
    EXPECT_EQ(cell_offset(extent, 0, 0, 1), 1);
    EXPECT_EQ(cell_offset(extent, 0, 1, 0), 4);
    EXPECT_EQ(cell_offset(extent, 1, 0, 0), 12);
    EXPECT_EQ(cell_offset(extent, 1, 2, 3), 23);
}

TEST(CellAddressingTest, OffsetsAreABijection) {
    const Extent extent(2, 3, 4);
    std::set<int64_t> seen;
    for (int32_t x = 0; x < extent.x; ++x) {
        for (int32_t y = 0; y < extent.y; ++y) {
            for (int32_t z = 0; z < extent.z; ++z) {
                const int64_t offset = cell_offset(extent, x, y, z);
                EXPECT_GE(offset, 0);
                EXPECT_LT(offset, volume(extent));
                seen.insert(offset);
                EXPECT_EQ(offset_to_cell(extent, offset), CellPos(x, y, z));
            }
        }
    }
    EXPECT_EQ(static_cast<int64_t>(seen.size()), volume(extent));
}

TEST(CellAddressingTest, InBounds) {
    const Extent extent(2, 3, 4);
    EXPECT_TRUE(in_bounds(extent, 0, 0, 0));
    EXPECT_TRUE(in_bounds(extent, 1, 2, 3));
    EXPECT_FALSE(in_bounds(extent, 2, 0, 0));
    EXPECT_FALSE(in_bounds(extent, 0, 3, 0));
    EXPECT_FALSE(in_bounds(extent, 0, 0, 4));
    EXPECT_FALSE(in_bounds(extent, -1, 0, 0));
    EXPECT_FALSE(in_bounds(Extent(0, 0, 0), 0, 0, 0));
}

// ============================================================================
// VoxelGrid
// ============================================================================

TEST(VoxelGridTest, FilledConstruction) {
    VoxelGrid grid(Extent(2, 3, 4), 0, true);
    EXPECT_EQ(grid.volume(), 24);
    EXPECT_EQ(grid.layer_count(), 2u);
    EXPECT_TRUE(grid.has_overlay());

    for (int32_t value : grid.layer(BLOCK_LAYER)) {
        EXPECT_EQ(value, 0);
    }
    for (int32_t value : grid.layer(LIQUID_LAYER)) {
        EXPECT_EQ(value, EMPTY_CELL);
    }
}

TEST(VoxelGridTest, WithoutOverlay) {
    VoxelGrid grid(Extent(1, 1, 1), 0, false);
    EXPECT_EQ(grid.layer_count(), 1u);
    EXPECT_FALSE(grid.has_overlay());
    EXPECT_FALSE(grid.read(LIQUID_LAYER, 0, 0, 0).has_value());
    EXPECT_FALSE(grid.write(LIQUID_LAYER, 0, 0, 0, 3));

    grid.add_overlay();
    EXPECT_TRUE(grid.has_overlay());
    EXPECT_EQ(grid.read(LIQUID_LAYER, 0, 0, 0), EMPTY_CELL);
}

TEST(VoxelGridTest, ReadWrite) {
    VoxelGrid grid(Extent(2, 3, 4), 0, true);
    EXPECT_TRUE(grid.write(BLOCK_LAYER, 1, 2, 3, 7));
    EXPECT_EQ(grid.read(BLOCK_LAYER, 1, 2, 3), 7);
    EXPECT_EQ(grid.layer(BLOCK_LAYER)[23], 7);
    EXPECT_EQ(grid.read(BLOCK_LAYER, 0, 0, 0), 0);
}

TEST(VoxelGridTest, OutOfBoundsAccess) {
    VoxelGrid grid(Extent(2, 3, 4), 0, true);
    EXPECT_FALSE(grid.write(BLOCK_LAYER, 2, 0, 0, 1));
    EXPECT_FALSE(grid.write(BLOCK_LAYER, 0, -1, 0, 1));
    EXPECT_FALSE(grid.read(BLOCK_LAYER, 0, 0, 4).has_value());
    EXPECT_FALSE(grid.read(5, 0, 0, 0).has_value());
}

TEST(VoxelGridTest, ShortDecodedLayerIsNotOverrun) {
    std::vector<std::vector<int32_t>> layers = {{1, 2, 3}};
    VoxelGrid grid(Extent(2, 2, 2), std::move(layers));
    EXPECT_EQ(grid.read(BLOCK_LAYER, 0, 0, 1), 2);
    EXPECT_FALSE(grid.read(BLOCK_LAYER, 1, 1, 1).has_value());
    EXPECT_FALSE(grid.write(BLOCK_LAYER, 1, 1, 1, 0));
}

TEST(VoxelGridTest, Fill) {
    VoxelGrid grid(Extent(2, 2, 2), 0, true);
    grid.fill(LIQUID_LAYER, 4);
    EXPECT_EQ(grid.read(LIQUID_LAYER, 1, 1, 1), 4);
    grid.fill(9, 4);  // Missing layer is ignored
    EXPECT_EQ(grid.layer_count(), 2u);
}

TEST(VoxelGridTest, EmptyExtent) {
    VoxelGrid grid(Extent(0, 5, 3), 0, true);
    EXPECT_EQ(grid.volume(), 0);
    EXPECT_TRUE(grid.layer(BLOCK_LAYER).empty());
    EXPECT_FALSE(grid.in_bounds(0, 0, 0));
}

TEST(CellAddressingTest, VolumeRejectsNegativeAndOverflowingExtents) {
    EXPECT_EQ(volume(Extent(2, 3, 4)), 24);
    EXPECT_EQ(volume(Extent(0, 70000, 70000)), 0);
    EXPECT_EQ(volume(Extent(2, -1, 4)), -1);

    // 2^21 * 2^21 * 2^22 = 2^64 wraps to 0 when multiplied naively
    EXPECT_EQ(volume(Extent(2097152, 2097152, 4194304)), -1);
    EXPECT_FALSE(is_valid_extent(Extent(2097152, 2097152, 4194304)));

    EXPECT_EQ(volume(Extent(65536, 65536, 65536)), int64_t{1} << 48);
    EXPECT_TRUE(is_valid_extent(Extent(65536, 65536, 65536)));
}

}  // namespace
}  // namespace voxstruct::structure
