// VoxStruct Structure Tests
// palette_test.cpp - Tests for Palette lookup, growth and resolution

#include <gtest/gtest.h>

#include <voxstruct/catalog/block_registry.hpp>
#include <voxstruct/structure/palette.hpp>

namespace voxstruct::structure {
namespace {

class PaletteTest : public ::testing::Test {
protected:
    void SetUp() override { registry.register_defaults(); }

    catalog::BlockRegistry registry;
    Palette palette;
};

TEST_F(PaletteTest, InsertReturnsPreviousSize) {
    EXPECT_EQ(palette.insert({"minecraft:air", {}}, 1, registry), 0);
    EXPECT_EQ(palette.insert({"minecraft:stone", {}}, 1, registry), 1);
    EXPECT_EQ(palette.size(), 2u);
}

TEST_F(PaletteTest, LookupIsFullEquality) {
    palette.append({"minecraft:barrel", {{"facing_direction", int32_t{1}}, {"open_bit", false}}, 1});

    EXPECT_EQ(palette.lookup("minecraft:barrel", {{"facing_direction", int32_t{1}}, {"open_bit", false}}), 0);
    // A subset of the properties is a different identity
    EXPECT_FALSE(palette.lookup("minecraft:barrel", {{"facing_direction", int32_t{1}}}).has_value());
    EXPECT_FALSE(palette.lookup("minecraft:chest", {}).has_value());
}

TEST_F(PaletteTest, LookupReturnsFirstMatch) {
    palette.append({"minecraft:stone", {}, 1});
    palette.append({"minecraft:dirt", {}, 1});
    palette.append({"minecraft:stone", {}, 2});

    EXPECT_EQ(palette.lookup("minecraft:stone", {}), 0);
    EXPECT_EQ(palette.lookup("minecraft:dirt", {}), 1);
}

TEST_F(PaletteTest, VersionIgnoredByMatch) {
    PaletteEntry entry{"minecraft:stone", {}, 1};
    EXPECT_TRUE(entry.matches("minecraft:stone", {}));
    EXPECT_FALSE(entry.matches("minecraft:dirt", {}));
}

TEST_F(PaletteTest, InactivePaletteHasNoResolvedEntries) {
    palette.append({"minecraft:stone", {}, 1});
    EXPECT_FALSE(palette.is_active());
    EXPECT_EQ(palette.resolved(0), nullptr);
}

TEST_F(PaletteTest, ActivateResolvesInOrder) {
    palette.append({"minecraft:stone", {}, 1});
    palette.append({"minecraft:unobtainium", {}, 1});
    palette.append({"minecraft:chest", {}, 1});
    palette.activate(registry);

    ASSERT_NE(palette.resolved(0), nullptr);
    ASSERT_NE(palette.resolved(0)->block, nullptr);
    EXPECT_EQ(palette.resolved(0)->block->encode_identity().name, "minecraft:stone");
    EXPECT_FALSE(palette.resolved(0)->has_payload);

    // Resolution miss keeps its slot
    ASSERT_NE(palette.resolved(1), nullptr);
    EXPECT_EQ(palette.resolved(1)->block, nullptr);

    ASSERT_NE(palette.resolved(2), nullptr);
    EXPECT_TRUE(palette.resolved(2)->has_payload);

    EXPECT_EQ(palette.resolved(3), nullptr);
    EXPECT_EQ(palette.resolved(-1), nullptr);
}

TEST_F(PaletteTest, InsertIntoActivePaletteResolves) {
    palette.activate(registry);
    int32_t index = palette.insert({"minecraft:water", {}}, 1, registry);

    const ResolvedEntry* resolved = palette.resolved(index);
    ASSERT_NE(resolved, nullptr);
    ASSERT_NE(resolved->block, nullptr);
    EXPECT_TRUE(resolved->block->is_liquid());
}

TEST_F(PaletteTest, ResolveUpgradesLegacyEntries) {
    ResolvedEntry resolved = Palette::resolve({"minecraft:grass", {}, 17825808}, registry);
    ASSERT_NE(resolved.block, nullptr);
    EXPECT_EQ(resolved.block->encode_identity().name, "minecraft:grass_block");

    // Same name at the current version is not upgraded and does not resolve
    EXPECT_EQ(Palette::resolve({"minecraft:grass", {}, catalog::CURRENT_BLOCK_VERSION}, registry).block, nullptr);
}

TEST_F(PaletteTest, ReplaceReResolves) {
    palette.append({"minecraft:stone", {}, 1});
    palette.activate(registry);

    EXPECT_TRUE(palette.replace(0, {"minecraft:dirt", {}, 1}, registry));
    EXPECT_EQ(palette.entry(0).name, "minecraft:dirt");
    EXPECT_EQ(palette.resolved(0)->block->encode_identity().name, "minecraft:dirt");

    EXPECT_FALSE(palette.replace(5, {"minecraft:dirt", {}, 1}, registry));
}

TEST_F(PaletteTest, DeactivateDropsCache) {
    palette.append({"minecraft:stone", {}, 1});
    palette.activate(registry);
    palette.deactivate();
    EXPECT_FALSE(palette.is_active());
    EXPECT_EQ(palette.resolved(0), nullptr);
    EXPECT_EQ(palette.size(), 1u);
}

TEST_F(PaletteTest, Payloads) {
    EXPECT_EQ(palette.payload_at(12), nullptr);

    palette.set_payload(12, {{"Lock", "key"}});
    ASSERT_NE(palette.payload_at(12), nullptr);
    EXPECT_EQ((*palette.payload_at(12))["Lock"], "key");
    EXPECT_EQ(palette.payloads().size(), 1u);

    EXPECT_TRUE(palette.erase_payload(12));
    EXPECT_FALSE(palette.erase_payload(12));
    EXPECT_EQ(palette.payload_at(12), nullptr);
}

}  // namespace
}  // namespace voxstruct::structure
