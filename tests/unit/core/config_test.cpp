// VoxStruct Core Tests
// config_test.cpp - Tests for Config and StructureSettings

#include <gtest/gtest.h>

#include <voxstruct/core/config.hpp>
#include <voxstruct/structure/settings.hpp>

#include <filesystem>

namespace voxstruct::core {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "voxstruct_test_config";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir_); }

    std::filesystem::path test_dir_;
};

TEST_F(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.get_string(config_section::STRUCTURE, config_key::DEFAULT_PALETTE), "default");
    EXPECT_EQ(config.get_string(config_section::STRUCTURE, config_key::AIR_BLOCK), "minecraft:air");
    EXPECT_EQ(config.get_string(config_section::STRUCTURE, config_key::BINARY_FORMAT), "cbor");
    EXPECT_TRUE(config.get_bool(config_section::STRUCTURE, config_key::OVERLAY_LAYER));
    EXPECT_EQ(config.get_string(config_section::LOGGING, config_key::LEVEL), "info");
}

TEST_F(ConfigTest, LoadFromStringKeepsMissingDefaults) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"structure": {"default_palette": "winter"}})"));

    EXPECT_EQ(config.get_string(config_section::STRUCTURE, config_key::DEFAULT_PALETTE), "winter");
    EXPECT_EQ(config.get_string(config_section::STRUCTURE, config_key::AIR_BLOCK), "minecraft:air");
    EXPECT_FALSE(config.is_dirty());
}

TEST_F(ConfigTest, RejectsMalformedDocuments) {
    Config config;
    EXPECT_FALSE(config.load_from_string("{not json"));
    EXPECT_FALSE(config.load_from_string("[1, 2, 3]"));
}

TEST_F(ConfigTest, TypeMismatchReturnsDefault) {
    Config config;
    config.set_string("structure", "overlay_layer", "yes");
    EXPECT_TRUE(config.get_bool("structure", "overlay_layer", true));
    EXPECT_EQ(config.get_int("structure", "default_palette", 7), 7);
}

TEST_F(ConfigTest, SetGetRemove) {
    Config config;
    config.set_int("custom", "count", 12);
    EXPECT_TRUE(config.has("custom", "count"));
    EXPECT_TRUE(config.has_section("custom"));
    EXPECT_EQ(config.get_int("custom", "count"), 12);

    EXPECT_TRUE(config.remove("custom", "count"));
    EXPECT_FALSE(config.has("custom", "count"));
    EXPECT_FALSE(config.remove("custom", "count"));
}

TEST_F(ConfigTest, ChangeCallbackAndDirtyFlag) {
    Config config;
    config.mark_clean();

    std::string changed;
    config.set_change_callback([&changed](std::string_view section, std::string_view key) {
        changed = std::string(section) + "." + std::string(key);
    });

    config.set_bool(config_section::STRUCTURE, config_key::OVERLAY_LAYER, false);
    EXPECT_EQ(changed, "structure.overlay_layer");
    EXPECT_TRUE(config.is_dirty());
}

TEST_F(ConfigTest, SaveAndLoad) {
    auto path = test_dir_ / "voxstruct.json";
    {
        Config config;
        config.set_string(config_section::STRUCTURE, config_key::BINARY_FORMAT, "msgpack");
        ASSERT_TRUE(config.save(path));
    }

    Config loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_EQ(loaded.get_string(config_section::STRUCTURE, config_key::BINARY_FORMAT), "msgpack");
    EXPECT_EQ(loaded.get_path(), path);
}

TEST_F(ConfigTest, LoadOrCreateDefaultWritesFile) {
    auto path = test_dir_ / "nested" / "voxstruct.json";
    Config config;
    EXPECT_TRUE(config.load_or_create_default(path));
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(ConfigTest, LoggerConfigFromLevel) {
    Config config;
    config.set_string(config_section::LOGGING, config_key::LEVEL, "debug");
    EXPECT_EQ(make_logger_config(config).console_level, LogLevel::Debug);

    config.set_string(config_section::LOGGING, config_key::LEVEL, "loud");
    EXPECT_EQ(make_logger_config(config).console_level, LogLevel::Info);
}

TEST_F(ConfigTest, StructureSettingsFromConfig) {
    Config config;
    config.set_string(config_section::STRUCTURE, config_key::DEFAULT_PALETTE, "night");
    config.set_string(config_section::STRUCTURE, config_key::BINARY_FORMAT, "bson");
    config.set_bool(config_section::STRUCTURE, config_key::OVERLAY_LAYER, false);

    auto settings = structure::StructureSettings::from_config(config);
    EXPECT_EQ(settings.default_palette, "night");
    EXPECT_EQ(settings.air_block, "minecraft:air");
    EXPECT_EQ(settings.binary_format, structure::BinaryFormat::Bson);
    EXPECT_FALSE(settings.overlay_layer);
}

TEST_F(ConfigTest, StructureSettingsFallBackOnBadValues) {
    Config config;
    config.set_string(config_section::STRUCTURE, config_key::DEFAULT_PALETTE, "");
    config.set_string(config_section::STRUCTURE, config_key::BINARY_FORMAT, "nbt");

    auto settings = structure::StructureSettings::from_config(config);
    EXPECT_EQ(settings.default_palette, "default");
    EXPECT_EQ(settings.binary_format, structure::BinaryFormat::Cbor);
}

}  // namespace
}  // namespace voxstruct::core
