// VoxStruct Structure Tests
// structure_io_test.cpp - Tests for StructureIO byte, stream and file handling

#include <gtest/gtest.h>

#include <voxstruct/catalog/block_registry.hpp>
#include <voxstruct/structure/structure_io.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace voxstruct::structure {
namespace {

class StructureIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_shared<catalog::BlockRegistry>();
        registry->register_defaults();

        test_dir_ = std::filesystem::temp_directory_path() / "voxstruct_test_io";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir_); }

    StructureDocument make_document() const {
        StructureDocument document(Extent(2, 2, 3), registry);
        document.set_origin(WorldOrigin(-8, 12, 40));
        document.set(0, 0, 0, registry->make_block("minecraft:stone"));
        document.set(1, 1, 2, registry->make_block("minecraft:chest", {}, {{"CustomName", "box"}}),
                     registry->make_block("minecraft:water"));
        document.set(1, 0, 1, nullptr);
        return document;
    }

    static StructureSettings settings_for(BinaryFormat format) {
        StructureSettings settings;
        settings.binary_format = format;
        return settings;
    }

    std::shared_ptr<catalog::BlockRegistry> registry;
    std::filesystem::path test_dir_;
};

TEST_F(StructureIOTest, BytesRoundTripInEveryFormat) {
    const StructureDocument document = make_document();
    const nlohmann::json expected = StructureCodec::encode(document);

    for (BinaryFormat format : {BinaryFormat::Cbor, BinaryFormat::MessagePack, BinaryFormat::Bson,
                                BinaryFormat::Ubjson, BinaryFormat::Json}) {
        SCOPED_TRACE(binary_format_to_string(format));

        EncodeResult encoded = StructureIO::write_bytes(document, format);
        ASSERT_TRUE(encoded.ok());
        EXPECT_FALSE(encoded.bytes.empty());

        auto decoded = StructureIO::read_bytes(encoded.bytes, registry, settings_for(format));
        ASSERT_TRUE(decoded.ok()) << decoded.error.message;
        EXPECT_EQ(StructureCodec::encode(*decoded.document), expected);
    }
}

TEST_F(StructureIOTest, StreamRoundTrip) {
    std::stringstream stream;
    EXPECT_FALSE(StructureIO::write(stream, make_document(), BinaryFormat::Cbor).has_value());

    auto result = StructureIO::read(stream, registry);
    ASSERT_TRUE(result.ok()) << result.error.message;

    auto cell = result.document->at(1, 1, 2);
    ASSERT_TRUE(cell.has_value());
    ASSERT_NE(cell->block, nullptr);
    EXPECT_EQ(cell->block->encode_payload()["CustomName"], "box");
    ASSERT_NE(cell->liquid, nullptr);
    EXPECT_EQ(cell->liquid->encode_identity().name, "minecraft:water");
}

TEST_F(StructureIOTest, FileRoundTrip) {
    auto path = test_dir_ / "house.mcstructure";
    EXPECT_FALSE(StructureIO::write_file(path, make_document(), BinaryFormat::MessagePack).has_value());
    EXPECT_TRUE(std::filesystem::exists(path));

    auto result = StructureIO::read_file(path, registry, settings_for(BinaryFormat::MessagePack));
    ASSERT_TRUE(result.ok()) << result.error.message;
    EXPECT_EQ(result.document->origin(), WorldOrigin(-8, 12, 40));
    EXPECT_EQ(result.document->dimensions(), Extent(2, 2, 3));
    EXPECT_EQ(result.document->at(1, 0, 1)->block, nullptr);
}

TEST_F(StructureIOTest, MissingFileIsIoError) {
    auto result = StructureIO::read_file(test_dir_ / "missing.mcstructure", registry);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error.kind, StructureErrorKind::Io);
}

TEST_F(StructureIOTest, UnwritablePathIsIoError) {
    auto error = StructureIO::write_file(test_dir_ / "no_such_dir" / "out.mcstructure", make_document(),
                                         BinaryFormat::Cbor);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, StructureErrorKind::Io);
}

TEST_F(StructureIOTest, GarbageBytesAreDecodeErrors) {
    std::vector<uint8_t> garbage = {0xff, 0x00, 0x13, 0x37};
    auto result = StructureIO::read_bytes(garbage, registry);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error.kind, StructureErrorKind::Decode);

    std::vector<uint8_t> empty;
    EXPECT_EQ(StructureIO::read_bytes(empty, registry).error.kind, StructureErrorKind::Decode);
}

TEST_F(StructureIOTest, NbtBytesAreDecodeErrors) {
    // Little-endian NBT: root compound "", then int "format_version" = 1
    std::vector<uint8_t> nbt = {0x0a, 0x00, 0x00, 0x03, 0x0e, 0x00, 'f', 'o', 'r', 'm', 'a', 't', '_',
                                'v',  'e',  'r',  's',  'i',  'o', 'n', 0x01, 0x00, 0x00, 0x00, 0x00};
    for (BinaryFormat format : {BinaryFormat::Cbor, BinaryFormat::MessagePack, BinaryFormat::Bson,
                                BinaryFormat::Ubjson, BinaryFormat::Json}) {
        SCOPED_TRACE(binary_format_to_string(format));
        auto result = StructureIO::read_bytes(nbt, registry, settings_for(format));
        EXPECT_FALSE(result.ok());
        EXPECT_EQ(result.error.kind, StructureErrorKind::Decode);
    }
}

TEST_F(StructureIOTest, WrongFormatIsDecodeError) {
    EncodeResult encoded = StructureIO::write_bytes(make_document(), BinaryFormat::Json);
    ASSERT_TRUE(encoded.ok());

    auto result = StructureIO::read_bytes(encoded.bytes, registry, settings_for(BinaryFormat::Bson));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error.kind, StructureErrorKind::Decode);
}

TEST_F(StructureIOTest, ValidationErrorsPassThrough) {
    nlohmann::json tree = StructureCodec::encode(make_document());
    tree["format_version"] = 7;
    std::vector<uint8_t> bytes = StructureIO::serialize(tree, BinaryFormat::Cbor);

    auto result = StructureIO::read_bytes(bytes, registry);
    EXPECT_EQ(result.error.kind, StructureErrorKind::UnsupportedVersion);
}

TEST_F(StructureIOTest, ParseReportsErrors) {
    std::vector<uint8_t> garbage = {'{', '"'};
    StructureError error;
    EXPECT_FALSE(StructureIO::parse(garbage, BinaryFormat::Json, &error).has_value());
    EXPECT_EQ(error.kind, StructureErrorKind::Decode);
    EXPECT_FALSE(error.message.empty());
}

}  // namespace
}  // namespace voxstruct::structure
