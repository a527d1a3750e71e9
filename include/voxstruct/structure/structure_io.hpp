// VoxStruct Structure
// structure_io.hpp - Reading and writing encoded structures from bytes, streams and files

#pragma once

#include "codec.hpp"
#include "settings.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <span>
#include <vector>

namespace voxstruct::structure {

// Result of an encoding step that produces bytes
struct EncodeResult {
    std::vector<uint8_t> bytes;
    std::optional<StructureError> error;

    [[nodiscard]] bool ok() const { return !error.has_value(); }
    explicit operator bool() const { return ok(); }
};

// Byte-level wrappers around StructureCodec. Stream and file failures are
// Io errors, malformed bytes are Decode errors.
//
// Only the nlohmann_json encodings in BinaryFormat are understood. Files
// saved by the game are little-endian NBT, which needs an NBT reader in front
// of StructureCodec::decode; fed to read_bytes they fail as Decode errors.
class StructureIO {
public:
    // Parses bytes in the given format into the tagged tree
    [[nodiscard]] static std::optional<nlohmann::json> parse(std::span<const uint8_t> bytes, BinaryFormat format,
                                                             StructureError* error = nullptr);

    // Serializes the tagged tree in the given format
    [[nodiscard]] static std::vector<uint8_t> serialize(const nlohmann::json& tree, BinaryFormat format);

    [[nodiscard]] static DecodeResult read_bytes(std::span<const uint8_t> bytes,
                                                 std::shared_ptr<const catalog::BlockCatalog> catalog,
                                                 const StructureSettings& settings = {});

    // Reads the whole stream
    [[nodiscard]] static DecodeResult read(std::istream& input, std::shared_ptr<const catalog::BlockCatalog> catalog,
                                           const StructureSettings& settings = {});

    [[nodiscard]] static DecodeResult read_file(const std::filesystem::path& path,
                                                std::shared_ptr<const catalog::BlockCatalog> catalog,
                                                const StructureSettings& settings = {});

    [[nodiscard]] static EncodeResult write_bytes(const StructureDocument& document, BinaryFormat format);

    // Returns the error, or nullopt on success
    static std::optional<StructureError> write(std::ostream& output, const StructureDocument& document,
                                               BinaryFormat format);

    // Creates or truncates the file
    static std::optional<StructureError> write_file(const std::filesystem::path& path,
                                                    const StructureDocument& document, BinaryFormat format);
};

}  // namespace voxstruct::structure
