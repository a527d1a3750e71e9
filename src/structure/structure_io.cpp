// VoxStruct Structure
// structure_io.cpp - StructureIO implementation

#include <fstream>
#include <iterator>
#include <voxstruct/core/logger.hpp>
#include <voxstruct/structure/structure_io.hpp>

namespace voxstruct::structure {

namespace {

DecodeResult failed(StructureErrorKind kind, std::string message) {
    DecodeResult result;
    result.error = StructureError{kind, std::move(message)};
    return result;
}

}  // namespace

std::optional<nlohmann::json> StructureIO::parse(std::span<const uint8_t> bytes, BinaryFormat format,
                                                 StructureError* error) {
    try {
        switch (format) {
            case BinaryFormat::Cbor:
                return nlohmann::json::from_cbor(bytes.begin(), bytes.end());
            case BinaryFormat::MessagePack:
                return nlohmann::json::from_msgpack(bytes.begin(), bytes.end());
            case BinaryFormat::Bson:
                return nlohmann::json::from_bson(bytes.begin(), bytes.end());
            case BinaryFormat::Ubjson:
                return nlohmann::json::from_ubjson(bytes.begin(), bytes.end());
            case BinaryFormat::Json:
                return nlohmann::json::parse(bytes.begin(), bytes.end());
        }
    } catch (const nlohmann::json::exception& e) {
        VOXSTRUCT_LOG_ERROR(core::log_category::IO, "Cannot parse {} bytes as {}: {}", bytes.size(),
                            binary_format_to_string(format), e.what());
        if (error != nullptr) {
            *error = StructureError{StructureErrorKind::Decode, e.what()};
        }
        return std::nullopt;
    }

    if (error != nullptr) {
        *error = StructureError{StructureErrorKind::Decode, "unknown binary format"};
    }
    return std::nullopt;
}

std::vector<uint8_t> StructureIO::serialize(const nlohmann::json& tree, BinaryFormat format) {
    switch (format) {
        case BinaryFormat::Cbor:
            return nlohmann::json::to_cbor(tree);
        case BinaryFormat::MessagePack:
            return nlohmann::json::to_msgpack(tree);
        case BinaryFormat::Bson:
            return nlohmann::json::to_bson(tree);
        case BinaryFormat::Ubjson:
            return nlohmann::json::to_ubjson(tree);
        case BinaryFormat::Json:
        default: {
            const std::string text = tree.dump();
            return std::vector<uint8_t>(text.begin(), text.end());
        }
    }
}

DecodeResult StructureIO::read_bytes(std::span<const uint8_t> bytes,
                                     std::shared_ptr<const catalog::BlockCatalog> catalog,
                                     const StructureSettings& settings) {
    StructureError error;
    auto tree = parse(bytes, settings.binary_format, &error);
    if (!tree) {
        DecodeResult result;
        result.error = std::move(error);
        return result;
    }
    return StructureCodec::decode(*tree, std::move(catalog), settings);
}

DecodeResult StructureIO::read(std::istream& input, std::shared_ptr<const catalog::BlockCatalog> catalog,
                               const StructureSettings& settings) {
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        VOXSTRUCT_LOG_ERROR(core::log_category::IO, "Stream read failed after {} bytes", bytes.size());
        return failed(StructureErrorKind::Io, "stream read failed");
    }
    return read_bytes(bytes, std::move(catalog), settings);
}

DecodeResult StructureIO::read_file(const std::filesystem::path& path,
                                    std::shared_ptr<const catalog::BlockCatalog> catalog,
                                    const StructureSettings& settings) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        VOXSTRUCT_LOG_ERROR(core::log_category::IO, "Cannot open structure file: {}", path.string());
        return failed(StructureErrorKind::Io, "cannot open " + path.string());
    }

    VOXSTRUCT_LOG_DEBUG(core::log_category::IO, "Reading structure from {}", path.string());
    return read(file, std::move(catalog), settings);
}

EncodeResult StructureIO::write_bytes(const StructureDocument& document, BinaryFormat format) {
    EncodeResult result;
    try {
        result.bytes = serialize(StructureCodec::encode(document), format);
    } catch (const nlohmann::json::exception& e) {
        // BSON only accepts a subset of trees
        VOXSTRUCT_LOG_ERROR(core::log_category::IO, "Cannot encode structure as {}: {}",
                            binary_format_to_string(format), e.what());
        result.error = StructureError{StructureErrorKind::Decode, e.what()};
    }
    return result;
}

std::optional<StructureError> StructureIO::write(std::ostream& output, const StructureDocument& document,
                                                 BinaryFormat format) {
    EncodeResult encoded = write_bytes(document, format);
    if (!encoded) {
        return encoded.error;
    }

    output.write(reinterpret_cast<const char*>(encoded.bytes.data()),
                 static_cast<std::streamsize>(encoded.bytes.size()));
    if (!output) {
        VOXSTRUCT_LOG_ERROR(core::log_category::IO, "Stream write of {} bytes failed", encoded.bytes.size());
        return StructureError{StructureErrorKind::Io, "stream write failed"};
    }
    return std::nullopt;
}

std::optional<StructureError> StructureIO::write_file(const std::filesystem::path& path,
                                                      const StructureDocument& document, BinaryFormat format) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        VOXSTRUCT_LOG_ERROR(core::log_category::IO, "Cannot create structure file: {}", path.string());
        return StructureError{StructureErrorKind::Io, "cannot create " + path.string()};
    }

    if (auto error = write(file, document, format)) {
        return error;
    }
    file.flush();
    if (!file) {
        return StructureError{StructureErrorKind::Io, "cannot flush " + path.string()};
    }

    VOXSTRUCT_LOG_DEBUG(core::log_category::IO, "Wrote structure to {}", path.string());
    return std::nullopt;
}

}  // namespace voxstruct::structure
