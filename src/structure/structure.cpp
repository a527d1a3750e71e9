// VoxStruct Structure
// structure.cpp - StructureDocument implementation and validation

#include <algorithm>
#include <stdexcept>
#include <voxstruct/core/logger.hpp>
#include <voxstruct/structure/structure.hpp>

namespace voxstruct::structure {

// ============================================================================
// Validation
// ============================================================================

namespace {

StructureError make_error(StructureErrorKind kind, std::string message) {
    return StructureError{kind, std::move(message)};
}

std::optional<StructureError> check_version(int32_t format_version) {
    if (format_version != FORMAT_VERSION) {
        return make_error(StructureErrorKind::UnsupportedVersion,
                          fmt::format("unsupported format version {}: expected version {}", format_version,
                                      FORMAT_VERSION));
    }
    return std::nullopt;
}

std::optional<StructureError> check_extent(const Extent& extent) {
    if (extent.x < 0 || extent.y < 0 || extent.z < 0) {
        return make_error(StructureErrorKind::BadExtent,
                          fmt::format("structure size must not be negative, got {}x{}x{}", extent.x, extent.y,
                                      extent.z));
    }
    if (!is_valid_extent(extent)) {
        return make_error(StructureErrorKind::BadExtent,
                          fmt::format("structure size {}x{}x{} has too many cells", extent.x, extent.y, extent.z));
    }
    return std::nullopt;
}

const Extent& require_valid_extent(const Extent& extent) {
    if (auto error = check_extent(extent)) {
        throw std::invalid_argument(error->message);
    }
    return extent;
}

std::optional<StructureError> check_layers(const std::vector<std::vector<int32_t>>& layers) {
    if (layers.empty()) {
        return make_error(StructureErrorKind::NoLayers, "structure has no blocks in it");
    }
    return std::nullopt;
}

std::optional<StructureError> check_layer_sizes(const std::vector<std::vector<int32_t>>& layers,
                                                const Extent& extent) {
    const int64_t expected = volume(extent);
    for (size_t i = 0; i < layers.size(); ++i) {
        if (static_cast<int64_t>(layers[i].size()) != expected) {
            return make_error(StructureErrorKind::LayerSizeMismatch,
                              fmt::format("structure is {}x{}x{} and should have {} blocks, but layer {} has {}",
                                          extent.x, extent.y, extent.z, expected, i, layers[i].size()));
        }
    }
    return std::nullopt;
}

// Sizes of every palette, keyed by name
std::optional<StructureError> check_palette_sizes(const std::map<std::string, size_t>& sizes) {
    if (sizes.empty()) {
        return make_error(StructureErrorKind::NoPalettes, "structure has no palettes in it");
    }
    const auto& [first_name, first_size] = *sizes.begin();
    for (const auto& [name, size] : sizes) {
        if (size != first_size) {
            return make_error(StructureErrorKind::PaletteSizeMismatch,
                              fmt::format("all palettes must have the same length, but '{}' has {} entries and "
                                          "'{}' has {}",
                                          first_name, first_size, name, size));
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<StructureError> validate(const StructureData& data) {
    if (auto error = check_version(data.format_version)) {
        return error;
    }
    if (data.size.size() != 3) {
        return make_error(StructureErrorKind::BadExtent,
                          fmt::format("structure size must have 3 values, but got {}", data.size.size()));
    }
    const Extent extent(data.size[0], data.size[1], data.size[2]);
    if (auto error = check_extent(extent)) {
        return error;
    }
    if (data.origin.size() != 3) {
        return make_error(StructureErrorKind::BadOrigin,
                          fmt::format("structure origin must have 3 values, but got {}", data.origin.size()));
    }
    if (auto error = check_layers(data.block_indices)) {
        return error;
    }
    if (data.palettes.empty()) {
        return make_error(StructureErrorKind::NoPalettes, "structure has no palettes in it");
    }
    if (auto error = check_layer_sizes(data.block_indices, extent)) {
        return error;
    }

    std::map<std::string, size_t> sizes;
    for (const auto& [name, palette] : data.palettes) {
        sizes[name] = palette.size();
    }
    return check_palette_sizes(sizes);
}

// ============================================================================
// StructureDocument Implementation
// ============================================================================

StructureDocument::StructureDocument(std::shared_ptr<const catalog::BlockCatalog> catalog)
    : catalog_(std::move(catalog)) {}

StructureDocument::StructureDocument(const Extent& extent, std::shared_ptr<const catalog::BlockCatalog> catalog,
                                     const StructureSettings& settings)
    : grid_(require_valid_extent(extent), 0, settings.overlay_layer), catalog_(std::move(catalog)) {
    if (!catalog_) {
        throw std::invalid_argument("StructureDocument requires a block catalog");
    }

    use_palette(settings.default_palette);

    // Index 0 is the fill entry every cell of layer 0 points at
    catalog::BlockIdentity air{settings.air_block, {}};
    if (auto block = catalog_->resolve(air)) {
        air = block->encode_identity();
    } else {
        VOXSTRUCT_LOG_WARN(core::log_category::STRUCTURE, "Air block '{}' is unknown to the catalog",
                           settings.air_block);
    }
    active_.insert(air, catalog_->current_version(), *catalog_);
}

DecodeResult StructureDocument::from_data(StructureData data, std::shared_ptr<const catalog::BlockCatalog> catalog,
                                          const StructureSettings& settings) {
    DecodeResult result;
    if (!catalog) {
        result.error = make_error(StructureErrorKind::Decode, "no block catalog supplied");
        return result;
    }
    if (auto error = validate(data)) {
        VOXSTRUCT_LOG_ERROR(core::log_category::STRUCTURE, "Invalid structure ({}): {}", to_string(error->kind),
                            error->message);
        result.error = std::move(*error);
        return result;
    }

    StructureDocument document(std::move(catalog));
    document.format_version_ = data.format_version;
    document.origin_ = WorldOrigin(data.origin[0], data.origin[1], data.origin[2]);
    document.grid_ = VoxelGrid(Extent(data.size[0], data.size[1], data.size[2]), std::move(data.block_indices));
    document.entities_ = std::move(data.entities);
    document.palettes_ = std::move(data.palettes);
    document.use_palette(settings.default_palette);

    result.document.emplace(std::move(document));
    return result;
}

std::optional<StructureError> StructureDocument::check() const {
    if (auto error = check_version(format_version_)) {
        return error;
    }
    if (auto error = check_extent(grid_.extent())) {
        return error;
    }
    if (auto error = check_layers(grid_.layers())) {
        return error;
    }
    if (auto error = check_layer_sizes(grid_.layers(), grid_.extent())) {
        return error;
    }

    std::map<std::string, size_t> sizes;
    for (const auto& [name, palette] : palettes_) {
        sizes[name] = palette.size();
    }
    if (has_active_) {
        sizes[active_name_] = active_.size();
    }
    return check_palette_sizes(sizes);
}

void StructureDocument::use_palette(std::string_view name) {
    if (has_active_) {
        Palette committed = active_;
        committed.deactivate();
        palettes_[active_name_] = std::move(committed);
    }

    auto it = palettes_.find(std::string(name));
    if (it != palettes_.end()) {
        active_ = it->second;
    } else {
        // A new palette starts as a copy of an existing one so entry counts
        // stay equal. Payloads belong to the palette and are not copied.
        VOXSTRUCT_LOG_DEBUG(core::log_category::STRUCTURE, "Creating palette '{}'", name);
        active_ = Palette{};
        if (!palettes_.empty()) {
            for (const auto& entry : palettes_.begin()->second.entries()) {
                active_.append(entry);
            }
        }
    }
    active_name_ = std::string(name);
    active_.activate(*catalog_);
    has_active_ = true;
}

std::vector<std::string> StructureDocument::palette_names() const {
    std::vector<std::string> names;
    for (const auto& [name, palette] : palettes_) {
        names.push_back(name);
    }
    if (has_active_ && palettes_.count(active_name_) == 0) {
        names.push_back(active_name_);
        std::sort(names.begin(), names.end());
    }
    return names;
}

std::map<std::string, Palette> StructureDocument::committed_palettes() const {
    std::map<std::string, Palette> result = palettes_;
    if (has_active_) {
        Palette committed = active_;
        committed.deactivate();
        result[active_name_] = std::move(committed);
    }
    return result;
}

bool StructureDocument::replace_palette_entry(size_t index, PaletteEntry entry) {
    return active_.replace(index, std::move(entry), *catalog_);
}

void StructureDocument::set_entities(nlohmann::json entities) {
    if (!entities.is_array()) {
        VOXSTRUCT_LOG_WARN(core::log_category::STRUCTURE, "Entities must be a list, ignoring {}",
                           entities.type_name());
        return;
    }
    entities_ = std::move(entities);
}

int32_t StructureDocument::pointer_for(const catalog::BlockIdentity& identity, int32_t version) {
    if (auto index = active_.lookup(identity.name, identity.properties)) {
        return *index;
    }

    const int32_t index = active_.insert(identity, version, *catalog_);

    // Keep the inactive palettes in lock-step with the active one
    for (auto& [name, palette] : palettes_) {
        if (name != active_name_) {
            palette.append(PaletteEntry{identity.name, identity.properties, version});
        }
    }
    return index;
}

int32_t StructureDocument::pointer_for(const catalog::Block& block) {
    return pointer_for(block.encode_identity(), catalog_->current_version());
}

bool StructureDocument::set(int32_t x, int32_t y, int32_t z, const catalog::BlockPtr& block,
                            const catalog::BlockPtr& liquid) {
    if (!grid_.in_bounds(x, y, z)) {
        VOXSTRUCT_LOG_WARN(core::log_category::STRUCTURE, "set({}, {}, {}) outside structure of size {}x{}x{}", x,
                           y, z, grid_.extent().x, grid_.extent().y, grid_.extent().z);
        return false;
    }
    if (liquid && !liquid->is_liquid()) {
        VOXSTRUCT_LOG_WARN(core::log_category::STRUCTURE, "set({}, {}, {}): {} is not a liquid", x, y, z,
                           catalog::identity_to_string(liquid->encode_identity()));
        return false;
    }

    const int64_t offset = grid_.offset(x, y, z);

    if (block) {
        grid_.write(BLOCK_LAYER, x, y, z, pointer_for(*block));
        if (block->has_payload()) {
            active_.set_payload(offset, block->encode_payload());
        } else {
            active_.erase_payload(offset);
        }
    } else {
        grid_.write(BLOCK_LAYER, x, y, z, EMPTY_CELL);
        active_.erase_payload(offset);
    }

    if (liquid) {
        if (!grid_.has_overlay()) {
            VOXSTRUCT_LOG_DEBUG(core::log_category::STRUCTURE, "Adding liquid layer");
            grid_.add_overlay();
        }
        grid_.write(LIQUID_LAYER, x, y, z, pointer_for(*liquid));
    } else if (grid_.has_overlay()) {
        grid_.write(LIQUID_LAYER, x, y, z, EMPTY_CELL);
    }
    return true;
}

bool StructureDocument::place_entry(size_t layer, int32_t x, int32_t y, int32_t z, const PaletteEntry& entry,
                                    const nlohmann::json* payload) {
    if (!grid_.in_bounds(x, y, z)) {
        VOXSTRUCT_LOG_WARN(core::log_category::STRUCTURE, "place_entry({}, {}, {}) outside structure of size {}x{}x{}",
                           x, y, z, grid_.extent().x, grid_.extent().y, grid_.extent().z);
        return false;
    }
    if (layer != BLOCK_LAYER && layer != LIQUID_LAYER) {
        VOXSTRUCT_LOG_WARN(core::log_category::STRUCTURE, "place_entry: layer {} is not a block or liquid layer",
                           layer);
        return false;
    }

    if (layer == LIQUID_LAYER && !grid_.has_overlay()) {
        VOXSTRUCT_LOG_DEBUG(core::log_category::STRUCTURE, "Adding liquid layer");
        grid_.add_overlay();
    }
    grid_.write(layer, x, y, z, pointer_for(entry.identity(), entry.version));

    if (layer == BLOCK_LAYER) {
        const int64_t offset = grid_.offset(x, y, z);
        if (payload != nullptr) {
            active_.set_payload(offset, *payload);
        } else {
            active_.erase_payload(offset);
        }
    }
    return true;
}

catalog::BlockPtr StructureDocument::resolve_cell(int32_t pointer) const {
    if (pointer == EMPTY_CELL) {
        return nullptr;
    }
    const ResolvedEntry* resolved = active_.resolved(pointer);
    if (resolved == nullptr) {
        VOXSTRUCT_LOG_DEBUG(core::log_category::STRUCTURE, "Pointer {} is outside palette '{}' ({} entries)",
                            pointer, active_name_, active_.size());
        return nullptr;
    }
    return resolved->block;
}

std::optional<StructureCell> StructureDocument::at(int32_t x, int32_t y, int32_t z) const {
    if (!grid_.in_bounds(x, y, z)) {
        VOXSTRUCT_LOG_WARN(core::log_category::STRUCTURE, "at({}, {}, {}) outside structure of size {}x{}x{}", x, y,
                           z, grid_.extent().x, grid_.extent().y, grid_.extent().z);
        return std::nullopt;
    }

    StructureCell cell;

    if (auto pointer = grid_.read(BLOCK_LAYER, x, y, z)) {
        cell.block = resolve_cell(*pointer);
        if (cell.block && cell.block->has_payload()) {
            if (const nlohmann::json* payload = active_.payload_at(grid_.offset(x, y, z))) {
                if (auto decoded = cell.block->decode_payload(*payload)) {
                    cell.block = std::move(decoded);
                }
            }
        }
    }

    if (auto pointer = grid_.read(LIQUID_LAYER, x, y, z)) {
        cell.liquid = resolve_cell(*pointer);
        if (cell.liquid && !cell.liquid->is_liquid()) {
            cell.liquid = nullptr;
        }
    }
    return cell;
}

}  // namespace voxstruct::structure
