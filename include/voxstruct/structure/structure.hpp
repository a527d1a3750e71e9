// VoxStruct Structure
// structure.hpp - Structure document: extent, palettes and the voxel grid

#pragma once

#include "palette.hpp"
#include "settings.hpp"
#include "structure_error.hpp"
#include "types.hpp"
#include "voxel_grid.hpp"

#include <voxstruct/catalog/block_catalog.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxstruct::structure {

// ============================================================================
// Structure Data (decoded, not yet validated)
// ============================================================================

struct StructureData {
    int32_t format_version = 0;
    std::vector<int32_t> size;
    std::vector<int32_t> origin;
    std::vector<std::vector<int32_t>> block_indices;
    nlohmann::json entities = nlohmann::json::array();
    std::map<std::string, Palette> palettes;
};

// Checks, in order: format version, size arity and sign, origin arity,
// layers present, palettes present, layer lengths, palette entry counts.
// Stops at the first violation.
[[nodiscard]] std::optional<StructureError> validate(const StructureData& data);

// ============================================================================
// Structure Cell
// ============================================================================

// Contents of one cell. A null pointer means nothing there: an EMPTY_CELL,
// a missing layer or an entry the catalog could not resolve.
struct StructureCell {
    catalog::BlockPtr block;
    catalog::BlockPtr liquid;
};

struct DecodeResult;

// ============================================================================
// Structure Document
// ============================================================================

// Exactly one palette is active at a time and every set()/at() goes through
// it. The active palette is a working copy: it is written back into the
// palette map when another palette is activated and when the document is
// encoded. Not thread-safe; callers serialize access to an instance.
class StructureDocument {
public:
    // Layer 0 filled with the air entry (index 0) and, when settings ask for
    // it, an all-EMPTY_CELL liquid layer. The catalog must not be null and
    // the extent must pass validation; std::invalid_argument otherwise.
    StructureDocument(const Extent& extent, std::shared_ptr<const catalog::BlockCatalog> catalog,
                      const StructureSettings& settings = {});

    // Validates the decoded fields and activates settings.default_palette.
    // No document is produced when validation fails.
    [[nodiscard]] static DecodeResult from_data(StructureData data,
                                                std::shared_ptr<const catalog::BlockCatalog> catalog,
                                                const StructureSettings& settings = {});

    // Re-validates the live document (see validate())
    [[nodiscard]] std::optional<StructureError> check() const;

    // ========================================================================
    // Palettes
    // ========================================================================

    // Commits the current palette back into the map, then activates the
    // named one. A new palette starts with a copy of an existing one's entries.
    void use_palette(std::string_view name);

    [[nodiscard]] const std::string& palette_name() const { return active_name_; }
    [[nodiscard]] const Palette& active_palette() const { return active_; }
    [[nodiscard]] std::vector<std::string> palette_names() const;

    // The palette map with the active palette folded in
    [[nodiscard]] std::map<std::string, Palette> committed_palettes() const;

    // Rewrites an entry of the active palette in place
    bool replace_palette_entry(size_t index, PaletteEntry entry);

    // ========================================================================
    // Cells
    // ========================================================================

    // Stores block (and liquid, on the overlay layer) at the cell. A null
    // block or liquid clears that layer. Returns false, changing nothing,
    // for an out-of-bounds cell or a liquid that is not a liquid.
    bool set(int32_t x, int32_t y, int32_t z, const catalog::BlockPtr& block,
             const catalog::BlockPtr& liquid = nullptr);

    // Points a block or liquid layer cell at the entry as stored, without
    // resolving it. Entries the catalog cannot resolve keep their name,
    // properties and version this way. On the block layer the payload
    // replaces the cell's payload; null erases it.
    bool place_entry(size_t layer, int32_t x, int32_t y, int32_t z, const PaletteEntry& entry,
                     const nlohmann::json* payload = nullptr);

    // nullopt only for an out-of-bounds cell
    [[nodiscard]] std::optional<StructureCell> at(int32_t x, int32_t y, int32_t z) const;

    [[nodiscard]] bool in_bounds(int32_t x, int32_t y, int32_t z) const { return grid_.in_bounds(x, y, z); }
    [[nodiscard]] int64_t offset(int32_t x, int32_t y, int32_t z) const { return grid_.offset(x, y, z); }

    // ========================================================================
    // Document fields
    // ========================================================================

    [[nodiscard]] int32_t format_version() const { return format_version_; }
    [[nodiscard]] const Extent& dimensions() const { return grid_.extent(); }
    [[nodiscard]] const WorldOrigin& origin() const { return origin_; }
    void set_origin(const WorldOrigin& origin) { origin_ = origin; }

    // Opaque entity blobs, passed through unexamined
    [[nodiscard]] const nlohmann::json& entities() const { return entities_; }
    void set_entities(nlohmann::json entities);

    [[nodiscard]] const VoxelGrid& grid() const { return grid_; }
    [[nodiscard]] const std::shared_ptr<const catalog::BlockCatalog>& catalog() const { return catalog_; }

private:
    explicit StructureDocument(std::shared_ptr<const catalog::BlockCatalog> catalog);

    // Palette index for the block, appending it (and mirroring it onto the
    // inactive palettes) when it is new
    int32_t pointer_for(const catalog::Block& block);
    int32_t pointer_for(const catalog::BlockIdentity& identity, int32_t version);

    [[nodiscard]] catalog::BlockPtr resolve_cell(int32_t pointer) const;

    int32_t format_version_ = FORMAT_VERSION;
    WorldOrigin origin_{0, 0, 0};
    VoxelGrid grid_;
    nlohmann::json entities_ = nlohmann::json::array();

    // Inactive palettes. The entry under active_name_ is stale until the
    // active palette is committed.
    std::map<std::string, Palette> palettes_;
    Palette active_;
    std::string active_name_;
    bool has_active_ = false;

    std::shared_ptr<const catalog::BlockCatalog> catalog_;
};

struct DecodeResult {
    std::optional<StructureDocument> document;
    StructureError error;  // Meaningful only when document is empty

    [[nodiscard]] bool ok() const { return document.has_value(); }
    explicit operator bool() const { return ok(); }
};

}  // namespace voxstruct::structure
