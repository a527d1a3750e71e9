// VoxStruct Structure
// palette.hpp - Deduplicated block identity table with per-position payloads

#pragma once

#include <voxstruct/catalog/block_catalog.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxstruct::structure {

// ============================================================================
// Palette Entry
// ============================================================================

struct PaletteEntry {
    std::string name;
    catalog::BlockProperties properties;
    int32_t version = 0;  // Catalog schema version at insertion time

    [[nodiscard]] catalog::BlockIdentity identity() const { return {name, properties}; }

    // Same name and the same property map; version is not compared
    [[nodiscard]] bool matches(std::string_view other_name, const catalog::BlockProperties& other_properties) const {
        return name == other_name && properties == other_properties;
    }

    bool operator==(const PaletteEntry& other) const = default;
};

// Cached resolution of one entry. block is null on a resolution miss.
struct ResolvedEntry {
    catalog::BlockPtr block;
    bool has_payload = false;
};

// ============================================================================
// Palette
// ============================================================================

// Entries are append-only: a grid cell stores an entry's index, so removing
// or reordering entries would change what every cell points at. The resolved
// cache only exists while the palette is active.
class Palette {
public:
    using PayloadMap = std::map<int64_t, nlohmann::json>;

    // First entry in insertion order with an equal identity
    [[nodiscard]] std::optional<int32_t> lookup(std::string_view name,
                                                const catalog::BlockProperties& properties) const;

    // Appends and returns the new entry's index (the size before the append).
    // An active palette resolves the entry straight away.
    int32_t insert(const catalog::BlockIdentity& identity, int32_t version, const catalog::BlockCatalog& catalog);

    // Appends without resolving, for decoding and inactive palettes
    int32_t append(PaletteEntry entry);

    // Overwrites an entry in place and re-resolves it when active.
    // Returns false for an index past the end.
    bool replace(size_t index, PaletteEntry entry, const catalog::BlockCatalog& catalog);

    // Upgrade then resolve. A miss is not an error: the block is null.
    [[nodiscard]] static ResolvedEntry resolve(const PaletteEntry& entry, const catalog::BlockCatalog& catalog);

    // Rebuilds the resolved cache from the entries, in order
    void activate(const catalog::BlockCatalog& catalog);
    void deactivate();
    [[nodiscard]] bool is_active() const { return active_; }

    // Precondition for the hot path: index < size(). Returns nullptr otherwise
    // or when the palette is not active.
    [[nodiscard]] const ResolvedEntry* resolved(int32_t index) const;

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] const std::vector<PaletteEntry>& entries() const { return entries_; }
    [[nodiscard]] const PaletteEntry& entry(size_t index) const { return entries_.at(index); }

    // ========================================================================
    // Position payloads (block entity data keyed by cell offset)
    // ========================================================================

    [[nodiscard]] const nlohmann::json* payload_at(int64_t offset) const;
    void set_payload(int64_t offset, nlohmann::json payload);
    bool erase_payload(int64_t offset);
    [[nodiscard]] const PayloadMap& payloads() const { return payloads_; }

private:
    std::vector<PaletteEntry> entries_;
    PayloadMap payloads_;
    std::vector<ResolvedEntry> resolved_;
    bool active_ = false;
};

}  // namespace voxstruct::structure
