// VoxStruct Structure
// palette.cpp - Palette implementation

#include <voxstruct/core/logger.hpp>
#include <voxstruct/structure/palette.hpp>

namespace voxstruct::structure {

std::optional<int32_t> Palette::lookup(std::string_view name, const catalog::BlockProperties& properties) const {
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].matches(name, properties)) {
            return static_cast<int32_t>(i);
        }
    }
    return std::nullopt;
}

int32_t Palette::insert(const catalog::BlockIdentity& identity, int32_t version,
                        const catalog::BlockCatalog& catalog) {
    int32_t index = append(PaletteEntry{identity.name, identity.properties, version});
    if (active_) {
        resolved_.push_back(resolve(entries_.back(), catalog));
    }

    VOXSTRUCT_LOG_TRACE(core::log_category::PALETTE, "Palette entry {} = {}", index,
                        catalog::identity_to_string(identity));
    return index;
}

int32_t Palette::append(PaletteEntry entry) {
    auto index = static_cast<int32_t>(entries_.size());
    entries_.push_back(std::move(entry));
    return index;
}

bool Palette::replace(size_t index, PaletteEntry entry, const catalog::BlockCatalog& catalog) {
    if (index >= entries_.size()) {
        return false;
    }
    entries_[index] = std::move(entry);
    if (active_) {
        resolved_[index] = resolve(entries_[index], catalog);
    }
    return true;
}

ResolvedEntry Palette::resolve(const PaletteEntry& entry, const catalog::BlockCatalog& catalog) {
    catalog::BlockIdentity identity = catalog.upgrade(entry.identity(), entry.version);

    ResolvedEntry result;
    result.block = catalog.resolve(identity);
    if (!result.block) {
        VOXSTRUCT_LOG_DEBUG(core::log_category::PALETTE, "Cannot resolve {}", catalog::identity_to_string(identity));
        return result;
    }
    result.has_payload = result.block->has_payload();
    return result;
}

void Palette::activate(const catalog::BlockCatalog& catalog) {
    resolved_.clear();
    resolved_.reserve(entries_.size());
    for (const auto& entry : entries_) {
        resolved_.push_back(resolve(entry, catalog));
    }
    active_ = true;
}

void Palette::deactivate() {
    resolved_.clear();
    resolved_.shrink_to_fit();
    active_ = false;
}

const ResolvedEntry* Palette::resolved(int32_t index) const {
    if (!active_ || index < 0 || static_cast<size_t>(index) >= resolved_.size()) {
        return nullptr;
    }
    return &resolved_[static_cast<size_t>(index)];
}

const nlohmann::json* Palette::payload_at(int64_t offset) const {
    auto it = payloads_.find(offset);
    if (it == payloads_.end()) {
        return nullptr;
    }
    return &it->second;
}

void Palette::set_payload(int64_t offset, nlohmann::json payload) {
    payloads_[offset] = std::move(payload);
}

bool Palette::erase_payload(int64_t offset) {
    return payloads_.erase(offset) > 0;
}

}  // namespace voxstruct::structure
