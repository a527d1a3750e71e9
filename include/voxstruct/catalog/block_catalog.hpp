// VoxStruct Block Catalog
// block_catalog.hpp - Port through which structures resolve block identities

#pragma once

#include "block.hpp"

#include <cstdint>

namespace voxstruct::catalog {

// Supplied by the host application. Structures never construct blocks
// themselves, they only go through this interface.
class BlockCatalog {
public:
    virtual ~BlockCatalog() = default;

    // Returns nullptr when the identity is unknown to the catalog
    [[nodiscard]] virtual BlockPtr resolve(const BlockIdentity& identity) const = 0;

    // Migrates an identity stored under an older schema version. Applied
    // before resolve(); the default leaves the identity untouched.
    [[nodiscard]] virtual BlockIdentity upgrade(const BlockIdentity& identity, int32_t version) const;

    // Schema version stamped on newly written palette entries
    [[nodiscard]] virtual int32_t current_version() const = 0;
};

}  // namespace voxstruct::catalog
