#pragma once

#include <string>
#include <vector>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/models.hpp"
#include "assetforge/db/db.hpp"
#include "assetforge/db/schema.hpp"

namespace assetforge::catalog {

// ========================================================================
// Lookup
// ========================================================================

[[nodiscard]] constexpr bool type_is_landline(assetforge::core::TypeId type) noexcept {
    return type == assetforge::db::kLandlineTypeId;
}

assetforge::core::Status type_get(assetforge::db::DbHandle db,
                                  assetforge::core::TypeId id,
                                  assetforge::core::HardwareType* out) noexcept;

// Code match is case-insensitive ("px" finds PX).
assetforge::core::Status type_find_by_code(assetforge::db::DbHandle db,
                                           const char* code,
                                           assetforge::core::HardwareType* out) noexcept;

assetforge::core::Status type_find_by_name(assetforge::db::DbHandle db,
                                           const char* name,
                                           assetforge::core::HardwareType* out) noexcept;

// Ordered by id.
assetforge::core::Status type_list(assetforge::db::DbHandle db,
                                   std::vector<assetforge::core::HardwareType>* out) noexcept;

assetforge::core::Status type_code(assetforge::db::DbHandle db,
                                   assetforge::core::TypeId id,
                                   std::string* out) noexcept;

// ========================================================================
// Administration
// ========================================================================

// Creates the type and its serial counter (starting at 1).
// - Invalid: empty name, code not 1-8 uppercase letters/digits
// - Duplicate: name or code already registered (case-insensitive)
assetforge::core::Status type_create(assetforge::db::DbHandle db,
                                     const char* name,
                                     const char* code,
                                     assetforge::core::TypeId* out) noexcept;

assetforge::core::Status type_rename(assetforge::db::DbHandle db,
                                     assetforge::core::TypeId id,
                                     const char* name) noexcept;

// The code is part of every printed tag, so it is frozen once any item
// references the type (Invalid).
assetforge::core::Status type_set_code(assetforge::db::DbHandle db,
                                       assetforge::core::TypeId id,
                                       const char* code) noexcept;

// Cascades to the type's items, their audit trail, attributes and counter.
assetforge::core::Status type_delete(assetforge::db::DbHandle db,
                                     assetforge::core::TypeId id) noexcept;

} // namespace assetforge::catalog
