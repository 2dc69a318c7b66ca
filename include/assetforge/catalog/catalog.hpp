#pragma once

#include <vector>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/models.hpp"
#include "assetforge/db/db.hpp"

namespace assetforge::catalog {
    using i64 = assetforge::core::i64;
    using CatalogKind = assetforge::core::CatalogKind;
    using CatalogEntry = assetforge::core::CatalogEntry;

    [[nodiscard]] const char* catalog_kind_name(CatalogKind kind) noexcept;

    // Names are trimmed and unique per catalog ignoring ASCII case.
    // - Invalid: empty name
    // - Duplicate: another row already has the name
    assetforge::core::Status catalog_create(assetforge::db::DbHandle db,
        CatalogKind kind,
        const char* name,
        i64* out_id) noexcept;

    // Find-or-create by name; returns the existing row's id when present.
    assetforge::core::Status catalog_ensure(assetforge::db::DbHandle db,
        CatalogKind kind,
        const char* name,
        i64* out_id) noexcept;

    assetforge::core::Status catalog_find_by_name(assetforge::db::DbHandle db,
        CatalogKind kind,
        const char* name,
        CatalogEntry* out) noexcept;

    assetforge::core::Status catalog_get(assetforge::db::DbHandle db,
        CatalogKind kind,
        i64 id,
        CatalogEntry* out) noexcept;

    // Ordered by name, then id.
    assetforge::core::Status catalog_list(assetforge::db::DbHandle db,
        CatalogKind kind,
        std::vector<CatalogEntry>* out) noexcept;

    assetforge::core::Status catalog_rename(assetforge::db::DbHandle db,
        CatalogKind kind,
        i64 id,
        const char* name) noexcept;

    // Items referencing the row keep existing with the reference cleared;
    // child locations are detached to the root.
    assetforge::core::Status catalog_delete(assetforge::db::DbHandle db,
        CatalogKind kind,
        i64 id) noexcept;

    // nullptr or "" clears the email.
    assetforge::core::Status user_set_email(assetforge::db::DbHandle db,
        i64 user_id,
        const char* email) noexcept;

    // parent_id == 0 moves the location to the root. A parent that is the
    // location itself or one of its descendants is Invalid.
    assetforge::core::Status location_set_parent(assetforge::db::DbHandle db,
        i64 location_id,
        i64 parent_id) noexcept;

} // namespace assetforge::catalog
