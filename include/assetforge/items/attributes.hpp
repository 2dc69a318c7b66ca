#pragma once

#include <vector>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/models.hpp"
#include "assetforge/db/db.hpp"

namespace assetforge::items {

    // Free-form key/value details attached to an item (warranty dates,
    // firmware versions). Keys are trimmed and compared exactly. Every change
    // is recorded in the item's audit trail under "attr:<key>" and refreshes
    // the item's updated_at.

    // Adds the key or replaces its value. Setting the value it already has
    // succeeds without writing an entry.
    // - Invalid: empty key
    // - NotFound: no such item
    assetforge::core::Status attribute_set(assetforge::db::DbHandle db,
        assetforge::core::ItemId item,
        const char* key,
        const char* value,
        const char* note) noexcept;

    // NotFound when the item does not exist or has no such key.
    assetforge::core::Status attribute_remove(assetforge::db::DbHandle db,
        assetforge::core::ItemId item,
        const char* key,
        const char* note) noexcept;

    // Ordered by key.
    assetforge::core::Status attribute_list(assetforge::db::DbHandle db,
        assetforge::core::ItemId item,
        std::vector<assetforge::core::ItemAttribute>* out) noexcept;

} // namespace assetforge::items
