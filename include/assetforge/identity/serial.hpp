#pragma once

#include "assetforge/core/errors.hpp"
#include "assetforge/core/types.hpp"
#include "assetforge/db/db.hpp"

namespace assetforge::identity {
    // Next serial the type's counter will issue; does not consume it.
    // Serials are only ever consumed by item creation, inside its transaction.
    assetforge::core::Status serial_peek(assetforge::db::DbHandle db,
        assetforge::core::TypeId type,
        assetforge::core::i64* out) noexcept;

} // namespace assetforge::identity
