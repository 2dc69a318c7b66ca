#pragma once

#include <sqlite3.h>

#include <string>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/models.hpp"

namespace assetforge::catalog::detail {
    // NotFound when the type row does not exist.
    assetforge::core::Status type_load(sqlite3* conn,
        assetforge::core::TypeId id,
        assetforge::core::HardwareType* out) noexcept;

    assetforge::core::Status type_code(sqlite3* conn,
        assetforge::core::TypeId id,
        std::string* out) noexcept;

} // namespace assetforge::catalog::detail
