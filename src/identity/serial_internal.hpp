#pragma once

#include <sqlite3.h>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/types.hpp"

namespace assetforge::identity::detail {
    // All of these run on a connection that already holds the write
    // transaction of the calling operation.

    // Issues the type's next serial and advances the counter in one statement.
    // A type without a counter row gets one seeded from max(type_serial) + 1.
    assetforge::core::Status serial_allocate(sqlite3* conn,
        assetforge::core::TypeId type,
        assetforge::core::i64* out) noexcept;

    // Moves the counter past `serial` if it has not got there yet.
    assetforge::core::Status serial_reserve(sqlite3* conn,
        assetforge::core::TypeId type,
        assetforge::core::i64 serial) noexcept;

    assetforge::core::Status serial_ensure_counter(sqlite3* conn,
        assetforge::core::TypeId type) noexcept;

} // namespace assetforge::identity::detail
