#pragma once

#include <sqlite3.h>

#include <string>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/types.hpp"

namespace assetforge::migrate::detail {
    using assetforge::core::i64;
    using assetforge::core::Status;

    // A step runs inside the runner's exclusive transaction with foreign key
    // enforcement suspended. It must leave no TEMP tables behind.
    using StepFn = Status (*)(sqlite3* conn);

    struct Step {
        assetforge::core::i32 version;
        const char* name;
        const char* description;
        StepFn run;
    };

    // Per-type tables of the legacy schema and the type each one holds.
    struct LegacyTable {
        const char* table;
        i64 type_id;
    };

    inline constexpr LegacyTable kLegacyTables[] = {
        {"laptops_pcs", 1},
        {"network_gear", 2},
        {"landline_phones", 3},
        {"printers", 4},
        {"payment_terminals", 5},
        {"lorex_cameras", 6},
        {"eufy_cameras", 7},
        {"peripheral_devices", 8},
        {"access_points", 9},
        {"misc", 10},
    };

    Status step_legacy_baseline(sqlite3* conn) noexcept;
    Status step_consolidate_items(sqlite3* conn) noexcept;
    Status step_type_serials(sqlite3* conn) noexcept;
    Status step_landline_extension(sqlite3* conn) noexcept;
    Status step_audit_digests(sqlite3* conn) noexcept;
    Status step_item_attributes(sqlite3* conn) noexcept;

    // ========================================================================
    // Shared helpers
    // ========================================================================

    Status script(sqlite3* conn, const char* sql) noexcept;
    Status script(sqlite3* conn, const std::string& sql) noexcept;

    // Single integer result of `sql`.
    Status scalar(sqlite3* conn, const char* sql, i64* out) noexcept;
    Status scalar(sqlite3* conn, const std::string& sql, i64* out) noexcept;

    // Secondary and unique indexes of the current items table; a rebuild drops
    // them with the old table.
    Status create_item_indexes(sqlite3* conn) noexcept;

} // namespace assetforge::migrate::detail
