#pragma once

#include "assetforge/core/types.hpp"

namespace assetforge::db {
    using i32 = assetforge::core::i32;

    // Schema generations, in the order the migration engine applies them.
    enum class SchemaVersion : i32 {
        Empty = 0,
        LegacyBaseline = 1,     // per-type tables, master_list, item_index
        ConsolidatedItems = 2,  // single items table, audit re-pointed
        TypeSerials = 3,        // catalogs deduplicated, type_serial + type_counters
        LandlineExtension = 4,  // items.extension, landline rows only
        AuditDigests = 5,       // item_updates.entry_digest chain, append-only guard
        ItemAttributes = 6,     // item_attributes key/value table
    };

    inline constexpr SchemaVersion kSchemaLatest = SchemaVersion::ItemAttributes;

    [[nodiscard]] constexpr i32 schema_version_value(SchemaVersion v) noexcept {
        return static_cast<i32>(v);
    }

    // The seeded "Landline Phones" type; the only type allowed an extension.
    inline constexpr assetforge::core::TypeId kLandlineTypeId{3};

    inline constexpr const char* kTagPrefix = "SDMM";

} // namespace assetforge::db
