#pragma once

#include <vector>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/models.hpp"
#include "assetforge/db/db.hpp"
#include "assetforge/db/schema.hpp"

namespace assetforge::migrate {
    using i32 = assetforge::core::i32;
    using u32 = assetforge::core::u32;
    using SchemaVersion = assetforge::db::SchemaVersion;

    struct MigrationInfo {
        i32 version{0};
        const char* name{""};
        const char* description{""};
    };

    struct MigrationProgress {
        i32 version{0};
        const char* name{""};
        bool finished{false};   // false when the step starts, true once committed
    };

    using MigrationProgressFn = void (*)(const MigrationProgress& progress, void* user);

    struct MigrationConfig {
        MigrationProgressFn on_progress{nullptr};
        void* user{nullptr};
    };

    struct MigrationReport {
        i32 from{0};
        i32 to{0};
        u32 applied{0};
    };

    // Every known version, oldest first.
    [[nodiscard]] std::vector<MigrationInfo> migrate_catalog();

    // Highest applied version per the ledger; 0 for a store that has none.
    // A ledger with gaps, or naming a version this build does not know, is a
    // Migration error.
    assetforge::core::Status migrate_current_version(assetforge::db::DbHandle db, i32* out) noexcept;

    // Applies every version after the current one up to `target`, each in its
    // own exclusive transaction. Reaching a version already applied is a no-op;
    // a target below the current version or past the latest is a Migration
    // error. On failure the store stays at the last committed version and the
    // status carries the failing version in aux.
    // - Conflict: the handle has a caller transaction open, or the store
    //   stayed locked by another connection
    assetforge::core::Status migrate_to(assetforge::db::DbHandle db,
        SchemaVersion target,
        const MigrationConfig& cfg,
        MigrationReport* out) noexcept;

    // Applies exactly `version`, which must be the next one; re-applying a
    // completed version is a Migration error.
    assetforge::core::Status migrate_apply(assetforge::db::DbHandle db,
        SchemaVersion version,
        const MigrationConfig& cfg) noexcept;

    // Ledger rows, oldest first.
    assetforge::core::Status migrate_history(assetforge::db::DbHandle db,
        std::vector<assetforge::core::MigrationRecord>* out) noexcept;

} // namespace assetforge::migrate
