#pragma once

#include <type_traits>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/types.hpp"

namespace assetforge::db {
    using u8 = assetforge::core::u8;
    using u32 = assetforge::core::u32;

    struct DbConfig {
        const char* path{nullptr};   // nullptr opens a private in-memory store
        u32 busy_timeout_ms{5000};
        u32 max_retries{3};          // extra attempts for a write that hit SQLITE_BUSY
    };

    // Each handle owns one sqlite3 connection. A handle serialises its own
    // calls; threads that write concurrently open one handle each.
    struct DbHandle {
        u32 id{0};
    };

    struct DbTxn {
        u32 id{0};
    };

    enum class TxnMode : u8 {
        Deferred = 0,
        Immediate = 1,
        Exclusive = 2,
    };

    assetforge::core::Status db_open(const DbConfig& cfg, DbHandle* out) noexcept;
    assetforge::core::Status db_close(DbHandle db) noexcept;

    [[nodiscard]] bool db_handle_valid(DbHandle db) noexcept;
    [[nodiscard]] bool db_txn_valid(DbTxn txn) noexcept;

    // Explicit caller transactions. Store operations issued on the same handle
    // while one is open run inside it (as savepoints) and never commit it.
    assetforge::core::Status db_txn_begin(DbHandle db, DbTxn* out, TxnMode mode = TxnMode::Immediate) noexcept;
    assetforge::core::Status db_txn_commit(DbTxn txn) noexcept;
    assetforge::core::Status db_txn_rollback(DbTxn txn) noexcept;

    assetforge::core::Status db_exec(DbHandle db, const char* sql) noexcept;
    assetforge::core::Status db_filename(DbHandle db, const char** out) noexcept;

    // PRAGMA quick_check; *ok is false when the store reports any problem.
    assetforge::core::Status db_quick_check(DbHandle db, bool* ok) noexcept;

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_trivially_copyable_v<DbHandle>);
    static_assert(std::is_trivially_copyable_v<DbTxn>);
    static_assert(std::is_standard_layout_v<DbConfig>);
    static_assert(std::is_standard_layout_v<DbHandle>);
    static_assert(std::is_standard_layout_v<DbTxn>);

} // namespace assetforge::db
