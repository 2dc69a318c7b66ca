#include "assetforge/db/db.hpp"
#include "db/connection.hpp"

#include <sqlite3.h>
#include <cstdlib>
#include <string>
#include <mutex>

namespace assetforge::db {

using namespace assetforge::core;

namespace detail {
    struct DbSlot {
        sqlite3* conn = nullptr;
        std::mutex mutex;
        DbConfig cfg{};
        std::string path;
        bool claimed = false; // guarded by g_slots_mutex
    };
} // namespace detail

namespace {
    constexpr u32 kMaxHandles = 64;

    detail::DbSlot g_slots[kMaxHandles];
    std::mutex g_slots_mutex; // guards slot claim/release

    [[nodiscard]] detail::DbSlot* slot_for(u32 id) noexcept {
        if (id == 0 || id > kMaxHandles) {
            return nullptr;
        }
        return &g_slots[id - 1];
    }

    void apply_pragmas(sqlite3* conn, const DbConfig& cfg) noexcept {
        sqlite3_extended_result_codes(conn, 1);
        sqlite3_busy_timeout(conn, static_cast<int>(cfg.busy_timeout_ms));

        // WAL lets readers proceed while one writer holds the reserved lock.
        const char* journal_mode = std::getenv("ASSETFORGE_DB_JOURNAL_MODE");
        if (!journal_mode || journal_mode[0] == '\0') {
            journal_mode = "WAL";
        }
        std::string journal_sql = "PRAGMA journal_mode=";
        journal_sql += journal_mode;
        // in-memory stores report "memory" and ignore the request
        (void)detail::exec(conn, journal_sql.c_str(), StatusDomain::Db);

        (void)detail::exec(conn, "PRAGMA synchronous=NORMAL", StatusDomain::Db);
        (void)detail::exec(conn, "PRAGMA temp_store=MEMORY", StatusDomain::Db);
    }
}

namespace detail {
    ConnGuard::ConnGuard(DbHandle db) noexcept {
        DbSlot* slot = slot_for(db.id);
        if (!slot) {
            return;
        }
        lock_ = std::unique_lock<std::mutex>(slot->mutex);
        conn_ = slot->conn;
        max_retries_ = slot->cfg.max_retries;
    }
} // namespace detail

// ============================================================================
// Database Lifecycle
// ============================================================================

Status db_open(const DbConfig& cfg, DbHandle* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::DbSlot* slot = nullptr;
    u32 id = 0;
    {
        std::lock_guard<std::mutex> lock(g_slots_mutex);
        for (u32 i = 0; i < kMaxHandles; ++i) {
            if (!g_slots[i].claimed) {
                g_slots[i].claimed = true;
                slot = &g_slots[i];
                id = i + 1;
                break;
            }
        }
    }
    if (!slot) {
        return make_status(StatusDomain::Db, StatusCode::Unsupported);
    }

    auto release = [slot]() noexcept {
        std::lock_guard<std::mutex> lock(g_slots_mutex);
        slot->claimed = false;
    };

    std::unique_lock<std::mutex> lock(slot->mutex);
    slot->path = cfg.path ? cfg.path : ":memory:";

    sqlite3* conn = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    int rc = sqlite3_open_v2(slot->path.c_str(), &conn, flags, nullptr);
    if (rc != SQLITE_OK) {
        const Status s = detail::status_from_rc(rc, StatusDomain::Db);
        if (conn) {
            sqlite3_close(conn);
        }
        slot->path.clear();
        lock.unlock();
        release();
        return s.code == StatusCode::Unknown ? make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc)) : s;
    }

    apply_pragmas(conn, cfg);

    const Status fk = detail::exec(conn, "PRAGMA foreign_keys=ON", StatusDomain::Db);
    if (!is_ok(fk)) {
        sqlite3_close(conn);
        slot->path.clear();
        lock.unlock();
        release();
        return fk;
    }

    slot->conn = conn;
    slot->cfg = cfg;
    slot->cfg.path = nullptr;
    out->id = id;
    return ok_status();
}

Status db_close(DbHandle db) noexcept {
    detail::DbSlot* slot = slot_for(db.id);
    if (!slot) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::unique_lock<std::mutex> lock(slot->mutex);

    if (!slot->conn) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    // An open caller transaction is abandoned, not committed.
    if (sqlite3_get_autocommit(slot->conn) == 0) {
        (void)detail::exec(slot->conn, "ROLLBACK", StatusDomain::Db);
    }

    const int rc = sqlite3_close(slot->conn);
    if (rc != SQLITE_OK) {
        return detail::status_from_rc(rc, StatusDomain::Db);
    }
    slot->conn = nullptr;
    slot->path.clear();
    slot->cfg = DbConfig{};
    lock.unlock();

    std::lock_guard<std::mutex> slots_lock(g_slots_mutex);
    slot->claimed = false;
    return ok_status();
}

bool db_handle_valid(DbHandle db) noexcept {
    detail::DbSlot* slot = slot_for(db.id);
    if (!slot) {
        return false;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->conn != nullptr;
}

bool db_txn_valid(DbTxn txn) noexcept {
    return slot_for(txn.id) != nullptr;
}

// ============================================================================
// Transaction Management
// ============================================================================

Status db_txn_begin(DbHandle db, DbTxn* out, TxnMode mode) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (detail::in_transaction(guard.get())) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const char* sql = "BEGIN IMMEDIATE";
    if (mode == TxnMode::Deferred) {
        sql = "BEGIN DEFERRED";
    } else if (mode == TxnMode::Exclusive) {
        sql = "BEGIN EXCLUSIVE";
    }

    const Status s = detail::exec(guard.get(), sql, StatusDomain::Db);
    if (!is_ok(s)) {
        return s;
    }

    out->id = db.id;
    return ok_status();
}

Status db_txn_commit(DbTxn txn) noexcept {
    if (!db_txn_valid(txn)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::ConnGuard guard(DbHandle{txn.id});
    if (!guard.valid() || !detail::in_transaction(guard.get())) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const Status s = detail::exec(guard.get(), "COMMIT", StatusDomain::Db);
    if (!is_ok(s) && detail::in_transaction(guard.get())) {
        (void)detail::exec(guard.get(), "ROLLBACK", StatusDomain::Db);
    }
    return s;
}

Status db_txn_rollback(DbTxn txn) noexcept {
    if (!db_txn_valid(txn)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::ConnGuard guard(DbHandle{txn.id});
    if (!guard.valid() || !detail::in_transaction(guard.get())) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    return detail::exec(guard.get(), "ROLLBACK", StatusDomain::Db);
}

// ============================================================================
// Utilities
// ============================================================================

Status db_exec(DbHandle db, const char* sql) noexcept {
    if (!sql) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    detail::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    return detail::exec(guard.get(), sql, StatusDomain::Db);
}

Status db_filename(DbHandle db, const char** out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    detail::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    // empty string for in-memory stores
    const char* name = sqlite3_db_filename(guard.get(), "main");
    *out = name ? name : "";
    return ok_status();
}

Status db_quick_check(DbHandle db, bool* ok) noexcept {
    if (!ok) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    detail::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::Stmt stmt(guard.get(), "PRAGMA quick_check");
    const Status ps = detail::prepare_status(stmt, StatusDomain::Db);
    if (!is_ok(ps)) {
        return ps;
    }

    bool clean = true;
    u32 rows = 0;
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        ++rows;
        const std::string line = detail::column_text(stmt.get(), 0);
        if (line != "ok") {
            clean = false;
        }
    }
    if (rc != SQLITE_DONE) {
        return detail::status_from_rc(rc, StatusDomain::Db);
    }

    *ok = clean && rows > 0;
    return ok_status();
}

} // namespace assetforge::db
