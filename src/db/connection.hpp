#pragma once

// Internal connection plumbing shared by the store modules. Not installed.

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/types.hpp"
#include "assetforge/db/db.hpp"

namespace assetforge::db::detail {
    using assetforge::core::i64;
    using assetforge::core::Status;
    using assetforge::core::StatusCode;
    using assetforge::core::StatusDomain;

    struct DbSlot;

    // Locks a handle's slot for the lifetime of the guard.
    class ConnGuard {
    public:
        explicit ConnGuard(DbHandle db) noexcept;
        ~ConnGuard() = default;

        ConnGuard(const ConnGuard&) = delete;
        ConnGuard& operator=(const ConnGuard&) = delete;

        [[nodiscard]] bool valid() const noexcept { return conn_ != nullptr; }
        [[nodiscard]] sqlite3* get() const noexcept { return conn_; }
        [[nodiscard]] u32 max_retries() const noexcept { return max_retries_; }

    private:
        std::unique_lock<std::mutex> lock_;
        sqlite3* conn_{nullptr};
        u32 max_retries_{0};
    };

    // ========================================================================
    // Statements
    // ========================================================================

    class Stmt {
    public:
        Stmt(sqlite3* conn, const char* sql) noexcept {
            rc_ = sqlite3_prepare_v2(conn, sql, -1, &stmt_, nullptr);
        }

        ~Stmt() {
            if (stmt_) {
                sqlite3_finalize(stmt_);
            }
        }

        Stmt(const Stmt&) = delete;
        Stmt& operator=(const Stmt&) = delete;

        [[nodiscard]] bool ok() const noexcept { return rc_ == SQLITE_OK && stmt_ != nullptr; }
        [[nodiscard]] int rc() const noexcept { return rc_; }
        [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

        int step() noexcept { return sqlite3_step(stmt_); }

        void reset() noexcept {
            sqlite3_reset(stmt_);
            sqlite3_clear_bindings(stmt_);
        }

    private:
        sqlite3_stmt* stmt_{nullptr};
        int rc_{SQLITE_ERROR};
    };

    // Maps an (extended) sqlite result code onto the store taxonomy. The raw
    // extended code travels in aux.
    [[nodiscard]] inline Status status_from_rc(int rc, StatusDomain domain) noexcept {
        const u32 aux = static_cast<u32>(rc);
        switch (rc & 0xff) {
            case SQLITE_OK:
            case SQLITE_ROW:
            case SQLITE_DONE:
                return assetforge::core::ok_status();
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                return assetforge::core::make_status(domain, StatusCode::Conflict, aux);
            case SQLITE_CONSTRAINT:
                if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
                    return assetforge::core::make_status(domain, StatusCode::Duplicate, aux);
                }
                return assetforge::core::make_status(domain, StatusCode::Invalid, aux);
            case SQLITE_CORRUPT:
            case SQLITE_NOTADB:
                return assetforge::core::make_status(domain, StatusCode::Corrupt, aux);
            case SQLITE_IOERR:
            case SQLITE_FULL:
            case SQLITE_CANTOPEN:
            case SQLITE_READONLY:
                return assetforge::core::make_status(domain, StatusCode::Io, aux);
            case SQLITE_MISUSE:
            case SQLITE_RANGE:
            case SQLITE_MISMATCH:
                return assetforge::core::make_status(domain, StatusCode::Invalid, aux);
            default:
                return assetforge::core::make_status(domain, StatusCode::Unknown, aux);
        }
    }

    [[nodiscard]] inline Status prepare_status(const Stmt& stmt, StatusDomain domain) noexcept {
        if (stmt.ok()) {
            return assetforge::core::ok_status();
        }
        return status_from_rc(stmt.rc() == SQLITE_OK ? SQLITE_ERROR : stmt.rc(), domain);
    }

    [[nodiscard]] inline Status exec(sqlite3* conn, const char* sql, StatusDomain domain) noexcept {
        if (!conn || !sql) {
            return assetforge::core::make_status(domain, StatusCode::Invalid);
        }
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(conn, sql, nullptr, nullptr, &err_msg);
        if (err_msg) {
            sqlite3_free(err_msg);
        }
        return status_from_rc(rc, domain);
    }

    // Steps a statement that returns no rows.
    [[nodiscard]] inline Status step_done(Stmt& stmt, StatusDomain domain) noexcept {
        const int rc = stmt.step();
        if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
            return assetforge::core::ok_status();
        }
        return status_from_rc(rc, domain);
    }

    // ========================================================================
    // Binding / column helpers
    // ========================================================================

    inline void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) noexcept {
        sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    // Empty text is stored as NULL.
    inline void bind_optional_text(sqlite3_stmt* stmt, int index, const std::string& value) noexcept {
        if (value.empty()) {
            sqlite3_bind_null(stmt, index);
            return;
        }
        bind_text(stmt, index, value);
    }

    template <typename IdT>
    inline void bind_id(sqlite3_stmt* stmt, int index, IdT id) noexcept {
        if (!id.is_valid()) {
            sqlite3_bind_null(stmt, index);
            return;
        }
        sqlite3_bind_int64(stmt, index, id.v);
    }

    [[nodiscard]] inline std::string column_text(sqlite3_stmt* stmt, int index) {
        const unsigned char* text = sqlite3_column_text(stmt, index);
        if (!text) {
            return {};
        }
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt, index)));
    }

    template <typename IdT>
    [[nodiscard]] inline IdT column_id(sqlite3_stmt* stmt, int index) noexcept {
        if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
            return IdT::invalid();
        }
        return IdT{sqlite3_column_int64(stmt, index)};
    }

    // ========================================================================
    // Write transactions
    // ========================================================================

    inline void backoff(u32 attempt) noexcept {
        std::this_thread::sleep_for(std::chrono::milliseconds(5 * attempt));
    }

    // Runs fn(conn) inside one write transaction. BEGIN IMMEDIATE takes the
    // reserved lock before any read, so a counter read-modify-write cannot be
    // interleaved; SQLITE_BUSY is retried up to max_retries times and then
    // surfaces as Conflict (aux = attempts). When the caller already holds a
    // transaction on this connection the work nests in a savepoint instead.
    template <typename Fn>
    [[nodiscard]] Status run_write(ConnGuard& guard, StatusDomain domain, Fn&& fn) noexcept {
        sqlite3* conn = guard.get();
        if (!conn) {
            return assetforge::core::make_status(domain, StatusCode::Invalid);
        }

        if (sqlite3_get_autocommit(conn) == 0) {
            Status s = exec(conn, "SAVEPOINT af_write", domain);
            if (!assetforge::core::is_ok(s)) {
                return s;
            }
            s = fn(conn);
            if (!assetforge::core::is_ok(s)) {
                (void)exec(conn, "ROLLBACK TO af_write", domain);
                (void)exec(conn, "RELEASE af_write", domain);
                return s;
            }
            return exec(conn, "RELEASE af_write", domain);
        }

        const u32 attempts = guard.max_retries() + 1;
        for (u32 attempt = 1; attempt <= attempts; ++attempt) {
            Status s = exec(conn, "BEGIN IMMEDIATE", domain);
            if (s.code == StatusCode::Conflict) {
                backoff(attempt);
                continue;
            }
            if (!assetforge::core::is_ok(s)) {
                return s;
            }

            s = fn(conn);
            if (assetforge::core::is_ok(s)) {
                s = exec(conn, "COMMIT", domain);
                if (assetforge::core::is_ok(s)) {
                    return s;
                }
            }

            if (sqlite3_get_autocommit(conn) == 0) {
                (void)exec(conn, "ROLLBACK", domain);
            }
            if (s.code != StatusCode::Conflict) {
                return s;
            }
            backoff(attempt);
        }
        return assetforge::core::make_status(domain, StatusCode::Conflict, attempts);
    }

    [[nodiscard]] inline bool in_transaction(sqlite3* conn) noexcept {
        return conn != nullptr && sqlite3_get_autocommit(conn) == 0;
    }

} // namespace assetforge::db::detail
