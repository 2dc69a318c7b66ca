#include "assetforge/migrate/migration.hpp"
#include "assetforge/core/clock.hpp"
#include "db/connection.hpp"
#include "migrate/steps.hpp"

#include <utility>

namespace assetforge::migrate {

using namespace assetforge::core;
namespace dbd = assetforge::db::detail;

namespace {
    constexpr detail::Step kSteps[] = {
        {1, "legacy_baseline", "per-type legacy tables and reference seed", detail::step_legacy_baseline},
        {2, "consolidate_items", "merge per-type tables into items, re-point audit trail", detail::step_consolidate_items},
        {3, "type_serials", "deduplicate catalogs, backfill type serials and tags", detail::step_type_serials},
        {4, "landline_extension", "items.extension restricted to landline phones", detail::step_landline_extension},
        {5, "audit_digests", "chained audit entry digests, append-only guard", detail::step_audit_digests},
        {6, "item_attributes", "per-item key/value attributes", detail::step_item_attributes},
    };

    constexpr i32 kLatest = assetforge::db::schema_version_value(assetforge::db::kSchemaLatest);
    static_assert(sizeof(kSteps) / sizeof(kSteps[0]) == static_cast<size_t>(kLatest));

    [[nodiscard]] Status migration_error(i32 version) noexcept {
        return make_status(StatusDomain::Migration, StatusCode::Migration, static_cast<u32>(version));
    }

    void report(const MigrationConfig& cfg, const detail::Step& step, bool finished) noexcept {
        if (!cfg.on_progress) {
            return;
        }
        MigrationProgress p;
        p.version = step.version;
        p.name = step.name;
        p.finished = finished;
        cfg.on_progress(p, cfg.user);
    }

    Status ledger_exists(sqlite3* conn, bool* out) noexcept {
        i64 n = 0;
        const Status s = detail::scalar(conn,
            "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'schema_migrations'", &n);
        if (!is_ok(s)) {
            return s;
        }
        *out = n > 0;
        return ok_status();
    }

    Status current_version(sqlite3* conn, i32* out) noexcept {
        bool exists = false;
        Status s = ledger_exists(conn, &exists);
        if (!is_ok(s)) {
            return s;
        }
        if (!exists) {
            *out = 0;
            return ok_status();
        }

        dbd::Stmt stmt(conn, "SELECT COUNT(*), COALESCE(MAX(version), 0), COALESCE(MIN(version), 1) FROM schema_migrations");
        s = dbd::prepare_status(stmt, StatusDomain::Migration);
        if (!is_ok(s)) {
            return s;
        }
        const int rc = stmt.step();
        if (rc != SQLITE_ROW) {
            return dbd::status_from_rc(rc, StatusDomain::Migration);
        }
        const i64 count = sqlite3_column_int64(stmt.get(), 0);
        const i64 max = sqlite3_column_int64(stmt.get(), 1);
        const i64 min = sqlite3_column_int64(stmt.get(), 2);

        // versions must be exactly 1..max
        if (min != 1 || count != max || max > kLatest) {
            return migration_error(static_cast<i32>(max));
        }
        *out = static_cast<i32>(max);
        return ok_status();
    }

    Status run_step(sqlite3* conn, const detail::Step& step, const MigrationConfig& cfg) noexcept {
        // foreign_keys cannot change inside a transaction
        Status s = dbd::exec(conn, "PRAGMA foreign_keys = OFF", StatusDomain::Migration);
        if (!is_ok(s)) {
            return s;
        }

        s = dbd::exec(conn, "BEGIN EXCLUSIVE", StatusDomain::Migration);
        if (!is_ok(s)) {
            (void)dbd::exec(conn, "PRAGMA foreign_keys = ON", StatusDomain::Migration);
            return s;
        }

        auto body = [&]() -> Status {
            Status st = detail::script(conn,
                "CREATE TABLE IF NOT EXISTS schema_migrations ("
                "  version INTEGER PRIMARY KEY,"
                "  description TEXT NOT NULL,"
                "  applied_at_utc TEXT NOT NULL)");
            if (!is_ok(st)) {
                return st;
            }

            // re-read under the exclusive lock; another process may have
            // moved the store on since the caller looked
            i32 current = 0;
            st = current_version(conn, &current);
            if (!is_ok(st)) {
                return st;
            }
            if (current != step.version - 1) {
                return migration_error(step.version);
            }

            report(cfg, step, false);
            st = step.run(conn);
            if (!is_ok(st)) {
                return st;
            }

            dbd::Stmt fk(conn, "PRAGMA foreign_key_check");
            st = dbd::prepare_status(fk, StatusDomain::Migration);
            if (!is_ok(st)) {
                return st;
            }
            const int rc = fk.step();
            if (rc == SQLITE_ROW) {
                return migration_error(step.version);
            }
            if (rc != SQLITE_DONE) {
                return dbd::status_from_rc(rc, StatusDomain::Migration);
            }

            dbd::Stmt ledger(conn,
                "INSERT INTO schema_migrations (version, description, applied_at_utc) VALUES (?, ?, ?)");
            st = dbd::prepare_status(ledger, StatusDomain::Migration);
            if (!is_ok(st)) {
                return st;
            }
            sqlite3_bind_int(ledger.get(), 1, step.version);
            sqlite3_bind_text(ledger.get(), 2, step.name, -1, SQLITE_STATIC);
            dbd::bind_text(ledger.get(), 3, now_utc_iso());
            return dbd::step_done(ledger, StatusDomain::Migration);
        };

        s = body();
        if (is_ok(s)) {
            s = dbd::exec(conn, "COMMIT", StatusDomain::Migration);
        }
        if (!is_ok(s) && dbd::in_transaction(conn)) {
            (void)dbd::exec(conn, "ROLLBACK", StatusDomain::Migration);
        }
        (void)dbd::exec(conn, "PRAGMA foreign_keys = ON", StatusDomain::Migration);

        if (!is_ok(s)) {
            // lock contention stays a Conflict; everything else names the version
            return s.code == StatusCode::Conflict ? s : migration_error(step.version);
        }
        report(cfg, step, true);
        return ok_status();
    }

    [[nodiscard]] const detail::Step* find_step(i32 version) noexcept {
        for (const detail::Step& step : kSteps) {
            if (step.version == version) {
                return &step;
            }
        }
        return nullptr;
    }
}

std::vector<MigrationInfo> migrate_catalog() {
    std::vector<MigrationInfo> out;
    out.reserve(sizeof(kSteps) / sizeof(kSteps[0]));
    for (const detail::Step& step : kSteps) {
        out.push_back(MigrationInfo{step.version, step.name, step.description});
    }
    return out;
}

Status migrate_current_version(assetforge::db::DbHandle db, i32* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Migration, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Migration, StatusCode::Invalid);
    }
    return current_version(guard.get(), out);
}

Status migrate_to(assetforge::db::DbHandle db, SchemaVersion target, const MigrationConfig& cfg, MigrationReport* out) noexcept {
    const i32 target_value = assetforge::db::schema_version_value(target);

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Migration, StatusCode::Invalid);
    }
    if (dbd::in_transaction(guard.get())) {
        return make_status(StatusDomain::Migration, StatusCode::Conflict);
    }

    i32 current = 0;
    Status s = current_version(guard.get(), &current);
    if (!is_ok(s)) {
        return s;
    }
    if (target_value < current || target_value > kLatest) {
        return migration_error(target_value);
    }

    MigrationReport rep;
    rep.from = current;
    rep.to = current;
    for (i32 v = current + 1; v <= target_value; ++v) {
        const detail::Step* step = find_step(v);
        if (!step) {
            return migration_error(v);
        }
        s = run_step(guard.get(), *step, cfg);
        if (!is_ok(s)) {
            if (out) {
                *out = rep;
            }
            return s;
        }
        rep.to = v;
        ++rep.applied;
    }

    if (out) {
        *out = rep;
    }
    return ok_status();
}

Status migrate_apply(assetforge::db::DbHandle db, SchemaVersion version, const MigrationConfig& cfg) noexcept {
    const i32 value = assetforge::db::schema_version_value(version);

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Migration, StatusCode::Invalid);
    }
    if (dbd::in_transaction(guard.get())) {
        return make_status(StatusDomain::Migration, StatusCode::Conflict);
    }

    i32 current = 0;
    Status s = current_version(guard.get(), &current);
    if (!is_ok(s)) {
        return s;
    }
    const detail::Step* step = find_step(value);
    if (!step || value != current + 1) {
        return migration_error(value);
    }
    return run_step(guard.get(), *step, cfg);
}

Status migrate_history(assetforge::db::DbHandle db, std::vector<MigrationRecord>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Migration, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Migration, StatusCode::Invalid);
    }

    out->clear();
    bool exists = false;
    Status s = ledger_exists(guard.get(), &exists);
    if (!is_ok(s) || !exists) {
        return s;
    }

    dbd::Stmt stmt(guard.get(), "SELECT version, description, applied_at_utc FROM schema_migrations ORDER BY version");
    s = dbd::prepare_status(stmt, StatusDomain::Migration);
    if (!is_ok(s)) {
        return s;
    }
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        MigrationRecord r;
        r.version = sqlite3_column_int(stmt.get(), 0);
        r.description = dbd::column_text(stmt.get(), 1);
        r.applied_at = dbd::column_text(stmt.get(), 2);
        out->push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) {
        return dbd::status_from_rc(rc, StatusDomain::Migration);
    }
    return ok_status();
}

} // namespace assetforge::migrate
