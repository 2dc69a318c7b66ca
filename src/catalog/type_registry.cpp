#include "assetforge/catalog/type_registry.hpp"
#include "assetforge/identity/tag.hpp"
#include "catalog/type_registry_internal.hpp"
#include "core/text.hpp"
#include "db/connection.hpp"
#include "identity/serial_internal.hpp"

namespace assetforge::catalog {

using namespace assetforge::core;
namespace dbd = assetforge::db::detail;

namespace {
    constexpr const char* kTypeColumns = "SELECT id, name, code FROM hardware_types ";

    void read_type(sqlite3_stmt* stmt, HardwareType* out) {
        out->id = TypeId{sqlite3_column_int64(stmt, 0)};
        out->name = dbd::column_text(stmt, 1);
        out->code = dbd::column_text(stmt, 2);
    }

    // Runs a single-row type lookup bound to one text parameter.
    Status find_one_by_text(sqlite3* conn, const char* where, const std::string& value, HardwareType* out) noexcept {
        std::string sql = kTypeColumns;
        sql += where;

        dbd::Stmt stmt(conn, sql.c_str());
        const Status s = dbd::prepare_status(stmt, StatusDomain::Catalog);
        if (!is_ok(s)) {
            return s;
        }
        dbd::bind_text(stmt.get(), 1, value);

        const int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            return make_status(StatusDomain::Catalog, StatusCode::NotFound);
        }
        if (rc != SQLITE_ROW) {
            return dbd::status_from_rc(rc, StatusDomain::Catalog);
        }
        read_type(stmt.get(), out);
        return ok_status();
    }

    // Duplicate when another type already uses the name or code.
    Status check_type_unique(sqlite3* conn, TypeId self, const std::string* name, const std::string* code) noexcept {
        dbd::Stmt stmt(conn,
            "SELECT 1 FROM hardware_types WHERE id <> ?1 AND "
            "((?2 IS NOT NULL AND lower(name) = lower(?2)) OR (?3 IS NOT NULL AND upper(code) = upper(?3))) "
            "LIMIT 1");
        const Status s = dbd::prepare_status(stmt, StatusDomain::Catalog);
        if (!is_ok(s)) {
            return s;
        }
        sqlite3_bind_int64(stmt.get(), 1, self.is_valid() ? self.v : -1);
        if (name) {
            dbd::bind_text(stmt.get(), 2, *name);
        }
        if (code) {
            dbd::bind_text(stmt.get(), 3, *code);
        }

        const int rc = stmt.step();
        if (rc == SQLITE_ROW) {
            return make_status(StatusDomain::Catalog, StatusCode::Duplicate);
        }
        if (rc != SQLITE_DONE) {
            return dbd::status_from_rc(rc, StatusDomain::Catalog);
        }
        return ok_status();
    }

    [[nodiscard]] Status count_changes(sqlite3* conn) noexcept {
        return sqlite3_changes(conn) == 0
            ? make_status(StatusDomain::Catalog, StatusCode::NotFound)
            : ok_status();
    }
}

namespace detail {

Status type_load(sqlite3* conn, TypeId id, HardwareType* out) noexcept {
    if (!conn || !out || !id.is_valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    std::string sql = kTypeColumns;
    sql += "WHERE id = ?";

    dbd::Stmt stmt(conn, sql.c_str());
    const Status s = dbd::prepare_status(stmt, StatusDomain::Catalog);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt.get(), 1, id.v);

    const int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return make_status(StatusDomain::Catalog, StatusCode::NotFound);
    }
    if (rc != SQLITE_ROW) {
        return dbd::status_from_rc(rc, StatusDomain::Catalog);
    }
    read_type(stmt.get(), out);
    return ok_status();
}

Status type_code(sqlite3* conn, TypeId id, std::string* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    HardwareType t;
    const Status s = type_load(conn, id, &t);
    if (!is_ok(s)) {
        return s;
    }
    *out = std::move(t.code);
    return ok_status();
}

} // namespace detail

// ============================================================================
// Lookup
// ============================================================================

Status type_get(assetforge::db::DbHandle db, TypeId id, HardwareType* out) noexcept {
    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    return detail::type_load(guard.get(), id, out);
}

Status type_find_by_code(assetforge::db::DbHandle db, const char* code, HardwareType* out) noexcept {
    if (!code || !out) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    return find_one_by_text(guard.get(), "WHERE upper(code) = upper(?)", text::trim(code), out);
}

Status type_find_by_name(assetforge::db::DbHandle db, const char* name, HardwareType* out) noexcept {
    if (!name || !out) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    return find_one_by_text(guard.get(), "WHERE lower(name) = lower(?)", text::trim(name), out);
}

Status type_list(assetforge::db::DbHandle db, std::vector<HardwareType>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    std::string sql = kTypeColumns;
    sql += "ORDER BY id";
    dbd::Stmt stmt(guard.get(), sql.c_str());
    const Status s = dbd::prepare_status(stmt, StatusDomain::Catalog);
    if (!is_ok(s)) {
        return s;
    }

    out->clear();
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        HardwareType t;
        read_type(stmt.get(), &t);
        out->push_back(std::move(t));
    }
    if (rc != SQLITE_DONE) {
        return dbd::status_from_rc(rc, StatusDomain::Catalog);
    }
    return ok_status();
}

Status type_code(assetforge::db::DbHandle db, TypeId id, std::string* out) noexcept {
    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    return detail::type_code(guard.get(), id, out);
}

// ============================================================================
// Administration
// ============================================================================

Status type_create(assetforge::db::DbHandle db, const char* name, const char* code, TypeId* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    const std::string clean_name = text::trim(name);
    const std::string clean_code = text::trim(code);
    if (clean_name.empty() || !assetforge::identity::type_code_valid(clean_code.c_str())) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    TypeId created = TypeId::invalid();
    const Status s = dbd::run_write(guard, StatusDomain::Catalog, [&](sqlite3* conn) -> Status {
        Status st = check_type_unique(conn, TypeId::invalid(), &clean_name, &clean_code);
        if (!is_ok(st)) {
            return st;
        }

        dbd::Stmt stmt(conn, "INSERT INTO hardware_types (name, code) VALUES (?, ?)");
        st = dbd::prepare_status(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        dbd::bind_text(stmt.get(), 1, clean_name);
        dbd::bind_text(stmt.get(), 2, clean_code);
        st = dbd::step_done(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }

        created = TypeId{sqlite3_last_insert_rowid(conn)};
        return assetforge::identity::detail::serial_ensure_counter(conn, created);
    });
    if (!is_ok(s)) {
        return s;
    }

    *out = created;
    return ok_status();
}

Status type_rename(assetforge::db::DbHandle db, TypeId id, const char* name) noexcept {
    const std::string clean_name = text::trim(name);
    if (!id.is_valid() || clean_name.empty()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    return dbd::run_write(guard, StatusDomain::Catalog, [&](sqlite3* conn) -> Status {
        Status st = check_type_unique(conn, id, &clean_name, nullptr);
        if (!is_ok(st)) {
            return st;
        }
        dbd::Stmt stmt(conn, "UPDATE hardware_types SET name = ? WHERE id = ?");
        st = dbd::prepare_status(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        dbd::bind_text(stmt.get(), 1, clean_name);
        sqlite3_bind_int64(stmt.get(), 2, id.v);
        st = dbd::step_done(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        return count_changes(conn);
    });
}

Status type_set_code(assetforge::db::DbHandle db, TypeId id, const char* code) noexcept {
    const std::string clean_code = text::trim(code);
    if (!id.is_valid() || !assetforge::identity::type_code_valid(clean_code.c_str())) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    return dbd::run_write(guard, StatusDomain::Catalog, [&](sqlite3* conn) -> Status {
        HardwareType current;
        Status st = detail::type_load(conn, id, &current);
        if (!is_ok(st)) {
            return st;
        }
        if (current.code == clean_code) {
            return ok_status();
        }

        dbd::Stmt used(conn, "SELECT 1 FROM items WHERE type_id = ? LIMIT 1");
        st = dbd::prepare_status(used, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        sqlite3_bind_int64(used.get(), 1, id.v);
        const int rc = used.step();
        if (rc == SQLITE_ROW) {
            return make_status(StatusDomain::Catalog, StatusCode::Invalid);
        }
        if (rc != SQLITE_DONE) {
            return dbd::status_from_rc(rc, StatusDomain::Catalog);
        }

        st = check_type_unique(conn, id, nullptr, &clean_code);
        if (!is_ok(st)) {
            return st;
        }

        dbd::Stmt stmt(conn, "UPDATE hardware_types SET code = ? WHERE id = ?");
        st = dbd::prepare_status(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        dbd::bind_text(stmt.get(), 1, clean_code);
        sqlite3_bind_int64(stmt.get(), 2, id.v);
        return dbd::step_done(stmt, StatusDomain::Catalog);
    });
}

Status type_delete(assetforge::db::DbHandle db, TypeId id) noexcept {
    if (!id.is_valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    return dbd::run_write(guard, StatusDomain::Catalog, [&](sqlite3* conn) -> Status {
        dbd::Stmt stmt(conn, "DELETE FROM hardware_types WHERE id = ?");
        Status st = dbd::prepare_status(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        sqlite3_bind_int64(stmt.get(), 1, id.v);
        st = dbd::step_done(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        return count_changes(conn);
    });
}

} // namespace assetforge::catalog
