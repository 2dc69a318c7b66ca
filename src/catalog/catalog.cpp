#include "assetforge/catalog/catalog.hpp"
#include "core/text.hpp"
#include "db/connection.hpp"

#include <string>

namespace assetforge::catalog {

using namespace assetforge::core;
namespace dbd = assetforge::db::detail;

namespace {
    struct CatalogTable {
        CatalogKind kind;
        const char* name;
        const char* table;
        const char* columns; // id, name, parent_id, email
    };

    constexpr CatalogTable kTables[] = {
        {CatalogKind::Location, "location", "locations", "id, name, parent_id, NULL"},
        {CatalogKind::User, "user", "users", "id, name, NULL, email"},
        {CatalogKind::Group, "group", "\"groups\"", "id, name, NULL, NULL"},
        {CatalogKind::SubType, "sub_type", "sub_types", "id, name, NULL, NULL"},
    };

    [[nodiscard]] const CatalogTable* table_for(CatalogKind kind) noexcept {
        for (const CatalogTable& t : kTables) {
            if (t.kind == kind) {
                return &t;
            }
        }
        return nullptr;
    }

    void read_entry(sqlite3_stmt* stmt, CatalogKind kind, CatalogEntry* out) {
        out->id = sqlite3_column_int64(stmt, 0);
        out->kind = kind;
        out->name = dbd::column_text(stmt, 1);
        out->parent_id = sqlite3_column_type(stmt, 2) == SQLITE_NULL ? 0 : sqlite3_column_int64(stmt, 2);
        out->email = dbd::column_text(stmt, 3);
    }

    Status select_one(sqlite3* conn, const CatalogTable& t, const char* where, CatalogEntry* out,
                      const std::string* text_arg, i64 int_arg) noexcept {
        std::string sql = "SELECT ";
        sql += t.columns;
        sql += " FROM ";
        sql += t.table;
        sql += " ";
        sql += where;

        dbd::Stmt stmt(conn, sql.c_str());
        const Status s = dbd::prepare_status(stmt, StatusDomain::Catalog);
        if (!is_ok(s)) {
            return s;
        }
        if (text_arg) {
            dbd::bind_text(stmt.get(), 1, *text_arg);
        } else {
            sqlite3_bind_int64(stmt.get(), 1, int_arg);
        }

        const int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            return make_status(StatusDomain::Catalog, StatusCode::NotFound);
        }
        if (rc != SQLITE_ROW) {
            return dbd::status_from_rc(rc, StatusDomain::Catalog);
        }
        read_entry(stmt.get(), t.kind, out);
        return ok_status();
    }

    Status find_by_name(sqlite3* conn, const CatalogTable& t, const std::string& name, CatalogEntry* out) noexcept {
        return select_one(conn, t, "WHERE lower(name) = lower(?) ORDER BY id LIMIT 1", out, &name, 0);
    }

    Status name_taken(sqlite3* conn, const CatalogTable& t, const std::string& name, i64 self) noexcept {
        CatalogEntry existing;
        const Status s = find_by_name(conn, t, name, &existing);
        if (s.code == StatusCode::NotFound) {
            return ok_status();
        }
        if (!is_ok(s)) {
            return s;
        }
        if (existing.id == self) {
            return ok_status();
        }
        return make_status(StatusDomain::Catalog, StatusCode::Duplicate);
    }

    Status insert_row(sqlite3* conn, const CatalogTable& t, const std::string& name, i64* out_id) noexcept {
        std::string sql = "INSERT INTO ";
        sql += t.table;
        sql += " (name) VALUES (?)";

        dbd::Stmt stmt(conn, sql.c_str());
        Status s = dbd::prepare_status(stmt, StatusDomain::Catalog);
        if (!is_ok(s)) {
            return s;
        }
        dbd::bind_text(stmt.get(), 1, name);
        s = dbd::step_done(stmt, StatusDomain::Catalog);
        if (!is_ok(s)) {
            return s;
        }
        *out_id = sqlite3_last_insert_rowid(conn);
        return ok_status();
    }

    Status exists(sqlite3* conn, const CatalogTable& t, i64 id) noexcept {
        CatalogEntry e;
        return select_one(conn, t, "WHERE id = ?", &e, nullptr, id);
    }
}

const char* catalog_kind_name(CatalogKind kind) noexcept {
    const CatalogTable* t = table_for(kind);
    return t ? t->name : "unknown";
}

// ============================================================================
// Create / lookup
// ============================================================================

Status catalog_create(assetforge::db::DbHandle db, CatalogKind kind, const char* name, i64* out_id) noexcept {
    const CatalogTable* t = table_for(kind);
    const std::string clean = text::trim(name);
    if (!t || !out_id || clean.empty()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    i64 id = 0;
    const Status s = dbd::run_write(guard, StatusDomain::Catalog, [&](sqlite3* conn) -> Status {
        const Status st = name_taken(conn, *t, clean, 0);
        if (!is_ok(st)) {
            return st;
        }
        return insert_row(conn, *t, clean, &id);
    });
    if (!is_ok(s)) {
        return s;
    }
    *out_id = id;
    return ok_status();
}

Status catalog_ensure(assetforge::db::DbHandle db, CatalogKind kind, const char* name, i64* out_id) noexcept {
    const CatalogTable* t = table_for(kind);
    const std::string clean = text::trim(name);
    if (!t || !out_id || clean.empty()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    i64 id = 0;
    const Status s = dbd::run_write(guard, StatusDomain::Catalog, [&](sqlite3* conn) -> Status {
        CatalogEntry existing;
        const Status st = find_by_name(conn, *t, clean, &existing);
        if (is_ok(st)) {
            id = existing.id;
            return ok_status();
        }
        if (st.code != StatusCode::NotFound) {
            return st;
        }
        return insert_row(conn, *t, clean, &id);
    });
    if (!is_ok(s)) {
        return s;
    }
    *out_id = id;
    return ok_status();
}

Status catalog_find_by_name(assetforge::db::DbHandle db, CatalogKind kind, const char* name, CatalogEntry* out) noexcept {
    const CatalogTable* t = table_for(kind);
    const std::string clean = text::trim(name);
    if (!t || !out || clean.empty()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    return find_by_name(guard.get(), *t, clean, out);
}

Status catalog_get(assetforge::db::DbHandle db, CatalogKind kind, i64 id, CatalogEntry* out) noexcept {
    const CatalogTable* t = table_for(kind);
    if (!t || !out) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }
    return select_one(guard.get(), *t, "WHERE id = ?", out, nullptr, id);
}

Status catalog_list(assetforge::db::DbHandle db, CatalogKind kind, std::vector<CatalogEntry>* out) noexcept {
    const CatalogTable* t = table_for(kind);
    if (!t || !out) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += t->columns;
    sql += " FROM ";
    sql += t->table;
    sql += " ORDER BY lower(name), id";

    dbd::Stmt stmt(guard.get(), sql.c_str());
    const Status s = dbd::prepare_status(stmt, StatusDomain::Catalog);
    if (!is_ok(s)) {
        return s;
    }

    out->clear();
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        CatalogEntry e;
        read_entry(stmt.get(), kind, &e);
        out->push_back(std::move(e));
    }
    if (rc != SQLITE_DONE) {
        return dbd::status_from_rc(rc, StatusDomain::Catalog);
    }
    return ok_status();
}

// ============================================================================
// Mutation
// ============================================================================

Status catalog_rename(assetforge::db::DbHandle db, CatalogKind kind, i64 id, const char* name) noexcept {
    const CatalogTable* t = table_for(kind);
    const std::string clean = text::trim(name);
    if (!t || clean.empty()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    return dbd::run_write(guard, StatusDomain::Catalog, [&](sqlite3* conn) -> Status {
        Status st = exists(conn, *t, id);
        if (!is_ok(st)) {
            return st;
        }
        st = name_taken(conn, *t, clean, id);
        if (!is_ok(st)) {
            return st;
        }

        std::string sql = "UPDATE ";
        sql += t->table;
        sql += " SET name = ? WHERE id = ?";
        dbd::Stmt stmt(conn, sql.c_str());
        st = dbd::prepare_status(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        dbd::bind_text(stmt.get(), 1, clean);
        sqlite3_bind_int64(stmt.get(), 2, id);
        return dbd::step_done(stmt, StatusDomain::Catalog);
    });
}

Status catalog_delete(assetforge::db::DbHandle db, CatalogKind kind, i64 id) noexcept {
    const CatalogTable* t = table_for(kind);
    if (!t) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    return dbd::run_write(guard, StatusDomain::Catalog, [&](sqlite3* conn) -> Status {
        std::string sql = "DELETE FROM ";
        sql += t->table;
        sql += " WHERE id = ?";
        dbd::Stmt stmt(conn, sql.c_str());
        Status st = dbd::prepare_status(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        sqlite3_bind_int64(stmt.get(), 1, id);
        st = dbd::step_done(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        if (sqlite3_changes(conn) == 0) {
            return make_status(StatusDomain::Catalog, StatusCode::NotFound);
        }
        return ok_status();
    });
}

Status user_set_email(assetforge::db::DbHandle db, i64 user_id, const char* email) noexcept {
    const std::string clean = text::trim(email);

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    return dbd::run_write(guard, StatusDomain::Catalog, [&](sqlite3* conn) -> Status {
        dbd::Stmt stmt(conn, "UPDATE users SET email = ? WHERE id = ?");
        Status st = dbd::prepare_status(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        dbd::bind_optional_text(stmt.get(), 1, clean);
        sqlite3_bind_int64(stmt.get(), 2, user_id);
        st = dbd::step_done(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        if (sqlite3_changes(conn) == 0) {
            return make_status(StatusDomain::Catalog, StatusCode::NotFound);
        }
        return ok_status();
    });
}

Status location_set_parent(assetforge::db::DbHandle db, i64 location_id, i64 parent_id) noexcept {
    if (parent_id == location_id) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Catalog, StatusCode::Invalid);
    }

    const CatalogTable& locations = *table_for(CatalogKind::Location);
    return dbd::run_write(guard, StatusDomain::Catalog, [&](sqlite3* conn) -> Status {
        Status st = exists(conn, locations, location_id);
        if (!is_ok(st)) {
            return st;
        }

        if (parent_id != 0) {
            st = exists(conn, locations, parent_id);
            if (!is_ok(st)) {
                return st;
            }

            // walk up from the new parent; meeting the location means a cycle
            dbd::Stmt walk(conn,
                "WITH RECURSIVE up(id) AS ("
                "  SELECT ?1 "
                "  UNION "
                "  SELECT l.parent_id FROM locations l JOIN up ON l.id = up.id WHERE l.parent_id IS NOT NULL"
                ") SELECT 1 FROM up WHERE id = ?2 LIMIT 1");
            st = dbd::prepare_status(walk, StatusDomain::Catalog);
            if (!is_ok(st)) {
                return st;
            }
            sqlite3_bind_int64(walk.get(), 1, parent_id);
            sqlite3_bind_int64(walk.get(), 2, location_id);
            const int rc = walk.step();
            if (rc == SQLITE_ROW) {
                return make_status(StatusDomain::Catalog, StatusCode::Invalid);
            }
            if (rc != SQLITE_DONE) {
                return dbd::status_from_rc(rc, StatusDomain::Catalog);
            }
        }

        dbd::Stmt stmt(conn, "UPDATE locations SET parent_id = ? WHERE id = ?");
        st = dbd::prepare_status(stmt, StatusDomain::Catalog);
        if (!is_ok(st)) {
            return st;
        }
        if (parent_id == 0) {
            sqlite3_bind_null(stmt.get(), 1);
        } else {
            sqlite3_bind_int64(stmt.get(), 1, parent_id);
        }
        sqlite3_bind_int64(stmt.get(), 2, location_id);
        return dbd::step_done(stmt, StatusDomain::Catalog);
    });
}

} // namespace assetforge::catalog
