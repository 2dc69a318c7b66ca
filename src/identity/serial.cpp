#include "assetforge/identity/serial.hpp"
#include "identity/serial_internal.hpp"
#include "db/connection.hpp"

namespace assetforge::identity {

using namespace assetforge::core;
namespace dbd = assetforge::db::detail;

namespace detail {

Status serial_ensure_counter(sqlite3* conn, TypeId type) noexcept {
    dbd::Stmt stmt(conn,
        "INSERT INTO type_counters (type_id, next_serial) "
        "SELECT ?1, COALESCE((SELECT MAX(type_serial) FROM items WHERE type_id = ?1), 0) + 1 "
        "WHERE NOT EXISTS (SELECT 1 FROM type_counters WHERE type_id = ?1)");
    Status s = dbd::prepare_status(stmt, StatusDomain::Identity);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt.get(), 1, type.v);
    return dbd::step_done(stmt, StatusDomain::Identity);
}

Status serial_allocate(sqlite3* conn, TypeId type, i64* out) noexcept {
    if (!conn || !out || !type.is_valid()) {
        return make_status(StatusDomain::Identity, StatusCode::Invalid);
    }

    Status s = serial_ensure_counter(conn, type);
    if (!is_ok(s)) {
        return s;
    }

    dbd::Stmt stmt(conn,
        "UPDATE type_counters SET next_serial = next_serial + 1 "
        "WHERE type_id = ? RETURNING next_serial - 1");
    s = dbd::prepare_status(stmt, StatusDomain::Identity);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt.get(), 1, type.v);

    const int rc = stmt.step();
    if (rc != SQLITE_ROW) {
        return rc == SQLITE_DONE
            ? make_status(StatusDomain::Identity, StatusCode::NotFound)
            : dbd::status_from_rc(rc, StatusDomain::Identity);
    }
    const i64 serial = sqlite3_column_int64(stmt.get(), 0);
    // drain RETURNING so the update is complete before the statement resets
    const int done = stmt.step();
    if (done != SQLITE_DONE) {
        return dbd::status_from_rc(done, StatusDomain::Identity);
    }
    if (serial < 1) {
        return make_status(StatusDomain::Identity, StatusCode::Corrupt);
    }

    *out = serial;
    return ok_status();
}

Status serial_reserve(sqlite3* conn, TypeId type, i64 serial) noexcept {
    if (!conn || !type.is_valid() || serial < 1) {
        return make_status(StatusDomain::Identity, StatusCode::Invalid);
    }

    Status s = serial_ensure_counter(conn, type);
    if (!is_ok(s)) {
        return s;
    }

    dbd::Stmt stmt(conn,
        "UPDATE type_counters SET next_serial = ?2 + 1 "
        "WHERE type_id = ?1 AND next_serial <= ?2");
    s = dbd::prepare_status(stmt, StatusDomain::Identity);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt.get(), 1, type.v);
    sqlite3_bind_int64(stmt.get(), 2, serial);
    return dbd::step_done(stmt, StatusDomain::Identity);
}

} // namespace detail

Status serial_peek(assetforge::db::DbHandle db, TypeId type, i64* out) noexcept {
    if (!out || !type.is_valid()) {
        return make_status(StatusDomain::Identity, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Identity, StatusCode::Invalid);
    }

    dbd::Stmt stmt(guard.get(),
        "SELECT COALESCE("
        "  (SELECT next_serial FROM type_counters WHERE type_id = ?1),"
        "  (SELECT COALESCE(MAX(type_serial), 0) + 1 FROM items WHERE type_id = ?1)) "
        "FROM hardware_types WHERE id = ?1");
    const Status s = dbd::prepare_status(stmt, StatusDomain::Identity);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt.get(), 1, type.v);

    const int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return make_status(StatusDomain::Identity, StatusCode::NotFound);
    }
    if (rc != SQLITE_ROW) {
        return dbd::status_from_rc(rc, StatusDomain::Identity);
    }

    *out = sqlite3_column_int64(stmt.get(), 0);
    return ok_status();
}

} // namespace assetforge::identity
