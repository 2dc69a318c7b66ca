#include "migrate/steps.hpp"
#include "db/connection.hpp"

namespace assetforge::migrate::detail {

using namespace assetforge::core;
namespace dbd = assetforge::db::detail;

Status script(sqlite3* conn, const char* sql) noexcept {
    return dbd::exec(conn, sql, StatusDomain::Migration);
}

Status script(sqlite3* conn, const std::string& sql) noexcept {
    return dbd::exec(conn, sql.c_str(), StatusDomain::Migration);
}

Status scalar(sqlite3* conn, const char* sql, i64* out) noexcept {
    if (!conn || !sql || !out) {
        return make_status(StatusDomain::Migration, StatusCode::Invalid);
    }
    dbd::Stmt stmt(conn, sql);
    const Status s = dbd::prepare_status(stmt, StatusDomain::Migration);
    if (!is_ok(s)) {
        return s;
    }
    const int rc = stmt.step();
    if (rc != SQLITE_ROW) {
        return rc == SQLITE_DONE
            ? make_status(StatusDomain::Migration, StatusCode::Corrupt)
            : dbd::status_from_rc(rc, StatusDomain::Migration);
    }
    *out = sqlite3_column_int64(stmt.get(), 0);
    return ok_status();
}

Status scalar(sqlite3* conn, const std::string& sql, i64* out) noexcept {
    return scalar(conn, sql.c_str(), out);
}

Status create_item_indexes(sqlite3* conn) noexcept {
    return script(conn,
        "CREATE INDEX idx_items_type ON items(type_id);"
        "CREATE INDEX idx_items_location ON items(location_id);"
        "CREATE INDEX idx_items_user ON items(user_id);"
        "CREATE INDEX idx_items_group ON items(group_id);"
        "CREATE INDEX idx_items_sub_type ON items(sub_type_id);"
        "CREATE UNIQUE INDEX ux_items_mac_lower ON items(lower(mac_address)) WHERE mac_address IS NOT NULL;"
        "CREATE UNIQUE INDEX ux_items_ip_addr ON items(ip_address) WHERE ip_address IS NOT NULL;"
        "CREATE UNIQUE INDEX ux_items_asset_tag ON items(asset_tag);"
        "CREATE UNIQUE INDEX ux_items_type_serial ON items(type_id, type_serial);");
}

} // namespace assetforge::migrate::detail
