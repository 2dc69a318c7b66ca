#include "migrate/steps.hpp"
#include "assetforge/db/schema.hpp"

#include <string>

namespace assetforge::migrate::detail {

using namespace assetforge::core;

namespace {
    [[nodiscard]] std::string rebuild_sql() {
        const std::string landline = std::to_string(assetforge::db::kLandlineTypeId.v);
        return
            "CREATE TABLE items_new ("
            "  id INTEGER PRIMARY KEY,"
            "  name TEXT NOT NULL,"
            "  model TEXT,"
            "  type_id INTEGER NOT NULL REFERENCES hardware_types(id) ON DELETE CASCADE,"
            "  type_serial INTEGER NOT NULL CHECK (type_serial >= 1),"
            "  asset_tag TEXT NOT NULL,"
            "  mac_address TEXT,"
            "  ip_address TEXT,"
            "  location_id INTEGER REFERENCES locations(id) ON DELETE SET NULL,"
            "  user_id INTEGER REFERENCES users(id) ON DELETE SET NULL,"
            "  group_id INTEGER REFERENCES \"groups\"(id) ON DELETE SET NULL,"
            "  sub_type_id INTEGER REFERENCES sub_types(id) ON DELETE SET NULL,"
            "  notes TEXT,"
            "  extension TEXT CHECK (extension IS NULL OR type_id = " + landline + "),"
            "  created_at_utc TEXT NOT NULL,"
            "  updated_at_utc TEXT NOT NULL,"
            "  archived INTEGER NOT NULL DEFAULT 0);"
            "INSERT INTO items_new (id, name, model, type_id, type_serial, asset_tag, mac_address, ip_address,"
            "                       location_id, user_id, group_id, sub_type_id, notes, extension,"
            "                       created_at_utc, updated_at_utc, archived) "
            "SELECT id, name, model, type_id, type_serial, asset_tag, mac_address, ip_address,"
            "       location_id, user_id, group_id, sub_type_id, notes, NULL,"
            "       created_at_utc, updated_at_utc, archived "
            "FROM items;"
            "UPDATE items_new SET extension = NULL WHERE type_id <> " + landline + ";"
            "DROP TABLE items;"
            "ALTER TABLE items_new RENAME TO items;";
    }
}

Status step_landline_extension(sqlite3* conn) noexcept {
    i64 before = 0;
    Status s = scalar(conn, "SELECT COUNT(*) FROM items", &before);
    if (!is_ok(s)) {
        return s;
    }
    s = script(conn, rebuild_sql());
    if (!is_ok(s)) {
        return s;
    }
    s = create_item_indexes(conn);
    if (!is_ok(s)) {
        return s;
    }

    i64 after = 0;
    s = scalar(conn, "SELECT COUNT(*) FROM items", &after);
    if (!is_ok(s)) {
        return s;
    }
    i64 stray = 0;
    std::string check = "SELECT COUNT(*) FROM items WHERE extension IS NOT NULL AND type_id <> ";
    check += std::to_string(assetforge::db::kLandlineTypeId.v);
    s = scalar(conn, check, &stray);
    if (!is_ok(s)) {
        return s;
    }
    if (after != before || stray != 0) {
        return make_status(StatusDomain::Migration, StatusCode::Corrupt);
    }
    return ok_status();
}

} // namespace assetforge::migrate::detail
