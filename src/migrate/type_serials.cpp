#include "migrate/steps.hpp"

#include <string>

namespace assetforge::migrate::detail {

using namespace assetforge::core;

namespace {
    struct Catalog {
        const char* table;       // quoted where needed
        const char* index_name;
        const char* item_column;
    };

    constexpr Catalog kCatalogs[] = {
        {"locations", "ux_locations_name", "location_id"},
        {"users", "ux_users_name", "user_id"},
        {"\"groups\"", "ux_groups_name", "group_id"},
        {"sub_types", "ux_sub_types_name", "sub_type_id"},
    };

    // Collapses rows whose names collide ignoring case and surrounding
    // whitespace onto the lowest id. References are moved to the kept row
    // before the duplicates go, so no item silently loses a reference.
    Status dedupe_catalog(sqlite3* conn, const Catalog& c) noexcept {
        const std::string table = c.table;
        const std::string column = c.item_column;

        std::string sql =
            "CREATE TEMP TABLE catalog_remap AS "
            "SELECT d.id AS old_id, k.keep_id AS keep_id FROM " + table + " d "
            "JOIN (SELECT lower(trim(name)) AS norm, MIN(id) AS keep_id FROM " + table +
            "      GROUP BY lower(trim(name))) k ON k.norm = lower(trim(d.name)) "
            "WHERE d.id <> k.keep_id;"
            "UPDATE items SET " + column + " = (SELECT keep_id FROM temp.catalog_remap WHERE old_id = items." + column + ") "
            "WHERE " + column + " IN (SELECT old_id FROM temp.catalog_remap);";
        if (table == "locations") {
            sql +=
                "UPDATE locations SET parent_id = (SELECT keep_id FROM temp.catalog_remap WHERE old_id = locations.parent_id) "
                "WHERE parent_id IN (SELECT old_id FROM temp.catalog_remap);"
                "UPDATE locations SET parent_id = NULL WHERE parent_id = id;";
        }
        sql +=
            "DELETE FROM " + table + " WHERE id IN (SELECT old_id FROM temp.catalog_remap);"
            "UPDATE " + table + " SET name = trim(name) WHERE name <> trim(name);"
            "DROP TABLE temp.catalog_remap;"
            "CREATE UNIQUE INDEX " + std::string(c.index_name) + " ON " + table + "(lower(name));";
        return script(conn, sql);
    }

    // Serials follow creation order within each type; julianday() keeps
    // mixed-precision timestamps ordered chronologically.
    constexpr const char* kRebuildItems =
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
        "  created_at_utc TEXT NOT NULL,"
        "  updated_at_utc TEXT NOT NULL,"
        "  archived INTEGER NOT NULL DEFAULT 0);"
        "INSERT INTO items_new (id, name, model, type_id, type_serial, asset_tag, mac_address, ip_address,"
        "                       location_id, user_id, group_id, sub_type_id, notes, created_at_utc,"
        "                       updated_at_utc, archived) "
        "SELECT i.id, trim(i.name), NULLIF(trim(i.model), ''), i.type_id, r.rn,"
        "       'SDMM-' || ht.code || '-' || printf('%04d', r.rn),"
        "       upper(NULLIF(trim(i.mac_address), '')), NULLIF(trim(i.ip_address), ''),"
        "       i.location_id, i.user_id, i.group_id, i.sub_type_id, NULLIF(trim(i.notes), ''),"
        "       i.created_at_utc, i.updated_at_utc, i.archived "
        "FROM items i "
        "JOIN hardware_types ht ON ht.id = i.type_id "
        "JOIN (SELECT id, ROW_NUMBER() OVER (PARTITION BY type_id "
        "                                    ORDER BY julianday(created_at_utc), id) AS rn "
        "      FROM items) r ON r.id = i.id;";

    constexpr const char* kCounters =
        "CREATE TABLE type_counters ("
        "  type_id INTEGER PRIMARY KEY REFERENCES hardware_types(id) ON DELETE CASCADE,"
        "  next_serial INTEGER NOT NULL CHECK (next_serial >= 1));"
        "INSERT INTO type_counters (type_id, next_serial) "
        "SELECT ht.id, COALESCE(MAX(i.type_serial), 0) + 1 "
        "FROM hardware_types ht LEFT JOIN items i ON i.type_id = ht.id GROUP BY ht.id;";
}

Status step_type_serials(sqlite3* conn) noexcept {
    for (const Catalog& c : kCatalogs) {
        const Status s = dedupe_catalog(conn, c);
        if (!is_ok(s)) {
            return s;
        }
    }

    i64 before = 0;
    Status s = scalar(conn, "SELECT COUNT(*) FROM items", &before);
    if (!is_ok(s)) {
        return s;
    }
    s = script(conn, kRebuildItems);
    if (!is_ok(s)) {
        return s;
    }
    // an item whose type row is gone would be dropped by the join
    i64 after = 0;
    s = scalar(conn, "SELECT COUNT(*) FROM items_new", &after);
    if (!is_ok(s)) {
        return s;
    }
    if (after != before) {
        return make_status(StatusDomain::Migration, StatusCode::Corrupt);
    }

    s = script(conn, "DROP TABLE items; ALTER TABLE items_new RENAME TO items;");
    if (!is_ok(s)) {
        return s;
    }
    s = create_item_indexes(conn);
    if (!is_ok(s)) {
        return s;
    }
    return script(conn, kCounters);
}

} // namespace assetforge::migrate::detail
