#include "migrate/steps.hpp"

#include <string>

namespace assetforge::migrate::detail {

using namespace assetforge::core;

namespace {
    constexpr const char* kReferenceTables =
        "CREATE TABLE hardware_types ("
        "  id INTEGER PRIMARY KEY,"
        "  name TEXT NOT NULL UNIQUE,"
        "  code TEXT NOT NULL UNIQUE);"
        "CREATE TABLE locations ("
        "  id INTEGER PRIMARY KEY,"
        "  name TEXT NOT NULL,"
        "  parent_id INTEGER REFERENCES locations(id) ON DELETE SET NULL);"
        "CREATE TABLE users ("
        "  id INTEGER PRIMARY KEY,"
        "  name TEXT NOT NULL,"
        "  email TEXT);"
        "CREATE TABLE \"groups\" ("
        "  id INTEGER PRIMARY KEY,"
        "  name TEXT NOT NULL UNIQUE);"
        "CREATE TABLE sub_types ("
        "  id INTEGER PRIMARY KEY,"
        "  name TEXT NOT NULL UNIQUE);";

    // Type ids are fixed: the per-type tables are bound to them.
    constexpr const char* kSeed =
        "INSERT INTO hardware_types (id, name, code) VALUES"
        "  (1, 'Laptops/PCs', 'PC'),"
        "  (2, 'Network Gear', 'NX'),"
        "  (3, 'Landline Phones', 'TP'),"
        "  (4, 'Printers', 'PX'),"
        "  (5, 'Payment Terminals', 'CC'),"
        "  (6, 'Lorex Cameras', 'LX'),"
        "  (7, 'Eufy Cameras', 'EX'),"
        "  (8, 'Periperal Devices', 'PD'),"
        "  (9, 'Access Points', 'AP'),"
        "  (10, 'Misc', 'MX');"
        "INSERT INTO sub_types (name) VALUES"
        "  ('Laptop'), ('Desktop'), ('Switch'), ('Router'), ('Printer'), ('Landline'),"
        "  ('Card Reader'), ('Camera'), ('Monitor'), ('Access Point');";

    // Columns shared by every per-type table and master_list.
    [[nodiscard]] std::string item_columns(i64 type_id) {
        std::string cols =
            "  name TEXT NOT NULL,"
            "  model TEXT,"
            "  type_id INTEGER NOT NULL DEFAULT ";
        cols += std::to_string(type_id);
        cols +=
            " REFERENCES hardware_types(id),"
            "  mac_address TEXT,"
            "  ip_address TEXT,"
            "  location_id INTEGER REFERENCES locations(id) ON DELETE SET NULL,"
            "  user_id INTEGER REFERENCES users(id) ON DELETE SET NULL,"
            "  group_id INTEGER REFERENCES \"groups\"(id) ON DELETE SET NULL,"
            "  sub_type_id INTEGER REFERENCES sub_types(id) ON DELETE SET NULL,"
            "  notes TEXT,"
            "  created_at_utc TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%SZ','now')),"
            "  updated_at_utc TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%SZ','now')),"
            "  asset_tag TEXT";
        return cols;
    }
}

Status step_legacy_baseline(sqlite3* conn) noexcept {
    Status s = script(conn, kReferenceTables);
    if (!is_ok(s)) {
        return s;
    }
    s = script(conn, kSeed);
    if (!is_ok(s)) {
        return s;
    }

    std::string ddl;
    for (const LegacyTable& t : kLegacyTables) {
        ddl += "CREATE TABLE ";
        ddl += t.table;
        ddl += " (id INTEGER PRIMARY KEY,";
        ddl += item_columns(t.type_id);
        ddl += ", master_id INTEGER);";
    }
    ddl += "CREATE TABLE master_list (master_id INTEGER PRIMARY KEY,";
    ddl += item_columns(10);
    ddl += ", archived INTEGER NOT NULL DEFAULT 0);";

    // item_index.id is the id a legacy audit entry recorded; it names the
    // per-type row (id, type_id) the entry was about.
    ddl +=
        "CREATE TABLE item_index ("
        "  id INTEGER PRIMARY KEY,"
        "  type_id INTEGER NOT NULL,"
        "  created_at_utc TEXT);"
        "CREATE TABLE item_updates ("
        "  id INTEGER PRIMARY KEY,"
        "  item_id INTEGER NOT NULL,"
        "  reason TEXT NOT NULL,"
        "  note TEXT,"
        "  changed_fields TEXT,"
        "  snapshot_before_json TEXT,"
        "  snapshot_after_json TEXT,"
        "  created_at_utc TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%SZ','now')));";
    return script(conn, ddl);
}

} // namespace assetforge::migrate::detail
