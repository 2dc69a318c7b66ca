#include "migrate/steps.hpp"
#include "db/connection.hpp"

#include <string>

namespace assetforge::migrate::detail {

using namespace assetforge::core;
namespace dbd = assetforge::db::detail;

namespace {
    constexpr const char* kItemsTable =
        "CREATE TABLE items ("
        "  id INTEGER PRIMARY KEY,"
        "  name TEXT NOT NULL,"
        "  model TEXT,"
        "  type_id INTEGER NOT NULL REFERENCES hardware_types(id) ON DELETE CASCADE,"
        "  mac_address TEXT,"
        "  ip_address TEXT,"
        "  location_id INTEGER REFERENCES locations(id) ON DELETE SET NULL,"
        "  user_id INTEGER REFERENCES users(id) ON DELETE SET NULL,"
        "  group_id INTEGER REFERENCES \"groups\"(id) ON DELETE SET NULL,"
        "  sub_type_id INTEGER REFERENCES sub_types(id) ON DELETE SET NULL,"
        "  notes TEXT,"
        "  asset_tag TEXT,"
        "  created_at_utc TEXT NOT NULL,"
        "  updated_at_utc TEXT NOT NULL,"
        "  archived INTEGER NOT NULL DEFAULT 0);"
        "CREATE INDEX idx_items_type ON items(type_id);";

    // Lives for this transaction only. A per-type row keeps its master's id
    // when it is the first row claiming an existing master; every other row
    // gets a fresh id above all master ids.
    constexpr const char* kMapTable =
        "CREATE TEMP TABLE legacy_item_map ("
        "  old_id INTEGER NOT NULL,"
        "  type_id INTEGER NOT NULL,"
        "  new_id INTEGER UNIQUE,"
        "  master_id INTEGER,"
        "  PRIMARY KEY (old_id, type_id));";

    constexpr const char* kClaimMasters =
        "UPDATE temp.legacy_item_map SET new_id = master_id "
        "WHERE master_id IN (SELECT master_id FROM main.master_list) "
        "  AND rowid = (SELECT MIN(m2.rowid) FROM temp.legacy_item_map m2 "
        "               WHERE m2.master_id = legacy_item_map.master_id);";

    // Numbered up front: the UPDATE below changes the set it ranks.
    constexpr const char* kRankFresh =
        "CREATE TEMP TABLE fresh_ids AS "
        "SELECT rowid AS map_row, ROW_NUMBER() OVER (ORDER BY type_id, old_id) AS rn "
        "FROM temp.legacy_item_map WHERE new_id IS NULL;";

    constexpr const char* kFreshIds =
        "UPDATE temp.legacy_item_map SET new_id = ?1 + "
        "  (SELECT rn FROM temp.fresh_ids WHERE map_row = legacy_item_map.rowid) "
        "WHERE new_id IS NULL;";

    // Resolution chain for each legacy entry: the item_index row naming a
    // per-type row, then a master id that survived as an item id, then an id
    // already present in items.
    constexpr const char* kResolveAudit =
        "CREATE TEMP TABLE audit_resolution AS "
        "SELECT u.id AS update_id, COALESCE("
        "  (SELECT m.new_id FROM main.item_index ix "
        "     JOIN temp.legacy_item_map m ON m.old_id = ix.id AND m.type_id = ix.type_id "
        "    WHERE ix.id = u.item_id),"
        "  (SELECT m.new_id FROM temp.legacy_item_map m "
        "    WHERE m.master_id = u.item_id AND m.new_id = m.master_id),"
        "  (SELECT i.id FROM main.items i WHERE i.id = u.item_id)) AS item_id "
        "FROM main.item_updates u;";

    constexpr const char* kRepointAudit =
        "CREATE TABLE item_updates_new ("
        "  id INTEGER PRIMARY KEY,"
        "  item_id INTEGER NOT NULL REFERENCES items(id) ON DELETE CASCADE,"
        "  reason TEXT NOT NULL,"
        "  note TEXT,"
        "  changed_fields TEXT,"
        "  snapshot_before_json TEXT,"
        "  snapshot_after_json TEXT,"
        "  created_at_utc TEXT NOT NULL);"
        "INSERT INTO item_updates_new (id, item_id, reason, note, changed_fields, snapshot_before_json,"
        "                              snapshot_after_json, created_at_utc) "
        "SELECT u.id, r.item_id, lower(trim(u.reason)), u.note, u.changed_fields, u.snapshot_before_json,"
        "       u.snapshot_after_json, u.created_at_utc "
        "FROM main.item_updates u JOIN temp.audit_resolution r ON r.update_id = u.id;"
        "DROP TABLE item_updates;"
        "ALTER TABLE item_updates_new RENAME TO item_updates;"
        "CREATE INDEX idx_item_updates_item ON item_updates(item_id, created_at_utc);";

    [[nodiscard]] std::string legacy_rows_union() {
        std::string sql;
        for (const LegacyTable& t : kLegacyTables) {
            if (!sql.empty()) {
                sql += " UNION ALL ";
            }
            sql += "SELECT id, ";
            sql += std::to_string(t.type_id);
            sql += ", master_id FROM main.";
            sql += t.table;
        }
        return sql;
    }

    Status copy_table_rows(sqlite3* conn, const LegacyTable& t) noexcept {
        const std::string type = std::to_string(t.type_id);
        std::string sql =
            "INSERT INTO items (id, name, model, type_id, mac_address, ip_address, location_id, user_id,"
            "                   group_id, sub_type_id, notes, asset_tag, created_at_utc, updated_at_utc, archived) "
            "SELECT m.new_id, r.name, r.model, ";
        sql += type;
        sql +=
            ", r.mac_address, r.ip_address, r.location_id, r.user_id, r.group_id, r.sub_type_id, r.notes,"
            "  r.asset_tag, r.created_at_utc, r.updated_at_utc, COALESCE(ml.archived, 0) "
            "FROM main.";
        sql += t.table;
        sql +=
            " r JOIN temp.legacy_item_map m ON m.old_id = r.id AND m.type_id = ";
        sql += type;
        sql += " LEFT JOIN main.master_list ml ON ml.master_id = m.new_id AND m.new_id = r.master_id;";
        return script(conn, sql);
    }

    // Masters no per-type row claimed: rows the legacy delete and archive
    // paths left behind. They keep their master id.
    constexpr const char* kCopyUnclaimedMasters =
        "INSERT INTO items (id, name, model, type_id, mac_address, ip_address, location_id, user_id,"
        "                   group_id, sub_type_id, notes, asset_tag, created_at_utc, updated_at_utc, archived) "
        "SELECT ml.master_id, ml.name, ml.model, ml.type_id, ml.mac_address, ml.ip_address, ml.location_id,"
        "       ml.user_id, ml.group_id, ml.sub_type_id, ml.notes, ml.asset_tag, ml.created_at_utc,"
        "       ml.updated_at_utc, ml.archived "
        "FROM main.master_list ml "
        "WHERE NOT EXISTS (SELECT 1 FROM temp.legacy_item_map m WHERE m.new_id = ml.master_id);";

    Status fail(Status s) noexcept {
        return is_ok(s) ? make_status(StatusDomain::Migration, StatusCode::Corrupt) : s;
    }
}

Status step_consolidate_items(sqlite3* conn) noexcept {
    i64 legacy_rows = 0;
    {
        std::string count = "SELECT COUNT(*) FROM (";
        count += legacy_rows_union();
        count += ")";
        const Status s = scalar(conn, count, &legacy_rows);
        if (!is_ok(s)) {
            return s;
        }
    }

    Status s = script(conn, kItemsTable);
    if (!is_ok(s)) {
        return s;
    }
    s = script(conn, kMapTable);
    if (!is_ok(s)) {
        return s;
    }
    {
        std::string fill = "INSERT INTO temp.legacy_item_map (old_id, type_id, master_id) ";
        fill += legacy_rows_union();
        fill += " ORDER BY 2, 1";
        s = script(conn, fill);
        if (!is_ok(s)) {
            return s;
        }
    }
    s = script(conn, kClaimMasters);
    if (!is_ok(s)) {
        return s;
    }

    i64 base = 0;
    s = scalar(conn,
        "SELECT MAX(COALESCE((SELECT MAX(master_id) FROM main.master_list), 0),"
        "           COALESCE((SELECT MAX(new_id) FROM temp.legacy_item_map), 0))", &base);
    if (!is_ok(s)) {
        return s;
    }
    s = script(conn, kRankFresh);
    if (!is_ok(s)) {
        return s;
    }
    {
        dbd::Stmt stmt(conn, kFreshIds);
        s = dbd::prepare_status(stmt, StatusDomain::Migration);
        if (!is_ok(s)) {
            return s;
        }
        sqlite3_bind_int64(stmt.get(), 1, base);
        s = dbd::step_done(stmt, StatusDomain::Migration);
        if (!is_ok(s)) {
            return s;
        }
    }

    for (const LegacyTable& t : kLegacyTables) {
        s = copy_table_rows(conn, t);
        if (!is_ok(s)) {
            return s;
        }
    }

    i64 unclaimed = 0;
    s = scalar(conn,
        "SELECT COUNT(*) FROM main.master_list ml "
        "WHERE NOT EXISTS (SELECT 1 FROM temp.legacy_item_map m WHERE m.new_id = ml.master_id)", &unclaimed);
    if (!is_ok(s)) {
        return s;
    }
    s = script(conn, kCopyUnclaimedMasters);
    if (!is_ok(s)) {
        return s;
    }

    // every per-type row and every unclaimed master must land exactly once
    i64 items = 0;
    s = scalar(conn, "SELECT COUNT(*) FROM items", &items);
    if (!is_ok(s) || items != legacy_rows + unclaimed) {
        return fail(s);
    }

    s = script(conn, kResolveAudit);
    if (!is_ok(s)) {
        return s;
    }
    i64 unresolved = 0;
    s = scalar(conn, "SELECT COUNT(*) FROM temp.audit_resolution WHERE item_id IS NULL", &unresolved);
    if (!is_ok(s) || unresolved != 0) {
        return fail(s);
    }
    s = script(conn, kRepointAudit);
    if (!is_ok(s)) {
        return s;
    }

    std::string drops = "DROP TABLE temp.audit_resolution; DROP TABLE temp.fresh_ids; DROP TABLE temp.legacy_item_map;"
                        "DROP TABLE item_index; DROP TABLE master_list;";
    for (const LegacyTable& t : kLegacyTables) {
        drops += "DROP TABLE ";
        drops += t.table;
        drops += ";";
    }
    return script(conn, drops);
}

} // namespace assetforge::migrate::detail
