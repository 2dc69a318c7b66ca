#include "assetforge/items/attributes.hpp"
#include "assetforge/core/clock.hpp"
#include "audit/audit_internal.hpp"
#include "core/text.hpp"
#include "db/connection.hpp"

#include <optional>
#include <utility>

#include <nlohmann/json.hpp>

namespace assetforge::items {

using namespace assetforge::core;
namespace dbd = assetforge::db::detail;

namespace {
    [[nodiscard]] std::string attribute_snapshot(const std::string& key, const std::string& value) {
        nlohmann::json j = nlohmann::json::object();
        j["key"] = key;
        j["value"] = value;
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    Status item_exists(sqlite3* conn, ItemId item) noexcept {
        dbd::Stmt stmt(conn, "SELECT 1 FROM items WHERE id = ?");
        const Status s = dbd::prepare_status(stmt, StatusDomain::Items);
        if (!is_ok(s)) {
            return s;
        }
        sqlite3_bind_int64(stmt.get(), 1, item.v);
        const int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            return make_status(StatusDomain::Items, StatusCode::NotFound);
        }
        if (rc != SQLITE_ROW) {
            return dbd::status_from_rc(rc, StatusDomain::Items);
        }
        return ok_status();
    }

    // Current value of the key, or nullopt when the item does not have it.
    Status current_value(sqlite3* conn, ItemId item, const std::string& key, std::optional<std::string>* out) noexcept {
        dbd::Stmt stmt(conn, "SELECT value FROM item_attributes WHERE item_id = ? AND key = ?");
        const Status s = dbd::prepare_status(stmt, StatusDomain::Items);
        if (!is_ok(s)) {
            return s;
        }
        sqlite3_bind_int64(stmt.get(), 1, item.v);
        dbd::bind_text(stmt.get(), 2, key);

        const int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            out->reset();
            return ok_status();
        }
        if (rc != SQLITE_ROW) {
            return dbd::status_from_rc(rc, StatusDomain::Items);
        }
        *out = dbd::column_text(stmt.get(), 0);
        return ok_status();
    }

    // An attribute change is a change to the item: it refreshes updated_at
    // and records one audit entry.
    Status record(sqlite3* conn,
                  ItemId item,
                  AuditReason reason,
                  const std::string& key,
                  const std::string& note,
                  const std::string& now,
                  std::string before,
                  std::string after) noexcept {
        dbd::Stmt stmt(conn, "UPDATE items SET updated_at_utc = ? WHERE id = ?");
        Status st = dbd::prepare_status(stmt, StatusDomain::Items);
        if (!is_ok(st)) {
            return st;
        }
        dbd::bind_text(stmt.get(), 1, now);
        sqlite3_bind_int64(stmt.get(), 2, item.v);
        st = dbd::step_done(stmt, StatusDomain::Items);
        if (!is_ok(st)) {
            return st;
        }

        assetforge::audit::detail::AuditAppend entry;
        entry.item = item;
        entry.reason = reason;
        entry.note = note;
        entry.changed_fields = {"attr:" + key};
        entry.snapshot_before = std::move(before);
        entry.snapshot_after = std::move(after);
        return assetforge::audit::detail::audit_append(conn, entry, nullptr);
    }
}

Status attribute_set(assetforge::db::DbHandle db, ItemId item, const char* key, const char* value, const char* note) noexcept {
    const std::string k = text::trim(key);
    if (!item.is_valid() || k.empty()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    const std::string v = value ? std::string(value) : std::string();
    const std::string note_value = text::trim(note);

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    return dbd::run_write(guard, StatusDomain::Items, [&](sqlite3* conn) -> Status {
        Status st = item_exists(conn, item);
        if (!is_ok(st)) {
            return st;
        }
        std::optional<std::string> existing;
        st = current_value(conn, item, k, &existing);
        if (!is_ok(st)) {
            return st;
        }
        if (existing && *existing == v) {
            return ok_status();
        }

        const std::string now = now_utc_iso();
        if (existing) {
            dbd::Stmt stmt(conn, "UPDATE item_attributes SET value = ?, updated_at_utc = ? WHERE item_id = ? AND key = ?");
            st = dbd::prepare_status(stmt, StatusDomain::Items);
            if (!is_ok(st)) {
                return st;
            }
            dbd::bind_text(stmt.get(), 1, v);
            dbd::bind_text(stmt.get(), 2, now);
            sqlite3_bind_int64(stmt.get(), 3, item.v);
            dbd::bind_text(stmt.get(), 4, k);
            st = dbd::step_done(stmt, StatusDomain::Items);
            if (!is_ok(st)) {
                return st;
            }
            return record(conn, item, AuditReason::AttributeUpdate, k, note_value, now,
                          attribute_snapshot(k, *existing), attribute_snapshot(k, v));
        }

        dbd::Stmt stmt(conn,
            "INSERT INTO item_attributes (item_id, key, value, created_at_utc, updated_at_utc) "
            "VALUES (?1, ?2, ?3, ?4, ?4)");
        st = dbd::prepare_status(stmt, StatusDomain::Items);
        if (!is_ok(st)) {
            return st;
        }
        sqlite3_bind_int64(stmt.get(), 1, item.v);
        dbd::bind_text(stmt.get(), 2, k);
        dbd::bind_text(stmt.get(), 3, v);
        dbd::bind_text(stmt.get(), 4, now);
        st = dbd::step_done(stmt, StatusDomain::Items);
        if (!is_ok(st)) {
            return st;
        }
        return record(conn, item, AuditReason::AttributeAdd, k, note_value, now,
                      std::string(), attribute_snapshot(k, v));
    });
}

Status attribute_remove(assetforge::db::DbHandle db, ItemId item, const char* key, const char* note) noexcept {
    const std::string k = text::trim(key);
    if (!item.is_valid() || k.empty()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    const std::string note_value = text::trim(note);

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    return dbd::run_write(guard, StatusDomain::Items, [&](sqlite3* conn) -> Status {
        Status st = item_exists(conn, item);
        if (!is_ok(st)) {
            return st;
        }
        std::optional<std::string> existing;
        st = current_value(conn, item, k, &existing);
        if (!is_ok(st)) {
            return st;
        }
        if (!existing) {
            return make_status(StatusDomain::Items, StatusCode::NotFound);
        }

        dbd::Stmt stmt(conn, "DELETE FROM item_attributes WHERE item_id = ? AND key = ?");
        st = dbd::prepare_status(stmt, StatusDomain::Items);
        if (!is_ok(st)) {
            return st;
        }
        sqlite3_bind_int64(stmt.get(), 1, item.v);
        dbd::bind_text(stmt.get(), 2, k);
        st = dbd::step_done(stmt, StatusDomain::Items);
        if (!is_ok(st)) {
            return st;
        }
        return record(conn, item, AuditReason::AttributeRemove, k, note_value, now_utc_iso(),
                      attribute_snapshot(k, *existing), std::string());
    });
}

Status attribute_list(assetforge::db::DbHandle db, ItemId item, std::vector<ItemAttribute>* out) noexcept {
    if (!out || !item.is_valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    Status s = item_exists(guard.get(), item);
    if (!is_ok(s)) {
        return s;
    }

    dbd::Stmt stmt(guard.get(),
        "SELECT id, item_id, key, value, created_at_utc, updated_at_utc "
        "FROM item_attributes WHERE item_id = ? ORDER BY key");
    s = dbd::prepare_status(stmt, StatusDomain::Items);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt.get(), 1, item.v);

    out->clear();
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        ItemAttribute a;
        a.id = sqlite3_column_int64(stmt.get(), 0);
        a.item = ItemId{sqlite3_column_int64(stmt.get(), 1)};
        a.key = dbd::column_text(stmt.get(), 2);
        a.value = dbd::column_text(stmt.get(), 3);
        a.created_at = dbd::column_text(stmt.get(), 4);
        a.updated_at = dbd::column_text(stmt.get(), 5);
        out->push_back(std::move(a));
    }
    if (rc != SQLITE_DONE) {
        return dbd::status_from_rc(rc, StatusDomain::Items);
    }
    return ok_status();
}

} // namespace assetforge::items
