#include "assetforge/audit/audit.hpp"
#include "audit/audit_internal.hpp"
#include "assetforge/core/clock.hpp"
#include "core/text.hpp"
#include "db/connection.hpp"

#include <cstring>
#include <utility>

#include <nlohmann/json.hpp>

namespace assetforge::audit {

using namespace assetforge::core;
namespace dbd = assetforge::db::detail;

namespace {
    struct ReasonName {
        AuditReason reason;
        const char* name;
    };

    constexpr ReasonName kReasons[] = {
        {AuditReason::Create, "create"},
        {AuditReason::Update, "update"},
        {AuditReason::Move, "move"},
        {AuditReason::Assign, "assign"},
        {AuditReason::Audit, "audit"},
        {AuditReason::Retire, "retire"},
        {AuditReason::Archive, "archive"},
        {AuditReason::Reactivate, "reactivate"},
        {AuditReason::AttributeAdd, "attribute_add"},
        {AuditReason::AttributeUpdate, "attribute_update"},
        {AuditReason::AttributeRemove, "attribute_remove"},
    };

    constexpr const char* kEntryColumns =
        "SELECT id, item_id, reason, note, changed_fields, snapshot_before_json, "
        "snapshot_after_json, created_at_utc, entry_digest FROM item_updates ";

    void read_digest(sqlite3_stmt* stmt, int index, Hash256* out) noexcept {
        *out = Hash256{};
        const void* blob = sqlite3_column_blob(stmt, index);
        if (blob && sqlite3_column_bytes(stmt, index) == static_cast<int>(out->b.size())) {
            std::memcpy(out->b.data(), blob, out->b.size());
        }
    }

    [[nodiscard]] AuditEntryFields read_fields(sqlite3_stmt* stmt) {
        AuditEntryFields f;
        f.item_id = sqlite3_column_int64(stmt, 1);
        f.reason = dbd::column_text(stmt, 2);
        f.note = dbd::column_text(stmt, 3);
        f.changed_fields = dbd::column_text(stmt, 4);
        f.snapshot_before = dbd::column_text(stmt, 5);
        f.snapshot_after = dbd::column_text(stmt, 6);
        f.created_at = dbd::column_text(stmt, 7);
        return f;
    }

    Status read_update(sqlite3_stmt* stmt, ItemUpdate* out) {
        AuditEntryFields f = read_fields(stmt);
        if (!audit_reason_parse(f.reason.c_str(), &out->reason)) {
            out->reason = AuditReason::Other;
        }
        out->reason_text = std::move(f.reason);
        out->id = UpdateId{sqlite3_column_int64(stmt, 0)};
        out->item = ItemId{f.item_id};
        out->note = std::move(f.note);
        out->changed_fields = detail::changed_fields_decode(f.changed_fields);
        out->snapshot_before = std::move(f.snapshot_before);
        out->snapshot_after = std::move(f.snapshot_after);
        out->created_at = std::move(f.created_at);
        read_digest(stmt, 8, &out->digest);
        return ok_status();
    }

    Status item_exists(sqlite3* conn, ItemId item) noexcept {
        dbd::Stmt stmt(conn, "SELECT 1 FROM items WHERE id = ?");
        const Status s = dbd::prepare_status(stmt, StatusDomain::Audit);
        if (!is_ok(s)) {
            return s;
        }
        sqlite3_bind_int64(stmt.get(), 1, item.v);
        const int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            return make_status(StatusDomain::Audit, StatusCode::NotFound);
        }
        if (rc != SQLITE_ROW) {
            return dbd::status_from_rc(rc, StatusDomain::Audit);
        }
        return ok_status();
    }
}

const char* audit_reason_name(AuditReason reason) noexcept {
    for (const ReasonName& r : kReasons) {
        if (r.reason == reason) {
            return r.name;
        }
    }
    return reason == AuditReason::Other ? "other" : "update";
}

bool audit_reason_parse(const char* name, AuditReason* out) noexcept {
    if (!name || !out) {
        return false;
    }
    for (const ReasonName& r : kReasons) {
        if (std::strcmp(r.name, name) == 0) {
            *out = r.reason;
            return true;
        }
    }
    return false;
}

namespace detail {

std::string changed_fields_encode(const std::vector<std::string>& fields) {
    return nlohmann::json(fields).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::vector<std::string> changed_fields_decode(const std::string& text_in) {
    std::vector<std::string> out;
    if (text_in.empty()) {
        return out;
    }
    try {
        const nlohmann::json parsed = nlohmann::json::parse(text_in);
        if (parsed.is_array()) {
            for (const auto& v : parsed) {
                if (v.is_string()) {
                    out.push_back(v.get<std::string>());
                }
            }
            return out;
        }
    } catch (const nlohmann::json::exception&) {
        // not JSON: fall through to the comma separated form
    }

    size_t start = 0;
    while (start <= text_in.size()) {
        size_t comma = text_in.find(',', start);
        if (comma == std::string::npos) {
            comma = text_in.size();
        }
        std::string field = text::trim(text_in.substr(start, comma - start));
        if (!field.empty()) {
            out.push_back(std::move(field));
        }
        start = comma + 1;
    }
    return out;
}

Status audit_append(sqlite3* conn, const AuditAppend& entry, UpdateId* out) noexcept {
    if (!conn || !entry.item.is_valid()) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }

    Hash256 prev{};
    {
        dbd::Stmt last(conn, "SELECT entry_digest FROM item_updates WHERE item_id = ? ORDER BY id DESC LIMIT 1");
        const Status s = dbd::prepare_status(last, StatusDomain::Audit);
        if (!is_ok(s)) {
            return s;
        }
        sqlite3_bind_int64(last.get(), 1, entry.item.v);
        const int rc = last.step();
        if (rc == SQLITE_ROW) {
            read_digest(last.get(), 0, &prev);
        } else if (rc != SQLITE_DONE) {
            return dbd::status_from_rc(rc, StatusDomain::Audit);
        }
    }

    AuditEntryFields fields;
    fields.item_id = entry.item.v;
    fields.reason = audit_reason_name(entry.reason);
    fields.note = entry.note;
    fields.changed_fields = changed_fields_encode(entry.changed_fields);
    fields.snapshot_before = entry.snapshot_before;
    fields.snapshot_after = entry.snapshot_after;
    fields.created_at = now_utc_iso();

    Hash256 digest{};
    Status s = audit_entry_digest(prev, fields, &digest);
    if (!is_ok(s)) {
        return s;
    }

    dbd::Stmt stmt(conn,
        "INSERT INTO item_updates (item_id, reason, note, changed_fields, snapshot_before_json, "
        "snapshot_after_json, created_at_utc, entry_digest) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    s = dbd::prepare_status(stmt, StatusDomain::Audit);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt.get(), 1, fields.item_id);
    dbd::bind_text(stmt.get(), 2, fields.reason);
    dbd::bind_optional_text(stmt.get(), 3, fields.note);
    dbd::bind_text(stmt.get(), 4, fields.changed_fields);
    dbd::bind_optional_text(stmt.get(), 5, fields.snapshot_before);
    dbd::bind_optional_text(stmt.get(), 6, fields.snapshot_after);
    dbd::bind_text(stmt.get(), 7, fields.created_at);
    sqlite3_bind_blob(stmt.get(), 8, digest.b.data(), static_cast<int>(digest.b.size()), SQLITE_TRANSIENT);
    s = dbd::step_done(stmt, StatusDomain::Audit);
    if (!is_ok(s)) {
        return s;
    }

    if (out) {
        *out = UpdateId{sqlite3_last_insert_rowid(conn)};
    }
    return ok_status();
}

Status audit_backfill_digests(sqlite3* conn) noexcept {
    std::vector<std::pair<i64, Hash256>> digests;
    {
        std::string sql = kEntryColumns;
        sql += "ORDER BY item_id, id";
        dbd::Stmt stmt(conn, sql.c_str());
        const Status s = dbd::prepare_status(stmt, StatusDomain::Audit);
        if (!is_ok(s)) {
            return s;
        }

        i64 current_item = 0;
        bool have_item = false;
        Hash256 prev{};
        int rc = SQLITE_ROW;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            const AuditEntryFields f = read_fields(stmt.get());
            if (!have_item || f.item_id != current_item) {
                current_item = f.item_id;
                have_item = true;
                prev = Hash256{};
            }
            Hash256 digest{};
            const Status ds = audit_entry_digest(prev, f, &digest);
            if (!is_ok(ds)) {
                return ds;
            }
            digests.emplace_back(sqlite3_column_int64(stmt.get(), 0), digest);
            prev = digest;
        }
        if (rc != SQLITE_DONE) {
            return dbd::status_from_rc(rc, StatusDomain::Audit);
        }
    }

    dbd::Stmt update(conn, "UPDATE item_updates SET entry_digest = ? WHERE id = ?");
    const Status s = dbd::prepare_status(update, StatusDomain::Audit);
    if (!is_ok(s)) {
        return s;
    }
    for (const auto& [id, digest] : digests) {
        update.reset();
        sqlite3_bind_blob(update.get(), 1, digest.b.data(), static_cast<int>(digest.b.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(update.get(), 2, id);
        const Status us = dbd::step_done(update, StatusDomain::Audit);
        if (!is_ok(us)) {
            return us;
        }
    }
    return ok_status();
}

} // namespace detail

// ============================================================================
// Reading
// ============================================================================

Status audit_list(assetforge::db::DbHandle db, ItemId item, std::vector<ItemUpdate>* out) noexcept {
    if (!out || !item.is_valid()) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }

    Status s = item_exists(guard.get(), item);
    if (!is_ok(s)) {
        return s;
    }

    std::string sql = kEntryColumns;
    sql += "WHERE item_id = ? ORDER BY julianday(created_at_utc), id";
    dbd::Stmt stmt(guard.get(), sql.c_str());
    s = dbd::prepare_status(stmt, StatusDomain::Audit);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt.get(), 1, item.v);

    out->clear();
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        ItemUpdate u;
        s = read_update(stmt.get(), &u);
        if (!is_ok(s)) {
            return s;
        }
        out->push_back(std::move(u));
    }
    if (rc != SQLITE_DONE) {
        return dbd::status_from_rc(rc, StatusDomain::Audit);
    }
    return ok_status();
}

Status audit_get(assetforge::db::DbHandle db, UpdateId id, ItemUpdate* out) noexcept {
    if (!out || !id.is_valid()) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }

    std::string sql = kEntryColumns;
    sql += "WHERE id = ?";
    dbd::Stmt stmt(guard.get(), sql.c_str());
    const Status s = dbd::prepare_status(stmt, StatusDomain::Audit);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt.get(), 1, id.v);

    const int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return make_status(StatusDomain::Audit, StatusCode::NotFound);
    }
    if (rc != SQLITE_ROW) {
        return dbd::status_from_rc(rc, StatusDomain::Audit);
    }
    return read_update(stmt.get(), out);
}

Status audit_verify(assetforge::db::DbHandle db, ItemId item, AuditVerifyResult* out) noexcept {
    if (!out || !item.is_valid()) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }
    *out = AuditVerifyResult{};

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }

    Status s = item_exists(guard.get(), item);
    if (!is_ok(s)) {
        return s;
    }

    std::string sql = kEntryColumns;
    sql += "WHERE item_id = ? ORDER BY id";
    dbd::Stmt stmt(guard.get(), sql.c_str());
    s = dbd::prepare_status(stmt, StatusDomain::Audit);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt.get(), 1, item.v);

    Hash256 prev{};
    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        const AuditEntryFields f = read_fields(stmt.get());
        Hash256 expected{};
        s = audit_entry_digest(prev, f, &expected);
        if (!is_ok(s)) {
            return s;
        }
        Hash256 stored{};
        read_digest(stmt.get(), 8, &stored);
        if (stored != expected) {
            out->first_bad = UpdateId{sqlite3_column_int64(stmt.get(), 0)};
            return make_status(StatusDomain::Audit, StatusCode::Corrupt, out->checked);
        }
        ++out->checked;
        prev = stored;
    }
    if (rc != SQLITE_DONE) {
        return dbd::status_from_rc(rc, StatusDomain::Audit);
    }
    return ok_status();
}

} // namespace assetforge::audit
