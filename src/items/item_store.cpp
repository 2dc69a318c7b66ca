#include "assetforge/items/item_store.hpp"
#include "assetforge/core/clock.hpp"
#include "assetforge/identity/tag.hpp"
#include "audit/audit_internal.hpp"
#include "core/text.hpp"
#include "db/connection.hpp"
#include "identity/serial_internal.hpp"
#include "items/item_internal.hpp"

#include <utility>
#include <vector>

namespace assetforge::items {

using namespace assetforge::core;
namespace dbd = assetforge::db::detail;

namespace {
    constexpr u32 kAllFields = (1u << 11) - 1;

    struct FieldName {
        ItemField field;
        const char* name;
    };

    constexpr FieldName kFieldNames[] = {
        {ItemField::Name, "name"},
        {ItemField::Model, "model"},
        {ItemField::Type, "type_id"},
        {ItemField::MacAddress, "mac_address"},
        {ItemField::IpAddress, "ip_address"},
        {ItemField::Location, "location_id"},
        {ItemField::User, "user_id"},
        {ItemField::Group, "group_id"},
        {ItemField::SubType, "sub_type_id"},
        {ItemField::Notes, "notes"},
        {ItemField::Extension, "extension"},
    };

    [[nodiscard]] std::string note_text(const char* note) {
        return text::trim(note);
    }

    [[nodiscard]] bool reason_accepted(AuditReason reason) noexcept {
        switch (reason) {
            case AuditReason::Update:
            case AuditReason::Move:
            case AuditReason::Assign:
            case AuditReason::Audit:
            case AuditReason::Retire:
                return true;
            default:
                return false;
        }
    }

    // Text fields are trimmed, empty means NULL; the MAC is normalized.
    Status apply_fields(const ItemFields& in, u32 mask, Item* item) {
        auto has = [mask](ItemField f) { return (mask & static_cast<u32>(f)) != 0; };

        if (has(ItemField::Name)) item->name = text::trim(in.name);
        if (has(ItemField::Model)) item->model = text::trim(in.model);
        if (has(ItemField::Type)) item->type = in.type;
        if (has(ItemField::IpAddress)) item->ip_address = text::trim(in.ip_address);
        if (has(ItemField::Location)) item->location = in.location;
        if (has(ItemField::User)) item->user = in.user;
        if (has(ItemField::Group)) item->group = in.group;
        if (has(ItemField::SubType)) item->sub_type = in.sub_type;
        if (has(ItemField::Notes)) item->notes = text::trim(in.notes);
        if (has(ItemField::Extension)) item->extension = text::trim(in.extension);
        if (has(ItemField::MacAddress)) {
            return detail::normalize_mac(in.mac_address, &item->mac_address);
        }
        return ok_status();
    }

    [[nodiscard]] std::vector<std::string> set_fields(const Item& item) {
        std::vector<std::string> out;
        auto note = [&](bool set, ItemField f) {
            if (set) {
                out.emplace_back(item_field_name(f));
            }
        };
        note(!item.name.empty(), ItemField::Name);
        note(!item.model.empty(), ItemField::Model);
        note(item.type.is_valid(), ItemField::Type);
        note(!item.mac_address.empty(), ItemField::MacAddress);
        note(!item.ip_address.empty(), ItemField::IpAddress);
        note(item.location.is_valid(), ItemField::Location);
        note(item.user.is_valid(), ItemField::User);
        note(item.group.is_valid(), ItemField::Group);
        note(item.sub_type.is_valid(), ItemField::SubType);
        note(!item.notes.empty(), ItemField::Notes);
        note(!item.extension.empty(), ItemField::Extension);
        return out;
    }

    void bind_item(sqlite3_stmt* stmt, const Item& item) noexcept {
        dbd::bind_text(stmt, 1, item.name);
        dbd::bind_optional_text(stmt, 2, item.model);
        dbd::bind_id(stmt, 3, item.type);
        dbd::bind_optional_text(stmt, 4, item.mac_address);
        dbd::bind_optional_text(stmt, 5, item.ip_address);
        dbd::bind_id(stmt, 6, item.location);
        dbd::bind_id(stmt, 7, item.user);
        dbd::bind_id(stmt, 8, item.group);
        dbd::bind_id(stmt, 9, item.sub_type);
        dbd::bind_optional_text(stmt, 10, item.notes);
        dbd::bind_optional_text(stmt, 11, item.extension);
        sqlite3_bind_int64(stmt, 12, item.type_serial);
        dbd::bind_text(stmt, 13, item.asset_tag);
        dbd::bind_text(stmt, 14, item.created_at);
        dbd::bind_text(stmt, 15, item.updated_at);
        sqlite3_bind_int(stmt, 16, item.archived ? 1 : 0);
    }

    Status insert_item(sqlite3* conn, Item* item) noexcept {
        dbd::Stmt stmt(conn,
            "INSERT INTO items (name, model, type_id, mac_address, ip_address, location_id, user_id, "
            "group_id, sub_type_id, notes, extension, type_serial, asset_tag, created_at_utc, "
            "updated_at_utc, archived) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16)");
        Status s = dbd::prepare_status(stmt, StatusDomain::Items);
        if (!is_ok(s)) {
            return s;
        }
        bind_item(stmt.get(), *item);
        s = dbd::step_done(stmt, StatusDomain::Items);
        if (!is_ok(s)) {
            return s;
        }
        item->id = ItemId{sqlite3_last_insert_rowid(conn)};
        return ok_status();
    }

    Status store_item(sqlite3* conn, const Item& item) noexcept {
        dbd::Stmt stmt(conn,
            "UPDATE items SET name = ?1, model = ?2, type_id = ?3, mac_address = ?4, ip_address = ?5, "
            "location_id = ?6, user_id = ?7, group_id = ?8, sub_type_id = ?9, notes = ?10, "
            "extension = ?11, type_serial = ?12, asset_tag = ?13, created_at_utc = ?14, "
            "updated_at_utc = ?15, archived = ?16 WHERE id = ?17");
        const Status s = dbd::prepare_status(stmt, StatusDomain::Items);
        if (!is_ok(s)) {
            return s;
        }
        bind_item(stmt.get(), item);
        sqlite3_bind_int64(stmt.get(), 17, item.id.v);
        return dbd::step_done(stmt, StatusDomain::Items);
    }

    // A retyped item keeps its serial, so the pair must still be free under
    // the new type.
    Status serial_free_under(sqlite3* conn, const Item& item) noexcept {
        dbd::Stmt stmt(conn, "SELECT 1 FROM items WHERE type_id = ?1 AND type_serial = ?2 AND id <> ?3 LIMIT 1");
        const Status s = dbd::prepare_status(stmt, StatusDomain::Identity);
        if (!is_ok(s)) {
            return s;
        }
        sqlite3_bind_int64(stmt.get(), 1, item.type.v);
        sqlite3_bind_int64(stmt.get(), 2, item.type_serial);
        sqlite3_bind_int64(stmt.get(), 3, item.id.v);
        const int rc = stmt.step();
        if (rc == SQLITE_ROW) {
            return make_status(StatusDomain::Identity, StatusCode::Duplicate);
        }
        if (rc != SQLITE_DONE) {
            return dbd::status_from_rc(rc, StatusDomain::Identity);
        }
        return ok_status();
    }

    Status set_archived(assetforge::db::DbHandle db, ItemId id, bool archived, const char* note, Item* out) noexcept {
        if (!id.is_valid()) {
            return make_status(StatusDomain::Items, StatusCode::Invalid);
        }

        dbd::ConnGuard guard(db);
        if (!guard.valid()) {
            return make_status(StatusDomain::Items, StatusCode::Invalid);
        }

        Item result;
        const std::string note_value = note_text(note);
        const Status s = dbd::run_write(guard, StatusDomain::Items, [&](sqlite3* conn) -> Status {
            Item before;
            Status st = detail::item_load(conn, id, &before);
            if (!is_ok(st)) {
                return st;
            }
            if (before.archived == archived) {
                result = std::move(before);
                return ok_status();
            }

            Item after = before;
            after.archived = archived;
            after.updated_at = now_utc_iso();
            st = store_item(conn, after);
            if (!is_ok(st)) {
                return st;
            }

            assetforge::audit::detail::AuditAppend entry;
            entry.item = id;
            entry.reason = archived ? AuditReason::Archive : AuditReason::Reactivate;
            entry.note = note_value;
            entry.changed_fields = {"archived"};
            entry.snapshot_before = detail::item_snapshot(before);
            entry.snapshot_after = detail::item_snapshot(after);
            st = assetforge::audit::detail::audit_append(conn, entry, nullptr);
            if (!is_ok(st)) {
                return st;
            }
            result = std::move(after);
            return ok_status();
        });
        if (is_ok(s) && out) {
            *out = std::move(result);
        }
        return s;
    }
}

const char* item_field_name(ItemField field) noexcept {
    for (const FieldName& f : kFieldNames) {
        if (f.field == field) {
            return f.name;
        }
    }
    return "";
}

// ============================================================================
// Creation / update
// ============================================================================

Status item_create(assetforge::db::DbHandle db, const ItemFields& fields, const char* note, Item* out) noexcept {
    Item item;
    Status s = apply_fields(fields, kAllFields, &item);
    if (!is_ok(s)) {
        return s;
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    const std::string note_value = note_text(note);
    Item result;
    s = dbd::run_write(guard, StatusDomain::Items, [&](sqlite3* conn) -> Status {
        Item row = item;
        Status st = detail::validate_item(conn, row, kAllFields);
        if (!is_ok(st)) {
            return st;
        }
        st = assetforge::identity::detail::serial_allocate(conn, row.type, &row.type_serial);
        if (!is_ok(st)) {
            return st;
        }
        const std::string now = now_utc_iso();
        row.created_at = now;
        st = detail::maintain_derived(conn, &row, now);
        if (!is_ok(st)) {
            return st;
        }
        st = insert_item(conn, &row);
        if (!is_ok(st)) {
            return st;
        }

        assetforge::audit::detail::AuditAppend entry;
        entry.item = row.id;
        entry.reason = AuditReason::Create;
        entry.note = note_value;
        entry.changed_fields = set_fields(row);
        entry.snapshot_after = detail::item_snapshot(row);
        st = assetforge::audit::detail::audit_append(conn, entry, nullptr);
        if (!is_ok(st)) {
            return st;
        }
        result = std::move(row);
        return ok_status();
    });
    if (is_ok(s) && out) {
        *out = std::move(result);
    }
    return s;
}

Status item_update(assetforge::db::DbHandle db,
                   ItemId id,
                   const ItemPatch& patch,
                   AuditReason reason,
                   const char* note,
                   Item* out) noexcept {
    if (!id.is_valid() || !reason_accepted(reason)) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    const std::string note_value = note_text(note);
    Item result;
    const Status s = dbd::run_write(guard, StatusDomain::Items, [&](sqlite3* conn) -> Status {
        Item before;
        Status st = detail::item_load(conn, id, &before);
        if (!is_ok(st)) {
            return st;
        }

        Item after = before;
        st = apply_fields(patch.values, patch.mask, &after);
        if (!is_ok(st)) {
            return st;
        }

        const std::vector<std::string> changed = detail::item_diff(before, after);
        u32 recheck = 0;
        for (const FieldName& f : kFieldNames) {
            if (patch.has(f.field)) {
                recheck |= static_cast<u32>(f.field);
            }
        }
        st = detail::validate_item(conn, after, recheck);
        if (!is_ok(st)) {
            return st;
        }

        if (after.type != before.type) {
            st = serial_free_under(conn, after);
            if (!is_ok(st)) {
                return st;
            }
            st = assetforge::identity::detail::serial_reserve(conn, after.type, after.type_serial);
            if (!is_ok(st)) {
                return st;
            }
        }

        st = detail::maintain_derived(conn, &after, now_utc_iso());
        if (!is_ok(st)) {
            return st;
        }
        st = store_item(conn, after);
        if (!is_ok(st)) {
            return st;
        }

        assetforge::audit::detail::AuditAppend entry;
        entry.item = id;
        entry.reason = reason;
        entry.note = note_value;
        entry.changed_fields = changed;
        entry.snapshot_before = detail::item_snapshot(before);
        entry.snapshot_after = detail::item_snapshot(after);
        st = assetforge::audit::detail::audit_append(conn, entry, nullptr);
        if (!is_ok(st)) {
            return st;
        }
        result = std::move(after);
        return ok_status();
    });
    if (is_ok(s) && out) {
        *out = std::move(result);
    }
    return s;
}

Status item_move(assetforge::db::DbHandle db, ItemId id, LocationId location, const char* note, Item* out) noexcept {
    ItemPatch patch;
    patch.set_location(location);
    return item_update(db, id, patch, AuditReason::Move, note, out);
}

Status item_assign(assetforge::db::DbHandle db,
                   ItemId id,
                   UserId user,
                   GroupId group,
                   const char* note,
                   Item* out) noexcept {
    ItemPatch patch;
    patch.set_user(user).set_group(group);
    return item_update(db, id, patch, AuditReason::Assign, note, out);
}

Status item_archive(assetforge::db::DbHandle db, ItemId id, const char* note, Item* out) noexcept {
    return set_archived(db, id, true, note, out);
}

Status item_reactivate(assetforge::db::DbHandle db, ItemId id, const char* note, Item* out) noexcept {
    return set_archived(db, id, false, note, out);
}

Status item_purge(assetforge::db::DbHandle db, ItemId id) noexcept {
    if (!id.is_valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    return dbd::run_write(guard, StatusDomain::Items, [&](sqlite3* conn) -> Status {
        dbd::Stmt stmt(conn, "DELETE FROM items WHERE id = ?");
        Status st = dbd::prepare_status(stmt, StatusDomain::Items);
        if (!is_ok(st)) {
            return st;
        }
        sqlite3_bind_int64(stmt.get(), 1, id.v);
        st = dbd::step_done(stmt, StatusDomain::Items);
        if (!is_ok(st)) {
            return st;
        }
        return sqlite3_changes(conn) == 0
            ? make_status(StatusDomain::Items, StatusCode::NotFound)
            : ok_status();
    });
}

// ============================================================================
// Lookup
// ============================================================================

Status item_get(assetforge::db::DbHandle db, ItemId id, Item* out) noexcept {
    if (!out || !id.is_valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    return detail::item_load(guard.get(), id, out);
}

Status item_find_by_tag(assetforge::db::DbHandle db, const char* tag, Item* out) noexcept {
    if (!out || !tag) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    const std::string normalized = assetforge::identity::tag_normalize(tag);
    if (normalized.empty()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    return detail::item_load_where(guard.get(), "WHERE asset_tag = ?", normalized, out);
}

Status item_find_by_mac(assetforge::db::DbHandle db, const char* mac, Item* out) noexcept {
    if (!out || !mac) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    std::string normalized;
    Status s = detail::normalize_mac(mac, &normalized);
    if (!is_ok(s)) {
        return s;
    }
    if (normalized.empty()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    return detail::item_load_where(guard.get(), "WHERE lower(mac_address) = lower(?)", normalized, out);
}

Status item_lookup_scan(assetforge::db::DbHandle db, const char* scanned, Item* out) noexcept {
    if (!out || !scanned) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    const std::string normalized = assetforge::identity::tag_normalize(scanned);
    if (assetforge::identity::tag_well_formed(normalized)) {
        return item_find_by_tag(db, normalized.c_str(), out);
    }

    std::string mac;
    if (is_ok(detail::normalize_mac(normalized, &mac)) && !mac.empty()) {
        return item_find_by_mac(db, mac.c_str(), out);
    }
    return make_status(StatusDomain::Items, StatusCode::Invalid);
}

} // namespace assetforge::items
