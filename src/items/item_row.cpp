#include "items/item_internal.hpp"
#include "assetforge/catalog/type_registry.hpp"
#include "assetforge/identity/tag.hpp"
#include "assetforge/items/item_store.hpp"
#include "catalog/type_registry_internal.hpp"
#include "core/text.hpp"
#include "db/connection.hpp"

#include <arpa/inet.h>

#include <cctype>

#include <nlohmann/json.hpp>

namespace assetforge::items::detail {

using namespace assetforge::core;
namespace dbd = assetforge::db::detail;

namespace {
    [[nodiscard]] nlohmann::json nullable_text(const std::string& s) {
        if (s.empty()) {
            return nullptr;
        }
        return s;
    }

    template <typename IdT>
    [[nodiscard]] nlohmann::json nullable_id(IdT id) {
        if (!id.is_valid()) {
            return nullptr;
        }
        return id.v;
    }

    // NotFound when `id` is set but no row of `table` has it.
    Status reference_exists(sqlite3* conn, const char* sql, i64 id) noexcept {
        dbd::Stmt stmt(conn, sql);
        const Status s = dbd::prepare_status(stmt, StatusDomain::Items);
        if (!is_ok(s)) {
            return s;
        }
        sqlite3_bind_int64(stmt.get(), 1, id);
        const int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            return make_status(StatusDomain::Items, StatusCode::NotFound);
        }
        if (rc != SQLITE_ROW) {
            return dbd::status_from_rc(rc, StatusDomain::Items);
        }
        return ok_status();
    }

    // Duplicate when another item already holds the value.
    Status value_unused(sqlite3* conn, const char* sql, const std::string& value, ItemId self) noexcept {
        dbd::Stmt stmt(conn, sql);
        const Status s = dbd::prepare_status(stmt, StatusDomain::Items);
        if (!is_ok(s)) {
            return s;
        }
        dbd::bind_text(stmt.get(), 1, value);
        sqlite3_bind_int64(stmt.get(), 2, self.is_valid() ? self.v : -1);
        const int rc = stmt.step();
        if (rc == SQLITE_ROW) {
            return make_status(StatusDomain::Items, StatusCode::Duplicate);
        }
        if (rc != SQLITE_DONE) {
            return dbd::status_from_rc(rc, StatusDomain::Items);
        }
        return ok_status();
    }

    [[nodiscard]] bool masked(u32 mask, ItemField f) noexcept {
        return (mask & static_cast<u32>(f)) != 0;
    }
}

// ============================================================================
// Row access
// ============================================================================

void read_item(sqlite3_stmt* stmt, Item* out) {
    out->id = ItemId{sqlite3_column_int64(stmt, 0)};
    out->name = dbd::column_text(stmt, 1);
    out->model = dbd::column_text(stmt, 2);
    out->type = dbd::column_id<TypeId>(stmt, 3);
    out->mac_address = dbd::column_text(stmt, 4);
    out->ip_address = dbd::column_text(stmt, 5);
    out->location = dbd::column_id<LocationId>(stmt, 6);
    out->user = dbd::column_id<UserId>(stmt, 7);
    out->group = dbd::column_id<GroupId>(stmt, 8);
    out->sub_type = dbd::column_id<SubTypeId>(stmt, 9);
    out->notes = dbd::column_text(stmt, 10);
    out->extension = dbd::column_text(stmt, 11);
    out->type_serial = sqlite3_column_int64(stmt, 12);
    out->asset_tag = dbd::column_text(stmt, 13);
    out->created_at = dbd::column_text(stmt, 14);
    out->updated_at = dbd::column_text(stmt, 15);
    out->archived = sqlite3_column_int(stmt, 16) != 0;
}

Status item_load(sqlite3* conn, ItemId id, Item* out) noexcept {
    if (!conn || !out || !id.is_valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    std::string sql = kItemColumns;
    sql += "WHERE id = ?";

    dbd::Stmt stmt(conn, sql.c_str());
    const Status s = dbd::prepare_status(stmt, StatusDomain::Items);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt.get(), 1, id.v);

    const int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return make_status(StatusDomain::Items, StatusCode::NotFound);
    }
    if (rc != SQLITE_ROW) {
        return dbd::status_from_rc(rc, StatusDomain::Items);
    }
    read_item(stmt.get(), out);
    return ok_status();
}

Status item_load_where(sqlite3* conn, const char* where, const std::string& arg, Item* out) noexcept {
    if (!conn || !where || !out) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    std::string sql = kItemColumns;
    sql += where;

    dbd::Stmt stmt(conn, sql.c_str());
    const Status s = dbd::prepare_status(stmt, StatusDomain::Items);
    if (!is_ok(s)) {
        return s;
    }
    dbd::bind_text(stmt.get(), 1, arg);

    const int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return make_status(StatusDomain::Items, StatusCode::NotFound);
    }
    if (rc != SQLITE_ROW) {
        return dbd::status_from_rc(rc, StatusDomain::Items);
    }
    read_item(stmt.get(), out);
    return ok_status();
}

// ============================================================================
// Field validation
// ============================================================================

Status normalize_mac(const std::string& in, std::string* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    const std::string trimmed = text::trim(in);
    if (trimmed.empty()) {
        out->clear();
        return ok_status();
    }

    std::string hex;
    u32 colons = 0;
    u32 dashes = 0;
    u32 dots = 0;
    for (char c : trimmed) {
        if (c == ':') {
            ++colons;
        } else if (c == '-') {
            ++dashes;
        } else if (c == '.') {
            ++dots;
        } else if (std::isxdigit(static_cast<unsigned char>(c))) {
            hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        } else {
            return make_status(StatusDomain::Items, StatusCode::Invalid);
        }
    }

    const u32 separators = colons + dashes + dots;
    const bool pairs = (colons == 5 || dashes == 5) && separators == 5;
    const bool quads = dots == 2 && separators == 2;
    if (hex.size() != 12 || !(separators == 0 || pairs || quads)) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    if (pairs) {
        // separators must fall between every pair of digits
        for (size_t i = 2; i < trimmed.size(); i += 3) {
            if (std::isxdigit(static_cast<unsigned char>(trimmed[i]))) {
                return make_status(StatusDomain::Items, StatusCode::Invalid);
            }
        }
        if (trimmed.size() != 17) {
            return make_status(StatusDomain::Items, StatusCode::Invalid);
        }
    }
    if (quads && (trimmed.size() != 14 || trimmed[4] != '.' || trimmed[9] != '.')) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    std::string norm;
    norm.reserve(17);
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (i > 0) {
            norm.push_back(':');
        }
        norm.push_back(hex[i]);
        norm.push_back(hex[i + 1]);
    }
    *out = std::move(norm);
    return ok_status();
}

bool ip_valid(const std::string& ip) noexcept {
    if (ip.empty()) {
        return false;
    }
    unsigned char buf[16];
    if (inet_pton(AF_INET, ip.c_str(), buf) == 1) {
        return true;
    }
    return inet_pton(AF_INET6, ip.c_str(), buf) == 1;
}

Status validate_item(sqlite3* conn, const Item& item, u32 mask) noexcept {
    // shape first, then references, then uniqueness
    if (masked(mask, ItemField::Name) && text::trim(item.name).empty()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    if (masked(mask, ItemField::Type) && !item.type.is_valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    if (masked(mask, ItemField::IpAddress) && !item.ip_address.empty() && !ip_valid(item.ip_address)) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    if (!item.extension.empty() && !assetforge::catalog::type_is_landline(item.type)) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    struct RefCheck {
        ItemField field;
        const char* sql;
        i64 id;
        bool set;
    };
    const RefCheck refs[] = {
        {ItemField::Type, "SELECT 1 FROM hardware_types WHERE id = ?", item.type.v, item.type.is_valid()},
        {ItemField::Location, "SELECT 1 FROM locations WHERE id = ?", item.location.v, item.location.is_valid()},
        {ItemField::User, "SELECT 1 FROM users WHERE id = ?", item.user.v, item.user.is_valid()},
        {ItemField::Group, "SELECT 1 FROM \"groups\" WHERE id = ?", item.group.v, item.group.is_valid()},
        {ItemField::SubType, "SELECT 1 FROM sub_types WHERE id = ?", item.sub_type.v, item.sub_type.is_valid()},
    };
    for (const RefCheck& r : refs) {
        if (!masked(mask, r.field) || !r.set) {
            continue;
        }
        const Status s = reference_exists(conn, r.sql, r.id);
        if (!is_ok(s)) {
            return s;
        }
    }

    if (masked(mask, ItemField::MacAddress) && !item.mac_address.empty()) {
        const Status s = value_unused(conn,
            "SELECT 1 FROM items WHERE lower(mac_address) = lower(?1) AND id <> ?2 LIMIT 1",
            item.mac_address, item.id);
        if (!is_ok(s)) {
            return s;
        }
    }
    if (masked(mask, ItemField::IpAddress) && !item.ip_address.empty()) {
        const Status s = value_unused(conn,
            "SELECT 1 FROM items WHERE ip_address = ?1 AND id <> ?2 LIMIT 1",
            item.ip_address, item.id);
        if (!is_ok(s)) {
            return s;
        }
    }
    return ok_status();
}

Status maintain_derived(sqlite3* conn, Item* item, const std::string& now) noexcept {
    if (!conn || !item) {
        return make_status(StatusDomain::Identity, StatusCode::Invalid);
    }

    std::string code;
    Status s = assetforge::catalog::detail::type_code(conn, item->type, &code);
    if (s.code == StatusCode::NotFound) {
        return make_status(StatusDomain::Identity, StatusCode::Corrupt);
    }
    if (!is_ok(s)) {
        return s;
    }

    std::string tag;
    s = assetforge::identity::tag_derive(code.c_str(), item->type_serial, &tag);
    if (!is_ok(s)) {
        return s;
    }

    dbd::Stmt stmt(conn, "SELECT 1 FROM items WHERE asset_tag = ?1 AND id <> ?2 LIMIT 1");
    s = dbd::prepare_status(stmt, StatusDomain::Identity);
    if (!is_ok(s)) {
        return s;
    }
    dbd::bind_text(stmt.get(), 1, tag);
    sqlite3_bind_int64(stmt.get(), 2, item->id.is_valid() ? item->id.v : -1);
    const int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return make_status(StatusDomain::Identity, StatusCode::Corrupt);
    }
    if (rc != SQLITE_DONE) {
        return dbd::status_from_rc(rc, StatusDomain::Identity);
    }

    item->asset_tag = std::move(tag);
    item->updated_at = now;
    return ok_status();
}

// ============================================================================
// Snapshots
// ============================================================================

std::string item_snapshot(const Item& item) {
    nlohmann::json j = nlohmann::json::object();
    j["id"] = nullable_id(item.id);
    j["name"] = item.name;
    j["model"] = nullable_text(item.model);
    j["type_id"] = nullable_id(item.type);
    j["type_serial"] = item.type_serial;
    j["asset_tag"] = nullable_text(item.asset_tag);
    j["mac_address"] = nullable_text(item.mac_address);
    j["ip_address"] = nullable_text(item.ip_address);
    j["location_id"] = nullable_id(item.location);
    j["user_id"] = nullable_id(item.user);
    j["group_id"] = nullable_id(item.group);
    j["sub_type_id"] = nullable_id(item.sub_type);
    j["notes"] = nullable_text(item.notes);
    j["extension"] = nullable_text(item.extension);
    j["archived"] = item.archived;
    j["created_at_utc"] = item.created_at;
    j["updated_at_utc"] = item.updated_at;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::vector<std::string> item_diff(const Item& before, const Item& after) {
    std::vector<std::string> changed;
    auto note = [&](bool differs, ItemField f) {
        if (differs) {
            changed.emplace_back(item_field_name(f));
        }
    };
    note(before.name != after.name, ItemField::Name);
    note(before.model != after.model, ItemField::Model);
    note(before.type != after.type, ItemField::Type);
    note(before.mac_address != after.mac_address, ItemField::MacAddress);
    note(before.ip_address != after.ip_address, ItemField::IpAddress);
    note(before.location != after.location, ItemField::Location);
    note(before.user != after.user, ItemField::User);
    note(before.group != after.group, ItemField::Group);
    note(before.sub_type != after.sub_type, ItemField::SubType);
    note(before.notes != after.notes, ItemField::Notes);
    note(before.extension != after.extension, ItemField::Extension);
    return changed;
}

} // namespace assetforge::items::detail
