#pragma once

#include <sqlite3.h>

#include <string>
#include <vector>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/models.hpp"

namespace assetforge::items::detail {
    using assetforge::core::u32;

    // Column list shared by every item SELECT, in read_item order.
    inline constexpr const char* kItemColumns =
        "SELECT id, name, model, type_id, mac_address, ip_address, location_id, user_id, "
        "group_id, sub_type_id, notes, extension, type_serial, asset_tag, created_at_utc, "
        "updated_at_utc, archived FROM items ";

    void read_item(sqlite3_stmt* stmt, assetforge::core::Item* out);

    // NotFound when no row matches.
    assetforge::core::Status item_load(sqlite3* conn,
        assetforge::core::ItemId id,
        assetforge::core::Item* out) noexcept;

    assetforge::core::Status item_load_where(sqlite3* conn,
        const char* where,
        const std::string& arg,
        assetforge::core::Item* out) noexcept;

    // ========================================================================
    // Field validation
    // ========================================================================

    // Accepts 12 hex digits, optionally split by ':' or '-' into six pairs or
    // by '.' into three quads; normalizes to "AA:BB:CC:DD:EE:FF".
    assetforge::core::Status normalize_mac(const std::string& in, std::string* out) noexcept;

    [[nodiscard]] bool ip_valid(const std::string& ip) noexcept;

    // Checks the fields named by `mask` (ItemField bits) plus the
    // type-conditional extension rule, which is checked on every write.
    assetforge::core::Status validate_item(sqlite3* conn,
        const assetforge::core::Item& item,
        u32 mask) noexcept;

    // Single maintenance point for derived columns: re-derives asset_tag from
    // the type's code and type_serial, checks its shape and global uniqueness
    // (Corrupt on failure) and stamps updated_at.
    assetforge::core::Status maintain_derived(sqlite3* conn,
        assetforge::core::Item* item,
        const std::string& now) noexcept;

    // Full row as a JSON object; NULL columns are JSON null.
    [[nodiscard]] std::string item_snapshot(const assetforge::core::Item& item);

    // Names of the recognized fields that differ between the two rows.
    [[nodiscard]] std::vector<std::string> item_diff(const assetforge::core::Item& before,
        const assetforge::core::Item& after);

} // namespace assetforge::items::detail
