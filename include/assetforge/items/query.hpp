#pragma once

#include <string>
#include <vector>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/models.hpp"
#include "assetforge/db/db.hpp"

namespace assetforge::items {
    using u32 = assetforge::core::u32;
    using u64 = assetforge::core::u64;

    enum class ArchivedFilter : assetforge::core::u8 {
        Active = 0,
        Archived = 1,
        All = 2,
    };

    // Every set criterion must match. Empty `types` means any type; invalid()
    // ids mean "any". `search` is a case-insensitive substring matched against
    // name, model, mac, ip, tag and notes.
    struct ItemFilter {
        std::vector<assetforge::core::TypeId> types;
        assetforge::core::LocationId location{assetforge::core::LocationId::invalid()};
        assetforge::core::UserId user{assetforge::core::UserId::invalid()};
        assetforge::core::GroupId group{assetforge::core::GroupId::invalid()};
        assetforge::core::SubTypeId sub_type{assetforge::core::SubTypeId::invalid()};
        ArchivedFilter archived{ArchivedFilter::Active};
        std::string search;
        u32 page_size{256};
    };

    // Lazy, finite, restartable walk over the items matching a filter, in id
    // order. Rows are fetched a page at a time with a keyset on id, so the
    // cursor holds no statement or lock between calls and rows created behind
    // it are never returned twice.
    struct ItemCursor {
        assetforge::db::DbHandle db{};
        ItemFilter filter{};
        assetforge::core::i64 last_id{0};
        std::vector<assetforge::core::Item> page{};
        u32 pos{0};
        bool exhausted{false};
    };

    assetforge::core::Status item_cursor_open(assetforge::db::DbHandle db,
        const ItemFilter& filter,
        ItemCursor* out) noexcept;

    // *has_row is false once the walk is over; further calls keep returning it.
    assetforge::core::Status item_cursor_next(ItemCursor* cursor,
        assetforge::core::Item* out,
        bool* has_row) noexcept;

    // Starts the walk over from the first matching item.
    void item_cursor_rewind(ItemCursor* cursor) noexcept;

    // Drains a fresh cursor into `out`.
    assetforge::core::Status item_query_all(assetforge::db::DbHandle db,
        const ItemFilter& filter,
        std::vector<assetforge::core::Item>* out) noexcept;

    assetforge::core::Status item_count(assetforge::db::DbHandle db,
        const ItemFilter& filter,
        u64* out) noexcept;

} // namespace assetforge::items
