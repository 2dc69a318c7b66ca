#include "assetforge/items/query.hpp"
#include "core/text.hpp"
#include "db/connection.hpp"
#include "items/item_internal.hpp"

#include <utility>

namespace assetforge::items {

using namespace assetforge::core;
namespace dbd = assetforge::db::detail;

namespace {
    constexpr u32 kMaxPageSize = 4096;

    // LIKE pattern for a literal substring; '\' escapes the wildcards.
    [[nodiscard]] std::string like_pattern(const std::string& needle) {
        std::string out = "%";
        for (char c : needle) {
            if (c == '%' || c == '_' || c == '\\') {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        out.push_back('%');
        return out;
    }

    // Builds the WHERE clause for `filter`. Parameter ?1 is always the keyset
    // lower bound; the remaining values are returned in bind order.
    struct FilterSql {
        std::string where;
        std::vector<i64> ids;
        std::string pattern;
        int pattern_index{0};
    };

    [[nodiscard]] FilterSql build_where(const ItemFilter& filter) {
        FilterSql out;
        out.where = "WHERE id > ?1";
        int next = 2;

        auto add_id = [&](const char* column, i64 value) {
            out.where += " AND ";
            out.where += column;
            out.where += " = ?" + std::to_string(next++);
            out.ids.push_back(value);
        };

        if (!filter.types.empty()) {
            out.where += " AND type_id IN (";
            for (size_t i = 0; i < filter.types.size(); ++i) {
                if (i > 0) {
                    out.where += ", ";
                }
                out.where += "?" + std::to_string(next++);
                out.ids.push_back(filter.types[i].v);
            }
            out.where += ")";
        }
        if (filter.location.is_valid()) add_id("location_id", filter.location.v);
        if (filter.user.is_valid()) add_id("user_id", filter.user.v);
        if (filter.group.is_valid()) add_id("group_id", filter.group.v);
        if (filter.sub_type.is_valid()) add_id("sub_type_id", filter.sub_type.v);

        switch (filter.archived) {
            case ArchivedFilter::Active:
                out.where += " AND archived = 0";
                break;
            case ArchivedFilter::Archived:
                out.where += " AND archived = 1";
                break;
            case ArchivedFilter::All:
                break;
        }

        const std::string needle = text::trim(filter.search);
        if (!needle.empty()) {
            out.pattern = like_pattern(needle);
            out.pattern_index = next;
            const std::string p = "?" + std::to_string(next);
            out.where += " AND (";
            const char* columns[] = {"name", "model", "mac_address", "ip_address", "asset_tag", "notes"};
            for (size_t i = 0; i < sizeof(columns) / sizeof(columns[0]); ++i) {
                if (i > 0) {
                    out.where += " OR ";
                }
                out.where += columns[i];
                out.where += " LIKE " + p + " ESCAPE '\\'";
            }
            out.where += ")";
        }
        return out;
    }

    void bind_filter(sqlite3_stmt* stmt, const FilterSql& f, i64 after_id) noexcept {
        sqlite3_bind_int64(stmt, 1, after_id);
        int index = 2;
        for (i64 v : f.ids) {
            sqlite3_bind_int64(stmt, index++, v);
        }
        if (f.pattern_index > 0) {
            dbd::bind_text(stmt, f.pattern_index, f.pattern);
        }
    }

    Status fetch_page(ItemCursor* cursor) noexcept {
        dbd::ConnGuard guard(cursor->db);
        if (!guard.valid()) {
            return make_status(StatusDomain::Items, StatusCode::Invalid);
        }

        const FilterSql f = build_where(cursor->filter);
        std::string sql = detail::kItemColumns;
        sql += f.where;
        sql += " ORDER BY id LIMIT " + std::to_string(cursor->filter.page_size);

        dbd::Stmt stmt(guard.get(), sql.c_str());
        const Status s = dbd::prepare_status(stmt, StatusDomain::Items);
        if (!is_ok(s)) {
            return s;
        }
        bind_filter(stmt.get(), f, cursor->last_id);

        cursor->page.clear();
        cursor->pos = 0;
        int rc = SQLITE_ROW;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            Item item;
            detail::read_item(stmt.get(), &item);
            cursor->page.push_back(std::move(item));
        }
        if (rc != SQLITE_DONE) {
            cursor->page.clear();
            return dbd::status_from_rc(rc, StatusDomain::Items);
        }
        if (cursor->page.size() < cursor->filter.page_size) {
            cursor->exhausted = true;
        }
        return ok_status();
    }
}

Status item_cursor_open(assetforge::db::DbHandle db, const ItemFilter& filter, ItemCursor* out) noexcept {
    if (!out || !assetforge::db::db_handle_valid(db)) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    if (filter.page_size == 0 || filter.page_size > kMaxPageSize) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    out->db = db;
    out->filter = filter;
    item_cursor_rewind(out);
    return ok_status();
}

Status item_cursor_next(ItemCursor* cursor, Item* out, bool* has_row) noexcept {
    if (!cursor || !out || !has_row) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    *has_row = false;

    if (cursor->pos >= cursor->page.size()) {
        if (cursor->exhausted) {
            return ok_status();
        }
        const Status s = fetch_page(cursor);
        if (!is_ok(s)) {
            return s;
        }
        if (cursor->page.empty()) {
            return ok_status();
        }
    }

    *out = std::move(cursor->page[cursor->pos++]);
    cursor->last_id = out->id.v;
    *has_row = true;
    return ok_status();
}

void item_cursor_rewind(ItemCursor* cursor) noexcept {
    if (!cursor) {
        return;
    }
    cursor->last_id = 0;
    cursor->page.clear();
    cursor->pos = 0;
    cursor->exhausted = false;
}

Status item_query_all(assetforge::db::DbHandle db, const ItemFilter& filter, std::vector<Item>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }
    ItemCursor cursor;
    Status s = item_cursor_open(db, filter, &cursor);
    if (!is_ok(s)) {
        return s;
    }

    out->clear();
    for (;;) {
        Item item;
        bool has_row = false;
        s = item_cursor_next(&cursor, &item, &has_row);
        if (!is_ok(s)) {
            return s;
        }
        if (!has_row) {
            return ok_status();
        }
        out->push_back(std::move(item));
    }
}

Status item_count(assetforge::db::DbHandle db, const ItemFilter& filter, u64* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    dbd::ConnGuard guard(db);
    if (!guard.valid()) {
        return make_status(StatusDomain::Items, StatusCode::Invalid);
    }

    const FilterSql f = build_where(filter);
    std::string sql = "SELECT COUNT(*) FROM items ";
    sql += f.where;

    dbd::Stmt stmt(guard.get(), sql.c_str());
    const Status s = dbd::prepare_status(stmt, StatusDomain::Items);
    if (!is_ok(s)) {
        return s;
    }
    bind_filter(stmt.get(), f, 0);

    const int rc = stmt.step();
    if (rc != SQLITE_ROW) {
        return dbd::status_from_rc(rc, StatusDomain::Items);
    }
    *out = static_cast<u64>(sqlite3_column_int64(stmt.get(), 0));
    return ok_status();
}

} // namespace assetforge::items
