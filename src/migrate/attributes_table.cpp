#include "migrate/steps.hpp"

namespace assetforge::migrate::detail {

using namespace assetforge::core;

Status step_item_attributes(sqlite3* conn) noexcept {
    return script(conn,
        "CREATE TABLE item_attributes ("
        "  id INTEGER PRIMARY KEY,"
        "  item_id INTEGER NOT NULL REFERENCES items(id) ON DELETE CASCADE,"
        "  key TEXT NOT NULL,"
        "  value TEXT NOT NULL,"
        "  created_at_utc TEXT NOT NULL,"
        "  updated_at_utc TEXT NOT NULL,"
        "  UNIQUE (item_id, key));");
}

} // namespace assetforge::migrate::detail
