#include "migrate/steps.hpp"
#include "audit/audit_internal.hpp"

namespace assetforge::migrate::detail {

using namespace assetforge::core;

Status step_audit_digests(sqlite3* conn) noexcept {
    Status s = script(conn, "ALTER TABLE item_updates ADD COLUMN entry_digest BLOB;");
    if (!is_ok(s)) {
        return s;
    }
    // the guard goes in after the backfill, which is the last in-place write
    s = assetforge::audit::detail::audit_backfill_digests(conn);
    if (!is_ok(s)) {
        return s;
    }
    return script(conn,
        "CREATE TRIGGER item_updates_append_only BEFORE UPDATE ON item_updates "
        "BEGIN SELECT RAISE(ABORT, 'item_updates is append-only'); END;");
}

} // namespace assetforge::migrate::detail
