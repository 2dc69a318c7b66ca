#pragma once

#include <sqlite3.h>

#include <string>
#include <vector>

#include "assetforge/audit/digest.hpp"
#include "assetforge/core/errors.hpp"
#include "assetforge/core/models.hpp"

namespace assetforge::audit::detail {

    struct AuditAppend {
        assetforge::core::ItemId item{assetforge::core::ItemId::invalid()};
        assetforge::core::AuditReason reason{assetforge::core::AuditReason::Update};
        std::string note;
        std::vector<std::string> changed_fields;
        std::string snapshot_before; // JSON text; empty stores NULL
        std::string snapshot_after;
    };

    // Appends one entry inside the caller's write transaction, chaining its
    // digest from the item's latest entry.
    assetforge::core::Status audit_append(sqlite3* conn,
        const AuditAppend& entry,
        assetforge::core::UpdateId* out) noexcept;

    // Recomputes and stores the digest chain of every item; used when the
    // digest column is introduced.
    assetforge::core::Status audit_backfill_digests(sqlite3* conn) noexcept;

    [[nodiscard]] std::string changed_fields_encode(const std::vector<std::string>& fields);

    // JSON array text; legacy rows may hold a comma separated list instead.
    [[nodiscard]] std::vector<std::string> changed_fields_decode(const std::string& text);

} // namespace assetforge::audit::detail
