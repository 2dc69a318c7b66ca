#pragma once

#include <vector>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/models.hpp"
#include "assetforge/db/db.hpp"

namespace assetforge::audit {
    using u32 = assetforge::core::u32;
    using AuditReason = assetforge::core::AuditReason;

    [[nodiscard]] const char* audit_reason_name(AuditReason reason) noexcept;
    [[nodiscard]] bool audit_reason_parse(const char* name, AuditReason* out) noexcept;

    // Oldest first: ordered by (created_at, id). NotFound if the item does not exist.
    assetforge::core::Status audit_list(assetforge::db::DbHandle db,
        assetforge::core::ItemId item,
        std::vector<assetforge::core::ItemUpdate>* out) noexcept;

    assetforge::core::Status audit_get(assetforge::db::DbHandle db,
        assetforge::core::UpdateId id,
        assetforge::core::ItemUpdate* out) noexcept;

    struct AuditVerifyResult {
        u32 checked{0};
        assetforge::core::UpdateId first_bad{assetforge::core::UpdateId::invalid()};
    };

    // Recomputes the item's digest chain in insertion order. A mismatch is
    // Corrupt, with first_bad naming the earliest entry that fails.
    assetforge::core::Status audit_verify(assetforge::db::DbHandle db,
        assetforge::core::ItemId item,
        AuditVerifyResult* out) noexcept;

} // namespace assetforge::audit
