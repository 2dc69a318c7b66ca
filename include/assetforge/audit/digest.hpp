#pragma once

#include <string>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/types.hpp"

namespace assetforge::audit {
    using i64 = assetforge::core::i64;

    [[nodiscard]] constexpr bool hash_is_zero(const assetforge::core::Hash256& h) noexcept {
        for (assetforge::core::u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // The stored columns of one item_updates row, as text (NULL reads as "").
    struct AuditEntryFields {
        i64 item_id{0};
        std::string reason;
        std::string note;
        std::string changed_fields;
        std::string snapshot_before;
        std::string snapshot_after;
        std::string created_at;
    };

    // digest = BLAKE3(prev || item_id || each field length-prefixed). The first
    // entry of an item chains from the all-zero hash.
    assetforge::core::Status audit_entry_digest(const assetforge::core::Hash256& prev,
        const AuditEntryFields& entry,
        assetforge::core::Hash256* out) noexcept;

} // namespace assetforge::audit
