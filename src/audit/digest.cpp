#include "assetforge/audit/digest.hpp"

#include <blake3.h>

namespace assetforge::audit {
    namespace {
        void update_u64(blake3_hasher* hasher, assetforge::core::u64 v) noexcept {
            assetforge::core::u8 buf[8];
            for (int i = 0; i < 8; ++i) {
                buf[i] = static_cast<assetforge::core::u8>((v >> (8 * i)) & 0xFF);
            }
            blake3_hasher_update(hasher, buf, sizeof(buf));
        }

        void update_field(blake3_hasher* hasher, const std::string& field) noexcept {
            update_u64(hasher, static_cast<assetforge::core::u64>(field.size()));
            if (!field.empty()) {
                blake3_hasher_update(hasher, field.data(), field.size());
            }
        }
    } // namespace

    assetforge::core::Status audit_entry_digest(const assetforge::core::Hash256& prev,
        const AuditEntryFields& entry,
        assetforge::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return assetforge::core::make_status(assetforge::core::StatusDomain::Audit, assetforge::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        blake3_hasher_update(&hasher, prev.b.data(), prev.b.size());
        update_u64(&hasher, static_cast<assetforge::core::u64>(entry.item_id));
        update_field(&hasher, entry.reason);
        update_field(&hasher, entry.note);
        update_field(&hasher, entry.changed_fields);
        update_field(&hasher, entry.snapshot_before);
        update_field(&hasher, entry.snapshot_after);
        update_field(&hasher, entry.created_at);

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return assetforge::core::ok_status();
    }
} // namespace assetforge::audit
