#pragma once

#include <string>
#include <vector>

#include "assetforge/core/types.hpp"

namespace assetforge::core {

    // ========================================================================
    // Reference entities
    // ========================================================================

    struct HardwareType {
        TypeId id{TypeId::invalid()};
        std::string name;
        std::string code;
    };

    enum class CatalogKind : u8 {
        Location = 0,
        User = 1,
        Group = 2,
        SubType = 3,
    };

    // One row of a reference catalog. parent_id is only meaningful for
    // locations, email only for users; 0 means "none".
    struct CatalogEntry {
        i64 id{0};
        CatalogKind kind{CatalogKind::Location};
        std::string name;
        i64 parent_id{0};
        std::string email;
    };

    // ========================================================================
    // Items
    // ========================================================================

    // Nullable text columns are represented by the empty string.
    struct Item {
        ItemId id{ItemId::invalid()};
        std::string name;
        std::string model;
        TypeId type{TypeId::invalid()};
        std::string mac_address;
        std::string ip_address;
        LocationId location{LocationId::invalid()};
        UserId user{UserId::invalid()};
        GroupId group{GroupId::invalid()};
        SubTypeId sub_type{SubTypeId::invalid()};
        std::string notes;
        std::string extension;
        i64 type_serial{0};
        std::string asset_tag;
        std::string created_at;
        std::string updated_at;
        bool archived{false};
    };

    struct ItemAttribute {
        i64 id{0};
        ItemId item{ItemId::invalid()};
        std::string key;
        std::string value;
        std::string created_at;
        std::string updated_at;
    };

    // ========================================================================
    // Audit trail
    // ========================================================================

    enum class AuditReason : u8 {
        Create = 0,
        Update,
        Move,
        Assign,
        Audit,
        Retire,
        Archive,
        Reactivate,
        AttributeAdd,
        AttributeUpdate,
        AttributeRemove,
        // Read back from a stored entry whose reason is none of the above
        // (legacy rows); the stored text is in ItemUpdate::reason_text.
        Other,
    };

    struct ItemUpdate {
        UpdateId id{UpdateId::invalid()};
        ItemId item{ItemId::invalid()};
        AuditReason reason{AuditReason::Update};
        std::string reason_text; // as stored
        std::string note;
        std::vector<std::string> changed_fields;
        std::string snapshot_before; // JSON object text, empty when absent
        std::string snapshot_after;
        std::string created_at;
        Hash256 digest{};
    };

    // ========================================================================
    // Schema ledger
    // ========================================================================

    struct MigrationRecord {
        i32 version{0};
        std::string description;
        std::string applied_at;
    };

} // namespace assetforge::core
