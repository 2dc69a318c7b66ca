#pragma once

#include <string>
#include <utility>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/models.hpp"
#include "assetforge/db/db.hpp"

namespace assetforge::items {
    using u32 = assetforge::core::u32;
    using Item = assetforge::core::Item;
    using ItemId = assetforge::core::ItemId;
    using AuditReason = assetforge::core::AuditReason;

    // Caller-supplied item fields. Empty text means NULL; invalid() ids mean
    // "no reference".
    struct ItemFields {
        std::string name;
        std::string model;
        assetforge::core::TypeId type{assetforge::core::TypeId::invalid()};
        std::string mac_address;
        std::string ip_address;
        assetforge::core::LocationId location{assetforge::core::LocationId::invalid()};
        assetforge::core::UserId user{assetforge::core::UserId::invalid()};
        assetforge::core::GroupId group{assetforge::core::GroupId::invalid()};
        assetforge::core::SubTypeId sub_type{assetforge::core::SubTypeId::invalid()};
        std::string notes;
        std::string extension;
    };

    enum class ItemField : u32 {
        Name = 1u << 0,
        Model = 1u << 1,
        Type = 1u << 2,
        MacAddress = 1u << 3,
        IpAddress = 1u << 4,
        Location = 1u << 5,
        User = 1u << 6,
        Group = 1u << 7,
        SubType = 1u << 8,
        Notes = 1u << 9,
        Extension = 1u << 10,
    };

    // Column name as recorded in an audit entry's changed_fields.
    [[nodiscard]] const char* item_field_name(ItemField field) noexcept;

    // A partial update: only the fields whose bit is set are applied.
    struct ItemPatch {
        u32 mask{0};
        ItemFields values{};

        [[nodiscard]] bool has(ItemField f) const noexcept { return (mask & static_cast<u32>(f)) != 0; }

        ItemPatch& set_name(std::string v) { values.name = std::move(v); return mark(ItemField::Name); }
        ItemPatch& set_model(std::string v) { values.model = std::move(v); return mark(ItemField::Model); }
        ItemPatch& set_type(assetforge::core::TypeId v) { values.type = v; return mark(ItemField::Type); }
        ItemPatch& set_mac_address(std::string v) { values.mac_address = std::move(v); return mark(ItemField::MacAddress); }
        ItemPatch& set_ip_address(std::string v) { values.ip_address = std::move(v); return mark(ItemField::IpAddress); }
        ItemPatch& set_location(assetforge::core::LocationId v) { values.location = v; return mark(ItemField::Location); }
        ItemPatch& set_user(assetforge::core::UserId v) { values.user = v; return mark(ItemField::User); }
        ItemPatch& set_group(assetforge::core::GroupId v) { values.group = v; return mark(ItemField::Group); }
        ItemPatch& set_sub_type(assetforge::core::SubTypeId v) { values.sub_type = v; return mark(ItemField::SubType); }
        ItemPatch& set_notes(std::string v) { values.notes = std::move(v); return mark(ItemField::Notes); }
        ItemPatch& set_extension(std::string v) { values.extension = std::move(v); return mark(ItemField::Extension); }

    private:
        ItemPatch& mark(ItemField f) noexcept {
            mask |= static_cast<u32>(f);
            return *this;
        }
    };

    // ========================================================================
    // Creation / update
    // ========================================================================

    // Validates references and mac/ip, allocates the type's next serial,
    // derives the tag and records a `create` audit entry, all in one
    // transaction.
    // - Invalid: empty name, no type, malformed mac/ip, extension on a
    //   non-landline type
    // - NotFound: type or catalog reference does not exist
    // - Duplicate: mac (any case) or ip already used by another item
    // - Conflict: the write lost to concurrent writers after all retries
    assetforge::core::Status item_create(assetforge::db::DbHandle db,
        const ItemFields& fields,
        const char* note,
        Item* out) noexcept;

    // Applies the patch, re-validates what changed, re-derives the tag when the
    // type changes (the serial is kept), refreshes updated_at and records one
    // audit entry with the field diff and both snapshots. Accepted reasons:
    // update, move, assign, audit, retire.
    assetforge::core::Status item_update(assetforge::db::DbHandle db,
        ItemId id,
        const ItemPatch& patch,
        AuditReason reason,
        const char* note,
        Item* out) noexcept;

    assetforge::core::Status item_move(assetforge::db::DbHandle db,
        ItemId id,
        assetforge::core::LocationId location,
        const char* note,
        Item* out) noexcept;

    assetforge::core::Status item_assign(assetforge::db::DbHandle db,
        ItemId id,
        assetforge::core::UserId user,
        assetforge::core::GroupId group,
        const char* note,
        Item* out) noexcept;

    // Flag only; tag and serial are untouched. Setting the state the item
    // already has succeeds without writing an entry.
    assetforge::core::Status item_archive(assetforge::db::DbHandle db,
        ItemId id,
        const char* note,
        Item* out) noexcept;

    assetforge::core::Status item_reactivate(assetforge::db::DbHandle db,
        ItemId id,
        const char* note,
        Item* out) noexcept;

    // Administrative removal; the item's audit trail and attributes go with it.
    assetforge::core::Status item_purge(assetforge::db::DbHandle db, ItemId id) noexcept;

    // ========================================================================
    // Lookup
    // ========================================================================

    assetforge::core::Status item_get(assetforge::db::DbHandle db, ItemId id, Item* out) noexcept;

    // Tag match ignores case and surrounding whitespace.
    assetforge::core::Status item_find_by_tag(assetforge::db::DbHandle db, const char* tag, Item* out) noexcept;

    assetforge::core::Status item_find_by_mac(assetforge::db::DbHandle db, const char* mac, Item* out) noexcept;

    // Barcode scanner input: resolves a tag, else a MAC address.
    assetforge::core::Status item_lookup_scan(assetforge::db::DbHandle db, const char* text, Item* out) noexcept;

} // namespace assetforge::items
