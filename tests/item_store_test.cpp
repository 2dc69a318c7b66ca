#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "assetforge/audit/audit.hpp"
#include "assetforge/catalog/catalog.hpp"
#include "assetforge/identity/serial.hpp"
#include "assetforge/items/item_store.hpp"
#include "test_support.hpp"

using namespace assetforge::core;
using namespace assetforge::items;

class ItemStoreTest : public assetforge::test::StoreTest {};

//=============================================================================
// Creation
//=============================================================================

TEST_F(ItemStoreTest, PrintersGetSequentialTagsThatSurviveArchive) {
    Item a = create("PX", "Printer reception");
    Item b = create("PX", "Printer finance");
    Item c = create("PX", "Printer warehouse");
    EXPECT_EQ(a.asset_tag, "SDMM-PX-0001");
    EXPECT_EQ(b.asset_tag, "SDMM-PX-0002");
    EXPECT_EQ(c.asset_tag, "SDMM-PX-0003");

    Item archived;
    ASSERT_TRUE(is_ok(item_archive(db_, b.id, "replaced", &archived)));
    EXPECT_TRUE(archived.archived);
    EXPECT_EQ(archived.asset_tag, "SDMM-PX-0002");
    EXPECT_EQ(archived.type_serial, 2);

    Item d = create("PX", "Printer annex");
    EXPECT_EQ(d.asset_tag, "SDMM-PX-0004");
}

TEST_F(ItemStoreTest, CreateFillsDerivedColumns) {
    ItemFields f = fields("NX", "  Core switch  ");
    f.model = " Catalyst 9300 ";
    f.mac_address = "00-1a-2b-3c-4d-5e";
    f.ip_address = "10.0.0.2";
    Item item;
    ASSERT_TRUE(is_ok(item_create(db_, f, "racked", &item)));

    EXPECT_TRUE(item.id.is_valid());
    EXPECT_EQ(item.name, "Core switch");
    EXPECT_EQ(item.model, "Catalyst 9300");
    EXPECT_EQ(item.mac_address, "00:1A:2B:3C:4D:5E");
    EXPECT_EQ(item.type_serial, 1);
    EXPECT_EQ(item.asset_tag, "SDMM-NX-0001");
    EXPECT_FALSE(item.created_at.empty());
    EXPECT_EQ(item.created_at, item.updated_at);
    EXPECT_FALSE(item.archived);

    Item stored;
    ASSERT_TRUE(is_ok(item_get(db_, item.id, &stored)));
    EXPECT_EQ(stored.asset_tag, item.asset_tag);
    EXPECT_EQ(stored.mac_address, item.mac_address);
    EXPECT_EQ(stored.ip_address, "10.0.0.2");
}

TEST_F(ItemStoreTest, CreateValidationErrors) {
    Item out;

    ItemFields no_name = fields("PC", "   ");
    EXPECT_EQ(item_create(db_, no_name, nullptr, &out).code, StatusCode::Invalid);

    ItemFields no_type;
    no_type.name = "Orphan";
    EXPECT_EQ(item_create(db_, no_type, nullptr, &out).code, StatusCode::Invalid);

    ItemFields unknown_type = fields("PC", "Ghost");
    unknown_type.type = TypeId{999};
    EXPECT_EQ(item_create(db_, unknown_type, nullptr, &out).code, StatusCode::NotFound);

    ItemFields bad_loc = fields("PC", "Lost");
    bad_loc.location = LocationId{12345};
    const Status s = item_create(db_, bad_loc, nullptr, &out);
    EXPECT_EQ(s.code, StatusCode::NotFound);
    EXPECT_EQ(s.domain, StatusDomain::Items);

    ItemFields bad_mac = fields("PC", "Weird nic");
    bad_mac.mac_address = "00:11:22:33:44";
    EXPECT_EQ(item_create(db_, bad_mac, nullptr, &out).code, StatusCode::Invalid);

    ItemFields bad_ip = fields("PC", "Weird ip");
    bad_ip.ip_address = "300.1.1.1";
    EXPECT_EQ(item_create(db_, bad_ip, nullptr, &out).code, StatusCode::Invalid);
}

TEST_F(ItemStoreTest, MacUniqueIgnoringCaseAndFormat) {
    ItemFields f = fields("PC", "Laptop A");
    f.mac_address = "aa:bb:cc:dd:ee:ff";
    Item a;
    ASSERT_TRUE(is_ok(item_create(db_, f, nullptr, &a)));
    EXPECT_EQ(a.mac_address, "AA:BB:CC:DD:EE:FF");

    ItemFields g = fields("PD", "Dock");
    g.mac_address = "AABB.CCDD.EEFF";
    Item b;
    const Status s = item_create(db_, g, nullptr, &b);
    EXPECT_EQ(s.code, StatusCode::Duplicate);
    EXPECT_EQ(s.domain, StatusDomain::Items);

    // the failed create left the dock counter alone
    i64 next = 0;
    ASSERT_TRUE(is_ok(assetforge::identity::serial_peek(db_, type_by_code("PD"), &next)));
    EXPECT_EQ(next, 1);
}

TEST_F(ItemStoreTest, IpUniqueAndIpv6Accepted) {
    ItemFields f = fields("AP", "AP lobby");
    f.ip_address = "fe80::1";
    Item a;
    ASSERT_TRUE(is_ok(item_create(db_, f, nullptr, &a)));

    ItemFields g = fields("AP", "AP upstairs");
    g.ip_address = " fe80::1 ";
    Item b;
    EXPECT_EQ(item_create(db_, g, nullptr, &b).code, StatusCode::Duplicate);
}

TEST_F(ItemStoreTest, ExtensionOnlyForLandlines) {
    ItemFields phone = fields("TP", "Front desk phone");
    phone.extension = "2104";
    Item p;
    ASSERT_TRUE(is_ok(item_create(db_, phone, nullptr, &p)));
    EXPECT_EQ(p.extension, "2104");

    ItemFields printer = fields("PX", "Printer with ext");
    printer.extension = "2105";
    Item x;
    EXPECT_EQ(item_create(db_, printer, nullptr, &x).code, StatusCode::Invalid);

    // moving a landline with an extension to another type needs the extension cleared
    ItemPatch retype;
    retype.set_type(type_by_code("MX"));
    Item out;
    EXPECT_EQ(item_update(db_, p.id, retype, AuditReason::Update, nullptr, &out).code, StatusCode::Invalid);

    retype.set_extension("");
    ASSERT_TRUE(is_ok(item_update(db_, p.id, retype, AuditReason::Update, nullptr, &out)));
    EXPECT_TRUE(out.extension.empty());
    EXPECT_EQ(out.asset_tag, "SDMM-MX-0001");
}

//=============================================================================
// Update
//=============================================================================

TEST_F(ItemStoreTest, UpdateRecordsDiffAndSnapshots) {
    Item item = create("PC", "Laptop");
    ItemPatch patch;
    patch.set_name("Laptop (Dana)").set_notes("new battery").set_model("");
    Item out;
    ASSERT_TRUE(is_ok(item_update(db_, item.id, patch, AuditReason::Update, "service", &out)));
    EXPECT_EQ(out.name, "Laptop (Dana)");
    EXPECT_EQ(out.asset_tag, item.asset_tag);
    EXPECT_GE(out.updated_at, item.updated_at);

    std::vector<ItemUpdate> trail;
    ASSERT_TRUE(is_ok(assetforge::audit::audit_list(db_, item.id, &trail)));
    ASSERT_EQ(trail.size(), 2u);
    EXPECT_EQ(trail[0].reason, AuditReason::Create);
    EXPECT_TRUE(trail[0].snapshot_before.empty());
    EXPECT_FALSE(trail[0].snapshot_after.empty());

    const ItemUpdate& u = trail[1];
    EXPECT_EQ(u.reason, AuditReason::Update);
    EXPECT_EQ(u.note, "service");
    const std::vector<std::string> expected = {"name", "notes"};
    EXPECT_EQ(u.changed_fields, expected);
    EXPECT_NE(u.snapshot_before.find("\"Laptop\""), std::string::npos);
    EXPECT_NE(u.snapshot_after.find("\"Laptop (Dana)\""), std::string::npos);
}

TEST_F(ItemStoreTest, UpdateRejectsReservedReasons) {
    Item item = create("PC", "Laptop");
    ItemPatch patch;
    patch.set_notes("x");
    Item out;
    EXPECT_EQ(item_update(db_, item.id, patch, AuditReason::Archive, nullptr, &out).code, StatusCode::Invalid);
    EXPECT_EQ(item_update(db_, item.id, patch, AuditReason::Create, nullptr, &out).code, StatusCode::Invalid);
    EXPECT_TRUE(is_ok(item_update(db_, item.id, patch, AuditReason::Retire, nullptr, &out)));
    EXPECT_EQ(item_update(db_, ItemId{9999}, patch, AuditReason::Update, nullptr, &out).code, StatusCode::NotFound);
}

TEST_F(ItemStoreTest, UpdateMacToOwnValueIsAllowed) {
    ItemFields f = fields("PC", "Laptop");
    f.mac_address = "AA:BB:CC:00:11:22";
    Item item;
    ASSERT_TRUE(is_ok(item_create(db_, f, nullptr, &item)));

    ItemPatch patch;
    patch.set_mac_address("aa-bb-cc-00-11-22");
    Item out;
    ASSERT_TRUE(is_ok(item_update(db_, item.id, patch, AuditReason::Audit, nullptr, &out)));
    EXPECT_EQ(out.mac_address, "AA:BB:CC:00:11:22");
}

TEST_F(ItemStoreTest, TypeChangeKeepsSerialAndReservesIt) {
    create("PC", "Laptop 1");
    create("PC", "Laptop 2");
    Item third = create("PC", "Laptop 3");

    ItemPatch patch;
    patch.set_type(type_by_code("PX"));
    Item out;
    ASSERT_TRUE(is_ok(item_update(db_, third.id, patch, AuditReason::Update, "was misfiled", &out)));
    EXPECT_EQ(out.type_serial, 3);
    EXPECT_EQ(out.asset_tag, "SDMM-PX-0003");

    Item next = create("PX", "Printer");
    EXPECT_EQ(next.asset_tag, "SDMM-PX-0004");

    Item found;
    ASSERT_TRUE(is_ok(item_find_by_tag(db_, "SDMM-PX-0003", &found)));
    EXPECT_EQ(found.id, third.id);
    EXPECT_EQ(item_find_by_tag(db_, "SDMM-PC-0003", &found).code, StatusCode::NotFound);
}

TEST_F(ItemStoreTest, TypeChangeCollisionIsDuplicate) {
    Item laptop = create("PC", "Laptop");
    create("PX", "Printer");

    ItemPatch patch;
    patch.set_type(type_by_code("PX"));
    Item out;
    const Status s = item_update(db_, laptop.id, patch, AuditReason::Update, nullptr, &out);
    EXPECT_EQ(s.code, StatusCode::Duplicate);
    EXPECT_EQ(s.domain, StatusDomain::Identity);

    Item unchanged;
    ASSERT_TRUE(is_ok(item_get(db_, laptop.id, &unchanged)));
    EXPECT_EQ(unchanged.asset_tag, "SDMM-PC-0001");
}

TEST_F(ItemStoreTest, MoveAndAssign) {
    i64 loc = 0;
    i64 user = 0;
    i64 group = 0;
    ASSERT_TRUE(is_ok(assetforge::catalog::catalog_create(db_, CatalogKind::Location, "Room 12", &loc)));
    ASSERT_TRUE(is_ok(assetforge::catalog::catalog_create(db_, CatalogKind::User, "Lee", &user)));
    ASSERT_TRUE(is_ok(assetforge::catalog::catalog_create(db_, CatalogKind::Group, "Support", &group)));

    Item item = create("PC", "Laptop");
    Item out;
    ASSERT_TRUE(is_ok(item_move(db_, item.id, LocationId{loc}, nullptr, &out)));
    EXPECT_EQ(out.location.v, loc);
    ASSERT_TRUE(is_ok(item_assign(db_, item.id, UserId{user}, GroupId{group}, "handover", &out)));
    EXPECT_EQ(out.user.v, user);
    EXPECT_EQ(out.group.v, group);

    std::vector<ItemUpdate> trail;
    ASSERT_TRUE(is_ok(assetforge::audit::audit_list(db_, item.id, &trail)));
    ASSERT_EQ(trail.size(), 3u);
    EXPECT_EQ(trail[1].reason, AuditReason::Move);
    EXPECT_EQ(trail[1].changed_fields, std::vector<std::string>{"location_id"});
    EXPECT_EQ(trail[2].reason, AuditReason::Assign);
    const std::vector<std::string> assigned = {"user_id", "group_id"};
    EXPECT_EQ(trail[2].changed_fields, assigned);

    EXPECT_EQ(item_move(db_, item.id, LocationId{loc + 100}, nullptr, &out).code, StatusCode::NotFound);
}

//=============================================================================
// Archive / purge
//=============================================================================

TEST_F(ItemStoreTest, ArchiveIsIdempotent) {
    Item item = create("CC", "Card reader");
    Item out;
    ASSERT_TRUE(is_ok(item_archive(db_, item.id, nullptr, &out)));
    ASSERT_TRUE(is_ok(item_archive(db_, item.id, nullptr, &out)));
    ASSERT_TRUE(is_ok(item_reactivate(db_, item.id, "back in use", &out)));
    EXPECT_FALSE(out.archived);

    std::vector<ItemUpdate> trail;
    ASSERT_TRUE(is_ok(assetforge::audit::audit_list(db_, item.id, &trail)));
    ASSERT_EQ(trail.size(), 3u);
    EXPECT_EQ(trail[1].reason, AuditReason::Archive);
    EXPECT_EQ(trail[2].reason, AuditReason::Reactivate);
    EXPECT_EQ(trail[2].changed_fields, std::vector<std::string>{"archived"});
}

TEST_F(ItemStoreTest, PurgeRemovesItemAndTrail) {
    Item item = create("LX", "Camera dock");
    ASSERT_TRUE(is_ok(item_purge(db_, item.id)));
    EXPECT_EQ(item_purge(db_, item.id).code, StatusCode::NotFound);

    std::vector<ItemUpdate> trail;
    EXPECT_EQ(assetforge::audit::audit_list(db_, item.id, &trail).code, StatusCode::NotFound);
}

//=============================================================================
// Lookup
//=============================================================================

TEST_F(ItemStoreTest, LookupScanResolvesTagThenMac) {
    ItemFields f = fields("EX", "Door camera");
    f.mac_address = "a1b2c3d4e5f6";
    Item cam;
    ASSERT_TRUE(is_ok(item_create(db_, f, nullptr, &cam)));

    Item out;
    ASSERT_TRUE(is_ok(item_lookup_scan(db_, "  sdmm-ex-0001 ", &out)));
    EXPECT_EQ(out.id, cam.id);

    ASSERT_TRUE(is_ok(item_lookup_scan(db_, "A1:B2:C3:D4:E5:F6", &out)));
    EXPECT_EQ(out.id, cam.id);
    ASSERT_TRUE(is_ok(item_find_by_mac(db_, "a1-b2-c3-d4-e5-f6", &out)));
    EXPECT_EQ(out.id, cam.id);

    EXPECT_EQ(item_lookup_scan(db_, "SDMM-EX-0002", &out).code, StatusCode::NotFound);
    EXPECT_EQ(item_lookup_scan(db_, "hello", &out).code, StatusCode::Invalid);
    EXPECT_EQ(item_lookup_scan(db_, "", &out).code, StatusCode::Invalid);
}
