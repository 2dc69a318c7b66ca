#include <gtest/gtest.h>

#include <vector>

#include "assetforge/catalog/catalog.hpp"
#include "assetforge/items/item_store.hpp"
#include "test_support.hpp"

using namespace assetforge::core;
using namespace assetforge::catalog;

class CatalogTest : public assetforge::test::StoreTest {};

TEST_F(CatalogTest, CreateTrimsAndRejectsCaseInsensitiveDuplicates) {
    i64 id = 0;
    ASSERT_TRUE(is_ok(catalog_create(db_, CatalogKind::Location, "  Warehouse  ", &id)));

    CatalogEntry e;
    ASSERT_TRUE(is_ok(catalog_get(db_, CatalogKind::Location, id, &e)));
    EXPECT_EQ(e.name, "Warehouse");
    EXPECT_EQ(e.kind, CatalogKind::Location);
    EXPECT_EQ(e.parent_id, 0);

    i64 dup = 0;
    const Status s = catalog_create(db_, CatalogKind::Location, "WAREHOUSE", &dup);
    EXPECT_EQ(s.code, StatusCode::Duplicate);
    EXPECT_EQ(s.domain, StatusDomain::Catalog);

    EXPECT_EQ(catalog_create(db_, CatalogKind::Location, "   ", &dup).code, StatusCode::Invalid);
}

TEST_F(CatalogTest, SameNameAllowedAcrossKinds) {
    i64 group = 0;
    i64 user = 0;
    EXPECT_TRUE(is_ok(catalog_create(db_, CatalogKind::Group, "IT", &group)));
    EXPECT_TRUE(is_ok(catalog_create(db_, CatalogKind::User, "IT", &user)));
}

TEST_F(CatalogTest, EnsureReturnsExistingRow) {
    i64 first = 0;
    i64 second = 0;
    ASSERT_TRUE(is_ok(catalog_ensure(db_, CatalogKind::User, "Dana Reyes", &first)));
    ASSERT_TRUE(is_ok(catalog_ensure(db_, CatalogKind::User, "dana reyes ", &second)));
    EXPECT_EQ(first, second);

    std::vector<CatalogEntry> users;
    ASSERT_TRUE(is_ok(catalog_list(db_, CatalogKind::User, &users)));
    EXPECT_EQ(users.size(), 1u);
}

TEST_F(CatalogTest, SeededSubTypesAreListedByName) {
    std::vector<CatalogEntry> subs;
    ASSERT_TRUE(is_ok(catalog_list(db_, CatalogKind::SubType, &subs)));
    ASSERT_EQ(subs.size(), 10u);
    EXPECT_EQ(subs.front().name, "Access Point");
    EXPECT_EQ(subs.back().name, "Switch");

    CatalogEntry e;
    ASSERT_TRUE(is_ok(catalog_find_by_name(db_, CatalogKind::SubType, "card reader", &e)));
    EXPECT_EQ(e.name, "Card Reader");
}

TEST_F(CatalogTest, RenameChecksUniqueness) {
    i64 a = 0;
    i64 b = 0;
    ASSERT_TRUE(is_ok(catalog_create(db_, CatalogKind::Group, "Finance", &a)));
    ASSERT_TRUE(is_ok(catalog_create(db_, CatalogKind::Group, "Sales", &b)));

    EXPECT_EQ(catalog_rename(db_, CatalogKind::Group, b, "finance").code, StatusCode::Duplicate);
    EXPECT_TRUE(is_ok(catalog_rename(db_, CatalogKind::Group, a, "FINANCE")));
    EXPECT_EQ(catalog_rename(db_, CatalogKind::Group, 9999, "Ops").code, StatusCode::NotFound);

    CatalogEntry e;
    ASSERT_TRUE(is_ok(catalog_get(db_, CatalogKind::Group, a, &e)));
    EXPECT_EQ(e.name, "FINANCE");
}

TEST_F(CatalogTest, DeleteClearsItemReferences) {
    i64 loc = 0;
    ASSERT_TRUE(is_ok(catalog_create(db_, CatalogKind::Location, "Annex", &loc)));

    assetforge::items::ItemFields f = fields("PC", "Annex desktop");
    f.location = LocationId{loc};
    Item item;
    ASSERT_TRUE(is_ok(assetforge::items::item_create(db_, f, nullptr, &item)));
    EXPECT_EQ(item.location.v, loc);

    ASSERT_TRUE(is_ok(catalog_delete(db_, CatalogKind::Location, loc)));
    EXPECT_EQ(catalog_delete(db_, CatalogKind::Location, loc).code, StatusCode::NotFound);

    Item after;
    ASSERT_TRUE(is_ok(assetforge::items::item_get(db_, item.id, &after)));
    EXPECT_FALSE(after.location.is_valid());
}

TEST_F(CatalogTest, UserEmailSetAndClear) {
    i64 user = 0;
    ASSERT_TRUE(is_ok(catalog_create(db_, CatalogKind::User, "Sam Ortiz", &user)));
    ASSERT_TRUE(is_ok(user_set_email(db_, user, " sam@example.com ")));

    CatalogEntry e;
    ASSERT_TRUE(is_ok(catalog_get(db_, CatalogKind::User, user, &e)));
    EXPECT_EQ(e.email, "sam@example.com");

    ASSERT_TRUE(is_ok(user_set_email(db_, user, nullptr)));
    ASSERT_TRUE(is_ok(catalog_get(db_, CatalogKind::User, user, &e)));
    EXPECT_TRUE(e.email.empty());

    EXPECT_EQ(user_set_email(db_, 4242, "x@example.com").code, StatusCode::NotFound);
}

TEST_F(CatalogTest, LocationParentRejectsCycles) {
    i64 site = 0;
    i64 floor = 0;
    i64 room = 0;
    ASSERT_TRUE(is_ok(catalog_create(db_, CatalogKind::Location, "HQ", &site)));
    ASSERT_TRUE(is_ok(catalog_create(db_, CatalogKind::Location, "HQ Floor 2", &floor)));
    ASSERT_TRUE(is_ok(catalog_create(db_, CatalogKind::Location, "Room 204", &room)));

    ASSERT_TRUE(is_ok(location_set_parent(db_, floor, site)));
    ASSERT_TRUE(is_ok(location_set_parent(db_, room, floor)));

    EXPECT_EQ(location_set_parent(db_, site, room).code, StatusCode::Invalid);
    EXPECT_EQ(location_set_parent(db_, site, site).code, StatusCode::Invalid);
    EXPECT_EQ(location_set_parent(db_, room, 777).code, StatusCode::NotFound);

    ASSERT_TRUE(is_ok(location_set_parent(db_, room, 0)));
    CatalogEntry e;
    ASSERT_TRUE(is_ok(catalog_get(db_, CatalogKind::Location, room, &e)));
    EXPECT_EQ(e.parent_id, 0);
}

TEST_F(CatalogTest, DeletingParentDetachesChildren) {
    i64 site = 0;
    i64 room = 0;
    ASSERT_TRUE(is_ok(catalog_create(db_, CatalogKind::Location, "Depot", &site)));
    ASSERT_TRUE(is_ok(catalog_create(db_, CatalogKind::Location, "Depot Cage", &room)));
    ASSERT_TRUE(is_ok(location_set_parent(db_, room, site)));

    ASSERT_TRUE(is_ok(catalog_delete(db_, CatalogKind::Location, site)));
    CatalogEntry e;
    ASSERT_TRUE(is_ok(catalog_get(db_, CatalogKind::Location, room, &e)));
    EXPECT_EQ(e.parent_id, 0);
}
