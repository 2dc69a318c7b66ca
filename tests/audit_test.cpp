#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "assetforge/audit/audit.hpp"
#include "assetforge/audit/digest.hpp"
#include "assetforge/items/item_store.hpp"
#include "test_support.hpp"

using namespace assetforge::core;
using namespace assetforge::audit;

//=============================================================================
// Digest primitives
//=============================================================================

TEST(AuditDigest, EmptyEntryStillHashes) {
    Hash256 h{};
    ASSERT_TRUE(is_ok(audit_entry_digest(Hash256{}, AuditEntryFields{}, &h)));
    EXPECT_FALSE(hash_is_zero(h));
    EXPECT_TRUE(hash_is_zero(Hash256{}));

    EXPECT_EQ(audit_entry_digest(Hash256{}, AuditEntryFields{}, nullptr).code, StatusCode::Invalid);
}

TEST(AuditDigest, ChainsFromPreviousAndCoversEveryField) {
    AuditEntryFields e;
    e.item_id = 7;
    e.reason = "update";
    e.note = "moved desk";
    e.changed_fields = "[\"location_id\"]";
    e.created_at = "2026-01-02T03:04:05.000Z";

    Hash256 zero{};
    Hash256 a{};
    ASSERT_TRUE(is_ok(audit_entry_digest(zero, e, &a)));

    Hash256 again{};
    ASSERT_TRUE(is_ok(audit_entry_digest(zero, e, &again)));
    EXPECT_EQ(a, again);

    Hash256 chained{};
    ASSERT_TRUE(is_ok(audit_entry_digest(a, e, &chained)));
    EXPECT_NE(a, chained);

    // length prefixes keep field boundaries apart
    AuditEntryFields shifted = e;
    shifted.reason = "updatemoved desk";
    shifted.note = "";
    Hash256 b{};
    ASSERT_TRUE(is_ok(audit_entry_digest(zero, shifted, &b)));
    EXPECT_NE(a, b);

    AuditEntryFields other_item = e;
    other_item.item_id = 8;
    ASSERT_TRUE(is_ok(audit_entry_digest(zero, other_item, &b)));
    EXPECT_NE(a, b);
}

TEST(AuditReasons, NamesRoundTrip) {
    AuditReason r{};
    ASSERT_TRUE(audit_reason_parse("attribute_update", &r));
    EXPECT_EQ(r, AuditReason::AttributeUpdate);
    EXPECT_STREQ(audit_reason_name(AuditReason::Reactivate), "reactivate");
    EXPECT_FALSE(audit_reason_parse("Delete", &r));
    EXPECT_FALSE(audit_reason_parse(nullptr, &r));

    // read-only bucket for stored text outside the known set
    EXPECT_STREQ(audit_reason_name(AuditReason::Other), "other");
    EXPECT_FALSE(audit_reason_parse("other", &r));
}

//=============================================================================
// Trail
//=============================================================================

class AuditTrailTest : public assetforge::test::StoreTest {};

TEST_F(AuditTrailTest, CreateEntryListsSetFields) {
    assetforge::items::ItemFields f = fields("TP", "Desk phone");
    f.extension = "301";
    Item item;
    ASSERT_TRUE(is_ok(assetforge::items::item_create(db_, f, "initial", &item)));

    std::vector<ItemUpdate> trail;
    ASSERT_TRUE(is_ok(audit_list(db_, item.id, &trail)));
    ASSERT_EQ(trail.size(), 1u);
    const ItemUpdate& u = trail[0];
    EXPECT_EQ(u.item, item.id);
    EXPECT_EQ(u.reason, AuditReason::Create);
    EXPECT_EQ(u.reason_text, "create");
    EXPECT_EQ(u.note, "initial");
    const std::vector<std::string> expected = {"name", "type_id", "extension"};
    EXPECT_EQ(u.changed_fields, expected);
    EXPECT_NE(u.snapshot_after.find("SDMM-TP-0001"), std::string::npos);
    EXPECT_FALSE(hash_is_zero(u.digest));

    ItemUpdate got;
    ASSERT_TRUE(is_ok(audit_get(db_, u.id, &got)));
    EXPECT_EQ(got.digest, u.digest);
    EXPECT_EQ(audit_get(db_, UpdateId{99999}, &got).code, StatusCode::NotFound);
}

TEST_F(AuditTrailTest, VerifyAcceptsUntouchedChain) {
    Item item = create("PC", "Laptop");
    assetforge::items::ItemPatch patch;
    patch.set_notes("imaged");
    Item out;
    ASSERT_TRUE(is_ok(assetforge::items::item_update(db_, item.id, patch, AuditReason::Update, nullptr, &out)));
    ASSERT_TRUE(is_ok(assetforge::items::item_archive(db_, item.id, nullptr, &out)));

    AuditVerifyResult result;
    ASSERT_TRUE(is_ok(audit_verify(db_, item.id, &result)));
    EXPECT_EQ(result.checked, 3u);
    EXPECT_FALSE(result.first_bad.is_valid());

    EXPECT_EQ(audit_verify(db_, ItemId{4242}, &result).code, StatusCode::NotFound);
}

TEST_F(AuditTrailTest, EntriesAreAppendOnly) {
    Item item = create("PC", "Laptop");
    const Status s = assetforge::db::db_exec(db_, "UPDATE item_updates SET note = 'rewritten'");
    EXPECT_FALSE(is_ok(s));

    std::vector<ItemUpdate> trail;
    ASSERT_TRUE(is_ok(audit_list(db_, item.id, &trail)));
    ASSERT_EQ(trail.size(), 1u);
    EXPECT_TRUE(trail[0].note.empty());
}

TEST_F(AuditTrailTest, VerifyFindsFirstTamperedEntry) {
    Item item = create("PC", "Laptop");
    assetforge::items::ItemPatch patch;
    patch.set_notes("first");
    Item out;
    ASSERT_TRUE(is_ok(assetforge::items::item_update(db_, item.id, patch, AuditReason::Update, nullptr, &out)));
    patch.set_notes("second");
    ASSERT_TRUE(is_ok(assetforge::items::item_update(db_, item.id, patch, AuditReason::Update, nullptr, &out)));

    std::vector<ItemUpdate> trail;
    ASSERT_TRUE(is_ok(audit_list(db_, item.id, &trail)));
    ASSERT_EQ(trail.size(), 3u);

    ASSERT_TRUE(is_ok(assetforge::db::db_exec(db_, "DROP TRIGGER item_updates_append_only")));
    const std::string sql = "UPDATE item_updates SET note = 'edited' WHERE id = " + std::to_string(trail[1].id.v);
    ASSERT_TRUE(is_ok(assetforge::db::db_exec(db_, sql.c_str())));

    AuditVerifyResult result;
    const Status s = audit_verify(db_, item.id, &result);
    EXPECT_EQ(s.code, StatusCode::Corrupt);
    EXPECT_EQ(s.domain, StatusDomain::Audit);
    EXPECT_EQ(result.checked, 1u);
    EXPECT_EQ(result.first_bad, trail[1].id);
}

TEST_F(AuditTrailTest, ChainsAreKeptPerItem) {
    Item a = create("PC", "Laptop A");
    Item b = create("PC", "Laptop B");
    assetforge::items::ItemPatch patch;
    patch.set_notes("a only");
    Item out;
    ASSERT_TRUE(is_ok(assetforge::items::item_update(db_, a.id, patch, AuditReason::Audit, nullptr, &out)));

    AuditVerifyResult ra;
    AuditVerifyResult rb;
    ASSERT_TRUE(is_ok(audit_verify(db_, a.id, &ra)));
    ASSERT_TRUE(is_ok(audit_verify(db_, b.id, &rb)));
    EXPECT_EQ(ra.checked, 2u);
    EXPECT_EQ(rb.checked, 1u);
}
