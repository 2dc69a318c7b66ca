#include <gtest/gtest.h>
#include "assetforge/db/db.hpp"
#include "assetforge/catalog/catalog.hpp"
#include "assetforge/catalog/type_registry.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

using namespace assetforge::db;
using namespace assetforge::core;

//=============================================================================
// Database Lifecycle Tests
//=============================================================================

TEST(Database, OpenClose) {
    DbConfig cfg{};
    DbHandle handle;

    Status s = db_open(cfg, &handle);
    EXPECT_TRUE(is_ok(s));
    EXPECT_TRUE(db_handle_valid(handle));

    s = db_close(handle);
    EXPECT_TRUE(is_ok(s));
    EXPECT_FALSE(db_handle_valid(handle));
}

TEST(Database, OpenWithNullOut) {
    DbConfig cfg{};
    Status s = db_open(cfg, nullptr);
    EXPECT_FALSE(is_ok(s));
    EXPECT_EQ(s.code, StatusCode::Invalid);
}

TEST(Database, CloseInvalidHandle) {
    DbHandle invalid{0};
    Status s = db_close(invalid);
    EXPECT_FALSE(is_ok(s));
}

TEST(Database, MultipleOpenClose) {
    DbConfig cfg{};
    DbHandle handle;

    for (int i = 0; i < 3; ++i) {
        Status s = db_open(cfg, &handle);
        EXPECT_TRUE(is_ok(s));

        s = db_close(handle);
        EXPECT_TRUE(is_ok(s));
    }
}

TEST(Database, InMemoryHandlesAreIndependent) {
    DbConfig cfg{};
    DbHandle a;
    DbHandle b;
    ASSERT_TRUE(is_ok(db_open(cfg, &a)));
    ASSERT_TRUE(is_ok(db_open(cfg, &b)));
    EXPECT_NE(a.id, b.id);

    EXPECT_TRUE(is_ok(db_exec(a, "CREATE TABLE t (x INTEGER)")));
    EXPECT_FALSE(is_ok(db_exec(b, "INSERT INTO t VALUES (1)")));

    const char* name = nullptr;
    EXPECT_TRUE(is_ok(db_filename(a, &name)));
    ASSERT_NE(name, nullptr);
    EXPECT_STREQ(name, "");

    EXPECT_TRUE(is_ok(db_close(a)));
    EXPECT_TRUE(is_ok(db_close(b)));
}

TEST(Database, QuickCheckOnFreshStore) {
    DbConfig cfg{};
    DbHandle handle;
    ASSERT_TRUE(is_ok(db_open(cfg, &handle)));
    bool ok = false;
    EXPECT_TRUE(is_ok(db_quick_check(handle, &ok)));
    EXPECT_TRUE(ok);
    EXPECT_EQ(db_quick_check(handle, nullptr).code, StatusCode::Invalid);
    EXPECT_TRUE(is_ok(db_close(handle)));
}

//=============================================================================
// Transaction Tests
//=============================================================================

TEST(DatabaseTxn, BeginCommit) {
    DbConfig cfg{};
    DbHandle handle;
    ASSERT_TRUE(is_ok(db_open(cfg, &handle)));
    ASSERT_TRUE(is_ok(db_exec(handle, "CREATE TABLE t (x INTEGER)")));

    DbTxn txn;
    ASSERT_TRUE(is_ok(db_txn_begin(handle, &txn)));
    EXPECT_TRUE(db_txn_valid(txn));
    EXPECT_TRUE(is_ok(db_exec(handle, "INSERT INTO t VALUES (1)")));
    EXPECT_TRUE(is_ok(db_txn_commit(txn)));

    // a second commit has nothing to commit
    EXPECT_EQ(db_txn_commit(txn).code, StatusCode::Invalid);
    EXPECT_TRUE(is_ok(db_close(handle)));
}

TEST(DatabaseTxn, NestedBeginIsInvalid) {
    DbConfig cfg{};
    DbHandle handle;
    ASSERT_TRUE(is_ok(db_open(cfg, &handle)));

    DbTxn txn;
    ASSERT_TRUE(is_ok(db_txn_begin(handle, &txn, TxnMode::Deferred)));
    DbTxn inner;
    EXPECT_EQ(db_txn_begin(handle, &inner).code, StatusCode::Invalid);
    EXPECT_TRUE(is_ok(db_txn_rollback(txn)));
    EXPECT_TRUE(is_ok(db_close(handle)));
}

class DatabaseStoreTxn : public assetforge::test::StoreTest {};

TEST_F(DatabaseStoreTxn, RollbackDiscardsStoreWrites) {
    DbTxn txn;
    ASSERT_TRUE(is_ok(db_txn_begin(db_, &txn)));

    i64 id = 0;
    ASSERT_TRUE(is_ok(assetforge::catalog::catalog_create(db_, CatalogKind::Location, "Basement", &id)));
    Item item = create("PC", "Scratch laptop");
    EXPECT_EQ(item.asset_tag, "SDMM-PC-0001");

    ASSERT_TRUE(is_ok(db_txn_rollback(txn)));

    CatalogEntry e;
    EXPECT_EQ(assetforge::catalog::catalog_get(db_, CatalogKind::Location, id, &e).code, StatusCode::NotFound);
    Item missing;
    EXPECT_EQ(assetforge::items::item_get(db_, item.id, &missing).code, StatusCode::NotFound);

    // the serial went back with the rollback
    Item again = create("PC", "Real laptop");
    EXPECT_EQ(again.asset_tag, "SDMM-PC-0001");
}

TEST_F(DatabaseStoreTxn, CommitKeepsStoreWrites) {
    DbTxn txn;
    ASSERT_TRUE(is_ok(db_txn_begin(db_, &txn)));
    Item a = create("PX", "Printer A");
    Item b = create("PX", "Printer B");
    ASSERT_TRUE(is_ok(db_txn_commit(txn)));

    Item got;
    ASSERT_TRUE(is_ok(assetforge::items::item_get(db_, b.id, &got)));
    EXPECT_EQ(a.asset_tag, "SDMM-PX-0001");
    EXPECT_EQ(got.asset_tag, "SDMM-PX-0002");
}

TEST_F(DatabaseStoreTxn, FailedOperationInsideCallerTxnLeavesEarlierWork) {
    DbTxn txn;
    ASSERT_TRUE(is_ok(db_txn_begin(db_, &txn)));
    Item a = create("NX", "Core switch");

    assetforge::items::ItemFields bad = fields("NX", "");
    Item out;
    EXPECT_EQ(assetforge::items::item_create(db_, bad, nullptr, &out).code, StatusCode::Invalid);
    ASSERT_TRUE(is_ok(db_txn_commit(txn)));

    Item got;
    EXPECT_TRUE(is_ok(assetforge::items::item_get(db_, a.id, &got)));
}
