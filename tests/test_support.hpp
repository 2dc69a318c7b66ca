#pragma once

#include <gtest/gtest.h>

#include <string>

#include "assetforge/catalog/type_registry.hpp"
#include "assetforge/core/errors.hpp"
#include "assetforge/db/db.hpp"
#include "assetforge/db/schema.hpp"
#include "assetforge/items/item_store.hpp"
#include "assetforge/migrate/migration.hpp"

namespace assetforge::test {

    // Private in-memory store migrated to the latest schema.
    class StoreTest : public ::testing::Test {
    protected:
        void SetUp() override {
            assetforge::db::DbConfig cfg{};
            ASSERT_TRUE(assetforge::core::is_ok(assetforge::db::db_open(cfg, &db_)));
            assetforge::migrate::MigrationReport report;
            const assetforge::core::Status s =
                assetforge::migrate::migrate_to(db_, assetforge::db::kSchemaLatest, {}, &report);
            ASSERT_TRUE(assetforge::core::is_ok(s));
        }

        void TearDown() override {
            EXPECT_TRUE(assetforge::core::is_ok(assetforge::db::db_close(db_)));
        }

        [[nodiscard]] assetforge::core::TypeId type_by_code(const char* code) const {
            assetforge::core::HardwareType t;
            EXPECT_TRUE(assetforge::core::is_ok(assetforge::catalog::type_find_by_code(db_, code, &t)));
            return t.id;
        }

        [[nodiscard]] assetforge::items::ItemFields fields(const char* code, const char* name) const {
            assetforge::items::ItemFields f;
            f.type = type_by_code(code);
            f.name = name;
            return f;
        }

        assetforge::core::Item create(const char* code, const char* name) {
            assetforge::core::Item item;
            const assetforge::core::Status s = assetforge::items::item_create(db_, fields(code, name), nullptr, &item);
            EXPECT_TRUE(assetforge::core::is_ok(s));
            return item;
        }

        assetforge::db::DbHandle db_{};
    };

} // namespace assetforge::test
