#include <benchmark/benchmark.h>

#include <string>

#include "assetforge/db/db.hpp"
#include "assetforge/db/schema.hpp"
#include "assetforge/migrate/migration.hpp"

using namespace assetforge::core;
using namespace assetforge::migrate;

namespace {

const char* const kLegacyTables[] = {
    "laptops_pcs", "network_gear", "landline_phones", "printers", "payment_terminals",
    "lorex_cameras", "eufy_cameras", "peripheral_devices", "access_points", "misc",
};

// Legacy store with `rows` rows in every per-type table, half of them
// claiming a master, and one audit entry per row.
std::string legacy_fixture(i64 rows) {
    std::string sql = "BEGIN;";
    sql += "INSERT INTO locations (id, name) VALUES (1, 'HQ'), (2, ' hq '), (3, 'Depot');";
    i64 next_id = 1;
    i64 type_id = 1;
    for (const char* table : kLegacyTables) {
        for (i64 r = 0; r < rows; ++r, ++next_id) {
            const std::string id = std::to_string(next_id);
            const std::string type = std::to_string(type_id);
            const bool mastered = (r % 2) == 0;
            if (mastered) {
                sql += "INSERT INTO master_list (master_id, name, type_id) VALUES (" +
                       std::to_string(100000 + next_id) + ", 'Row " + id + "', " + type + ");";
            }
            sql += "INSERT INTO ";
            sql += table;
            sql += " (id, name, location_id, created_at_utc, updated_at_utc, master_id) VALUES (" + id +
                   ", 'Row " + id + "', " + std::to_string(1 + r % 3) +
                   ", '2024-01-01T00:00:00Z', '2024-01-01T00:00:00Z', " +
                   (mastered ? std::to_string(100000 + next_id) : std::string("NULL")) + ");";
            sql += "INSERT INTO item_index (id, type_id) VALUES (" + id + ", " + type + ");";
            sql += "INSERT INTO item_updates (item_id, reason) VALUES (" + id + ", 'create');";
        }
        ++type_id;
    }
    sql += "COMMIT;";
    return sql;
}

} // namespace

//=============================================================================
// Schema upgrades
//=============================================================================

static void BM_MigrateEmptyStore(benchmark::State& state) {
    for (auto _ : state) {
        assetforge::db::DbConfig cfg{};
        assetforge::db::DbHandle db;
        (void)assetforge::db::db_open(cfg, &db);
        MigrationReport report;
        const Status s = migrate_to(db, assetforge::db::kSchemaLatest, {}, &report);
        benchmark::DoNotOptimize(s);
        (void)assetforge::db::db_close(db);
    }
}
BENCHMARK(BM_MigrateEmptyStore);

static void BM_MigrateLegacyStore(benchmark::State& state) {
    const std::string fixture = legacy_fixture(state.range(0));
    for (auto _ : state) {
        state.PauseTiming();
        assetforge::db::DbConfig cfg{};
        assetforge::db::DbHandle db;
        (void)assetforge::db::db_open(cfg, &db);
        MigrationReport report;
        (void)migrate_to(db, assetforge::db::SchemaVersion::LegacyBaseline, {}, &report);
        (void)assetforge::db::db_exec(db, fixture.c_str());
        state.ResumeTiming();

        const Status s = migrate_to(db, assetforge::db::kSchemaLatest, {}, &report);
        benchmark::DoNotOptimize(s);

        state.PauseTiming();
        (void)assetforge::db::db_close(db);
        state.ResumeTiming();
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * 10);
}
BENCHMARK(BM_MigrateLegacyStore)->Arg(10)->Arg(100)->Arg(1000);

static void BM_CurrentVersion(benchmark::State& state) {
    assetforge::db::DbConfig cfg{};
    assetforge::db::DbHandle db;
    (void)assetforge::db::db_open(cfg, &db);
    MigrationReport report;
    (void)migrate_to(db, assetforge::db::kSchemaLatest, {}, &report);
    for (auto _ : state) {
        i32 v = 0;
        const Status s = migrate_current_version(db, &v);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(v);
    }
    (void)assetforge::db::db_close(db);
}
BENCHMARK(BM_CurrentVersion);
