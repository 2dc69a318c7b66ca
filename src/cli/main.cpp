#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include <filesystem>

#include "assetforge/audit/audit.hpp"
#include "assetforge/catalog/catalog.hpp"
#include "assetforge/catalog/type_registry.hpp"
#include "assetforge/cli/commands.hpp"
#include "assetforge/cli/options.hpp"
#include "assetforge/core/errors.hpp"
#include "assetforge/db/db.hpp"
#include "assetforge/db/schema.hpp"
#include "assetforge/identity/serial.hpp"
#include "assetforge/items/attributes.hpp"
#include "assetforge/items/item_store.hpp"
#include "assetforge/items/query.hpp"
#include "assetforge/migrate/migration.hpp"

namespace af = assetforge;

// ========================================================================
// Configuration
// ========================================================================

struct CliConfig {
    std::string db_path;
    bool verbose{false};
    af::core::u32 max_retries{3};
};

// Explicit --db wins, then ASSETFORGE_DB, then a per-user default.
static void resolve_db_path(CliConfig& cfg, const char* explicit_path) {
    if (explicit_path && *explicit_path) {
        cfg.db_path = explicit_path;
        return;
    }
    const char* env = std::getenv("ASSETFORGE_DB");
    if (env && *env) {
        cfg.db_path = env;
        return;
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        cfg.db_path = std::string(home) + "/.assetforge/inventory.db";
    } else {
        cfg.db_path = "/tmp/assetforge/inventory.db";
    }
}

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, af::core::Status s) {
    fprintf(stderr, "error: %s failed (code=%u, domain=%u)\n",
            context,
            static_cast<unsigned>(s.code),
            static_cast<unsigned>(s.domain));
}

void print_status_error_detailed(const char* context, af::core::Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
            context,
            af::core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            af::core::status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
    if (s.code == af::core::StatusCode::Migration) {
        fprintf(stderr, "error: %s: schema left at the last committed version (failed at %u)\n", context, s.aux);
    }
}

// ========================================================================
// Option tables
// ========================================================================

static const af::cli::OptionSpec kGlobalOptions[] = {
    {af::cli::OptionId::Db, af::cli::OptionType::String, "db", 'd'},
    {af::cli::OptionId::Verbose, af::cli::OptionType::Flag, "verbose", 'v'},
    {af::cli::OptionId::Retries, af::cli::OptionType::I64, "retries", '\0'},
};

static const af::cli::OptionSpec kItemOptions[] = {
    {af::cli::OptionId::Type, af::cli::OptionType::String, "type", 't'},
    {af::cli::OptionId::Name, af::cli::OptionType::String, "name", 'n'},
    {af::cli::OptionId::Model, af::cli::OptionType::String, "model", 'm'},
    {af::cli::OptionId::Mac, af::cli::OptionType::String, "mac", '\0'},
    {af::cli::OptionId::Ip, af::cli::OptionType::String, "ip", '\0'},
    {af::cli::OptionId::Location, af::cli::OptionType::String, "location", 'l'},
    {af::cli::OptionId::User, af::cli::OptionType::String, "user", 'u'},
    {af::cli::OptionId::Group, af::cli::OptionType::String, "group", 'g'},
    {af::cli::OptionId::SubType, af::cli::OptionType::String, "sub-type", '\0'},
    {af::cli::OptionId::Notes, af::cli::OptionType::String, "notes", '\0'},
    {af::cli::OptionId::Extension, af::cli::OptionType::String, "extension", 'x'},
    {af::cli::OptionId::Note, af::cli::OptionType::String, "note", '\0'},
    {af::cli::OptionId::Reason, af::cli::OptionType::String, "reason", 'r'},
};

static const af::cli::OptionSpec kListOptions[] = {
    {af::cli::OptionId::Type, af::cli::OptionType::String, "type", 't'},
    {af::cli::OptionId::Search, af::cli::OptionType::String, "search", 's'},
    {af::cli::OptionId::Archived, af::cli::OptionType::Flag, "archived", '\0'},
    {af::cli::OptionId::All, af::cli::OptionType::Flag, "all", 'a'},
};

static const af::cli::OptionSpec kMigrateOptions[] = {
    {af::cli::OptionId::Target, af::cli::OptionType::I64, "target", '\0'},
};

static const af::cli::OptionSpec kNoteOptions[] = {
    {af::cli::OptionId::Note, af::cli::OptionType::String, "note", '\0'},
};

constexpr af::core::u32 kMaxParsed = 32;

template <size_t N>
static af::core::Status parse_command_options(const af::cli::CliArgs& args,
                                              const af::cli::OptionSpec (&specs)[N],
                                              af::cli::ParsedOption (&storage)[kMaxParsed],
                                              af::cli::ParsedOptions* out,
                                              af::cli::CliArgs* rest) {
    out->data = storage;
    out->cap = kMaxParsed;
    af::core::u32 consumed = 0;
    const af::core::Status s = af::cli::parse_options(args, specs, static_cast<af::core::u32>(N), out, &consumed);
    if (!af::core::is_ok(s)) {
        return s;
    }
    rest->argv = args.argv + consumed;
    rest->argc = args.argc - consumed;
    return af::core::ok_status();
}

// ========================================================================
// Output
// ========================================================================

static void print_item_row(const af::core::Item& item) {
    printf("%-16s  %-28s  %-17s  %-15s%s\n",
           item.asset_tag.c_str(),
           item.name.c_str(),
           item.mac_address.empty() ? "-" : item.mac_address.c_str(),
           item.ip_address.empty() ? "-" : item.ip_address.c_str(),
           item.archived ? "  [archived]" : "");
}

static void print_item_detail(af::db::DbHandle db, const af::core::Item& item) {
    std::string type_code;
    if (!af::core::is_ok(af::catalog::type_code(db, item.type, &type_code))) {
        type_code = "?";
    }
    printf("tag:         %s\n", item.asset_tag.c_str());
    printf("id:          %lld\n", static_cast<long long>(item.id.v));
    printf("name:        %s\n", item.name.c_str());
    printf("type:        %s (serial %lld)\n", type_code.c_str(), static_cast<long long>(item.type_serial));
    if (!item.model.empty()) printf("model:       %s\n", item.model.c_str());
    if (!item.mac_address.empty()) printf("mac:         %s\n", item.mac_address.c_str());
    if (!item.ip_address.empty()) printf("ip:          %s\n", item.ip_address.c_str());
    if (!item.extension.empty()) printf("extension:   %s\n", item.extension.c_str());
    if (!item.notes.empty()) printf("notes:       %s\n", item.notes.c_str());
    printf("archived:    %s\n", item.archived ? "yes" : "no");
    printf("created:     %s\n", item.created_at.c_str());
    printf("updated:     %s\n", item.updated_at.c_str());

    std::vector<af::core::ItemAttribute> attrs;
    if (af::core::is_ok(af::items::attribute_list(db, item.id, &attrs))) {
        for (const af::core::ItemAttribute& a : attrs) {
            printf("  %s = %s\n", a.key.c_str(), a.value.c_str());
        }
    }
}

static void migration_progress(const af::migrate::MigrationProgress& p, void* user) {
    (void)user;
    fprintf(stderr, "info: migration %d (%s) %s\n", p.version, p.name, p.finished ? "committed" : "started");
}

// ========================================================================
// Helpers
// ========================================================================

// Schema must be current before any item command touches the store.
static bool require_latest_schema(af::db::DbHandle db) {
    af::core::i32 version = 0;
    const af::core::Status s = af::migrate::migrate_current_version(db, &version);
    if (!af::core::is_ok(s)) {
        print_status_error_detailed("schema check", s);
        return false;
    }
    const af::core::i32 latest = af::db::schema_version_value(af::db::kSchemaLatest);
    if (version != latest) {
        fprintf(stderr, "error: store is at schema version %d (latest %d); run 'afctl migrate'\n", version, latest);
        return false;
    }
    return true;
}

static bool resolve_type(af::db::DbHandle db, const char* code, af::core::TypeId* out) {
    af::core::HardwareType type;
    const af::core::Status s = af::catalog::type_find_by_code(db, code, &type);
    if (!af::core::is_ok(s)) {
        fprintf(stderr, "error: unknown hardware type code '%s' (see 'afctl types')\n", code);
        return false;
    }
    *out = type.id;
    return true;
}

// Catalog references are given by name and created on first use.
static bool resolve_catalog(af::db::DbHandle db, af::core::CatalogKind kind, const char* name, af::core::i64* out) {
    if (!name || !*name) {
        *out = -1;
        return true;
    }
    const af::core::Status s = af::catalog::catalog_ensure(db, kind, name, out);
    if (!af::core::is_ok(s)) {
        fprintf(stderr, "error: %s '%s' could not be resolved\n", af::catalog::catalog_kind_name(kind), name);
        print_status_error_detailed("catalog", s);
        return false;
    }
    return true;
}

static bool find_item(af::db::DbHandle db, const char* selector, af::core::Item* out) {
    const af::core::Status s = af::items::item_lookup_scan(db, selector, out);
    if (af::core::is_ok(s)) {
        return true;
    }
    if (s.code == af::core::StatusCode::NotFound) {
        fprintf(stderr, "error: no item matches '%s'\n", selector);
    } else if (s.code == af::core::StatusCode::Invalid) {
        fprintf(stderr, "error: '%s' is neither an asset tag nor a MAC address\n", selector);
    } else {
        print_status_error_detailed("lookup", s);
    }
    return false;
}

// Fills `patch` from whichever item options were given.
static bool build_patch(af::db::DbHandle db, const af::cli::ParsedOptions& opts, af::items::ItemPatch* patch) {
    using af::cli::OptionId;
    if (const char* v = af::cli::option_string(opts, OptionId::Type)) {
        af::core::TypeId type;
        if (!resolve_type(db, v, &type)) return false;
        patch->set_type(type);
    }
    if (const char* v = af::cli::option_string(opts, OptionId::Name)) patch->set_name(v);
    if (const char* v = af::cli::option_string(opts, OptionId::Model)) patch->set_model(v);
    if (const char* v = af::cli::option_string(opts, OptionId::Mac)) patch->set_mac_address(v);
    if (const char* v = af::cli::option_string(opts, OptionId::Ip)) patch->set_ip_address(v);
    if (const char* v = af::cli::option_string(opts, OptionId::Notes)) patch->set_notes(v);
    if (const char* v = af::cli::option_string(opts, OptionId::Extension)) patch->set_extension(v);

    af::core::i64 id = -1;
    if (const char* v = af::cli::option_string(opts, OptionId::Location)) {
        if (!resolve_catalog(db, af::core::CatalogKind::Location, v, &id)) return false;
        patch->set_location(af::core::LocationId{id});
    }
    if (const char* v = af::cli::option_string(opts, OptionId::User)) {
        if (!resolve_catalog(db, af::core::CatalogKind::User, v, &id)) return false;
        patch->set_user(af::core::UserId{id});
    }
    if (const char* v = af::cli::option_string(opts, OptionId::Group)) {
        if (!resolve_catalog(db, af::core::CatalogKind::Group, v, &id)) return false;
        patch->set_group(af::core::GroupId{id});
    }
    if (const char* v = af::cli::option_string(opts, OptionId::SubType)) {
        if (!resolve_catalog(db, af::core::CatalogKind::SubType, v, &id)) return false;
        patch->set_sub_type(af::core::SubTypeId{id});
    }
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Usage: afctl [--db PATH] [--verbose] [--retries N] <command> [options]\n\n");
    printf("Commands:\n");
    printf("  migrate [--target N]        Apply pending schema migrations\n");
    printf("  status                      Show schema version, ledger and store integrity\n");
    printf("  types                       List hardware types with their next serial\n");
    printf("  create --type CODE --name NAME [fields]\n");
    printf("                              Register an item; prints its asset tag\n");
    printf("  update <tag|mac> [fields] [--reason R] [--note TEXT]\n");
    printf("                              Change an item (reasons: update, move, assign, audit, retire)\n");
    printf("  archive <tag|mac> [--note TEXT]\n");
    printf("  reactivate <tag|mac> [--note TEXT]\n");
    printf("  list [--type CODE] [--search TEXT] [--archived|--all]\n");
    printf("  show <tag|mac>              Item details and attributes\n");
    printf("  history <tag|mac>           Audit trail, oldest first\n");
    printf("  verify [tag|mac]            Check an item's audit chain, or the whole store\n");
    printf("  help                        Show this help\n\n");
    printf("Fields: --model, --mac, --ip, --location, --user, --group, --sub-type, --notes, --extension\n");
    printf("Database: --db, else $ASSETFORGE_DB, else ~/.assetforge/inventory.db\n");
}

int handle_migrate(const CliConfig& cfg, af::db::DbHandle db, const af::cli::CliArgs& args) {
    af::cli::ParsedOption storage[kMaxParsed];
    af::cli::ParsedOptions opts;
    af::cli::CliArgs rest;
    if (!af::core::is_ok(parse_command_options(args, kMigrateOptions, storage, &opts, &rest)) || rest.argc != 0) {
        print_error("migrate: expected: migrate [--target N]");
        return EXIT_FAILURE;
    }

    af::core::i32 target = af::db::schema_version_value(af::db::kSchemaLatest);
    if (const af::cli::ParsedOption* t = af::cli::find_option(opts, af::cli::OptionId::Target)) {
        target = static_cast<af::core::i32>(t->value.i64v);
    }

    af::migrate::MigrationConfig mcfg;
    if (cfg.verbose) {
        mcfg.on_progress = migration_progress;
    }
    af::migrate::MigrationReport report;
    const af::core::Status s = af::migrate::migrate_to(db, static_cast<af::db::SchemaVersion>(target), mcfg, &report);
    if (!af::core::is_ok(s)) {
        print_status_error_detailed("migrate", s);
        return EXIT_FAILURE;
    }
    if (report.applied == 0) {
        printf("schema already at version %d\n", report.to);
    } else {
        printf("schema migrated from version %d to %d (%u applied)\n", report.from, report.to, report.applied);
    }
    return EXIT_SUCCESS;
}

int handle_status(const CliConfig& cfg, af::db::DbHandle db) {
    af::core::i32 version = 0;
    af::core::Status s = af::migrate::migrate_current_version(db, &version);
    if (!af::core::is_ok(s)) {
        print_status_error_detailed("status", s);
        return EXIT_FAILURE;
    }
    printf("db_path=%s\n", cfg.db_path.c_str());
    printf("schema_version=%d latest=%d\n", version, af::db::schema_version_value(af::db::kSchemaLatest));

    std::vector<af::core::MigrationRecord> history;
    s = af::migrate::migrate_history(db, &history);
    if (!af::core::is_ok(s)) {
        print_status_error_detailed("status(history)", s);
        return EXIT_FAILURE;
    }
    for (const af::core::MigrationRecord& r : history) {
        printf("  %3d  %-20s  %s\n", r.version, r.description.c_str(), r.applied_at.c_str());
    }

    bool ok = false;
    s = af::db::db_quick_check(db, &ok);
    if (!af::core::is_ok(s)) {
        print_status_error_detailed("status(quick_check)", s);
        return EXIT_FAILURE;
    }
    printf("integrity=%s\n", ok ? "ok" : "FAILED");
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

int handle_types(af::db::DbHandle db) {
    std::vector<af::core::HardwareType> types;
    const af::core::Status s = af::catalog::type_list(db, &types);
    if (!af::core::is_ok(s)) {
        print_status_error_detailed("types", s);
        return EXIT_FAILURE;
    }
    for (const af::core::HardwareType& t : types) {
        af::core::i64 next = 0;
        if (!af::core::is_ok(af::identity::serial_peek(db, t.id, &next))) {
            next = 0;
        }
        printf("%3lld  %-8s  %-24s  next=%lld\n",
               static_cast<long long>(t.id.v), t.code.c_str(), t.name.c_str(), static_cast<long long>(next));
    }
    return EXIT_SUCCESS;
}

int handle_create(af::db::DbHandle db, const af::cli::CliArgs& args) {
    af::cli::ParsedOption storage[kMaxParsed];
    af::cli::ParsedOptions opts;
    af::cli::CliArgs rest;
    if (!af::core::is_ok(parse_command_options(args, kItemOptions, storage, &opts, &rest)) || rest.argc != 0) {
        print_error("create: expected: create --type CODE --name NAME [fields]");
        return EXIT_FAILURE;
    }
    if (!af::cli::option_string(opts, af::cli::OptionId::Type) || !af::cli::option_string(opts, af::cli::OptionId::Name)) {
        print_error("create: --type and --name are required");
        return EXIT_FAILURE;
    }

    af::items::ItemPatch patch;
    if (!build_patch(db, opts, &patch)) {
        return EXIT_FAILURE;
    }

    af::core::Item item;
    const af::core::Status s = af::items::item_create(db, patch.values, af::cli::option_string(opts, af::cli::OptionId::Note), &item);
    if (!af::core::is_ok(s)) {
        if (s.code == af::core::StatusCode::Duplicate) {
            print_error("create: mac or ip address already belongs to another item");
        }
        print_status_error_detailed("create", s);
        return EXIT_FAILURE;
    }
    printf("%s\n", item.asset_tag.c_str());
    return EXIT_SUCCESS;
}

int handle_update(af::db::DbHandle db, const af::cli::CliArgs& args) {
    if (args.argc == 0) {
        print_error("update: missing item (tag or mac)");
        return EXIT_FAILURE;
    }
    const char* selector = args.argv[0];
    af::cli::CliArgs tail{args.argv + 1, args.argc - 1};

    af::cli::ParsedOption storage[kMaxParsed];
    af::cli::ParsedOptions opts;
    af::cli::CliArgs rest;
    if (!af::core::is_ok(parse_command_options(tail, kItemOptions, storage, &opts, &rest)) || rest.argc != 0) {
        print_error("update: invalid options");
        return EXIT_FAILURE;
    }

    af::core::AuditReason reason = af::core::AuditReason::Update;
    if (const char* r = af::cli::option_string(opts, af::cli::OptionId::Reason)) {
        if (!af::audit::audit_reason_parse(r, &reason)) {
            fprintf(stderr, "error: update: unknown reason '%s'\n", r);
            return EXIT_FAILURE;
        }
    }

    af::core::Item item;
    if (!find_item(db, selector, &item)) {
        return EXIT_FAILURE;
    }
    af::items::ItemPatch patch;
    if (!build_patch(db, opts, &patch)) {
        return EXIT_FAILURE;
    }

    const af::core::Status s = af::items::item_update(db, item.id, patch, reason, af::cli::option_string(opts, af::cli::OptionId::Note), &item);
    if (!af::core::is_ok(s)) {
        print_status_error_detailed("update", s);
        return EXIT_FAILURE;
    }
    printf("%s\n", item.asset_tag.c_str());
    return EXIT_SUCCESS;
}

int handle_archive(af::db::DbHandle db, const af::cli::CliArgs& args, bool archive) {
    const char* cmd = archive ? "archive" : "reactivate";
    if (args.argc == 0) {
        fprintf(stderr, "error: %s: missing item (tag or mac)\n", cmd);
        return EXIT_FAILURE;
    }
    af::cli::CliArgs tail{args.argv + 1, args.argc - 1};
    af::cli::ParsedOption storage[kMaxParsed];
    af::cli::ParsedOptions opts;
    af::cli::CliArgs rest;
    if (!af::core::is_ok(parse_command_options(tail, kNoteOptions, storage, &opts, &rest)) || rest.argc != 0) {
        fprintf(stderr, "error: %s: invalid options\n", cmd);
        return EXIT_FAILURE;
    }

    af::core::Item item;
    if (!find_item(db, args.argv[0], &item)) {
        return EXIT_FAILURE;
    }
    const char* note = af::cli::option_string(opts, af::cli::OptionId::Note);
    const af::core::Status s = archive
        ? af::items::item_archive(db, item.id, note, &item)
        : af::items::item_reactivate(db, item.id, note, &item);
    if (!af::core::is_ok(s)) {
        print_status_error_detailed(cmd, s);
        return EXIT_FAILURE;
    }
    printf("%s %s\n", item.asset_tag.c_str(), item.archived ? "archived" : "active");
    return EXIT_SUCCESS;
}

int handle_list(af::db::DbHandle db, const af::cli::CliArgs& args) {
    af::cli::ParsedOption storage[kMaxParsed];
    af::cli::ParsedOptions opts;
    af::cli::CliArgs rest;
    if (!af::core::is_ok(parse_command_options(args, kListOptions, storage, &opts, &rest)) || rest.argc != 0) {
        print_error("list: invalid options");
        return EXIT_FAILURE;
    }

    af::items::ItemFilter filter;
    const char* codes[kMaxParsed];
    const af::core::u32 code_count = af::cli::option_strings(opts, af::cli::OptionId::Type, codes, kMaxParsed);
    for (af::core::u32 i = 0; i < code_count; ++i) {
        af::core::TypeId type;
        if (!resolve_type(db, codes[i], &type)) {
            return EXIT_FAILURE;
        }
        filter.types.push_back(type);
    }
    if (const char* q = af::cli::option_string(opts, af::cli::OptionId::Search)) {
        filter.search = q;
    }
    if (af::cli::option_flag(opts, af::cli::OptionId::All)) {
        filter.archived = af::items::ArchivedFilter::All;
    } else if (af::cli::option_flag(opts, af::cli::OptionId::Archived)) {
        filter.archived = af::items::ArchivedFilter::Archived;
    }

    af::items::ItemCursor cursor;
    af::core::Status s = af::items::item_cursor_open(db, filter, &cursor);
    if (!af::core::is_ok(s)) {
        print_status_error_detailed("list", s);
        return EXIT_FAILURE;
    }
    af::core::u64 shown = 0;
    for (;;) {
        af::core::Item item;
        bool has_row = false;
        s = af::items::item_cursor_next(&cursor, &item, &has_row);
        if (!af::core::is_ok(s)) {
            print_status_error_detailed("list", s);
            return EXIT_FAILURE;
        }
        if (!has_row) {
            break;
        }
        print_item_row(item);
        ++shown;
    }
    printf("(%llu items)\n", static_cast<unsigned long long>(shown));
    return EXIT_SUCCESS;
}

int handle_show(af::db::DbHandle db, const af::cli::CliArgs& args) {
    if (args.argc != 1) {
        print_error("show: expected: show <tag|mac>");
        return EXIT_FAILURE;
    }
    af::core::Item item;
    if (!find_item(db, args.argv[0], &item)) {
        return EXIT_FAILURE;
    }
    print_item_detail(db, item);
    return EXIT_SUCCESS;
}

int handle_history(af::db::DbHandle db, const af::cli::CliArgs& args) {
    if (args.argc != 1) {
        print_error("history: expected: history <tag|mac>");
        return EXIT_FAILURE;
    }
    af::core::Item item;
    if (!find_item(db, args.argv[0], &item)) {
        return EXIT_FAILURE;
    }

    std::vector<af::core::ItemUpdate> entries;
    const af::core::Status s = af::audit::audit_list(db, item.id, &entries);
    if (!af::core::is_ok(s)) {
        print_status_error_detailed("history", s);
        return EXIT_FAILURE;
    }
    for (const af::core::ItemUpdate& u : entries) {
        std::string fields;
        for (const std::string& f : u.changed_fields) {
            if (!fields.empty()) fields += ",";
            fields += f;
        }
        printf("%s  %-16s  %-32s  %s\n",
               u.created_at.c_str(),
               u.reason_text.c_str(),
               fields.c_str(),
               u.note.c_str());
    }
    return EXIT_SUCCESS;
}

int handle_verify(af::db::DbHandle db, const af::cli::CliArgs& args) {
    if (args.argc == 0) {
        bool ok = false;
        const af::core::Status s = af::db::db_quick_check(db, &ok);
        if (!af::core::is_ok(s)) {
            print_status_error_detailed("verify", s);
            return EXIT_FAILURE;
        }
        printf("store integrity: %s\n", ok ? "ok" : "FAILED");
        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    af::core::Item item;
    if (!find_item(db, args.argv[0], &item)) {
        return EXIT_FAILURE;
    }
    af::audit::AuditVerifyResult result;
    const af::core::Status s = af::audit::audit_verify(db, item.id, &result);
    if (s.code == af::core::StatusCode::Corrupt) {
        fprintf(stderr, "error: audit chain of %s broken at entry %lld (%u entries verified)\n",
                item.asset_tag.c_str(), static_cast<long long>(result.first_bad.v), result.checked);
        return EXIT_FAILURE;
    }
    if (!af::core::is_ok(s)) {
        print_status_error_detailed("verify", s);
        return EXIT_FAILURE;
    }
    printf("%s: %u audit entries verified\n", item.asset_tag.c_str(), result.checked);
    return EXIT_SUCCESS;
}

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    af::cli::CliArgs all{argv + 1, static_cast<af::core::u32>(argc > 0 ? argc - 1 : 0)};

    af::cli::ParsedOption storage[kMaxParsed];
    af::cli::ParsedOptions globals;
    af::cli::CliArgs rest;
    if (!af::core::is_ok(parse_command_options(all, kGlobalOptions, storage, &globals, &rest))) {
        print_error("invalid global options (try 'afctl help')");
        return EXIT_FAILURE;
    }

    CliConfig cfg;
    resolve_db_path(cfg, af::cli::option_string(globals, af::cli::OptionId::Db));
    cfg.verbose = af::cli::option_flag(globals, af::cli::OptionId::Verbose);
    if (const af::cli::ParsedOption* r = af::cli::find_option(globals, af::cli::OptionId::Retries)) {
        if (r->value.i64v < 0 || r->value.i64v > 100) {
            print_error("--retries must be between 0 and 100");
            return EXIT_FAILURE;
        }
        cfg.max_retries = static_cast<af::core::u32>(r->value.i64v);
    }

    static const af::cli::CommandSpec kCommands[] = {
        {af::cli::CommandId::Help, "help"},
        {af::cli::CommandId::Migrate, "migrate"},
        {af::cli::CommandId::Status, "status"},
        {af::cli::CommandId::Types, "types"},
        {af::cli::CommandId::Create, "create"},
        {af::cli::CommandId::Update, "update"},
        {af::cli::CommandId::Archive, "archive"},
        {af::cli::CommandId::Reactivate, "reactivate"},
        {af::cli::CommandId::List, "list"},
        {af::cli::CommandId::List, "ls"},
        {af::cli::CommandId::Show, "show"},
        {af::cli::CommandId::History, "history"},
        {af::cli::CommandId::Verify, "verify"},
    };
    const af::core::u32 command_count = sizeof(kCommands) / sizeof(kCommands[0]);

    if (rest.argc == 0) {
        handle_help();
        return EXIT_FAILURE;
    }

    af::cli::CommandInvocation inv;
    af::core::u32 consumed = 0;
    af::core::Status s = af::cli::parse_command(rest, kCommands, command_count, &inv, &consumed);
    if (!af::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command '%s' (try 'afctl help')\n", rest.argv[0]);
        return EXIT_FAILURE;
    }
    if (inv.id == af::cli::CommandId::Help) {
        handle_help();
        return EXIT_SUCCESS;
    }

    std::error_code ec;
    const std::filesystem::path parent = std::filesystem::path(cfg.db_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            fprintf(stderr, "error: cannot create %s: %s\n", parent.c_str(), ec.message().c_str());
            return EXIT_FAILURE;
        }
    }

    af::db::DbConfig db_cfg;
    db_cfg.path = cfg.db_path.c_str();
    db_cfg.max_retries = cfg.max_retries;
    af::db::DbHandle db;
    s = af::db::db_open(db_cfg, &db);
    if (!af::core::is_ok(s)) {
        print_status_error_detailed("open database", s);
        return EXIT_FAILURE;
    }
    if (cfg.verbose) {
        fprintf(stderr, "info: db_path=%s\n", cfg.db_path.c_str());
    }

    int rc = EXIT_FAILURE;
    switch (inv.id) {
        case af::cli::CommandId::Migrate:
            rc = handle_migrate(cfg, db, inv.args);
            break;
        case af::cli::CommandId::Status:
            rc = handle_status(cfg, db);
            break;
        default:
            if (!require_latest_schema(db)) {
                break;
            }
            switch (inv.id) {
                case af::cli::CommandId::Types: rc = handle_types(db); break;
                case af::cli::CommandId::Create: rc = handle_create(db, inv.args); break;
                case af::cli::CommandId::Update: rc = handle_update(db, inv.args); break;
                case af::cli::CommandId::Archive: rc = handle_archive(db, inv.args, true); break;
                case af::cli::CommandId::Reactivate: rc = handle_archive(db, inv.args, false); break;
                case af::cli::CommandId::List: rc = handle_list(db, inv.args); break;
                case af::cli::CommandId::Show: rc = handle_show(db, inv.args); break;
                case af::cli::CommandId::History: rc = handle_history(db, inv.args); break;
                case af::cli::CommandId::Verify: rc = handle_verify(db, inv.args); break;
                default: print_error("unhandled command"); break;
            }
            break;
    }

    s = af::db::db_close(db);
    if (!af::core::is_ok(s)) {
        print_status_error("close database", s);
        return EXIT_FAILURE;
    }
    return rc;
}
