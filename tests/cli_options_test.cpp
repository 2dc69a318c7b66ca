#include <array>

#include <gtest/gtest.h>

#include "assetforge/cli/options.hpp"

namespace {
    const std::array<assetforge::cli::OptionSpec, 5> kSpecs = {{
        {assetforge::cli::OptionId::Db, assetforge::cli::OptionType::String, "db", 'd'},
        {assetforge::cli::OptionId::Name, assetforge::cli::OptionType::String, "name", 'n'},
        {assetforge::cli::OptionId::Target, assetforge::cli::OptionType::I64, "target", '\0'},
        {assetforge::cli::OptionId::Verbose, assetforge::cli::OptionType::Flag, "verbose", 'v'},
        {assetforge::cli::OptionId::All, assetforge::cli::OptionType::Flag, "all", 'a'},
    }};
}

TEST(CliOptions, ParsesLongAndShortAndStopsAtCommand) {
    const char* argv[] = {"--verbose", "--db", "inv.db", "-n", "Front desk printer", "create", "--all"};
    const assetforge::cli::CliArgs args{argv, 7};

    assetforge::cli::ParsedOption buf[8]{};
    assetforge::cli::ParsedOptions out{buf, 0, 8};
    assetforge::cli::u32 consumed = 0;
    const assetforge::core::Status s = assetforge::cli::parse_options(args, kSpecs.data(), kSpecs.size(), &out, &consumed);
    ASSERT_EQ(s.code, assetforge::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);
    ASSERT_EQ(out.len, 3u);

    EXPECT_EQ(out.data[0].id, assetforge::cli::OptionId::Verbose);
    EXPECT_EQ(out.data[0].type, assetforge::cli::OptionType::Flag);
    EXPECT_EQ(out.data[0].value.boolv, 1);

    EXPECT_EQ(out.data[1].id, assetforge::cli::OptionId::Db);
    EXPECT_STREQ(out.data[1].value.str, "inv.db");

    EXPECT_EQ(out.data[2].id, assetforge::cli::OptionId::Name);
    EXPECT_STREQ(out.data[2].value.str, "Front desk printer");
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const char* argv[] = {"--db=/tmp/x.db", "-nLaptop", "--target=4"};
    const assetforge::cli::CliArgs args{argv, 3};

    assetforge::cli::ParsedOption buf[8]{};
    assetforge::cli::ParsedOptions out{buf, 0, 8};
    assetforge::cli::u32 consumed = 0;
    const assetforge::core::Status s = assetforge::cli::parse_options(args, kSpecs.data(), kSpecs.size(), &out, &consumed);
    ASSERT_EQ(s.code, assetforge::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 3u);
    EXPECT_STREQ(out.data[0].value.str, "/tmp/x.db");
    EXPECT_STREQ(out.data[1].value.str, "Laptop");
    EXPECT_EQ(out.data[2].value.i64v, 4);
}

TEST(CliOptions, StopsAtDoubleDash) {
    const char* argv[] = {"--db", "a.db", "--", "--verbose"};
    const assetforge::cli::CliArgs args{argv, 4};

    assetforge::cli::ParsedOption buf[8]{};
    assetforge::cli::ParsedOptions out{buf, 0, 8};
    assetforge::cli::u32 consumed = 0;
    const assetforge::core::Status s = assetforge::cli::parse_options(args, kSpecs.data(), kSpecs.size(), &out, &consumed);
    ASSERT_EQ(s.code, assetforge::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 1u);
    EXPECT_STREQ(out.data[0].value.str, "a.db");
}

TEST(CliOptions, InvalidOnUnknownMissingValueOrBadInteger) {
    const char* unknown[] = {"--nope"};
    const char* missing[] = {"--db"};
    const char* bad_int[] = {"--target", "4x"};
    const char* flag_value[] = {"--verbose=1"};

    const struct {
        const char* const* argv;
        assetforge::cli::u32 argc;
    } cases[] = {{unknown, 1}, {missing, 1}, {bad_int, 2}, {flag_value, 1}};

    for (const auto& c : cases) {
        assetforge::cli::ParsedOption buf[2]{};
        assetforge::cli::ParsedOptions out{buf, 0, 2};
        assetforge::cli::u32 consumed = 0;
        const assetforge::core::Status s =
            assetforge::cli::parse_options({c.argv, c.argc}, kSpecs.data(), kSpecs.size(), &out, &consumed);
        EXPECT_EQ(s.code, assetforge::core::StatusCode::Invalid) << c.argv[0];
        EXPECT_EQ(s.domain, assetforge::core::StatusDomain::Cli);
    }
}

TEST(CliOptions, InvalidWhenStorageIsFull) {
    const char* argv[] = {"-v", "-a", "-v"};
    assetforge::cli::ParsedOption buf[2]{};
    assetforge::cli::ParsedOptions out{buf, 0, 2};
    assetforge::cli::u32 consumed = 0;
    const assetforge::core::Status s =
        assetforge::cli::parse_options({argv, 3}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    EXPECT_EQ(s.code, assetforge::core::StatusCode::Invalid);
}

TEST(CliOptions, FindOptionReturnsLastOccurrence) {
    const char* argv[] = {"--name", "first", "-a", "--name", "second"};
    assetforge::cli::ParsedOption buf[8]{};
    assetforge::cli::ParsedOptions out{buf, 0, 8};
    assetforge::cli::u32 consumed = 0;
    ASSERT_EQ(assetforge::cli::parse_options({argv, 5}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              assetforge::core::StatusCode::Ok);

    const assetforge::cli::ParsedOption* name = assetforge::cli::find_option(out, assetforge::cli::OptionId::Name);
    ASSERT_NE(name, nullptr);
    EXPECT_STREQ(name->value.str, "second");

    EXPECT_TRUE(assetforge::cli::option_flag(out, assetforge::cli::OptionId::All));
    EXPECT_FALSE(assetforge::cli::option_flag(out, assetforge::cli::OptionId::Verbose));
    EXPECT_EQ(assetforge::cli::find_option(out, assetforge::cli::OptionId::Db), nullptr);
}

TEST(CliOptions, RepeatedStringOptionsCollectInOrder) {
    const char* argv[] = {"-n", "PC", "--target=3", "--name=PX", "-nTP"};
    assetforge::cli::ParsedOption buf[8]{};
    assetforge::cli::ParsedOptions out{buf, 0, 8};
    assetforge::cli::u32 consumed = 0;
    ASSERT_EQ(assetforge::cli::parse_options({argv, 5}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              assetforge::core::StatusCode::Ok);

    const char* names[4]{};
    ASSERT_EQ(assetforge::cli::option_strings(out, assetforge::cli::OptionId::Name, names, 4), 3u);
    EXPECT_STREQ(names[0], "PC");
    EXPECT_STREQ(names[1], "PX");
    EXPECT_STREQ(names[2], "TP");

    // capped at the caller's storage
    EXPECT_EQ(assetforge::cli::option_strings(out, assetforge::cli::OptionId::Name, names, 2), 2u);

    EXPECT_STREQ(assetforge::cli::option_string(out, assetforge::cli::OptionId::Name), "TP");
    // integer options are not strings
    EXPECT_EQ(assetforge::cli::option_string(out, assetforge::cli::OptionId::Target), nullptr);
    EXPECT_EQ(assetforge::cli::option_string(out, assetforge::cli::OptionId::Db), nullptr);
}
