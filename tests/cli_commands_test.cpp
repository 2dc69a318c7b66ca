#include <array>

#include <gtest/gtest.h>

#include "assetforge/cli/commands.hpp"

namespace {
    const std::array<assetforge::cli::CommandSpec, 4> kSpecs = {{
        {assetforge::cli::CommandId::Help, "help"},
        {assetforge::cli::CommandId::Create, "create"},
        {assetforge::cli::CommandId::Show, "show"},
        {assetforge::cli::CommandId::List, "ls"},
    }};
}

TEST(CliCommands, ParsesKnownCommandAndReturnsRemainingArgs) {
    const char* argv[] = {"create", "--type", "PX", "--name", "HP LaserJet"};
    const assetforge::cli::CliArgs args{argv, 5};

    assetforge::cli::CommandInvocation out{};
    assetforge::cli::u32 consumed = 0;
    const assetforge::core::Status s = assetforge::cli::parse_command(args, kSpecs.data(), kSpecs.size(), &out, &consumed);
    ASSERT_EQ(s.code, assetforge::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(out.id, assetforge::cli::CommandId::Create);
    ASSERT_EQ(out.args.argc, 4u);
    EXPECT_STREQ(out.args.argv[0], "--type");
}

TEST(CliCommands, NotFoundOnUnknownCommand) {
    const char* argv[] = {"nope"};
    assetforge::cli::CommandInvocation out{};
    assetforge::cli::u32 consumed = 0;
    const assetforge::core::Status s = assetforge::cli::parse_command({argv, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    EXPECT_EQ(s.code, assetforge::core::StatusCode::NotFound);
    EXPECT_EQ(out.id, assetforge::cli::CommandId::None);
    EXPECT_EQ(consumed, 0u);
}

TEST(CliCommands, InvalidOnOptionOrEmptyArgs) {
    const char* argv[] = {"--verbose", "show"};
    assetforge::cli::CommandInvocation out{};
    assetforge::cli::u32 consumed = 0;
    EXPECT_EQ(assetforge::cli::parse_command({argv, 2}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              assetforge::core::StatusCode::Invalid);
    EXPECT_EQ(assetforge::cli::parse_command({argv, 0}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              assetforge::core::StatusCode::Invalid);
}

TEST(CliCommands, FindCommandMatchesAlias) {
    const assetforge::cli::CommandSpec* spec = assetforge::cli::find_command(kSpecs.data(), kSpecs.size(), "ls");
    ASSERT_NE(spec, nullptr);
    EXPECT_EQ(spec->id, assetforge::cli::CommandId::List);
    EXPECT_EQ(assetforge::cli::find_command(kSpecs.data(), kSpecs.size(), "list"), nullptr);
}
