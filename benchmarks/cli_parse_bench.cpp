#include <array>

#include <benchmark/benchmark.h>

#include "assetforge/cli/commands.hpp"
#include "assetforge/cli/options.hpp"

static void BM_CliParseOptions(benchmark::State& state) {
    const std::array<assetforge::cli::OptionSpec, 5> specs = {{
        {assetforge::cli::OptionId::Type, assetforge::cli::OptionType::String, "type", 't'},
        {assetforge::cli::OptionId::Name, assetforge::cli::OptionType::String, "name", 'n'},
        {assetforge::cli::OptionId::Mac, assetforge::cli::OptionType::String, "mac", '\0'},
        {assetforge::cli::OptionId::Location, assetforge::cli::OptionType::String, "location", 'l'},
        {assetforge::cli::OptionId::Verbose, assetforge::cli::OptionType::Flag, "verbose", 'v'},
    }};

    const char* argv[] = {"--verbose", "--type", "PC", "--mac=00:1A:2B:3C:4D:5E", "-nFront desk", "-l", "HQ", "--", "extra"};
    const assetforge::cli::CliArgs args{argv, 9};
    for (auto _ : state) {
        assetforge::cli::ParsedOption buf[8]{};
        assetforge::cli::ParsedOptions out{buf, 0, 8};
        assetforge::cli::u32 consumed = 0;
        const assetforge::core::Status s = assetforge::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
        benchmark::DoNotOptimize(static_cast<assetforge::core::u16>(s.code));
        benchmark::DoNotOptimize(out.len);
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseOptions);

static void BM_CliParseCommand(benchmark::State& state) {
    const std::array<assetforge::cli::CommandSpec, 6> specs = {{
        {assetforge::cli::CommandId::Help, "help"},
        {assetforge::cli::CommandId::Migrate, "migrate"},
        {assetforge::cli::CommandId::Create, "create"},
        {assetforge::cli::CommandId::Update, "update"},
        {assetforge::cli::CommandId::List, "list"},
        {assetforge::cli::CommandId::Show, "show"},
    }};

    const char* argv[] = {"show", "SDMM-PC-0001"};
    const assetforge::cli::CliArgs args{argv, 2};
    for (auto _ : state) {
        assetforge::cli::CommandInvocation out{};
        assetforge::cli::u32 consumed = 0;
        const assetforge::core::Status s = assetforge::cli::parse_command(args, specs.data(), specs.size(), &out, &consumed);
        benchmark::DoNotOptimize(static_cast<assetforge::core::u16>(s.code));
        benchmark::DoNotOptimize(static_cast<assetforge::cli::u32>(out.id));
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseCommand);
