#pragma once

#include <type_traits>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/types.hpp"

namespace assetforge::cli {
    using u8 = assetforge::core::u8;
    using u32 = assetforge::core::u32;
    using i64 = assetforge::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        // global
        Db = 1,
        Verbose = 2,
        Retries = 3,
        // item fields
        Type = 10,
        Name = 11,
        Model = 12,
        Mac = 13,
        Ip = 14,
        Location = 15,
        User = 16,
        Group = 17,
        SubType = 18,
        Notes = 19,
        Extension = 20,
        // command modifiers
        Note = 30,
        Reason = 31,
        Search = 32,
        Archived = 33,
        All = 34,
        Target = 35,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Consumes leading options ("--name value", "--name=value", "-n value",
    // "-nvalue", flags) and stops at the first positional token or after "--".
    // Unknown options, missing values and malformed integers are Invalid.
    assetforge::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence wins; nullptr when the option is absent.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    [[nodiscard]] bool option_flag(const ParsedOptions& opts, OptionId id) noexcept;

    // Value of the last occurrence; nullptr when absent or not a string option.
    [[nodiscard]] const char* option_string(const ParsedOptions& opts, OptionId id) noexcept;

    // Every occurrence of a repeatable string option (`list --type PC --type PX`),
    // in command-line order. Returns how many were written to `out`.
    u32 option_strings(const ParsedOptions& opts, OptionId id, const char** out, u32 cap) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace assetforge::cli
