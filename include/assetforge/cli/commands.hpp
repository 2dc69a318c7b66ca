#pragma once

#include <type_traits>

#include "assetforge/cli/options.hpp"
#include "assetforge/core/errors.hpp"

namespace assetforge::cli {
    using u32 = assetforge::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Migrate = 2,
        Status = 3,
        Types = 4,
        Create = 5,
        Update = 6,
        Archive = 7,
        Reactivate = 8,
        List = 9,
        Show = 10,
        History = 11,
        Verify = 12,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    [[nodiscard]] const CommandSpec* find_command(const CommandSpec* specs, u32 spec_count, const char* name) noexcept;

    // Matches argv[0] against the specs; the invocation's args are the rest.
    // An option in command position is Invalid, an unknown name NotFound.
    assetforge::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace assetforge::cli
