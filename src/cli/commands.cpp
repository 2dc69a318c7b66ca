#include "assetforge/cli/commands.hpp"

#include <cstring>

namespace assetforge::cli {
    using assetforge::core::make_status;
    using assetforge::core::Status;
    using assetforge::core::StatusCode;
    using assetforge::core::StatusDomain;

    const CommandSpec* find_command(const CommandSpec* specs, u32 spec_count, const char* name) noexcept {
        if (specs == nullptr || name == nullptr) {
            return nullptr;
        }
        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, name) == 0) {
                return &s;
            }
        }
        return nullptr;
    }

    Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-' || cmd[0] == '\0') {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const CommandSpec* match = find_command(specs, spec_count, cmd);
        if (match == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::NotFound);
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return assetforge::core::ok_status();
    }
} // namespace assetforge::cli
