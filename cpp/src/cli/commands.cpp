#include "wcoord/cli/commands.hpp"

#include <cstring>

namespace wcoord::cli {

    using wcoord::core::Status;
    using wcoord::core::StatusCode;
    using wcoord::core::StatusDomain;

    Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return wcoord::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return wcoord::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return wcoord::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return wcoord::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                out->id = s.id;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return wcoord::core::ok_status();
            }
        }
        return wcoord::core::make_status(StatusDomain::Cli, StatusCode::NotFound);
    }
} // namespace wcoord::cli
