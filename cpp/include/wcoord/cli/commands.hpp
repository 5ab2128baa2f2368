#pragma once

#include <type_traits>

#include "wcoord/cli/options.hpp"
#include "wcoord/core/errors.hpp"

namespace wcoord::cli {
    using u32 = wcoord::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Bin = 2,
        Report = 3,
        Truck = 4,
        Driver = 5,
        Pair = 6,
        Loc = 7,
        Optimize = 8,
        Assign = 9,
        Start = 10,
        Collect = 11,
        Close = 12,
        Cancel = 13,
        Route = 14,
        Routes = 15,
        Urgent = 16,
        Nearby = 17,
        Drivers = 18,
        Quit = 19,
    };

    // Several specs may share an id to provide aliases.
    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    [[nodiscard]] wcoord::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace wcoord::cli
