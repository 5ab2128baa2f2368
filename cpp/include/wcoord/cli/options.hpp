#pragma once

#include <type_traits>

#include "wcoord/core/errors.hpp"
#include "wcoord/core/types.hpp"

namespace wcoord::cli {
    using u8 = wcoord::core::u8;
    using u32 = wcoord::core::u32;
    using i64 = wcoord::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
        F64 = 3,
    };

    enum class OptionId : u32 {
        None = 0,
        Db = 1,
        Lat = 2,
        Lon = 3,
        Radius = 4,
        Capacity = 5,
        Category = 6,
        Code = 7,
        Owner = 8,
        Reporter = 9,
        At = 10,
        Distance = 11,
        Sharing = 12,
        OnDuty = 13,
        Frequency = 14,
        Speed = 15,
        Accuracy = 16,
        Heading = 17,
        Battery = 18,
        All = 19,
        Unclaimed = 20,
        Interval = 21,
        Verbose = 22,
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
        double f64v;
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

    // Parses leading options ("--name value", "--name=value", "-n value",
    // "-nvalue", flags) up to the first positional token or "--".
    // *consumed is the index of the first unparsed token.
    [[nodiscard]] wcoord::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence of `id`, or nullptr.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace wcoord::cli
