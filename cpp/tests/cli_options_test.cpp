#include <array>

#include <gtest/gtest.h>

#include "wcoord/cli/options.hpp"

TEST(CliOptions, ParsesLongAndShortAndStopsAtPositional) {
    const std::array<wcoord::cli::OptionSpec, 4> specs = {{
        {wcoord::cli::OptionId::Capacity, wcoord::cli::OptionType::I64, "capacity", 'c'},
        {wcoord::cli::OptionId::Category, wcoord::cli::OptionType::String, "category", 't'},
        {wcoord::cli::OptionId::Radius, wcoord::cli::OptionType::F64, "radius", 'r'},
        {wcoord::cli::OptionId::Verbose, wcoord::cli::OptionType::Flag, "verbose", 'v'},
    }};

    const char* argv[] = {"--verbose", "--category", "organic", "-c", "240", "52.5", "13.4"};
    const wcoord::cli::CliArgs args{argv, 7};

    wcoord::cli::ParsedOption buf[8]{};
    wcoord::cli::ParsedOptions out{buf, 0, 8};
    wcoord::cli::u32 consumed = 0;
    const wcoord::core::Status s = wcoord::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, wcoord::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);
    ASSERT_EQ(out.len, 3u);

    EXPECT_EQ(out.data[0].id, wcoord::cli::OptionId::Verbose);
    EXPECT_EQ(out.data[0].value.boolv, 1);

    EXPECT_EQ(out.data[1].id, wcoord::cli::OptionId::Category);
    EXPECT_STREQ(out.data[1].value.str, "organic");

    EXPECT_EQ(out.data[2].id, wcoord::cli::OptionId::Capacity);
    EXPECT_EQ(out.data[2].value.i64v, 240);
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const std::array<wcoord::cli::OptionSpec, 2> specs = {{
        {wcoord::cli::OptionId::Radius, wcoord::cli::OptionType::F64, "radius", 'r'},
        {wcoord::cli::OptionId::Reporter, wcoord::cli::OptionType::I64, "reporter", 'u'},
    }};

    const char* argv[] = {"--radius=250.5", "-u123"};
    const wcoord::cli::CliArgs args{argv, 2};

    wcoord::cli::ParsedOption buf[8]{};
    wcoord::cli::ParsedOptions out{buf, 0, 8};
    wcoord::cli::u32 consumed = 0;
    const wcoord::core::Status s = wcoord::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, wcoord::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 2u);
    ASSERT_EQ(out.len, 2u);
    EXPECT_DOUBLE_EQ(out.data[0].value.f64v, 250.5);
    EXPECT_EQ(out.data[1].value.i64v, 123);
}

TEST(CliOptions, StopsAtDoubleDash) {
    const std::array<wcoord::cli::OptionSpec, 2> specs = {{
        {wcoord::cli::OptionId::Code, wcoord::cli::OptionType::String, "code", 'k'},
        {wcoord::cli::OptionId::Verbose, wcoord::cli::OptionType::Flag, "verbose", 'v'},
    }};

    const char* argv[] = {"--code", "B1", "--", "--verbose"};
    const wcoord::cli::CliArgs args{argv, 4};

    wcoord::cli::ParsedOption buf[8]{};
    wcoord::cli::ParsedOptions out{buf, 0, 8};
    wcoord::cli::u32 consumed = 0;
    const wcoord::core::Status s = wcoord::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, wcoord::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 1u);
    EXPECT_STREQ(out.data[0].value.str, "B1");
}

TEST(CliOptions, NegativeNumbersArePositional) {
    const std::array<wcoord::cli::OptionSpec, 1> specs = {{
        {wcoord::cli::OptionId::Radius, wcoord::cli::OptionType::F64, "radius", 'r'},
    }};

    const char* argv[] = {"-r", "100", "-33.86", "-.5"};
    wcoord::cli::ParsedOption buf[4]{};
    wcoord::cli::ParsedOptions out{buf, 0, 4};
    wcoord::cli::u32 consumed = 0;
    const wcoord::core::Status s = wcoord::cli::parse_options({argv, 4}, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, wcoord::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 2u);
    ASSERT_EQ(out.len, 1u);
    EXPECT_DOUBLE_EQ(out.data[0].value.f64v, 100.0);
}

TEST(CliOptions, InvalidOnUnknownOrMissingValue) {
    const std::array<wcoord::cli::OptionSpec, 1> specs = {{
        {wcoord::cli::OptionId::Code, wcoord::cli::OptionType::String, "code", 'k'},
    }};

    {
        const char* argv[] = {"--nope"};
        wcoord::cli::ParsedOption buf[2]{};
        wcoord::cli::ParsedOptions out{buf, 0, 2};
        wcoord::cli::u32 consumed = 0;
        const wcoord::core::Status s = wcoord::cli::parse_options({argv, 1}, specs.data(), specs.size(), &out, &consumed);
        EXPECT_EQ(s.code, wcoord::core::StatusCode::Invalid);
        EXPECT_EQ(s.domain, wcoord::core::StatusDomain::Cli);
    }
    {
        const char* argv[] = {"--code"};
        wcoord::cli::ParsedOption buf[2]{};
        wcoord::cli::ParsedOptions out{buf, 0, 2};
        wcoord::cli::u32 consumed = 0;
        const wcoord::core::Status s = wcoord::cli::parse_options({argv, 1}, specs.data(), specs.size(), &out, &consumed);
        EXPECT_EQ(s.code, wcoord::core::StatusCode::Invalid);
    }
}

TEST(CliOptions, InvalidOnBadNumbers) {
    const std::array<wcoord::cli::OptionSpec, 2> specs = {{
        {wcoord::cli::OptionId::Capacity, wcoord::cli::OptionType::I64, "capacity", 'c'},
        {wcoord::cli::OptionId::Radius, wcoord::cli::OptionType::F64, "radius", 'r'},
    }};

    const char* bad_int[] = {"--capacity", "12kg"};
    const char* bad_float[] = {"-r", "inf"};
    const char* empty_int[] = {"--capacity="};

    for (const auto& argv : {bad_int, bad_float}) {
        wcoord::cli::ParsedOption buf[2]{};
        wcoord::cli::ParsedOptions out{buf, 0, 2};
        wcoord::cli::u32 consumed = 0;
        const wcoord::core::Status s = wcoord::cli::parse_options({argv, 2}, specs.data(), specs.size(), &out, &consumed);
        EXPECT_EQ(s.code, wcoord::core::StatusCode::Invalid);
    }
    wcoord::cli::ParsedOption buf[2]{};
    wcoord::cli::ParsedOptions out{buf, 0, 2};
    wcoord::cli::u32 consumed = 0;
    const wcoord::core::Status s = wcoord::cli::parse_options({empty_int, 1}, specs.data(), specs.size(), &out, &consumed);
    EXPECT_EQ(s.code, wcoord::core::StatusCode::Invalid);
    EXPECT_EQ(s.aux, static_cast<wcoord::cli::u32>(wcoord::cli::OptionId::Capacity));
}

TEST(CliOptions, FlagRejectsValue) {
    const std::array<wcoord::cli::OptionSpec, 1> specs = {{
        {wcoord::cli::OptionId::All, wcoord::cli::OptionType::Flag, "all", 'a'},
    }};

    const char* argv[] = {"--all=yes"};
    wcoord::cli::ParsedOption buf[2]{};
    wcoord::cli::ParsedOptions out{buf, 0, 2};
    wcoord::cli::u32 consumed = 0;
    const wcoord::core::Status s = wcoord::cli::parse_options({argv, 1}, specs.data(), specs.size(), &out, &consumed);
    EXPECT_EQ(s.code, wcoord::core::StatusCode::Invalid);
}

TEST(CliOptions, InvalidWhenBufferFull) {
    const std::array<wcoord::cli::OptionSpec, 1> specs = {{
        {wcoord::cli::OptionId::Verbose, wcoord::cli::OptionType::Flag, "verbose", 'v'},
    }};

    const char* argv[] = {"-v", "-v"};
    wcoord::cli::ParsedOption buf[1]{};
    wcoord::cli::ParsedOptions out{buf, 0, 1};
    wcoord::cli::u32 consumed = 0;
    const wcoord::core::Status s = wcoord::cli::parse_options({argv, 2}, specs.data(), specs.size(), &out, &consumed);
    EXPECT_EQ(s.code, wcoord::core::StatusCode::Invalid);
}

TEST(CliOptions, FindOptionReturnsLastOccurrence) {
    const std::array<wcoord::cli::OptionSpec, 2> specs = {{
        {wcoord::cli::OptionId::Radius, wcoord::cli::OptionType::F64, "radius", 'r'},
        {wcoord::cli::OptionId::Unclaimed, wcoord::cli::OptionType::Flag, "unclaimed", 'u'},
    }};

    const char* argv[] = {"-r", "100", "--radius", "300"};
    wcoord::cli::ParsedOption buf[4]{};
    wcoord::cli::ParsedOptions out{buf, 0, 4};
    wcoord::cli::u32 consumed = 0;
    const wcoord::core::Status s = wcoord::cli::parse_options({argv, 4}, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, wcoord::core::StatusCode::Ok);

    const wcoord::cli::ParsedOption* r = wcoord::cli::find_option(out, wcoord::cli::OptionId::Radius);
    ASSERT_NE(r, nullptr);
    EXPECT_DOUBLE_EQ(r->value.f64v, 300.0);
    EXPECT_EQ(wcoord::cli::find_option(out, wcoord::cli::OptionId::Unclaimed), nullptr);
}
