#include <array>

#include <gtest/gtest.h>

#include "medley/cli/app.hpp"
#include "medley/cli/options.hpp"

using medley::core::StatusCode;
namespace cli = medley::cli;

TEST(CliOptions, ParsesLongAndShortAndStopsAtCommand) {
    const std::array<cli::OptionSpec, 4> specs = {{
        {cli::OptionId::DataRoot, cli::OptionType::String, "data-root", 'd'},
        {cli::OptionId::Db, cli::OptionType::String, "db", 'b'},
        {cli::OptionId::User, cli::OptionType::I64, "user", 'u'},
        {cli::OptionId::Strict, cli::OptionType::Flag, "strict", 's'},
    }};

    const char* argv[] = {"--strict", "--data-root", "/srv/music", "-b", "cat.db", "upload", "1", "a.mp3"};
    const cli::CliArgs args{argv, 8};

    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    cli::u32 consumed = 0;
    ASSERT_EQ(cli::parse_options(args, specs.data(), specs.size(), &out, &consumed).code, StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);
    ASSERT_EQ(out.len, 3u);

    EXPECT_EQ(out.data[0].id, cli::OptionId::Strict);
    EXPECT_EQ(out.data[0].value.boolv, 1);
    EXPECT_STREQ(out.data[1].value.str, "/srv/music");
    EXPECT_EQ(out.data[2].id, cli::OptionId::Db);
    EXPECT_STREQ(out.data[2].value.str, "cat.db");
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const std::array<cli::OptionSpec, 2> specs = {{
        {cli::OptionId::Title, cli::OptionType::String, "title", 't'},
        {cli::OptionId::User, cli::OptionType::I64, "user", 'u'},
    }};

    const char* argv[] = {"--title=Blue in Green", "-u123"};
    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    cli::u32 consumed = 0;
    ASSERT_EQ(cli::parse_options({argv, 2}, specs.data(), specs.size(), &out, &consumed).code, StatusCode::Ok);
    EXPECT_EQ(consumed, 2u);
    ASSERT_EQ(out.len, 2u);
    EXPECT_STREQ(out.data[0].value.str, "Blue in Green");
    EXPECT_EQ(out.data[1].value.i64v, 123);
}

TEST(CliOptions, StopsAtDoubleDash) {
    const std::array<cli::OptionSpec, 2> specs = {{
        {cli::OptionId::Title, cli::OptionType::String, "title", 't'},
        {cli::OptionId::Repair, cli::OptionType::Flag, "repair", 'r'},
    }};

    const char* argv[] = {"--title", "x", "--", "--repair"};
    cli::ParsedOption buf[8]{};
    cli::ParsedOptions out{buf, 0, 8};
    cli::u32 consumed = 0;
    ASSERT_EQ(cli::parse_options({argv, 4}, specs.data(), specs.size(), &out, &consumed).code, StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 1u);
    EXPECT_STREQ(out.data[0].value.str, "x");
}

TEST(CliOptions, InvalidOnUnknownMissingOrMalformedValue) {
    const std::array<cli::OptionSpec, 3> specs = {{
        {cli::OptionId::Title, cli::OptionType::String, "title", 't'},
        {cli::OptionId::Library, cli::OptionType::I64, "library", 'L'},
        {cli::OptionId::Repair, cli::OptionType::Flag, "repair", 'r'},
    }};

    const char* unknown[] = {"--nope"};
    const char* missing[] = {"--title"};
    const char* not_a_number[] = {"-L", "12x"};
    const char* flag_with_value[] = {"--repair=yes"};
    const cli::CliArgs cases[] = {{unknown, 1}, {missing, 1}, {not_a_number, 2}, {flag_with_value, 1}};

    for (const cli::CliArgs& args : cases) {
        cli::ParsedOption buf[2]{};
        cli::ParsedOptions out{buf, 0, 2};
        cli::u32 consumed = 0;
        EXPECT_EQ(cli::parse_options(args, specs.data(), specs.size(), &out, &consumed).code, StatusCode::Invalid)
            << args.argv[0];
    }
}

TEST(CliOptions, FullBufferIsInvalid) {
    const std::array<cli::OptionSpec, 1> specs = {{{cli::OptionId::Repair, cli::OptionType::Flag, "repair", 'r'}}};
    const char* argv[] = {"-r", "-r", "-r"};
    cli::ParsedOption buf[2]{};
    cli::ParsedOptions out{buf, 0, 2};
    cli::u32 consumed = 0;
    EXPECT_EQ(cli::parse_options({argv, 3}, specs.data(), specs.size(), &out, &consumed).code, StatusCode::Invalid);
}

TEST(CliOptions, FindOptionReturnsLastOccurrence) {
    const std::array<cli::OptionSpec, 1> specs = {{{cli::OptionId::Title, cli::OptionType::String, "title", 't'}}};
    const char* argv[] = {"-t", "first", "-t", "second"};
    cli::ParsedOption buf[4]{};
    cli::ParsedOptions out{buf, 0, 4};
    cli::u32 consumed = 0;
    ASSERT_EQ(cli::parse_options({argv, 4}, specs.data(), specs.size(), &out, &consumed).code, StatusCode::Ok);

    const cli::ParsedOption* t = cli::find_option(out, cli::OptionId::Title);
    ASSERT_NE(t, nullptr);
    EXPECT_STREQ(t->value.str, "second");
    EXPECT_EQ(cli::find_option(out, cli::OptionId::Mime), nullptr);
}

TEST(CliGlobalOptions, AppliedOntoAppOptions) {
    cli::u32 count = 0;
    const cli::OptionSpec* specs = cli::global_option_specs(&count);
    const char* argv[] = {"-d", "/srv/medley", "--user", "7", "-s", "-l", "debug", "libs"};

    cli::ParsedOption buf[8]{};
    cli::ParsedOptions parsed{buf, 0, 8};
    cli::u32 consumed = 0;
    ASSERT_EQ(cli::parse_options({argv, 8}, specs, count, &parsed, &consumed).code, StatusCode::Ok);
    EXPECT_EQ(consumed, 7u);

    cli::AppOptions opts;
    ASSERT_EQ(cli::apply_global_options(parsed, &opts).code, StatusCode::Ok);
    EXPECT_EQ(opts.config.data_root, "/srv/medley");
    EXPECT_EQ(opts.user.v, 7u);
    EXPECT_TRUE(opts.config.strict_cascade);
    EXPECT_EQ(opts.config.log_level, "debug");
}

TEST(CliGlobalOptions, NonPositiveUserIsInvalid) {
    cli::u32 count = 0;
    const cli::OptionSpec* specs = cli::global_option_specs(&count);
    const char* argv[] = {"--user=0"};

    cli::ParsedOption buf[4]{};
    cli::ParsedOptions parsed{buf, 0, 4};
    cli::u32 consumed = 0;
    ASSERT_EQ(cli::parse_options({argv, 1}, specs, count, &parsed, &consumed).code, StatusCode::Ok);

    cli::AppOptions opts;
    EXPECT_EQ(cli::apply_global_options(parsed, &opts).code, StatusCode::Invalid);
    EXPECT_EQ(cli::apply_global_options(parsed, nullptr).code, StatusCode::Invalid);
}
