#include <gtest/gtest.h>

#include "args.hpp"
#include "hg_error.hpp"
#include "output.hpp"

#include <lexertl/enums.hpp>

#include <iterator>
#include <string>

// Use the lexertl enum operator
using namespace lexertl;

class args_test : public ::testing::Test
{
protected:
    void SetUp() override
    {
        g_options = options();
    }

    void TearDown() override
    {
        g_options = options();
    }
};

template<std::size_t N>
scan_config parse(const char* const (&argv)[N])
{
    return read_args(static_cast<int>(N), argv);
}

TEST_F(args_test, split)
{
    const auto parts = split("colour,color", ',');

    ASSERT_EQ(parts.size(), 2U);
    EXPECT_EQ(parts[0], "colour");
    EXPECT_EQ(parts[1], "color");
    EXPECT_TRUE(split("", ',').empty());
    EXPECT_EQ(split(",,a,", ',').size(), 1U);
}

TEST_F(args_test, positional_form)
{
    const char* const argv[] = { "hook_grep", "1", "0", "1", "4", "todo" };
    const scan_config cfg = parse(argv);

    EXPECT_TRUE(is_positional(6, argv));
    EXPECT_EQ(cfg._flags, *config_flags::icase | *config_flags::negate);
    EXPECT_EQ(cfg._concurrency, 4U);
    EXPECT_EQ(cfg._pattern, "todo");
}

TEST_F(args_test, positional_pattern_taken_verbatim)
{
    const char* const argv[] = { "hook_grep", "0", "1", "0", "1", "-x" };
    const scan_config cfg = parse(argv);

    EXPECT_EQ(cfg._flags, *config_flags::multiline);
    EXPECT_EQ(cfg._pattern, "-x");
}

TEST_F(args_test, positional_rejects_bad_flag)
{
    const char* const two[] = { "hook_grep", "2", "0", "0", "1", "p" };
    const char* const word[] = { "hook_grep", "0", "true", "0", "1", "p" };
    const char* const empty[] = { "hook_grep", "0", "0", "", "1", "p" };

    EXPECT_THROW(parse(two), usage_error);
    EXPECT_THROW(parse(word), usage_error);
    EXPECT_THROW(parse(empty), usage_error);
}

TEST_F(args_test, positional_rejects_bad_concurrency)
{
    const char* const zero[] = { "hook_grep", "0", "0", "0", "0", "p" };
    const char* const neg[] = { "hook_grep", "0", "0", "0", "-1", "p" };
    const char* const text[] = { "hook_grep", "0", "0", "0", "4x", "p" };

    EXPECT_THROW(parse(zero), usage_error);
    EXPECT_THROW(parse(neg), usage_error);
    EXPECT_THROW(parse(text), usage_error);
}

TEST_F(args_test, five_switch_arguments_are_not_positional)
{
    const char* const argv[] = { "hook_grep", "foo", "-i", "--negate", "-j",
        "2" };
    const scan_config cfg = parse(argv);

    EXPECT_FALSE(is_positional(6, argv));
    EXPECT_EQ(cfg._flags, *config_flags::icase | *config_flags::negate);
    EXPECT_EQ(cfg._concurrency, 2U);
    EXPECT_EQ(cfg._pattern, "foo");
}

TEST_F(args_test, wrong_positional_count)
{
    const char* const argv[] = { "hook_grep", "0", "0", "0", "1" };

    EXPECT_THROW(read_positional(5, argv), usage_error);
}

TEST_F(args_test, switch_form)
{
    const char* const argv[] = { "hook_grep", "-i", "--multiline", "-j", "3",
        "pat" };
    const scan_config cfg = parse(argv);

    EXPECT_FALSE(is_positional(6, argv));
    EXPECT_EQ(cfg._flags, *config_flags::icase | *config_flags::multiline);
    EXPECT_EQ(cfg._concurrency, 3U);
    EXPECT_EQ(cfg._pattern, "pat");
}

TEST_F(args_test, switch_form_matches_positional_form)
{
    const char* const pos[] = { "hook_grep", "1", "1", "1", "2", "x+" };
    const char* const sw[] = { "hook_grep", "--negate", "--jobs=2",
        "--ignore-case", "--multiline", "x+" };
    const scan_config lhs = parse(pos);
    const scan_config rhs = parse(sw);

    EXPECT_EQ(lhs._flags, rhs._flags);
    EXPECT_EQ(lhs._concurrency, rhs._concurrency);
    EXPECT_EQ(lhs._pattern, rhs._pattern);
}

TEST_F(args_test, grouped_short_options)
{
    const char* const argv[] = { "hook_grep", "-is", "pat" };
    const scan_config cfg = parse(argv);

    EXPECT_EQ(cfg._flags, *config_flags::icase);
    EXPECT_TRUE(g_options._no_messages);
}

TEST_F(args_test, default_concurrency)
{
    const char* const argv[] = { "hook_grep", "pat" };
    const scan_config cfg = parse(argv);

    EXPECT_GE(default_concurrency(), 1U);
    EXPECT_EQ(cfg._concurrency, default_concurrency());
    EXPECT_EQ(cfg._flags, *config_flags::none);
}

TEST_F(args_test, end_of_options)
{
    const char* const argv[] = { "hook_grep", "--negate", "--", "-i" };
    const scan_config cfg = parse(argv);

    EXPECT_EQ(cfg._flags, *config_flags::negate);
    EXPECT_EQ(cfg._pattern, "-i");
}

TEST_F(args_test, lone_dash_is_pattern)
{
    const char* const argv[] = { "hook_grep", "-" };

    EXPECT_EQ(parse(argv)._pattern, "-");
}

TEST_F(args_test, missing_pattern)
{
    const char* const argv[] = { "hook_grep", "-i" };

    EXPECT_THROW(parse(argv), usage_error);
}

TEST_F(args_test, second_pattern)
{
    const char* const argv[] = { "hook_grep", "a", "b" };

    EXPECT_THROW(parse(argv), usage_error);
}

TEST_F(args_test, unknown_options)
{
    const char* const lng[] = { "hook_grep", "--recursive", "pat" };
    const char* const shrt[] = { "hook_grep", "-r", "pat" };

    EXPECT_THROW(parse(lng), usage_error);
    EXPECT_THROW(parse(shrt), usage_error);
}

TEST_F(args_test, jobs_needs_value)
{
    const char* const lng[] = { "hook_grep", "pat", "--jobs" };
    const char* const shrt[] = { "hook_grep", "pat", "-j" };
    const char* const bad[] = { "hook_grep", "--jobs=0", "pat" };
    const char* const extra[] = { "hook_grep", "--negate=1", "pat" };

    EXPECT_THROW(parse(lng), usage_error);
    EXPECT_THROW(parse(shrt), usage_error);
    EXPECT_THROW(parse(bad), usage_error);
    EXPECT_THROW(parse(extra), usage_error);
}

TEST_F(args_test, colour_option)
{
    const char* const always[] = { "hook_grep", "--colour=always", "p" };
    const char* const never[] = { "hook_grep", "--color=never", "p" };
    const char* const bare[] = { "hook_grep", "--colour", "p" };
    const char* const bad[] = { "hook_grep", "--colour=sometimes", "p" };

    parse(always);
    EXPECT_EQ(g_options._colour, colour::always);
    parse(never);
    EXPECT_EQ(g_options._colour, colour::never);
    parse(bare);
    EXPECT_EQ(g_options._colour, colour::automatic);
    EXPECT_THROW(parse(bad), usage_error);
}

TEST_F(args_test, help_and_version_need_no_pattern)
{
    const char* const help[] = { "hook_grep", "--help" };
    const char* const version[] = { "hook_grep", "-V" };

    EXPECT_NO_THROW(parse(help));
    EXPECT_TRUE(g_options._show_help);
    EXPECT_NO_THROW(parse(version));
    EXPECT_TRUE(g_options._show_version);
}

TEST_F(args_test, usage_names_both_forms)
{
    const std::string text = usage();

    EXPECT_NE(text.find("[OPTION]... PATTERN"), std::string::npos);
    EXPECT_NE(text.find("IGNORE_CASE MULTILINE NEGATE CONCURRENCY PATTERN"),
        std::string::npos);
}

TEST_F(args_test, help_lists_every_switch)
{
    testing::internal::CaptureStdout();
    show_help();

    const std::string text = testing::internal::GetCapturedStdout();

    EXPECT_NE(text.find("  -i, --ignore-case"), std::string::npos);
    EXPECT_NE(text.find("      --multiline"), std::string::npos);
    EXPECT_NE(text.find("  -j, --jobs=NUM"), std::string::npos);
    EXPECT_NE(text.find("--colour[=WHEN], --color[=WHEN]"),
        std::string::npos);
    // Second help line is indented to the help column
    EXPECT_NE(text.find('\n' + std::string(30, ' ') +
        "(default: number of hardware threads)"), std::string::npos);
}
