#include <gtest/gtest.h>

#include "hg_error.hpp"
#include "pattern.hpp"

#include <lexertl/enums.hpp>
#include <boost/regex.hpp>

#include <string>

// Use the lexertl enum operator
using namespace lexertl;

static scan_config make_config(const std::string& pattern,
    const unsigned int flags = config_flags::none)
{
    scan_config cfg;

    cfg._flags = flags;
    cfg._concurrency = 1;
    cfg._pattern = pattern;
    return cfg;
}

TEST(compile_pattern, case_sensitive_by_default)
{
    const matcher m = compile_pattern(make_config("foo"));

    EXPECT_TRUE(boost::regex_search("a foo b", m._rx));
    EXPECT_FALSE(boost::regex_search("a FOO b", m._rx));
}

TEST(compile_pattern, ignore_case)
{
    const matcher m = compile_pattern(make_config("foo",
        *config_flags::icase));

    EXPECT_TRUE(boost::regex_search("a FoO b", m._rx));
}

TEST(compile_pattern, line_mode_dot_matches_carriage_return)
{
    const matcher m = compile_pattern(make_config("abc."));

    EXPECT_TRUE(boost::regex_search("abc\r", m._rx));
    EXPECT_TRUE(boost::regex_search("abc-", m._rx));
    EXPECT_FALSE(boost::regex_search("abc", m._rx));
}

TEST(compile_pattern, line_mode_anchors_ignore_carriage_return)
{
    const matcher m = compile_pattern(make_config("^b"));

    EXPECT_FALSE(boost::regex_search("a\rb", m._rx));
    EXPECT_TRUE(boost::regex_search("b\r", m._rx));
}

TEST(compile_pattern, multiline_dot_and_anchors)
{
    const matcher m = compile_pattern(make_config("a.b",
        *config_flags::multiline));
    const matcher anchored = compile_pattern(make_config("^two$",
        *config_flags::multiline));

    EXPECT_TRUE(boost::regex_search("a\nb", m._rx));
    EXPECT_TRUE(boost::regex_search("one\ntwo\nthree", anchored._rx));
}

TEST(compile_pattern, perl_syntax)
{
    const matcher m = compile_pattern(make_config(R"(\bTODO\(\w+\):)"));

    EXPECT_TRUE(boost::regex_search("// TODO(ben): fix", m._rx));
    EXPECT_FALSE(boost::regex_search("// XTODO(ben): fix", m._rx));
}

TEST(compile_pattern, invalid_pattern_throws)
{
    EXPECT_THROW(compile_pattern(make_config("foo(")), hg_error);
    EXPECT_THROW(compile_pattern(make_config("[a-")), hg_error);
}

TEST(compile_pattern, invalid_pattern_message_names_pattern)
{
    try
    {
        compile_pattern(make_config("(unbalanced"));
        FAIL() << "expected hg_error";
    }
    catch (const hg_error& e)
    {
        EXPECT_NE(std::string(e.what()).find("(unbalanced"),
            std::string::npos);
    }
}
