#pragma once

#include "hg_error.hpp"
#include "output.hpp"
#include "types.hpp"

#include <lexertl/enums.hpp>

#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <vector>

extern options g_options;

extern std::size_t parse_concurrency(const std::string_view value);
extern std::vector<std::string_view> split(const char* str, const char c);

struct option
{
    enum class type
    {
        matching,
        misc,
        output
    };

    type _type;
    const char _short;
    const char* _long;
    const char* _param;
    const char* _help;
    void (*_func)(int& i, const bool longp,
        const char* const argv[], std::string_view param,
        scan_config& cfg);
};

void validate_value(int& i, const char* const argv[],
    const bool longp, std::string_view& value)
{
    if (!longp)
    {
        ++i;
        value = argv[i];
    }
}

const option g_option[]
{
    {
        option::type::matching,
        'i',
        "ignore-case",
        nullptr,
        "ignore case distinctions in PATTERN and data",
        [](int&, const bool, const char* const [],
            std::string_view, scan_config& cfg)
        {
            // Use the lexertl enum operator
            using namespace lexertl;

            cfg._flags |= *config_flags::icase;
        }
    },
    {
        option::type::matching,
        '\0',
        "multiline",
        nullptr,
        "search each file as a whole; '.' matches newlines\n"
        "and '^'/'$' match at every line",
        [](int&, const bool, const char* const [],
            std::string_view, scan_config& cfg)
        {
            // Use the lexertl enum operator
            using namespace lexertl;

            cfg._flags |= *config_flags::multiline;
        }
    },
    {
        option::type::matching,
        '\0',
        "negate",
        nullptr,
        "list the files that do NOT contain a match",
        [](int&, const bool, const char* const [],
            std::string_view, scan_config& cfg)
        {
            // Use the lexertl enum operator
            using namespace lexertl;

            cfg._flags |= *config_flags::negate;
        }
    },
    {
        option::type::misc,
        'h',
        "help",
        nullptr,
        "display this help text and exit",
        [](int&, const bool, const char* const [], std::string_view,
            scan_config&)
        {
            g_options._show_help = true;
        }
    },
    {
        option::type::misc,
        'j',
        "jobs",
        "NUM",
        "search at most NUM files at once\n"
        "(default: number of hardware threads)",
        [](int& i, const bool longp, const char* const argv[],
            std::string_view value, scan_config& cfg)
        {
            validate_value(i, argv, longp, value);
            cfg._concurrency = parse_concurrency(value);
        }
    },
    {
        option::type::misc,
        's',
        "no-messages",
        nullptr,
        "suppress error messages about unreadable files",
        [](int&, const bool, const char* const [], std::string_view,
            scan_config&)
        {
            g_options._no_messages = true;
        }
    },
    {
        option::type::misc,
        'V',
        "version",
        nullptr,
        "display version information and exit",
        [](int&, const bool, const char* const [], std::string_view,
            scan_config&)
        {
            g_options._show_version = true;
        }
    },
    {
        option::type::output,
        '\0',
        "colour,color",
        "[WHEN",
        "use markers to highlight error messages;\n"
        "WHEN is 'always', 'never', or 'auto'",
        [](int&, const bool, const char* const [], std::string_view value,
            scan_config&)
        {
            if (value.empty() || value == "auto")
                g_options._colour = colour::automatic;
            else if (value == "always")
                g_options._colour = colour::always;
            else if (value == "never")
                g_options._colour = colour::never;
            else
            {
                throw usage_error(std::format("invalid argument '{}' for "
                    "'--colour'",
                    value));
            }
        }
    }
};
