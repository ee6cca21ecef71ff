#include "pch.h"

#include "args.hpp"
#include <charconv>
#include <format>
#include "hg_error.hpp"
#include "option.hpp"

#include <iterator>
#include <thread>

std::vector<std::string_view> split(const char* str, const char c)
{
    std::vector<std::string_view> ret;
    const char* first = str;
    std::size_t count = 0;

    for (; *str; ++str)
    {
        if (*str == c)
        {
            count = str - first;

            if (count > 0)
                ret.emplace_back(first, count);

            first = str + 1;
        }
    }

    count = str - first;

    if (count > 0)
        ret.emplace_back(first, count);

    return ret;
}

std::size_t default_concurrency()
{
    // hardware_concurrency() is allowed to report 0
    return std::max(std::thread::hardware_concurrency(), 1U);
}

std::size_t parse_concurrency(const std::string_view value)
{
    std::size_t concurrency = 0;
    const char* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), last, concurrency);

    if (ec != std::errc() || ptr != last || concurrency == 0)
    {
        throw usage_error(std::format("invalid concurrency '{}', "
            "expected a positive integer",
            value));
    }

    return concurrency;
}

[[nodiscard]] static bool parse_flag(const std::string_view value,
    const char* name)
{
    if (value == "1")
        return true;
    else if (value == "0")
        return false;

    throw usage_error(std::format("invalid {} '{}', expected 0 or 1",
        name,
        value));
}

bool is_positional(const int argc, const char* const argv[])
{
    const std::string_view ignore_case = argc == 6 ?
        argv[1] : std::string_view();

    return ignore_case == "0" || ignore_case == "1";
}

scan_config read_positional(const int argc, const char* const argv[])
{
    // Use the lexertl enum operator
    using namespace lexertl;
    scan_config cfg;

    if (argc != 6)
        throw usage_error(std::format("expected 5 arguments, got {}",
            argc - 1));

    if (parse_flag(argv[1], "IGNORE_CASE"))
        cfg._flags |= *config_flags::icase;

    if (parse_flag(argv[2], "MULTILINE"))
        cfg._flags |= *config_flags::multiline;

    if (parse_flag(argv[3], "NEGATE"))
        cfg._flags |= *config_flags::negate;

    cfg._concurrency = parse_concurrency(argv[4]);
    cfg._pattern = argv[5];
    return cfg;
}

static void process_long(int& i, const char* const argv[], scan_config& cfg)
{
    // Skip over "--"
    const char* a = argv[i] + 2;
    const char* equal = strchr(a, '=');
    const std::string_view param(a, equal ? equal : a + strlen(a));
    const std::string_view value(equal ? equal + 1 : "");
    auto iter = std::ranges::find_if(g_option,
        [param](const auto& c)
        {
            std::vector<std::string_view> switches;

            if (c._long)
                switches = split(c._long, ',');

            return std::ranges::find(switches, param) != switches.end();
        });

    if (iter == std::end(g_option))
        throw usage_error(std::format("unrecognised option '{}'", argv[i]));

    if (iter->_param && value.empty() && *iter->_param != '[')
    {
        throw usage_error(std::format("option '{}' requires an argument",
            argv[i]));
    }

    if (!value.empty() && !iter->_param)
    {
        throw usage_error(std::format("option '{}' doesn't accept an "
            "argument",
            param));
    }

    iter->_func(i, true, argv, value, cfg);
}

static void process_short(int& i, const int argc, const char* const argv[],
    scan_config& cfg)
{
    // Skip over '-'
    const char* param = argv[i] + 1;

    while (*param)
    {
        auto iter = std::find_if(std::begin(g_option), std::end(g_option),
            [param](const auto& c)
            {
                return *param == c._short;
            });

        if (iter == std::end(g_option))
        {
            throw usage_error(std::format("unrecognised option '-{}'",
                *param));
        }

        if (iter->_param && i + 1 == argc)
        {
            throw usage_error(std::format("option requires an "
                "argument -- {}",
                *param));
        }

        iter->_func(i, false, argv, std::string_view(), cfg);
        ++param;
    }
}

scan_config read_switches(const int argc, const char* const argv[])
{
    scan_config cfg;
    bool pattern_set = false;
    bool end_of_options = false;

    for (int i = 1; i < argc; ++i)
    {
        const char* param = argv[i];

        // A lone "-" is a pattern
        if (!end_of_options && *param == '-' && param[1])
        {
            if (param[1] != '-')
                process_short(i, argc, argv, cfg);
            else if (param[2])
                process_long(i, argv, cfg);
            else
                end_of_options = true;
        }
        else if (pattern_set)
        {
            throw usage_error(std::format("unexpected argument '{}'",
                param));
        }
        else
        {
            cfg._pattern = param;
            pattern_set = true;
        }
    }

    if (g_options._show_help || g_options._show_version)
        return cfg;

    if (!pattern_set)
        throw usage_error("no PATTERN given");

    if (cfg._concurrency == 0)
        cfg._concurrency = default_concurrency();

    return cfg;
}

scan_config read_args(const int argc, const char* const argv[])
{
    return is_positional(argc, argv) ?
        read_positional(argc, argv) :
        read_switches(argc, argv);
}

// "-j, --jobs=NUM" or "    --colour[=WHEN], --color[=WHEN]"
[[nodiscard]] static std::string switch_text(const option& opt)
{
    std::string text = opt._short ?
        std::format("-{}", opt._short) :
        std::string("  ");
    std::string_view param = opt._param ? opt._param : "";
    const bool optional = !param.empty() && param.front() == '[';

    if (optional)
        param.remove_prefix(1);

    if (opt._long)
    {
        const char* sep = opt._short ? ", " : "  ";

        for (const auto& name : split(opt._long, ','))
        {
            text += std::format("{}--{}", sep, name);

            if (optional)
                text += std::format("[={}]", param);
            else if (!param.empty())
                text += std::format("={}", param);

            sep = ", ";
        }
    }
    else if (!param.empty())
        text += std::format(" {}", param);

    return text;
}

static void show_option(const option& opt)
{
    constexpr std::size_t column = 30;
    const std::string text = switch_text(opt);
    // Help starts on the next line when the switches overrun the column
    std::string indent = text.size() + 2 < column ?
        std::string(column - text.size() - 2, ' ') :
        '\n' + std::string(column, ' ');

    std::cout << "  " << text;

    if (!opt._help)
        std::cout << '\n';

    for (const auto& line : split(opt._help ? opt._help : "", '\n'))
    {
        std::cout << indent << line << '\n';
        indent.assign(column, ' ');
    }
}

const char* usage()
{
    return "Usage: hook_grep [OPTION]... PATTERN < FILE-LIST\n"
        "  or:  hook_grep IGNORE_CASE MULTILINE NEGATE CONCURRENCY "
        "PATTERN < FILE-LIST\n";
}

const char* try_help()
{
    return "Try 'hook_grep --help' for more information.\n";
}

void show_help()
{
    auto iter = std::begin(g_option);
    auto end = std::end(g_option);

    std::cout << usage();
    std::cout << "Search for PATTERN in each file named on standard input, "
        "one per line.\n";
    std::cout << "PATTERN is a Perl style regular expression.\n";
    std::cout << "In the second form IGNORE_CASE, MULTILINE and NEGATE are "
        "0 or 1.\n";
    std::cout << "Example: git ls-files | hook_grep -i \"todo\"\n\n";

    std::cout << "Pattern selection and interpretation:\n";

    for (; iter != end && iter->_type == option::type::matching; ++iter)
    {
        show_option(*iter);
    }

    std::cout << '\n' << "Miscellaneous:\n";

    for (; iter != end && iter->_type == option::type::misc; ++iter)
    {
        show_option(*iter);
    }

    std::cout << '\n' << "Output control:\n";

    for (; iter != end; ++iter)
    {
        show_option(*iter);
    }

    std::cout << '\n';
    std::cout << "Output is 'FILE:LINE:TEXT' for each matching line, or just "
        "'FILE' with --negate.\n"
        "Exit status is 0 if nothing was reported, 1 if something was "
        "reported or a file\n"
        "could not be read, and 2 if an error occurred.\n";
}
