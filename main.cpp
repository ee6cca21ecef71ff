// Searches every file named on stdin for a Perl style regular expression
// and reports matching lines (or non-matching files) the way a grep does.

#include "pch.h"

#include "args.hpp"
#include "hg_error.hpp"
#include "limits.hpp"
#include "output.hpp"
#include "parser.hpp"
#include "pattern.hpp"
#include "pool.hpp"
#include "types.hpp"
#include "version.hpp"

#include <exception>
#include <format>
#include <iostream>

#ifdef _WIN32
#include <minwindef.h>
#include <processenv.h>
#endif

#include <stdlib.h>
#include <string>
#include <vector>

static std::string env_var(const char* var)
{
    std::string ret;
#ifdef _WIN32
    const DWORD dwSize = ::GetEnvironmentVariableA(var, nullptr, 0);

    if (dwSize)
    {
        std::vector<char> buff(dwSize, ' ');

        ::GetEnvironmentVariableA(var, &buff.front(), dwSize);
        ret.assign(&buff.front());
    }
#else
    const char* str = std::getenv(var);

    if (str)
        ret = str;
#endif

    return ret;
}

static void raise_file_limit(output_sink& err)
{
    const file_limit limit = adjust_open_file_limit();

    if (limit._result == file_limit::result::failed)
    {
        err.write(warning(err._tty,
            std::format("cannot raise the open file limit from {} to {}: {}",
                limit._soft,
                limit._target,
                limit._error.message())));
    }
}

int main(int argc, char* argv[])
{
    try
    {
        if (argc == 1)
            throw usage_error("no PATTERN given");

        if (const std::string colours = env_var("GREP_COLORS");
            !colours.empty())
        {
            // A malformed GREP_COLORS leaves the defaults alone
            parse_colours(colours, g_options);
        }

        const scan_config config = read_args(argc, argv);

        if (g_options._show_help)
        {
            show_help();
            return exit_no_match;
        }

        if (g_options._show_version)
        {
            std::cout << "hook_grep " << g_version_string << '\n';
            return exit_no_match;
        }

        const matcher m = compile_pattern(config);
        output_sink out(std::cout, is_a_tty(stdout));
        output_sink err(std::cerr, is_a_tty(stderr));

        raise_file_limit(err);

        const scan_result result = scan(config, m, std::cin, out, err);

        if (!out.flush())
            throw hg_error("failed to write to standard output");

        return result.exit_code();
    }
    catch (const usage_error& e)
    {
        output_text_nl(std::cerr, is_a_tty(stderr),
            g_options._ms_text.c_str(),
            std::format("{}{}",
                hg_text(),
                e.what()));
        std::cerr << usage() << try_help();
        return exit_fatal;
    }
    catch (const std::exception& e)
    {
        output_text_nl(std::cerr, is_a_tty(stderr),
            g_options._ms_text.c_str(),
            std::format("{}{}",
                hg_text(),
                e.what()));
        return exit_fatal;
    }
}
