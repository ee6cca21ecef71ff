#include "pch.h"

#include "parser.hpp"

#include <lexertl/generator.hpp>
#include <lexertl/iterator.hpp>
#include <lexertl/rules.hpp>
#include <parsertl/generator.hpp>
#include <parsertl/iterator.hpp>
#include <parsertl/rules.hpp>

#include <algorithm>
#include <format>
#include <iterator>
#include <string_view>
#include <utility>

void build_colour_parser(colour_parser& parser)
{
    parsertl::rules grules;
    lexertl::rules lrules;

    grules.token("Name VALUE");
    grules.push("start", "list");
    grules.push("list", "item | list ':' item");
    parser._name_val_idx = grules.push("item", "name '=' value");
    // ne flag
    parser._ne_idx = grules.push("item", "'ne'");
    // Any other bare capability (rv etc.) is accepted and ignored
    grules.push("item", "Name");
    grules.push("name", "'fn' | 'ms' | 'wa' | Name");
    grules.push("value", "%empty | VALUE");
    parsertl::generator::build(grules, parser._gsm);

    lrules.push(":", grules.token_id("':'"));
    lrules.push("=", grules.token_id("'='"));
    lrules.push("fn", grules.token_id("'fn'"));
    lrules.push("ms", grules.token_id("'ms'"));
    lrules.push("ne", grules.token_id("'ne'"));
    lrules.push("wa", grules.token_id("'wa'"));
    // Must follow the keywords so that they win on equal length
    lrules.push("[a-z]{2}", grules.token_id("Name"));
    lrules.push(R"(\d{1,3}(;\d{1,3}){0,2})", grules.token_id("VALUE"));
    lexertl::generator::build(lrules, parser._lsm);
}

bool parse_colours(const std::string& colours, options& opts)
{
    static colour_parser parser;

    if (parser._gsm.empty())
        build_colour_parser(parser);

    lexertl::citerator liter(colours.c_str(),
        colours.c_str() + colours.size(), parser._lsm);
    parsertl::citerator giter(liter, parser._gsm);
    options temp = opts;

    for (; giter->entry.action != parsertl::action::accept &&
        giter->entry.action != parsertl::action::error; ++giter)
    {
        if (giter->entry.action != parsertl::action::reduce)
            continue;

        if (giter->entry.param == parser._name_val_idx)
        {
            const auto value = giter.dollar(2).view();

            if (value.empty())
                // Ignore blank value
                continue;

            std::pair<const char*, std::string&> lookup[] =
            {
                {"fn", temp._fn_text},
                {"ms", temp._ms_text},
                {"wa", temp._wa_text}
            };
            const auto name = giter.dollar(0).view();

            if (auto iter = std::ranges::find_if(lookup,
                [name](const auto& pair) { return name == pair.first; });
                iter != std::end(lookup))
            {
                iter->second = std::format("\x1b[{}m", value);
            }
        }
        else if (giter->entry.param == parser._ne_idx)
            temp._ne = true;
    }

    if (giter->entry.action == parsertl::action::error)
        return false;

    opts = std::move(temp);
    return true;
}
