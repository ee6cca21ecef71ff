#pragma once

#include "types.hpp"

#include <lexertl/state_machine.hpp>
#include <parsertl/state_machine.hpp>

#include <cstdint>
#include <string>

struct colour_parser
{
    parsertl::state_machine _gsm;
    lexertl::state_machine _lsm;
    uint16_t _name_val_idx = 0;
    uint16_t _ne_idx = 0;
};

void build_colour_parser(colour_parser& parser);

// Applies a GREP_COLORS style list ("wa=01;33:fn=35:ne") to opts.
// Returns false, leaving opts alone, if colours does not parse.
bool parse_colours(const std::string& colours, options& opts);
