#include "pch.h"

#include <format>
#include "hg_error.hpp"
#include <lexertl/enums.hpp>
#include "pattern.hpp"

matcher compile_pattern(const scan_config& cfg)
{
    // Use the lexertl enum operator
    using namespace lexertl;
    matcher m;
    boost::regex::flag_type rx_flags = boost::regex_constants::perl;

    if (cfg._flags & *config_flags::icase)
        rx_flags |= boost::regex_constants::icase;

    if (cfg._flags & *config_flags::multiline)
        // Boost anchors ^ and $ at embedded newlines unless told otherwise,
        // so only the dot needs widening.
        rx_flags |= boost::regex_constants::mod_s;
    else
        // Lines arrive without their LF, so '.' matches anything left
        // (a trailing CR included).
        rx_flags |= boost::regex_constants::mod_s |
            boost::regex_constants::no_mod_m;

    try
    {
        m._rx.assign(cfg._pattern, rx_flags);
    }
    catch (const boost::regex_error& e)
    {
        throw hg_error(std::format("invalid pattern '{}': {}",
            cfg._pattern,
            e.what()));
    }

    return m;
}
