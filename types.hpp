#pragma once

#include "colours.hpp"

#include <boost/regex.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

enum config_flags
{
    none = 0,
    icase = 1,
    multiline = 2,
    negate = 4
};

enum class colour
{
    never, automatic, always
};

struct options
{
    colour _colour = colour::automatic;
    bool _no_messages = false;
    bool _show_help = false;
    bool _show_version = false;

    // Colours:
    std::string _fn_text = szDefaultFnText;
    std::string _ms_text = szDefaultMsText;
    bool _ne = false;
    std::string _wa_text = szDefaultWaText;
};

// What to scan for and how.
// Built once from the command line, then only read.
struct scan_config
{
    unsigned int _flags = config_flags::none;
    std::size_t _concurrency = 0;
    std::string _pattern;
};

struct matcher
{
    boost::regex _rx;
};

// Stateless search strategies, one per (multiline, negate) pair
struct line_search
{
};

struct negated_line_search
{
};

struct buffer_search
{
};

struct negated_buffer_search
{
};

enum class search_mode
{
    // Must match order of variant in file_processor (below).
    line, negated_line, buffer, negated_buffer
};

using file_processor = std::variant<line_search, negated_line_search,
    buffer_search, negated_buffer_search>;

struct file_outcome
{
    // Position of the pathname in the input list
    std::size_t _slot = 0;
    std::string _pathname;
    // Already incorporates negation
    bool _matched = false;
    // Set when the file could not be searched at all
    std::optional<std::string> _error;
};

constexpr int exit_no_match = 0;
constexpr int exit_match = 1;
constexpr int exit_fatal = 2;

struct scan_result
{
    bool _matched = false;
    std::size_t _files = 0;
    std::size_t _errors = 0;

    void fold(const file_outcome& outcome);
    [[nodiscard]] int exit_code() const;
};
