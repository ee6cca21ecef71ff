#include "pch.h"

#include "types.hpp"

options g_options;

void scan_result::fold(const file_outcome& outcome)
{
    ++_files;

    if (outcome._error)
        // A file that could not be searched has no outcome to OR in
        ++_errors;
    else
        _matched |= outcome._matched;
}

int scan_result::exit_code() const
{
    // An unreadable file fails the check just like a match does.
    return _matched || _errors ? exit_match : exit_no_match;
}
