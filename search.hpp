#pragma once

#include "types.hpp"

#include <string>

[[nodiscard]] file_processor select_processor(const unsigned int flags);

// Searches [first, second) attributed to pathname.
// Any report lines are appended to report.
bool search(const file_processor& processor, const matcher& m,
    const std::string& pathname, const char* first, const char* second,
    std::string& report);

// Maps pathname and searches it. On failure report is left empty and
// the outcome carries the reason instead of a match result.
file_outcome process_file(const std::string& pathname, const matcher& m,
    const file_processor& processor, std::string& report);
