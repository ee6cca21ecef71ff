#pragma once

#include "types.hpp"

// Throws hg_error if cfg._pattern is not a valid Perl style expression
[[nodiscard]] matcher compile_pattern(const scan_config& cfg);
