#pragma once

#include "types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

std::vector<std::string_view> split(const char* str, const char c);
[[nodiscard]] std::size_t default_concurrency();
std::size_t parse_concurrency(const std::string_view value);
// IGNORE_CASE MULTILINE NEGATE CONCURRENCY PATTERN, with IGNORE_CASE
// 0 or 1. Anything else is read as switches.
[[nodiscard]] bool is_positional(const int argc, const char* const argv[]);
scan_config read_positional(const int argc, const char* const argv[]);
scan_config read_switches(const int argc, const char* const argv[]);
// Picks the positional or switch form
scan_config read_args(const int argc, const char* const argv[]);
const char* usage();
const char* try_help();
void show_help();
