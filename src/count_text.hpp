#pragma once
/*
 * Count text
 *
 * Purpose: the on-disk and command-line text form of a counter value.
 * Format: optional '+'/'-' then decimal digits, must fit in int64_t.
 */
#include <cstdint>
#include <string>
#include <string_view>

bool parse_count(std::string_view s, int64_t& out);
std::string format_count(int64_t v);
std::string_view trim_right(std::string_view s);
