#pragma once

#include <cstdint>
#include <string>

namespace reprise::util {

/**
 * Format a millisecond position as "MM:SS", or "HH:MM:SS" from one hour up.
 * Negative input is clamped to zero.
 */
std::string format_time(int64_t ms);

/**
 * Calculate the display width of a UTF-8 string (each code point counts as 1 column).
 */
int display_cols(const std::string& s);

/**
 * Truncate a string to fit exactly `width` display columns without
 * splitting a UTF-8 sequence.
 */
std::string take_cols(const std::string& s, int width);

/**
 * Truncate string if too long (with ellipsis), pad with spaces if too short.
 * Result will be exactly `width` display columns.
 */
std::string trunc_pad(const std::string& s, int width);

} // namespace reprise::util
