// Tools for formatting and parsing strings
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>


#include "aiomerge_export.h"

namespace aiomerge::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
AIOMERGE_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Parses an unsigned 32-bit value written in decimal or `0x` hex.
 *
 * Leading/trailing whitespace is ignored and the `0x`/`0X` prefix selects
 * base 16. Returns std::nullopt for empty input, stray characters, or a
 * value that does not fit in 32 bits.
 */
AIOMERGE_EXPORT std::optional<uint32_t> parse_u32(std::string_view text);

/**
 * @brief Formats a byte count with a binary unit suffix, e.g. "4.00 KiB".
 * Values below 1 KiB are printed as plain bytes ("512 B").
 */
AIOMERGE_EXPORT std::string human_size(uint64_t bytes);

} // namespace aiomerge::format_tools
