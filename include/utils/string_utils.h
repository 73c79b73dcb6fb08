#pragma once

#include <string>
#include <string_view>

namespace tradegate {
namespace utils {

/**
 * @brief Convert string to lowercase ASCII
 */
std::string to_lower_ascii(std::string_view input);

/**
 * @brief Convert string to uppercase ASCII
 */
std::string to_upper_ascii(std::string_view input);

/**
 * @brief First letter upper, rest lower ("buy" -> "Buy", "SELL" -> "Sell")
 */
std::string capitalize_ascii(std::string_view input);

/**
 * @brief Trim ASCII whitespace on both ends
 */
std::string trim_ascii(std::string_view input);

/**
 * @brief Shorten an identifier for log lines: "0x1234...abcd".
 *
 * Values shorter than 12 characters are fully masked.
 */
std::string redact(std::string_view value, std::size_t keep = 4);

/**
 * @brief Normalize venue name to lowercase key
 */
std::string normalize_venue_key(std::string_view venue);

} // namespace utils
} // namespace tradegate
