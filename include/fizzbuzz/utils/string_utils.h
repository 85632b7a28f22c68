/**
 * @file string_utils.h
 * @brief String manipulation utilities
 */

#pragma once

#include <string>
#include <vector>

namespace fizzbuzz {
namespace utils {

/**
 * @brief Check for a white-space character (space, \t, \n, \v, \f, \r)
 */
bool isWhiteSpace(char c);

/**
 * @brief Trim white space from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Join strings with delimiter
 *
 * @param parts Vector of strings
 * @param delimiter Delimiter string
 * @return Joined string (no leading or trailing delimiter)
 */
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

/**
 * @brief Remove a single trailing carriage return, if present
 */
std::string stripCarriageReturn(const std::string& line);

} // namespace utils
} // namespace fizzbuzz
