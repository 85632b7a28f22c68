/**
 * @file parser.h
 * @brief Raw user input to integer conversion
 *
 * Pure function: no I/O, never throws on malformed input.
 */

#pragma once

#include <optional>
#include <string>

namespace fizzbuzz {

/**
 * @brief Parse user input and try to convert it to an integer
 *
 * Accepted format:
 *   [white space][+|-]digits[white space]
 *
 * Leading zeros are allowed. Embedded white space, decimal points,
 * thousands separators and values outside the int range are rejected.
 *
 * @param input Raw user input
 * @return Parsed integer, or std::nullopt if no integer could be extracted
 */
std::optional<int> tryParse(const std::string& input);

} // namespace fizzbuzz
