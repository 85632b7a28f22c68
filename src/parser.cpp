/**
 * @file parser.cpp
 * @brief Integer parsing implementation
 */

#include "fizzbuzz/parser.h"
#include "fizzbuzz/utils/string_utils.h"

#include <charconv>
#include <cctype>
#include <system_error>

namespace fizzbuzz {

std::optional<int> tryParse(const std::string& input) {
    std::string text = utils::trim(input);
    if (text.empty()) {
        return std::nullopt;
    }

    const char* first = text.data();
    const char* last = text.data() + text.size();

    // std::from_chars takes '-' but not '+'
    if (*first == '+') {
        ++first;
        if (first == last || !std::isdigit(static_cast<unsigned char>(*first))) {
            return std::nullopt;
        }
    }

    int value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

} // namespace fizzbuzz
