/**
 * @file string_utils.cpp
 * @brief String utility functions implementation
 */

#include "fizzbuzz/utils/string_utils.h"

namespace fizzbuzz {
namespace utils {

bool isWhiteSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

std::string trim(const std::string& str) {
    // Find first non-whitespace character
    size_t start = 0;
    while (start < str.length() && isWhiteSpace(str[start])) {
        ++start;
    }

    // If all whitespace, return empty string
    if (start == str.length()) {
        return "";
    }

    // Find last non-whitespace character
    size_t end = str.length();
    while (end > start && isWhiteSpace(str[end - 1])) {
        --end;
    }

    return str.substr(start, end - start);
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) {
        return "";
    }

    size_t total = delimiter.length() * (parts.size() - 1);
    for (const auto& part : parts) {
        total += part.length();
    }

    std::string result;
    result.reserve(total);
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

std::string stripCarriageReturn(const std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        return line.substr(0, line.length() - 1);
    }
    return line;
}

} // namespace utils
} // namespace fizzbuzz
