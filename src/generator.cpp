/**
 * @file generator.cpp
 * @brief FizzBuzz sequence generation implementation
 */

#include "fizzbuzz/generator.h"
#include "fizzbuzz/utils/string_utils.h"

#include <vector>
#include <spdlog/spdlog.h>

namespace fizzbuzz {

std::string fizzBuzzLabel(int n) {
    const bool fizz = n % 3 == 0;
    const bool buzz = n % 5 == 0;

    if (fizz && buzz) return "FizzBuzz";
    if (fizz) return "Fizz";
    if (buzz) return "Buzz";
    return std::to_string(n);
}

std::string getFizzBuzzString(const ValidatedNumber& number) {
    const int upper = number.getValue();

    std::vector<std::string> labels;
    labels.reserve(static_cast<size_t>(upper));
    for (int n = 1; n <= upper; ++n) {
        labels.push_back(fizzBuzzLabel(n));
    }

    spdlog::debug("Generated {} FizzBuzz labels", labels.size());
    return utils::join(labels, "\n");
}

} // namespace fizzbuzz
