/**
 * @file validated_number.cpp
 * @brief ValidatedNumber range check implementation
 */

#include "fizzbuzz/validated_number.h"
#include <spdlog/spdlog.h>

namespace fizzbuzz {

bool ValidatedNumber::isInRange(int number) noexcept {
    return kMinimum <= number && number <= kMaximum;
}

std::optional<ValidatedNumber> ValidatedNumber::tryCreate(int number) {
    if (!isInRange(number)) {
        spdlog::debug("Number {} outside [{}, {}]", number, kMinimum, kMaximum);
        return std::nullopt;
    }
    return ValidatedNumber(number);
}

} // namespace fizzbuzz
