/**
 * @file validated_number.h
 * @brief Range-checked number accepted by the FizzBuzz generator
 *
 * No I/O. ValidatedNumber::tryCreate is the only way to
 * obtain an instance, so every ValidatedNumber lies within [1, 4000].
 */

#pragma once

#include <optional>
#include "domain/value_object.h"

namespace fizzbuzz {

/**
 * @brief Integer known by construction to lie within [kMinimum, kMaximum]
 *
 * Usage:
 * @code
 *   if (auto number = ValidatedNumber::tryCreate(15)) {
 *       std::string text = getFizzBuzzString(*number);
 *   }
 * @endcode
 */
class ValidatedNumber : public domain::ValueObject<int> {
public:
    static constexpr int kMinimum = 1;
    static constexpr int kMaximum = 4000;

    /**
     * @brief Validate that a number is within [kMinimum, kMaximum]
     *
     * Both bounds are inclusive.
     *
     * @param number Candidate integer
     * @return ValidatedNumber, or std::nullopt if out of range
     */
    static std::optional<ValidatedNumber> tryCreate(int number);

    /**
     * @brief Check the range without constructing an instance
     */
    static bool isInRange(int number) noexcept;

private:
    explicit ValidatedNumber(int number) : domain::ValueObject<int>(number) {}
};

} // namespace fizzbuzz
