/**
 * @file generator.h
 * @brief FizzBuzz sequence generation
 *
 * Pure and deterministic. No I/O or hidden state.
 *
 * Rules, checked in order for each n in 1..N:
 *   - 3 and 5 are factors -> "FizzBuzz"
 *   - 3 is a factor       -> "Fizz"
 *   - 5 is a factor       -> "Buzz"
 *   - otherwise           -> decimal n
 */

#pragma once

#include <string>
#include "validated_number.h"

namespace fizzbuzz {

/**
 * @brief Label for a single number
 * @param n Number to label
 * @return "FizzBuzz", "Fizz", "Buzz" or the decimal representation of n
 */
std::string fizzBuzzLabel(int n);

/**
 * @brief Build the FizzBuzz sequence for 1..N
 *
 * @param number Upper bound N (inclusive); the sequence starts at 1
 * @return Labels in ascending order joined by "\n", no trailing newline
 */
std::string getFizzBuzzString(const ValidatedNumber& number);

} // namespace fizzbuzz
