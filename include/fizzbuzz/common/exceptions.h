/**
 * @file exceptions.h
 * @brief Infrastructure exception hierarchy
 *
 * Domain failures (unparseable or out-of-range input) are never thrown;
 * these types cover configuration and console failures only.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace fizzbuzz::common {

/**
 * @brief Base exception for all FizzBuzz infrastructure exceptions
 */
class FizzBuzzException : public std::runtime_error {
public:
    explicit FizzBuzzException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public FizzBuzzException {
public:
    explicit ConfigException(const std::string& message)
        : FizzBuzzException("Configuration error: " + message) {}
};

/**
 * @brief Console stream failure
 */
class ConsoleException : public FizzBuzzException {
public:
    explicit ConsoleException(const std::string& message)
        : FizzBuzzException("Console error: " + message) {}
};

} // namespace fizzbuzz::common
