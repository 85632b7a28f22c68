/**
 * @file types.h
 * @brief Error and result types for the FizzBuzz workflow
 *
 * Domain failures are values, never exceptions. A WorkflowResult holds
 * exactly one of: success text, ParseError, ValidationError.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace fizzbuzz {

/// @brief Input could not be parsed as an integer
struct ParseError {
    std::string input;  ///< Original raw input

    bool operator==(const ParseError& other) const { return input == other.input; }
    bool operator!=(const ParseError& other) const { return !(*this == other); }
};

/// @brief Parsed integer is outside the accepted range
struct ValidationError {
    int value = 0;      ///< Offending integer

    bool operator==(const ValidationError& other) const { return value == other.value; }
    bool operator!=(const ValidationError& other) const { return !(*this == other); }
};

/// @brief Any workflow failure
using WorkflowError = std::variant<ParseError, ValidationError>;

/// @brief Workflow failure discriminator
enum class WorkflowErrorKind {
    PARSE_ERROR,
    VALIDATION_ERROR
};

/// @brief Convert WorkflowErrorKind to string
inline std::string workflowErrorKindToString(WorkflowErrorKind k) {
    switch (k) {
        case WorkflowErrorKind::PARSE_ERROR:      return "ParseError";
        case WorkflowErrorKind::VALIDATION_ERROR: return "ValidationError";
    }
    return "UNKNOWN";
}

/// @brief Kind of a WorkflowError
inline WorkflowErrorKind errorKindOf(const WorkflowError& error) {
    return std::holds_alternative<ParseError>(error)
        ? WorkflowErrorKind::PARSE_ERROR
        : WorkflowErrorKind::VALIDATION_ERROR;
}

/**
 * @brief Tagged success/failure outcome of one workflow run
 *
 * Usage:
 * @code
 *   std::string message = result.match(
 *       [](const std::string& text) { return text; },
 *       [](const ParseError& e) { return e.input; },
 *       [](const ValidationError& e) { return std::to_string(e.value); });
 * @endcode
 */
class WorkflowResult {
public:
    static WorkflowResult success(std::string text) {
        return WorkflowResult(Value(std::in_place_index<0>, std::move(text)));
    }

    static WorkflowResult failure(WorkflowError error) {
        return WorkflowResult(Value(std::in_place_index<1>, std::move(error)));
    }

    bool isSuccess() const noexcept { return value_.index() == 0; }
    bool isFailure() const noexcept { return !isSuccess(); }

    /**
     * @brief Success text
     * @throws std::logic_error if the result is a failure
     */
    const std::string& text() const {
        if (!isSuccess()) {
            throw std::logic_error("WorkflowResult: text() called on a failure");
        }
        return std::get<0>(value_);
    }

    /**
     * @brief Failure details
     * @throws std::logic_error if the result is a success
     */
    const WorkflowError& error() const {
        if (isSuccess()) {
            throw std::logic_error("WorkflowResult: error() called on a success");
        }
        return std::get<1>(value_);
    }

    /// @throws std::logic_error if the result is a success
    WorkflowErrorKind errorKind() const { return errorKindOf(error()); }

    /**
     * @brief Dispatch on the held alternative
     *
     * All three handlers are required and must return the same type.
     */
    template<typename OnSuccess, typename OnParseError, typename OnValidationError>
    auto match(OnSuccess&& onSuccess,
               OnParseError&& onParseError,
               OnValidationError&& onValidationError) const {
        if (isSuccess()) {
            return onSuccess(std::get<0>(value_));
        }
        const WorkflowError& err = std::get<1>(value_);
        if (const auto* parseError = std::get_if<ParseError>(&err)) {
            return onParseError(*parseError);
        }
        return onValidationError(std::get<ValidationError>(err));
    }

    bool operator==(const WorkflowResult& other) const { return value_ == other.value_; }
    bool operator!=(const WorkflowResult& other) const { return !(*this == other); }

private:
    using Value = std::variant<std::string, WorkflowError>;

    explicit WorkflowResult(Value value) : value_(std::move(value)) {}

    Value value_;
};

} // namespace fizzbuzz
