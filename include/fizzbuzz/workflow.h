/**
 * @file workflow.h
 * @brief Parse -> validate -> generate pipeline
 *
 * The three stages are injected as function objects, so tests (or any
 * caller) can substitute alternate implementations without touching the
 * orchestration logic.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include "types.h"
#include "validated_number.h"

namespace fizzbuzz {

using ParseNumber = std::function<std::optional<int>(const std::string&)>;
using ValidateNumber = std::function<std::optional<ValidatedNumber>(int)>;
using GetFizzBuzzString = std::function<std::string(const ValidatedNumber&)>;

/**
 * @brief FizzBuzz workflow orchestrator
 *
 * Usage:
 * @code
 *   FizzBuzzWorkflow workflow = FizzBuzzWorkflow::createDefault();
 *   WorkflowResult result = workflow.execute("15");
 * @endcode
 */
class FizzBuzzWorkflow {
public:
    /**
     * @brief Constructor
     * @param parseNumber Raw text -> integer, std::nullopt on failure
     * @param validateNumber Integer -> ValidatedNumber, std::nullopt if rejected
     * @param getFizzBuzzString ValidatedNumber -> output text
     * @throws std::invalid_argument if any stage is empty
     */
    FizzBuzzWorkflow(ParseNumber parseNumber,
                     ValidateNumber validateNumber,
                     GetFizzBuzzString getFizzBuzzString);

    /**
     * @brief Workflow wired to tryParse, ValidatedNumber::tryCreate and
     *        getFizzBuzzString
     */
    static FizzBuzzWorkflow createDefault();

    /**
     * @brief Run the pipeline on one raw input
     *
     * Algorithm:
     * 1. Parse; on failure return ParseError(rawInput)
     * 2. Validate; on failure return ValidationError(parsed)
     * 3. Generate; return success(text)
     *
     * Later stages never run once an earlier stage fails.
     *
     * @param rawInput Text exactly as entered by the user
     * @return Exactly one of success, ParseError, ValidationError
     */
    WorkflowResult execute(const std::string& rawInput) const;

private:
    ParseNumber parseNumber_;
    ValidateNumber validateNumber_;
    GetFizzBuzzString getFizzBuzzString_;
};

/**
 * @brief Run the default workflow on one raw input
 */
WorkflowResult executeWorkflow(const std::string& rawInput);

} // namespace fizzbuzz
