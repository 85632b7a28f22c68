/**
 * @file workflow.cpp
 * @brief FizzBuzz workflow orchestrator implementation
 */

#include "fizzbuzz/workflow.h"
#include "fizzbuzz/generator.h"
#include "fizzbuzz/parser.h"

#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

namespace fizzbuzz {

FizzBuzzWorkflow::FizzBuzzWorkflow(ParseNumber parseNumber,
                                   ValidateNumber validateNumber,
                                   GetFizzBuzzString getFizzBuzzString)
    : parseNumber_(std::move(parseNumber)),
      validateNumber_(std::move(validateNumber)),
      getFizzBuzzString_(std::move(getFizzBuzzString))
{
    if (!parseNumber_) {
        throw std::invalid_argument("FizzBuzzWorkflow: parseNumber cannot be empty");
    }
    if (!validateNumber_) {
        throw std::invalid_argument("FizzBuzzWorkflow: validateNumber cannot be empty");
    }
    if (!getFizzBuzzString_) {
        throw std::invalid_argument("FizzBuzzWorkflow: getFizzBuzzString cannot be empty");
    }
}

FizzBuzzWorkflow FizzBuzzWorkflow::createDefault() {
    return FizzBuzzWorkflow(&tryParse, &ValidatedNumber::tryCreate, &getFizzBuzzString);
}

WorkflowResult FizzBuzzWorkflow::execute(const std::string& rawInput) const {
    // Step 1: parse
    std::optional<int> parsed = parseNumber_(rawInput);
    if (!parsed) {
        spdlog::debug("Parse failed for input '{}'", rawInput);
        return WorkflowResult::failure(ParseError{rawInput});
    }

    // Step 2: validate
    std::optional<ValidatedNumber> validated = validateNumber_(*parsed);
    if (!validated) {
        spdlog::debug("Validation failed for {}", *parsed);
        return WorkflowResult::failure(ValidationError{*parsed});
    }

    // Step 3: generate
    spdlog::debug("Generating FizzBuzz for 1..{}", validated->getValue());
    return WorkflowResult::success(getFizzBuzzString_(*validated));
}

WorkflowResult executeWorkflow(const std::string& rawInput) {
    static const FizzBuzzWorkflow workflow = FizzBuzzWorkflow::createDefault();
    return workflow.execute(rawInput);
}

} // namespace fizzbuzz
