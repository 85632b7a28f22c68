/**
 * @file console_shell.cpp
 * @brief Console front end implementation
 */

#include "fizzbuzz/console_shell.h"
#include "fizzbuzz/common/exceptions.h"
#include "fizzbuzz/utils/string_utils.h"
#include "fizzbuzz/validated_number.h"

#include <utility>
#include <spdlog/spdlog.h>

namespace fizzbuzz {

std::string renderResult(const WorkflowResult& result) {
    return result.match(
        [](const std::string& text) {
            return "Here is the output:\n" + text;
        },
        [](const ParseError& error) {
            return error.input + " is not an integer";
        },
        [](const ValidationError& error) {
            return "You entered " + std::to_string(error.value) +
                   ". Please enter a valid integer between " +
                   std::to_string(ValidatedNumber::kMinimum) + " and " +
                   std::to_string(ValidatedNumber::kMaximum) + ".";
        });
}

ConsoleShell::ConsoleShell(std::istream& in, std::ostream& out, FizzBuzzWorkflow workflow)
    : in_(in), out_(out), workflow_(std::move(workflow)) {}

void ConsoleShell::writeLine(const std::string& line) {
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        throw common::ConsoleException("failed to write to output stream");
    }
}

bool ConsoleShell::runOnce() {
    writeLine(kPrompt);

    std::string line;
    if (!std::getline(in_, line)) {
        spdlog::debug("Input exhausted");
        return false;
    }

    WorkflowResult result = workflow_.execute(utils::stripCarriageReturn(line));
    if (result.isFailure()) {
        spdlog::info("Rejected input: {}", workflowErrorKindToString(result.errorKind()));
    }
    writeLine(renderResult(result));
    return true;
}

int ConsoleShell::run() {
    int cycles = 0;
    while (runOnce()) {
        ++cycles;
    }
    spdlog::debug("Console shell finished after {} cycle(s)", cycles);
    return cycles;
}

} // namespace fizzbuzz
