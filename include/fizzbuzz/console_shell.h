/**
 * @file console_shell.h
 * @brief Interactive prompt/read/render loop around FizzBuzzWorkflow
 *
 * The workflow itself performs no I/O; this shell owns the prompt and
 * the rendering of each WorkflowResult into user-facing text.
 */

#pragma once

#include <istream>
#include <ostream>
#include <string>
#include "types.h"
#include "workflow.h"

namespace fizzbuzz {

/**
 * @brief Render a workflow result as the message shown to the user
 *
 *   success         -> "Here is the output:\n<text>"
 *   ParseError      -> "<input> is not an integer"
 *   ValidationError -> "You entered <n>. Please enter a valid integer between 1 and 4000."
 */
std::string renderResult(const WorkflowResult& result);

/**
 * @brief Console front end
 *
 * Streams are non-owning and must outlive the shell.
 */
class ConsoleShell {
public:
    static constexpr const char* kPrompt = "Please enter a number between 1 and 4000:";

    ConsoleShell(std::istream& in, std::ostream& out, FizzBuzzWorkflow workflow);

    /**
     * @brief One interaction cycle: prompt, read a line, render the result
     * @return false if input was exhausted before a line could be read
     * @throws common::ConsoleException if writing to the output fails
     */
    bool runOnce();

    /**
     * @brief Repeat runOnce() until input is exhausted
     * @return Number of completed cycles
     * @throws common::ConsoleException if writing to the output fails
     */
    int run();

private:
    void writeLine(const std::string& line);

    std::istream& in_;
    std::ostream& out_;
    FizzBuzzWorkflow workflow_;
};

} // namespace fizzbuzz
