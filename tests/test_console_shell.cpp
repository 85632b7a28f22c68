/**
 * @file test_console_shell.cpp
 * @brief Unit tests for ConsoleShell and result rendering
 */

#include <gtest/gtest.h>
#include <fizzbuzz/common/exceptions.h>
#include <fizzbuzz/console_shell.h>

#include <sstream>
#include <string>

using namespace fizzbuzz;

// ============================================================================
// renderResult
// ============================================================================

TEST(RenderResultTest, Success) {
    EXPECT_EQ(renderResult(WorkflowResult::success("1\n2\nFizz")),
              "Here is the output:\n1\n2\nFizz");
}

TEST(RenderResultTest, ParseError) {
    EXPECT_EQ(renderResult(WorkflowResult::failure(ParseError{"abc"})),
              "abc is not an integer");
}

TEST(RenderResultTest, ValidationError_Zero) {
    EXPECT_EQ(renderResult(WorkflowResult::failure(ValidationError{0})),
              "You entered 0. Please enter a valid integer between 1 and 4000.");
}

TEST(RenderResultTest, ValidationError_Negative) {
    EXPECT_EQ(renderResult(WorkflowResult::failure(ValidationError{-12})),
              "You entered -12. Please enter a valid integer between 1 and 4000.");
}

TEST(RenderResultTest, EmptyInput_ParseError) {
    EXPECT_EQ(renderResult(executeWorkflow("")), " is not an integer");
}

// ============================================================================
// ConsoleShell
// ============================================================================

class ConsoleShellTest : public ::testing::Test {
protected:
    std::istringstream in_;
    std::ostringstream out_;

    ConsoleShell makeShell(const std::string& input) {
        in_.str(input);
        in_.clear();
        return ConsoleShell(in_, out_, FizzBuzzWorkflow::createDefault());
    }

    static std::string prompt() {
        return std::string(ConsoleShell::kPrompt) + "\n";
    }
};

TEST_F(ConsoleShellTest, RunOnce_Success) {
    auto shell = makeShell("5\n");

    EXPECT_TRUE(shell.runOnce());
    EXPECT_EQ(out_.str(), prompt() + "Here is the output:\n1\n2\nFizz\n4\nBuzz\n");
}

TEST_F(ConsoleShellTest, RunOnce_ParseError) {
    auto shell = makeShell("abc\n");

    EXPECT_TRUE(shell.runOnce());
    EXPECT_EQ(out_.str(), prompt() + "abc is not an integer\n");
}

TEST_F(ConsoleShellTest, RunOnce_ValidationError) {
    auto shell = makeShell("4001\n");

    EXPECT_TRUE(shell.runOnce());
    EXPECT_EQ(out_.str(),
              prompt() + "You entered 4001. Please enter a valid integer between 1 and 4000.\n");
}

TEST_F(ConsoleShellTest, RunOnce_StripsCarriageReturn) {
    auto shell = makeShell("xyz\r\n");

    EXPECT_TRUE(shell.runOnce());
    EXPECT_EQ(out_.str(), prompt() + "xyz is not an integer\n");
}

TEST_F(ConsoleShellTest, RunOnce_LastLineWithoutNewline) {
    auto shell = makeShell("3");

    EXPECT_TRUE(shell.runOnce());
    EXPECT_EQ(out_.str(), prompt() + "Here is the output:\n1\n2\nFizz\n");
}

TEST_F(ConsoleShellTest, RunOnce_EndOfInput) {
    auto shell = makeShell("");

    EXPECT_FALSE(shell.runOnce());
    EXPECT_EQ(out_.str(), prompt());
}

TEST_F(ConsoleShellTest, Run_RecoversAfterErrors) {
    auto shell = makeShell("abc\n0\n2\n");

    EXPECT_EQ(shell.run(), 3);
    EXPECT_EQ(out_.str(),
              prompt() + "abc is not an integer\n" +
              prompt() + "You entered 0. Please enter a valid integer between 1 and 4000.\n" +
              prompt() + "Here is the output:\n1\n2\n" +
              prompt());
}

TEST_F(ConsoleShellTest, Run_UsesInjectedWorkflow) {
    in_.str("anything\n");
    ConsoleShell shell(in_, out_, FizzBuzzWorkflow(
        [](const std::string&) -> std::optional<int> { return 1; },
        [](int n) { return ValidatedNumber::tryCreate(n); },
        [](const ValidatedNumber&) { return std::string("stub"); }));

    EXPECT_EQ(shell.run(), 1);
    EXPECT_EQ(out_.str(), prompt() + "Here is the output:\nstub\n" + prompt());
}

TEST_F(ConsoleShellTest, FailedOutput_Throws) {
    auto shell = makeShell("1\n");
    out_.setstate(std::ios::badbit);

    EXPECT_THROW(shell.runOnce(), common::ConsoleException);
}
