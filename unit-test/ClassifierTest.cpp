#include <signal.h>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/verdict.hpp"

using namespace std;
using namespace scorer;

static execution_result completed(const string &output, int code = 0, const string &error = "") {
    execution_result result;
    result.status = exit_status::completed{code};
    result.output = output;
    result.error = error;
    result.wall_time = chrono::duration<double>(0.1);
    result.peak_memory = 9396 * 1024;
    return result;
}

static execution_result with_status(exit_status_t status, const string &error = "") {
    execution_result result;
    result.status = status;
    result.error = error;
    result.wall_time = chrono::duration<double>(2);
    return result;
}

TEST(ClassifierTest, AcceptedWhenTrimmedOutputMatches) {
    EXPECT_EQ(classify(completed("Hello, World!\n"), "Hello, World!"), outcome::ACCEPTED);
    EXPECT_EQ(classify(completed("  3\r\n\n"), "\t3 "), outcome::ACCEPTED);
}

TEST(ClassifierTest, WrongAnswerWhenOutputDiffers) {
    EXPECT_EQ(classify(completed("Wrong Answer\n"), "Hello, World!"), outcome::WRONG_ANSWER);
    // 只去除首尾的空白字符，中间的空白字符需要完全一致
    EXPECT_EQ(classify(completed("1  2\n"), "1 2"), outcome::WRONG_ANSWER);
}

TEST(ClassifierTest, EmptyExpectedOutput) {
    EXPECT_EQ(classify(completed(""), ""), outcome::ACCEPTED);
    EXPECT_EQ(classify(completed(" \n\n"), ""), outcome::ACCEPTED);
    EXPECT_EQ(classify(completed("0\n"), ""), outcome::WRONG_ANSWER);
}

TEST(ClassifierTest, TimeoutTakesPrecedence) {
    EXPECT_EQ(classify(with_status(exit_status::timed_out{}, "SyntaxError: invalid syntax"), ""), outcome::TIMEOUT);
}

TEST(ClassifierTest, OomKillIsMemoryLimitExceeded) {
    EXPECT_EQ(classify(with_status(exit_status::signaled{SIGKILL, true}), ""), outcome::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(classify(with_status(exit_status::signaled{SIGKILL, true}, "MemoryError"), ""), outcome::MEMORY_LIMIT_EXCEEDED);
}

TEST(ClassifierTest, OtherSignalIsRuntimeError) {
    EXPECT_EQ(classify(with_status(exit_status::signaled{SIGSEGV, false}), ""), outcome::RUNTIME_ERROR);
}

TEST(ClassifierTest, SyntaxErrorIsCompilationError) {
    string error = R"(  File "/sandbox/client_script.py", line 1
    print("Hello"
         ^
SyntaxError: '(' was never closed
)";
    EXPECT_EQ(classify(completed("", 1, error), "Hello"), outcome::COMPILATION_ERROR);
}

TEST(ClassifierTest, IndentationAndTabErrorsAreCompilationErrors) {
    EXPECT_EQ(classify(completed("", 1, "IndentationError: unexpected indent"), ""), outcome::COMPILATION_ERROR);
    EXPECT_EQ(classify(completed("", 1, "TabError: inconsistent use of tabs and spaces in indentation"), ""), outcome::COMPILATION_ERROR);
}

TEST(ClassifierTest, NonzeroExitIsRuntimeError) {
    string error = R"(Traceback (most recent call last):
  File "/sandbox/client_script.py", line 1, in <module>
    print(1 / 0)
ZeroDivisionError: division by zero
)";
    EXPECT_EQ(classify(completed("", 1, error), ""), outcome::RUNTIME_ERROR);
}

TEST(ClassifierTest, ZeroExitIgnoresStderr) {
    EXPECT_EQ(classify(completed("42\n", 0, "SyntaxError: warning printed by the program"), "42"), outcome::ACCEPTED);
}

TEST(ClassifierTest, LaunchFailureIsNotClassified) {
    auto result = with_status(exit_status::launch_failed{"Cannot connect to the Docker daemon"});
    EXPECT_FALSE(classify(result, "").has_value());
    EXPECT_THROW(make_verdict(result, "", default_language()), launch_error);
}

TEST(ClassifierTest, MakeVerdictKeepsStreamsAndUsage) {
    auto v = make_verdict(completed("Hello\n", 0, "debug"), "Hello", default_language());
    EXPECT_EQ(v.result, outcome::ACCEPTED);
    EXPECT_EQ(v.output, "Hello\n");
    EXPECT_EQ(v.error, "debug");
    EXPECT_DOUBLE_EQ(v.elapsed.count(), 0.1);
    ASSERT_TRUE(v.peak_memory.has_value());
    EXPECT_EQ(*v.peak_memory, 9396u * 1024);
}

TEST(ClassifierTest, TimeoutVerdictHasNoMemory) {
    auto v = make_verdict(with_status(exit_status::timed_out{}, "Execution time exceeded the limit of 2 seconds."), "", default_language());
    EXPECT_EQ(v.result, outcome::TIMEOUT);
    EXPECT_FALSE(v.peak_memory.has_value());
    EXPECT_DOUBLE_EQ(v.elapsed.count(), 2);
}

TEST(ClassifierTest, DisplayMessages) {
    EXPECT_STREQ(get_display_message(outcome::ACCEPTED), "Accepted");
    EXPECT_STREQ(get_display_message(outcome::WRONG_ANSWER), "Wrong Answer");
    EXPECT_STREQ(get_display_message(outcome::COMPILATION_ERROR), "Compilation Error");
    EXPECT_STREQ(get_display_message(outcome::RUNTIME_ERROR), "Runtime Error");
    EXPECT_STREQ(get_display_message(outcome::TIMEOUT), "Timeout");
    EXPECT_STREQ(get_display_message(outcome::MEMORY_LIMIT_EXCEEDED), "Memory Limit Exceeded");
}
