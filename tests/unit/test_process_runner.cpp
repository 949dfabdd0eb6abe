#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/server_errors.hpp"
#include "runtime/process_runner.hpp"

namespace {

using vidmcp::core::errors::get_error;
using vidmcp::core::errors::get_value;
using vidmcp::core::errors::is_error;
using vidmcp::runtime::ProcessRequest;
using vidmcp::runtime::run_process;

ProcessRequest shell(const std::string& script) {
    ProcessRequest request;
    request.argv = {"/bin/sh", "-c", script};
    return request;
}

TEST(ProcessRunnerTest, CapturesBothStreamsAndExitCode) {
    auto result = run_process(shell("echo out; echo err >&2; exit 3"));
    ASSERT_FALSE(is_error(result));

    const auto& capture = get_value(result);
    EXPECT_EQ(capture.exit_code, 3);
    EXPECT_EQ(capture.stdout_text, "out\n");
    EXPECT_EQ(capture.stderr_text, "err\n");
    EXPECT_FALSE(capture.timed_out);
    EXPECT_FALSE(capture.cancelled);
}

TEST(ProcessRunnerTest, DeliversLinesPerStream) {
    std::vector<std::string> out_lines;
    std::vector<std::string> err_lines;
    auto result = run_process(
        shell("printf 'a\\nb\\n'; printf 'x\\n' >&2; printf 'tail'"),
        [&out_lines](const std::string& line) { out_lines.push_back(line); },
        [&err_lines](const std::string& line) { err_lines.push_back(line); });
    ASSERT_FALSE(is_error(result));

    EXPECT_EQ(out_lines, (std::vector<std::string>{"a", "b", "tail"}));
    EXPECT_EQ(err_lines, (std::vector<std::string>{"x"}));
}

TEST(ProcessRunnerTest, ChildStdinIsDevNull) {
    auto result = run_process(shell("cat; echo done"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "done\n");
    EXPECT_EQ(get_value(result).exit_code, 0);
}

TEST(ProcessRunnerTest, RunsInWorkingDirectory) {
    ProcessRequest request = shell("pwd");
    request.working_directory = std::filesystem::temp_directory_path();
    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));

    const auto reported = get_value(result).stdout_text;
    EXPECT_EQ(std::filesystem::canonical(reported.substr(0, reported.size() - 1)),
              std::filesystem::canonical(std::filesystem::temp_directory_path()));
}

TEST(ProcessRunnerTest, MissingExecutableExits127) {
    ProcessRequest request;
    request.argv = {"__definitely_missing_vidmcp_binary__"};
    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 127);
}

TEST(ProcessRunnerTest, TimeoutKillsChild) {
    ProcessRequest request;
    request.argv = {"sleep", "5"};
    request.timeout_ms = 200;
    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));

    const auto& capture = get_value(result);
    EXPECT_TRUE(capture.timed_out);
    EXPECT_NE(capture.exit_code, 0);
    EXPECT_LT(capture.duration_ms, 4000.0);
}

TEST(ProcessRunnerTest, PreCancelledRequestNeverStarts) {
    ProcessRequest request = shell("echo should-not-run");
    request.cancel_token = std::make_shared<std::atomic_bool>(true);
    auto result = run_process(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_TRUE(get_value(result).stdout_text.empty());
}

TEST(ProcessRunnerTest, EmptyArgvIsRejected) {
    ProcessRequest request;
    auto result = run_process(request);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_command");
}

}  // namespace
