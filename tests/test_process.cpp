// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <chrono>
#include <gtest/gtest.h>
#include <hangul_ai/process.hpp>
#include <thread>

using namespace hangul_ai;

namespace
{

std::string drain(ReadPipe& pipe)
{
    std::string output;
    char buffer[256];
    while (pipe.has_data(500))
    {
        size_t n = pipe.read(buffer, sizeof(buffer));
        if (n == 0)
            break;
        output.append(buffer, n);
    }
    return output;
}

} // namespace

// =============================================================================
// Process Tests
// =============================================================================

TEST(ProcessTest, SpawnAndWait)
{
    Process proc;
    proc.spawn("echo", {"hello"});

    EXPECT_GT(proc.pid(), 0);
    EXPECT_EQ(proc.wait(), 0);
}

TEST(ProcessTest, ReadStdout)
{
    Process proc;
    proc.spawn("echo", {"test output"});

    std::string output = drain(proc.stdout_pipe());
    proc.wait();

    EXPECT_NE(output.find("test output"), std::string::npos);
}

TEST(ProcessTest, WriteStdin)
{
    Process proc;
    proc.spawn("cat", {});

    proc.stdin_pipe().write("안녕 world\n");
    proc.stdin_pipe().close();

    std::string output = drain(proc.stdout_pipe());
    proc.wait();

    EXPECT_EQ(output, "안녕 world\n");
}

TEST(ProcessTest, StderrNotRedirectedByDefault)
{
    Process proc;
    proc.spawn("true", {});

    EXPECT_THROW(proc.stderr_pipe(), ProcessError);
    proc.wait();
}

TEST(ProcessTest, TryWait)
{
    Process proc;
    proc.spawn("sleep", {"0.3"});

    EXPECT_TRUE(proc.is_running());
    EXPECT_FALSE(proc.try_wait().has_value());

    proc.wait();
    EXPECT_FALSE(proc.is_running());
}

TEST(ProcessTest, ExitCode)
{
    Process proc;
    proc.spawn("sh", {"-c", "exit 3"});

    EXPECT_EQ(proc.wait(), 3);
}

TEST(ProcessTest, Terminate)
{
    Process proc;
    proc.spawn("sleep", {"100"});
    EXPECT_TRUE(proc.is_running());

    proc.terminate();
    int exit_code = proc.wait();

    EXPECT_FALSE(proc.is_running());
    EXPECT_NE(exit_code, 0);
}

TEST(ProcessTest, Kill)
{
    Process proc;
    proc.spawn("sleep", {"100"});

    proc.kill();
    proc.wait();

    EXPECT_FALSE(proc.is_running());
}

TEST(ProcessTest, WaitOrKillEscalates)
{
    Process proc;
    // Ignores SIGTERM so only SIGKILL ends it
    proc.spawn("sh", {"-c", "trap '' TERM; while :; do sleep 0.1; done"});
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    proc.terminate();
    auto started = std::chrono::steady_clock::now();
    proc.wait_or_kill(std::chrono::milliseconds(200));

    EXPECT_FALSE(proc.is_running());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(ProcessTest, WriteToExitedChildThrows)
{
    Process proc;
    proc.spawn("true", {});
    proc.wait();

    // The read end is gone; the write fails instead of raising SIGPIPE
    EXPECT_THROW(proc.stdin_pipe().write("hello\n"), ProcessError);
}

TEST(ProcessTest, Environment)
{
    Process proc;
    ProcessOptions opts;
    opts.environment["HANGUL_AI_TEST_VAR"] = "test_value";

    proc.spawn("sh", {"-c", "echo $HANGUL_AI_TEST_VAR"}, opts);
    std::string output = drain(proc.stdout_pipe());
    proc.wait();

    EXPECT_NE(output.find("test_value"), std::string::npos);
}

TEST(ProcessTest, WorkingDirectory)
{
    Process proc;
    ProcessOptions opts;
    opts.working_directory = "/";

    proc.spawn("pwd", {}, opts);
    std::string output = drain(proc.stdout_pipe());
    proc.wait();

    EXPECT_EQ(output, "/\n");
}

TEST(ProcessTest, NonExistentExecutable)
{
    Process proc;
    EXPECT_THROW(proc.spawn("this_executable_does_not_exist_12345", {}), ProcessError);
}

// =============================================================================
// run_captured
// =============================================================================

TEST(RunCapturedTest, CapturesBothStreams)
{
    auto result = run_captured("sh", {"-c", "echo out; echo err 1>&2"});

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.out, "out\n");
    EXPECT_EQ(result.err, "err\n");
}

TEST(RunCapturedTest, ReportsExitCode)
{
    auto result = run_captured("sh", {"-c", "echo 'not logged in' 1>&2; exit 1"});

    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.err, "not logged in\n");
}

TEST(RunCapturedTest, MissingExecutableThrows)
{
    EXPECT_THROW(run_captured("this_does_not_exist_xyz123", {"--version"}), ProcessError);
}

// =============================================================================
// Utility Function Tests
// =============================================================================

TEST(ProcessUtilTest, FindExecutable)
{
    auto sh = find_executable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->front(), '/');
}

TEST(ProcessUtilTest, FindExecutableNotFound)
{
    EXPECT_FALSE(find_executable("this_does_not_exist_xyz123").has_value());
}

TEST(ProcessUtilTest, IsNodeScript)
{
    EXPECT_TRUE(is_node_script("index.js"));
    EXPECT_TRUE(is_node_script("/usr/lib/node_modules/@github/copilot/index.js"));
    EXPECT_TRUE(is_node_script("cli.mjs"));
    EXPECT_FALSE(is_node_script("copilot"));
    EXPECT_FALSE(is_node_script("script.py"));
    EXPECT_FALSE(is_node_script("js"));
}
