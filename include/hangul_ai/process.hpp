// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file process.hpp
/// @brief Subprocess management for the Copilot CLI and the probe commands

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hangul_ai
{

// Platform-specific state, defined in process_posix.cpp
struct ProcessHandle;
struct PipeHandle;

// =============================================================================
// Error Types
// =============================================================================

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

// =============================================================================
// Pipes
// =============================================================================

/// Read end of a pipe connected to a child's stdout or stderr
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// Read up to size bytes into buffer
    /// @return Number of bytes read, 0 on EOF
    /// @throws ProcessError on read failure
    size_t read(char* buffer, size_t size);

    /// Read everything until EOF
    std::string read_all();

    /// Wait until data is available
    /// @param timeout_ms 0 = non-blocking check
    bool has_data(int timeout_ms = 0);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Write end of a pipe connected to a child's stdin
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    /// Write all bytes
    /// @throws ProcessError on write failure or broken pipe
    size_t write(const char* data, size_t size);
    size_t write(const std::string& data);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// =============================================================================
// Process
// =============================================================================

/// Options for spawning a subprocess
struct ProcessOptions
{
    /// Working directory for the subprocess (empty = inherit from parent)
    std::string working_directory;

    /// Environment variables to set on top of (or instead of) the parent's
    std::map<std::string, std::string> environment;

    bool inherit_environment = true;

    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;
};

/// A child process with optional pipes to its standard streams
///
/// Example usage:
/// @code
/// Process proc;
/// proc.spawn("copilot", {"--server", "--stdio"});
/// proc.stdin_pipe().write(frame);
/// proc.terminate();
/// int exit_code = proc.wait();
/// @endcode
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    /// Spawn a new process, searching PATH for the executable
    /// @throws ProcessError if the pipes cannot be created or exec fails
    void spawn(
        const std::string& executable,
        const std::vector<std::string>& args,
        const ProcessOptions& options = {}
    );

    /// @throws ProcessError if stdin was not redirected
    WritePipe& stdin_pipe();

    /// @throws ProcessError if stdout was not redirected
    ReadPipe& stdout_pipe();

    /// @throws ProcessError if stderr was not redirected
    ReadPipe& stderr_pipe();

    bool is_running() const;

    /// Non-blocking wait
    /// @return Exit code if the process has terminated, nullopt if still running
    std::optional<int> try_wait();

    /// Blocking wait
    /// @return Exit code (128 + signal number when killed by a signal)
    int wait();

    /// Wait up to timeout, then SIGKILL
    /// @return Exit code
    int wait_or_kill(std::chrono::milliseconds timeout);

    /// SIGTERM
    void terminate();

    /// SIGKILL
    void kill();

    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// =============================================================================
// One-shot Commands
// =============================================================================

/// Exit status and output of a command run to completion
struct CapturedOutput
{
    int exit_code = -1;
    std::string out;
    std::string err;

    bool success() const
    {
        return exit_code == 0;
    }
};

/// Run a command with no stdin and capture both output streams
/// @throws ProcessError if the command cannot be started
CapturedOutput run_captured(const std::string& executable, const std::vector<std::string>& args);

// =============================================================================
// Utility Functions
// =============================================================================

/// Find an executable in the system PATH
/// @return Full path, or nullopt if not found
std::optional<std::string> find_executable(const std::string& name);

/// True if path ends with .js or .mjs
bool is_node_script(const std::string& path);

/// Path of the node executable, if on PATH
std::optional<std::string> find_node();

} // namespace hangul_ai
