// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

// POSIX subprocess management (Linux and macOS)

#include <hangul_ai/process.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <signal.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern "C" char** environ;

namespace hangul_ai
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

namespace
{

std::string errno_message(int err = errno)
{
    return std::strerror(err);
}

std::once_flag g_sigpipe_once;
bool g_sigpipe_ignored_by_us = false;

/// Writes to a dead child must fail with EPIPE instead of killing the host.
/// A handler the host installed itself is left alone.
void ignore_sigpipe()
{
    std::call_once(
        g_sigpipe_once,
        []
        {
            struct sigaction current;
            if (::sigaction(SIGPIPE, nullptr, &current) != 0 || current.sa_handler != SIG_DFL)
                return;

            struct sigaction ignore = {};
            ignore.sa_handler = SIG_IGN;
            sigemptyset(&ignore.sa_mask);
            if (::sigaction(SIGPIPE, &ignore, nullptr) == 0)
                g_sigpipe_ignored_by_us = true;
        }
    );
}

/// Both ends of a pipe(2); closes whatever is still owned on destruction
struct FdPair
{
    int read_end = -1;
    int write_end = -1;

    FdPair() = default;
    FdPair(const FdPair&) = delete;
    FdPair& operator=(const FdPair&) = delete;

    ~FdPair()
    {
        close_read();
        close_write();
    }

    void open(const char* what)
    {
        int fds[2];
        if (::pipe(fds) != 0)
            throw ProcessError(std::string("Failed to create ") + what + " pipe: " + errno_message());
        read_end = fds[0];
        write_end = fds[1];
    }

    bool is_open() const
    {
        return read_end >= 0 || write_end >= 0;
    }

    void close_read()
    {
        if (read_end >= 0)
            ::close(read_end);
        read_end = -1;
    }

    void close_write()
    {
        if (write_end >= 0)
            ::close(write_end);
        write_end = -1;
    }

    int release_read()
    {
        int fd = read_end;
        read_end = -1;
        return fd;
    }

    int release_write()
    {
        int fd = write_end;
        write_end = -1;
        return fd;
    }
};

/// Report errno to the parent through the exec-error pipe and exit (child only)
[[noreturn]] void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    while (true)
    {
        ssize_t n = ::read(handle_->fd, buffer, size);
        if (n >= 0)
            return static_cast<size_t>(n);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ProcessError("Read failed: " + errno_message());
    }
}

std::string ReadPipe::read_all()
{
    std::string out;
    char buffer[4096];
    while (true)
    {
        size_t n = read(buffer, sizeof(buffer));
        if (n == 0)
            break;
        out.append(buffer, n);
    }
    return out;
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(handle_->fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = ::select(handle_->fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0)
        throw ProcessError("select failed: " + errno_message());

    return result > 0 && FD_ISSET(handle_->fd, &read_fds);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// WritePipe implementation
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    size_t total = 0;
    while (total < size)
    {
        ssize_t n = ::write(handle_->fd, data + total, size - total);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + errno_message());
        }
        total += static_cast<size_t>(n);
    }
    return total;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    if (stdin_)
        stdin_->close();
    if (stdout_)
        stdout_->close();
    if (stderr_)
        stderr_->close();

    if (handle_ && handle_->running)
    {
        terminate();
        try
        {
            wait_or_kill(std::chrono::seconds(5));
        }
        catch (const ProcessError&)
        {
            // Already reaped elsewhere
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(
    const std::string& executable,
    const std::vector<std::string>& args,
    const ProcessOptions& options
)
{
    if (handle_->running)
        throw ProcessError("Process already spawned");

    ignore_sigpipe();

    FdPair in, out, err, exec_error;
    if (options.redirect_stdin)
        in.open("stdin");
    if (options.redirect_stdout)
        out.open("stdout");
    if (options.redirect_stderr)
        err.open("stderr");
    exec_error.open("exec-error");

    // Closed automatically by a successful exec, so EOF on the read end means success
    ::fcntl(exec_error.write_end, F_SETFD, FD_CLOEXEC);

    // Build argv and envp before forking
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
        throw ProcessError("Failed to fork process: " + errno_message());

    if (pid == 0)
    {
        // Child
        exec_error.close_read();

        // An ignored disposition survives exec; give the child the default back
        if (g_sigpipe_ignored_by_us)
            ::signal(SIGPIPE, SIG_DFL);

        if (in.is_open())
        {
            in.close_write();
            if (::dup2(in.read_end, STDIN_FILENO) < 0)
                child_fail(exec_error.write_end);
            in.close_read();
        }
        if (out.is_open())
        {
            out.close_read();
            if (::dup2(out.write_end, STDOUT_FILENO) < 0)
                child_fail(exec_error.write_end);
            out.close_write();
        }
        if (err.is_open())
        {
            err.close_read();
            if (::dup2(err.write_end, STDERR_FILENO) < 0)
                child_fail(exec_error.write_end);
            err.close_write();
        }

        if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0)
            child_fail(exec_error.write_end);

        if (!options.inherit_environment)
        {
#if defined(__linux__) && defined(_GNU_SOURCE)
            ::clearenv();
#else
            if (environ)
                environ[0] = nullptr;
#endif
        }
        for (const auto& [key, value] : options.environment)
            ::setenv(key.c_str(), value.c_str(), 1);

        ::execvp(executable.c_str(), argv.data());
        child_fail(exec_error.write_end);
    }

    // Parent
    exec_error.close_write();
    int child_errno = 0;
    ssize_t n;
    do
        n = ::read(exec_error.read_end, &child_errno, sizeof(child_errno));
    while (n < 0 && errno == EINTR);

    if (n > 0)
    {
        ::waitpid(pid, nullptr, 0);
        throw ProcessError("Failed to execute '" + executable + "': " + errno_message(child_errno));
    }

    if (in.is_open())
    {
        in.close_read();
        stdin_->handle_->fd = in.release_write();
    }
    if (out.is_open())
    {
        out.close_write();
        stdout_->handle_->fd = out.release_read();
    }
    if (err.is_open())
    {
        err.close_write();
        stderr_->handle_->fd = err.release_read();
    }

    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_ || !stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    if (::kill(handle_->pid, 0) == 0)
        return true;

    // EPERM still means the process exists
    return errno != ESRCH;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return handle_ ? handle_->exit_code : -1;

    int status = 0;
    pid_t result = ::waitpid(handle_->pid, &status, WNOHANG);
    if (result == 0)
        return std::nullopt;
    if (result != handle_->pid)
        throw ProcessError("waitpid failed: " + errno_message());

    handle_->exit_code = decode_status(status);
    handle_->running = false;
    return handle_->exit_code;
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return handle_ ? handle_->exit_code : -1;

    int status = 0;
    pid_t result;
    do
        result = ::waitpid(handle_->pid, &status, 0);
    while (result < 0 && errno == EINTR);

    if (result != handle_->pid)
        throw ProcessError("waitpid failed: " + errno_message());

    handle_->exit_code = decode_status(status);
    handle_->running = false;
    return handle_->exit_code;
}

int Process::wait_or_kill(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (auto code = try_wait())
            return *code;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    kill();
    return wait();
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// =============================================================================
// One-shot Commands
// =============================================================================

CapturedOutput run_captured(const std::string& executable, const std::vector<std::string>& args)
{
    ProcessOptions options;
    options.redirect_stdin = false;
    options.redirect_stdout = true;
    options.redirect_stderr = true;

    Process proc;
    proc.spawn(executable, args, options);

    CapturedOutput captured;
    ReadPipe& out = proc.stdout_pipe();
    ReadPipe& err = proc.stderr_pipe();

    // Drain both streams together so a chatty stderr cannot block the child
    char buffer[4096];
    while (out.is_open() || err.is_open())
    {
        for (auto& [pipe, sink] : {std::pair<ReadPipe*, std::string*>{&out, &captured.out},
                                   std::pair<ReadPipe*, std::string*>{&err, &captured.err}})
        {
            if (!pipe->is_open() || !pipe->has_data(10))
                continue;
            size_t n = pipe->read(buffer, sizeof(buffer));
            if (n == 0)
                pipe->close();
            else
                sink->append(buffer, n);
        }
    }

    captured.exit_code = proc.wait();
    return captured;
}

// =============================================================================
// Utility functions
// =============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto usable = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string::npos)
    {
        if (usable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            if (usable(candidate))
                return candidate.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

bool is_node_script(const std::string& path)
{
    auto ends_with = [&path](const std::string& suffix)
    {
        return path.size() >= suffix.size() &&
               path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return ends_with(".js") || ends_with(".mjs");
}

std::optional<std::string> find_node()
{
    return find_executable("node");
}

} // namespace hangul_ai
