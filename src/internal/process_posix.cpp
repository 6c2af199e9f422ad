// POSIX provider processes: fork/exec with the parent holding stdin and stdout pipes

#include "process.hpp"

#include <csignal>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <mutex>
#include <sys/select.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern "C" char** environ;

namespace mcpchat::process
{
namespace
{

std::string errno_text(int err = errno)
{
    return std::strerror(err);
}

void close_fd(int& fd)
{
    if (fd >= 0)
        ::close(fd);
    fd = -1;
}

// pipe(2) pair; ends not taken by the caller are closed on scope exit
struct Pipe
{
    int fds[2] = {-1, -1};

    explicit Pipe(const char* purpose)
    {
        if (::pipe(fds) != 0)
            throw ProcessError(std::string("cannot create ") + purpose + " pipe: " + errno_text());
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    ~Pipe()
    {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }

    int& read_end()
    {
        return fds[0];
    }
    int& write_end()
    {
        return fds[1];
    }
    int take(int& end)
    {
        int fd = end;
        end = -1;
        return fd;
    }
};

void mark_cloexec(int fd)
{
    ::fcntl(fd, F_SETFD, FD_CLOEXEC);
}

// A write to a provider that already exited must come back as EPIPE.
void ignore_sigpipe()
{
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

/// "KEY=VALUE" entries: the host environment with `overrides` applied
std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides)
{
    std::vector<std::string> entries;
    for (char** e = environ; e && *e; ++e)
    {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && overrides.count(entry.substr(0, eq)))
            continue;
        entries.push_back(std::move(entry));
    }
    for (const auto& kv : overrides)
        entries.push_back(kv.first + "=" + kv.second);
    return entries;
}

std::vector<char*> to_argv(std::vector<std::string>& strings)
{
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings)
        out.push_back(&s[0]);
    out.push_back(nullptr);
    return out;
}

// Child side after fork: report errno to the parent and exit.
[[noreturn]] void exec_failed(int report_fd)
{
    int err = errno;
    ssize_t ignored = ::write(report_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

} // namespace

// ReadPipe

ReadPipe::~ReadPipe()
{
    close();
}

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (fd_ < 0)
        throw ProcessError("output pipe is closed");

    ssize_t n;
    do
        n = ::read(fd_, buffer, size);
    while (n < 0 && errno == EINTR);

    if (n < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ProcessError("read failed: " + errno_text());
    }
    return static_cast<size_t>(n);
}

bool ReadPipe::wait_readable(int timeout_ms)
{
    if (fd_ < 0)
        return false;

    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(fd_, &fds);
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;

    int rc = ::select(fd_ + 1, &fds, nullptr, nullptr, &tv);
    if (rc < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("select failed: " + errno_text());
    }
    return rc > 0;
}

void ReadPipe::close()
{
    close_fd(fd_);
}

// WritePipe

WritePipe::~WritePipe()
{
    close();
}

void WritePipe::write_all(const std::string& data)
{
    if (fd_ < 0)
        throw ProcessError("input pipe is closed");

    size_t written = 0;
    while (written < data.size())
    {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("broken pipe (provider closed its input)");
            throw ProcessError("write failed: " + errno_text());
        }
        written += static_cast<size_t>(n);
    }
}

void WritePipe::close()
{
    close_fd(fd_);
}

// Process

Process::~Process()
{
    stdin_.close();
    stdout_.close();
    if (!running_)
        return;
    signal(SIGKILL);
    try
    {
        wait();
    }
    catch (const ProcessError&)
    {
        // reaped elsewhere
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const std::map<std::string, std::string>& environment)
{
    if (running_)
        throw ProcessError("process already running");
    ignore_sigpipe();

    Pipe input("stdin");
    Pipe output("stdout");
    Pipe report("exec status");

    // Parent ends stay out of providers launched later.
    mark_cloexec(input.write_end());
    mark_cloexec(output.read_end());
    mark_cloexec(report.write_end());

    // Built before fork; the child only makes async-signal-safe calls.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable);
    argv_strings.insert(argv_strings.end(), args.begin(), args.end());
    std::vector<std::string> env_strings = merged_environment(environment);
    std::vector<char*> argv = to_argv(argv_strings);
    std::vector<char*> envp = to_argv(env_strings);

    pid_t pid = ::fork();
    if (pid < 0)
        throw ProcessError("fork failed: " + errno_text());

    if (pid == 0)
    {
        if (::dup2(input.read_end(), STDIN_FILENO) < 0 ||
            ::dup2(output.write_end(), STDOUT_FILENO) < 0)
            exec_failed(report.write_end());
        ::execvpe(executable.c_str(), argv.data(), envp.data());
        exec_failed(report.write_end());
    }

    // The report pipe closes on a successful exec; otherwise the child sends its errno.
    close_fd(report.write_end());
    int child_errno = 0;
    ssize_t got;
    do
        got = ::read(report.read_end(), &child_errno, sizeof(child_errno));
    while (got < 0 && errno == EINTR);

    if (got > 0)
    {
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw ProcessError("Failed to execute '" + executable + "': " + errno_text(child_errno));
    }

    stdin_.fd_ = input.take(input.write_end());
    stdout_.fd_ = output.take(output.read_end());
    pid_ = pid;
    running_ = true;
    exit_code_ = -1;
}

int Process::record_exit(int status)
{
    if (WIFEXITED(status))
        exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        exit_code_ = 128 + WTERMSIG(status);
    else
        exit_code_ = -1;
    running_ = false;
    return exit_code_;
}

std::optional<int> Process::poll_exit()
{
    if (!running_)
        return exit_code_;

    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == 0)
        return std::nullopt;
    if (rc != pid_)
        throw ProcessError("waitpid failed: " + errno_text());
    return record_exit(status);
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto code = poll_exit())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

int Process::wait()
{
    if (!running_)
        return exit_code_;

    int status = 0;
    pid_t rc;
    do
        rc = ::waitpid(pid_, &status, 0);
    while (rc < 0 && errno == EINTR);

    if (rc != pid_)
        throw ProcessError("waitpid failed: " + errno_text());
    return record_exit(status);
}

void Process::signal(int signo)
{
    if (running_ && pid_ > 0)
        ::kill(pid_, signo);
}

} // namespace mcpchat::process
