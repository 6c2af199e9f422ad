// Provider child processes for StdioTransport (POSIX fork/exec, piped stdin/stdout)

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <vector>

namespace mcpchat::process
{

class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Parent end of the child's stdout. Owns the descriptor.
class ReadPipe
{
  public:
    ReadPipe() = default;
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;

    /// @return bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// Wait up to timeout_ms until data or EOF is readable
    bool wait_readable(int timeout_ms);

    void close();
    bool is_open() const
    {
        return fd_ >= 0;
    }

  private:
    friend class Process;
    int fd_{-1};
};

/// Parent end of the child's stdin. Owns the descriptor.
class WritePipe
{
  public:
    WritePipe() = default;
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;

    /// Write all of data
    /// @throws ProcessError on a broken pipe
    void write_all(const std::string& data);

    void close();
    bool is_open() const
    {
        return fd_ >= 0;
    }

  private:
    friend class Process;
    int fd_{-1};
};

/// One launched provider. stderr is inherited from the host.
/// The destructor kills and reaps a child that is still running.
class Process
{
  public:
    Process() = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// PATH lookup; `environment` entries override the inherited environment.
    /// @throws ProcessError if the executable cannot be started
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const std::map<std::string, std::string>& environment = {});

    WritePipe& input()
    {
        return stdin_;
    }
    ReadPipe& output()
    {
        return stdout_;
    }

    /// EOF on the child's stdin
    void close_input()
    {
        stdin_.close();
    }

    /// Reap without blocking; the exit code once the child is gone
    std::optional<int> poll_exit();

    /// Poll for exit up to timeout
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    /// Block until the child is reaped
    int wait();

    void signal(int signo);

    bool running() const
    {
        return running_;
    }
    int pid() const
    {
        return static_cast<int>(pid_);
    }

  private:
    int record_exit(int status);

    pid_t pid_{0};
    bool running_{false};
    int exit_code_{-1};
    WritePipe stdin_;
    ReadPipe stdout_;
};

} // namespace mcpchat::process
