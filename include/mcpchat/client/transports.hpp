#pragma once
#include "mcpchat/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpchat::process
{
class Process;
}

namespace mcpchat::client
{

/// Bidirectional line channel to one tool provider.
/// send/receive may be called from one thread while close() is called from another.
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Write one message line (newline appended by the transport)
    /// @throws ConnectionClosed if the channel is closed, TransportError on I/O failure
    virtual void send(const std::string& line) = 0;

    /// Wait up to timeout for the next inbound line.
    /// @return nullopt on timeout, or when the channel is closed/at EOF (see is_open())
    virtual std::optional<std::string> receive(std::chrono::milliseconds timeout) = 0;

    /// Release the channel. Idempotent.
    /// @return true if the peer exited on its own within timeout
    virtual bool close(std::chrono::milliseconds timeout) = 0;

    virtual bool is_open() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<ITransport>(const ServerSpec&)>;

/// Launches a provider process and speaks line-delimited JSON-RPC over its stdin/stdout.
/// The provider's stderr is inherited.
class StdioTransport : public ITransport
{
  public:
    /// @throws LaunchError if the process cannot be started
    explicit StdioTransport(const ServerSpec& spec);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void send(const std::string& line) override;
    std::optional<std::string> receive(std::chrono::milliseconds timeout) override;
    bool close(std::chrono::milliseconds timeout) override;
    bool is_open() const override;

    int pid() const;

  private:
    std::optional<std::string> take_buffered_line();

    std::string name_;
    std::unique_ptr<process::Process> process_;
    mutable std::mutex io_mutex_;
    std::string buffer_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> eof_{false};
};

/// Default factory: a StdioTransport per spec.
std::unique_ptr<ITransport> launch_stdio_transport(const ServerSpec& spec);

/// In-process provider: each sent message is handed to a handler whose return value
/// (if any) becomes the next inbound line.
class LoopbackTransport : public ITransport
{
  public:
    using Handler = std::function<std::optional<Json>(const Json& message)>;

    explicit LoopbackTransport(Handler handler);

    void send(const std::string& line) override;
    std::optional<std::string> receive(std::chrono::milliseconds timeout) override;
    bool close(std::chrono::milliseconds timeout) override;
    bool is_open() const override;

    /// Queue a raw inbound line (malformed payloads, unsolicited notifications)
    void push_line(std::string line);

    /// Invoked once, on the first close()
    void set_on_close(std::function<void()> on_close);

    /// Lines written by the client, in order
    std::vector<std::string> sent_lines() const;

  private:
    Handler handler_;
    std::function<void()> on_close_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbound_;
    std::vector<std::string> sent_;
    bool closed_{false};
};

} // namespace mcpchat::client
