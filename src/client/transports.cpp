#include "mcpchat/client/transports.hpp"

#include "../internal/process.hpp"
#include "mcpchat/exceptions.hpp"
#include "mcpchat/logging.hpp"
#include "mcpchat/util/json.hpp"

#include <algorithm>
#include <csignal>
#include <sstream>

namespace mcpchat::client
{
namespace
{

constexpr auto kPollSlice = std::chrono::milliseconds(50);
constexpr auto kTerminateGrace = std::chrono::milliseconds(200);
constexpr size_t kReadChunk = 4096;

std::string describe_command(const ServerSpec& spec)
{
    std::ostringstream cmd;
    cmd << spec.command;
    for (const auto& a : spec.args)
        cmd << " " << a;
    return cmd.str();
}

} // namespace

// =============================================================================
// StdioTransport
// =============================================================================

StdioTransport::StdioTransport(const ServerSpec& spec)
    : name_(spec.name), process_(std::make_unique<process::Process>())
{
    try
    {
        process_->spawn(spec.command, spec.args, spec.env);
    }
    catch (const process::ProcessError& e)
    {
        throw LaunchError("failed to launch '" + name_ + "' (" + describe_command(spec) +
                          "): " + e.what());
    }
    log::debug("transport", "launched '" + name_ + "' pid " + std::to_string(process_->pid()));
}

StdioTransport::~StdioTransport()
{
    close(kTerminateGrace);
}

void StdioTransport::send(const std::string& line)
{
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (closed_ || eof_)
        throw ConnectionClosed("connection to '" + name_ + "' is closed");
    try
    {
        process_->input().write_all(line + "\n");
    }
    catch (const process::ProcessError& e)
    {
        eof_ = true;
        throw ConnectionClosed("provider '" + name_ + "' stopped accepting input: " + e.what());
    }
}

std::optional<std::string> StdioTransport::take_buffered_line()
{
    auto pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;
    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

std::optional<std::string> StdioTransport::receive(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (auto line = take_buffered_line())
            return line;
        if (closed_)
            return std::nullopt;
        if (eof_)
        {
            if (buffer_.empty())
                return std::nullopt;
            std::string rest;
            rest.swap(buffer_);
            return rest;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return std::nullopt;

        try
        {
            auto& out = process_->output();
            if (!out.wait_readable(static_cast<int>(std::min(remaining, kPollSlice).count())))
                continue;
            char chunk[kReadChunk];
            size_t n = out.read(chunk, sizeof(chunk));
            if (n == 0)
            {
                eof_ = true;
                log::debug("transport", "'" + name_ + "' closed its output");
            }
            else
            {
                buffer_.append(chunk, n);
            }
        }
        catch (const process::ProcessError& e)
        {
            eof_ = true;
            throw TransportError("reading from '" + name_ + "' failed: " + e.what());
        }
    }
}

bool StdioTransport::close(std::chrono::milliseconds timeout)
{
    if (closed_.exchange(true))
        return true;

    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!process_)
        return true;

    bool graceful = false;
    try
    {
        // EOF on stdin is the stdio protocol's shutdown request.
        process_->close_input();
        graceful = process_->wait_for(timeout).has_value();
        if (!graceful)
        {
            log::warn("transport", "'" + name_ + "' did not exit within " +
                                       std::to_string(timeout.count()) + "ms; terminating");
            process_->signal(SIGTERM);
            if (!process_->wait_for(kTerminateGrace))
            {
                process_->signal(SIGKILL);
                process_->wait();
            }
        }
    }
    catch (const process::ProcessError& e)
    {
        log::warn("transport", "shutdown of '" + name_ + "' reported: " + e.what());
    }
    process_.reset();
    buffer_.clear();
    return graceful;
}

bool StdioTransport::is_open() const
{
    return !closed_ && !eof_;
}

int StdioTransport::pid() const
{
    std::lock_guard<std::mutex> lock(io_mutex_);
    return process_ ? process_->pid() : 0;
}

std::unique_ptr<ITransport> launch_stdio_transport(const ServerSpec& spec)
{
    return std::make_unique<StdioTransport>(spec);
}

// =============================================================================
// LoopbackTransport
// =============================================================================

LoopbackTransport::LoopbackTransport(Handler handler) : handler_(std::move(handler)) {}

void LoopbackTransport::send(const std::string& line)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            throw ConnectionClosed("loopback transport is closed");
        sent_.push_back(line);
    }
    auto message = util::json::try_parse(line);
    if (!message || !handler_)
        return;
    if (auto reply = handler_(*message))
        push_line(reply->dump());
}

std::optional<std::string> LoopbackTransport::receive(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !inbound_.empty(); });
    if (closed_ || inbound_.empty())
        return std::nullopt;
    std::string line = std::move(inbound_.front());
    inbound_.pop_front();
    return line;
}

bool LoopbackTransport::close(std::chrono::milliseconds /*timeout*/)
{
    std::function<void()> on_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return true;
        closed_ = true;
        on_close = on_close_;
    }
    cv_.notify_all();
    if (on_close)
        on_close();
    return true;
}

bool LoopbackTransport::is_open() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_;
}

void LoopbackTransport::push_line(std::string line)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inbound_.push_back(std::move(line));
    }
    cv_.notify_all();
}

void LoopbackTransport::set_on_close(std::function<void()> on_close)
{
    std::lock_guard<std::mutex> lock(mutex_);
    on_close_ = std::move(on_close);
}

std::vector<std::string> LoopbackTransport::sent_lines() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

} // namespace mcpchat::client
