#pragma once
/// @file client/connection.hpp
/// @brief One tool-provider process and the correlated request/reply channel to it

#include "mcpchat/client/transports.hpp"
#include "mcpchat/client/types.hpp"
#include "mcpchat/types.hpp"
#include "mcpchat/wire/codec.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcpchat::client
{

/// Connection to a single tool provider.
///
/// Lifecycle: open() -> handshake() -> list_tools()/invoke() -> close().
/// Every outbound request carries a fresh integer id and the matching reply is
/// awaited; requests on one connection are serialized. close() may be called from
/// another thread and cancels a waiting request with ConnectionClosed.
///
/// @code
/// ServerConnection conn({"fs", "fs-server", {}, {}});
/// conn.open();
/// conn.handshake(std::chrono::seconds(10));
/// for (const auto& tool : conn.list_tools())
///     std::cout << tool.name << "\n";
/// auto result = conn.invoke("read_file", {{"path", "intro.md"}});
/// conn.close(std::chrono::seconds(2));
/// @endcode
class ServerConnection
{
  public:
    static constexpr std::chrono::milliseconds kDefaultRequestTimeout{60000};
    static constexpr int kMaxToolPages = 64;
    /// Timed-out request ids remembered for discarding late replies
    static constexpr size_t kMaxAbandonedIds = 64;

    explicit ServerConnection(ServerSpec spec,
                              TransportFactory factory = launch_stdio_transport);
    ~ServerConnection();

    ServerConnection(const ServerConnection&) = delete;
    ServerConnection& operator=(const ServerConnection&) = delete;

    /// Launch the provider. Uninitialized -> Initializing.
    /// @throws LaunchError (state becomes Failed)
    void open();

    /// Single initialize exchange. Initializing -> Ready, or Failed.
    /// @throws HandshakeError on timeout, error reply or malformed reply
    void handshake(std::chrono::milliseconds timeout);

    /// Advertised tools, following pagination. Requires Ready.
    /// @throws ProtocolError, TimeoutError, ConnectionClosed
    std::vector<ToolDescriptor> list_tools();

    /// Call a tool. Requires Ready. `tool_call_id` of the result is left empty.
    /// @throws ToolExecutionError, ProtocolError, TimeoutError, ConnectionClosed
    ToolResult invoke(const std::string& tool_name, const Json& arguments,
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Graceful shutdown then forced termination after timeout. Never throws.
    /// @return true if the provider exited on its own
    bool close(std::chrono::milliseconds timeout) noexcept;

    ConnectionState state() const
    {
        return state_.load();
    }
    const std::string& name() const
    {
        return spec_.name;
    }
    const ServerSpec& spec() const
    {
        return spec_;
    }
    const InitializeResult& initialize_result() const
    {
        return init_result_;
    }

    void set_default_timeout(std::chrono::milliseconds timeout)
    {
        default_timeout_ = timeout;
    }
    std::chrono::milliseconds default_timeout() const
    {
        return default_timeout_;
    }

    /// Timed-out requests whose replies are still awaited for discarding
    size_t abandoned_requests() const
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        return abandoned_ids_.size();
    }

  private:
    void abandon(int64_t id);
    wire::Reply request(const std::string& method, const Json& params,
                        std::chrono::milliseconds timeout);
    void answer_server_request(const wire::ServerRequest& req);
    void require_ready(const char* operation) const;

    ServerSpec spec_;
    TransportFactory factory_;
    std::unique_ptr<ITransport> transport_;
    std::atomic<ConnectionState> state_{ConnectionState::Uninitialized};
    mutable std::mutex request_mutex_;
    int64_t next_id_{1};
    std::set<int64_t> abandoned_ids_;
    // Replies with ids at or below this were pruned from abandoned_ids_
    int64_t abandoned_floor_{0};
    std::chrono::milliseconds default_timeout_{kDefaultRequestTimeout};
    InitializeResult init_result_;
};

/// Flatten MCP content blocks: text joined by newlines, other blocks as compact JSON.
std::string flatten_content(const Json& content);

} // namespace mcpchat::client
