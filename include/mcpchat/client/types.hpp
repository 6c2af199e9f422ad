#pragma once
/// @file client/types.hpp
/// @brief Provider-side result types returned by ServerConnection

#include "mcpchat/types.hpp"

#include <optional>
#include <string>

namespace mcpchat::client
{

class ServerConnection;

/// Lifecycle of one provider connection. Closed is terminal and reachable from any state.
enum class ConnectionState
{
    Uninitialized,
    Initializing,
    Ready,
    Failed,
    Closed
};

inline std::string to_string(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Uninitialized:
        return "uninitialized";
    case ConnectionState::Initializing:
        return "initializing";
    case ConnectionState::Ready:
        return "ready";
    case ConnectionState::Failed:
        return "failed";
    case ConnectionState::Closed:
        return "closed";
    }
    return "uninitialized";
}

struct ServerInfo
{
    std::string name{"unknown"};
    std::string version{"unknown"};
};

/// Reply to the initialize handshake
struct InitializeResult
{
    std::string protocolVersion;
    Json capabilities = Json::object();
    ServerInfo serverInfo;
    std::optional<std::string> instructions;
};

/// One advertised tool. `connection` is a non-owning back-reference; the descriptor
/// must not outlive the session that owns the connection.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    Json input_schema = Json::object();
    ServerConnection* connection{nullptr};
    std::string server_name;

    /// MCP tool shape: {name, description, inputSchema}
    Json to_schema() const
    {
        Json j = {{"name", name}, {"inputSchema", input_schema}};
        if (!description.empty())
            j["description"] = description;
        return j;
    }
};

} // namespace mcpchat::client
