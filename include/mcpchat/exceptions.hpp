#pragma once
#include "mcpchat/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace mcpchat
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

/// Operation issued against a connection or session in the wrong lifecycle state.
struct InvalidStateError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

/// Provider process could not be started.
struct LaunchError : public TransportError
{
    using TransportError::TransportError;
};

struct HandshakeError : public Error
{
    using Error::Error;
};

/// Undecodable message, or a reply that matches no pending request.
struct ProtocolError : public Error
{
    using Error::Error;
};

struct ToolExecutionError : public Error
{
    ToolExecutionError(const std::string& message, Json error_payload)
        : Error(message), payload(std::move(error_payload))
    {
    }

    Json payload;
};

struct TimeoutError : public Error
{
    using Error::Error;
};

struct ConnectionClosed : public Error
{
    using Error::Error;
};

struct DuplicateToolError : public Error
{
    DuplicateToolError(const std::string& tool, const std::string& first_server,
                       const std::string& second_server)
        : Error("tool '" + tool + "' advertised by both '" + first_server + "' and '" +
                second_server + "'"),
          tool_name(tool)
    {
    }

    std::string tool_name;
};

/// Startup failed; every connection opened so far has been closed.
struct SessionStartError : public Error
{
    SessionStartError(std::string server, std::string reason)
        : Error("failed to start server '" + server + "': " + reason),
          server_name(std::move(server)), cause(std::move(reason))
    {
    }

    std::string server_name;
    std::string cause;
};

struct CompletionError : public Error
{
    explicit CompletionError(const std::string& message,
                             std::optional<long> status = std::nullopt)
        : Error(message), http_status(status)
    {
    }

    std::optional<long> http_status;
};

struct LoopLimitExceeded : public Error
{
    explicit LoopLimitExceeded(int max_rounds)
        : Error("conversation exceeded " + std::to_string(max_rounds) + " completion rounds"),
          rounds(max_rounds)
    {
    }

    int rounds;
};

} // namespace mcpchat
