#pragma once

#include "mcpchat/client/connection.hpp"
#include "mcpchat/client/transports.hpp"
#include "mcpchat/session/tool_registry.hpp"
#include "mcpchat/settings.hpp"
#include "mcpchat/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace mcpchat::session
{

struct SessionOptions
{
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds close_timeout{2000};
    DuplicateBehavior duplicate_behavior{DuplicateBehavior::Replace};
    client::TransportFactory transport_factory = client::launch_stdio_transport;

    /// @throws ValidationError for an unknown duplicate policy name
    static SessionOptions from_settings(const Settings& settings);
};

struct ShutdownReport
{
    std::vector<std::string> closed; ///< every connection closed by stop(), in start order
    std::vector<std::string> forced; ///< the subset that had to be terminated
};

/// Owns the provider connections of one session and the ToolRegistry built from them.
///
/// start() is all-or-nothing: the first launch or handshake failure closes every
/// connection opened so far and raises SessionStartError. The registry and the
/// connection set are read-only once start() returns.
class SessionManager
{
  public:
    explicit SessionManager(SessionOptions options = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Open and handshake each server in order, then list tools in the same order.
    /// @throws SessionStartError (nothing left running), InvalidStateError if started
    void start(const std::vector<ServerSpec>& specs);

    /// Close every connection, each bounded by the close timeout. Never throws.
    ShutdownReport stop();
    ShutdownReport stop(std::chrono::milliseconds timeout);

    bool started() const
    {
        return started_;
    }

    const ToolRegistry& registry() const
    {
        return registry_;
    }

    /// Connections currently Ready, in start order
    std::vector<client::ServerConnection*> connections() const;

    /// nullptr when no server of that name belongs to the session
    client::ServerConnection* connection(const std::string& name) const;

    const SessionOptions& options() const
    {
        return options_;
    }

  private:
    void rollback();

    SessionOptions options_;
    std::vector<std::unique_ptr<client::ServerConnection>> connections_;
    ToolRegistry registry_;
    bool started_{false};
};

} // namespace mcpchat::session
