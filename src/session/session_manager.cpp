#include "mcpchat/session/session_manager.hpp"

#include "mcpchat/exceptions.hpp"
#include "mcpchat/logging.hpp"
#include "mcpchat/telemetry.hpp"

#include <set>

namespace mcpchat::session
{

SessionOptions SessionOptions::from_settings(const Settings& settings)
{
    SessionOptions options;
    options.handshake_timeout = std::chrono::milliseconds(settings.handshake_timeout_ms);
    options.request_timeout = std::chrono::milliseconds(settings.request_timeout_ms);
    options.close_timeout = std::chrono::milliseconds(settings.close_timeout_ms);
    options.duplicate_behavior = duplicate_behavior_from_string(settings.duplicate_tools);
    return options;
}

SessionManager::SessionManager(SessionOptions options)
    : options_(std::move(options)), registry_(options_.duplicate_behavior)
{
}

SessionManager::~SessionManager()
{
    stop();
}

void SessionManager::start(const std::vector<ServerSpec>& specs)
{
    if (started_)
        throw InvalidStateError("session already started");

    std::set<std::string> names;
    for (const auto& spec : specs)
    {
        if (spec.name.empty())
            throw SessionStartError("<unnamed>", "server name is empty");
        if (!names.insert(spec.name).second)
            throw SessionStartError(spec.name, "server name listed more than once");
    }

    // Connections left closed by an earlier stop()
    connections_.clear();
    registry_ = ToolRegistry(options_.duplicate_behavior);

    auto span = telemetry::session_span(specs.size());
    log::info("session", "starting " + std::to_string(specs.size()) + " server(s)");

    std::string current;
    try
    {
        for (const auto& spec : specs)
        {
            current = spec.name;
            connections_.push_back(
                std::make_unique<client::ServerConnection>(spec, options_.transport_factory));
            auto& conn = *connections_.back();
            conn.set_default_timeout(options_.request_timeout);
            conn.open();
            conn.handshake(options_.handshake_timeout);
        }

        ToolRegistry registry(options_.duplicate_behavior);
        for (const auto& conn : connections_)
        {
            current = conn->name();
            auto tools = conn->list_tools();
            log::info("session", "'" + current + "' advertises " + std::to_string(tools.size()) +
                                     " tool(s)");
            for (auto& tool : tools)
                registry.add(std::move(tool));
        }
        registry_ = std::move(registry);
    }
    catch (const Error& e)
    {
        log::error("session", "startup failed at '" + current + "': " + e.what());
        rollback();
        throw SessionStartError(current, e.what());
    }
    catch (const std::exception& e)
    {
        log::error("session", "startup failed at '" + current + "': " + e.what());
        rollback();
        throw SessionStartError(current, e.what());
    }

    started_ = true;
    log::info("session", "ready with " + std::to_string(registry_.size()) + " tool(s)");
}

ShutdownReport SessionManager::stop()
{
    return stop(options_.close_timeout);
}

ShutdownReport SessionManager::stop(std::chrono::milliseconds timeout)
{
    ShutdownReport report;
    for (const auto& conn : connections_)
    {
        if (conn->state() == client::ConnectionState::Closed)
            continue;
        report.closed.push_back(conn->name());
        if (!conn->close(timeout))
            report.forced.push_back(conn->name());
    }
    if (!report.closed.empty())
        log::info("session", "stopped " + std::to_string(report.closed.size()) + " server(s), " +
                                 std::to_string(report.forced.size()) + " forced");
    // Closed connections stay owned until the next start() or destruction; registry
    // descriptors keep pointing at them and dispatch gets ConnectionClosed.
    started_ = false;
    return report;
}

std::vector<client::ServerConnection*> SessionManager::connections() const
{
    std::vector<client::ServerConnection*> out;
    for (const auto& conn : connections_)
        if (conn->state() == client::ConnectionState::Ready)
            out.push_back(conn.get());
    return out;
}

client::ServerConnection* SessionManager::connection(const std::string& name) const
{
    for (const auto& conn : connections_)
        if (conn->name() == name)
            return conn.get();
    return nullptr;
}

void SessionManager::rollback()
{
    for (const auto& conn : connections_)
        conn->close(options_.close_timeout);
    connections_.clear();
    registry_ = ToolRegistry(options_.duplicate_behavior);
}

} // namespace mcpchat::session
