#include "mcpchat/client/connection.hpp"

#include "mcpchat/exceptions.hpp"
#include "mcpchat/logging.hpp"
#include "mcpchat/telemetry.hpp"

#include <variant>

namespace mcpchat::client
{
namespace
{

constexpr const char* kClientName = "mcpchat";
constexpr const char* kClientVersion = "0.1.0";
constexpr std::chrono::milliseconds kDestructorCloseTimeout{2000};

bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string string_member(const Json& obj, const char* key, const std::string& defv = "")
{
    if (obj.contains(key) && obj[key].is_string())
        return obj[key].get<std::string>();
    return defv;
}

InitializeResult parse_initialize_result(const std::string& server, const Json& result)
{
    if (!result.is_object())
        throw HandshakeError("'" + server + "' sent a malformed initialize reply");
    if (!result.contains("protocolVersion") || !result["protocolVersion"].is_string())
        throw HandshakeError("'" + server + "' initialize reply lacks protocolVersion");

    InitializeResult out;
    out.protocolVersion = result["protocolVersion"].get<std::string>();
    if (result.contains("capabilities") && result["capabilities"].is_object())
        out.capabilities = result["capabilities"];
    if (result.contains("serverInfo") && result["serverInfo"].is_object())
    {
        out.serverInfo.name = string_member(result["serverInfo"], "name", "unknown");
        out.serverInfo.version = string_member(result["serverInfo"], "version", "unknown");
    }
    if (result.contains("instructions") && result["instructions"].is_string())
        out.instructions = result["instructions"].get<std::string>();
    return out;
}

} // namespace

std::string flatten_content(const Json& content)
{
    if (content.is_string())
        return content.get<std::string>();

    std::vector<Json> blocks;
    if (content.is_array())
        blocks = content.get<std::vector<Json>>();
    else if (content.is_object())
        blocks.push_back(content);

    std::string out;
    for (const auto& block : blocks)
    {
        if (block.is_null())
            continue;
        if (!out.empty())
            out.append("\n");
        if (block.is_object() && string_member(block, "type") == "text" &&
            block.contains("text") && block["text"].is_string())
            out.append(block["text"].get<std::string>());
        else
            out.append(block.dump());
    }
    return out;
}

ServerConnection::ServerConnection(ServerSpec spec, TransportFactory factory)
    : spec_(std::move(spec)), factory_(std::move(factory))
{
}

ServerConnection::~ServerConnection()
{
    close(kDestructorCloseTimeout);
}

void ServerConnection::open()
{
    auto expected = ConnectionState::Uninitialized;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Initializing))
        throw InvalidStateError("cannot open '" + name() + "': connection is " +
                                to_string(expected));
    try
    {
        transport_ = factory_(spec_);
    }
    catch (const LaunchError&)
    {
        state_ = ConnectionState::Failed;
        throw;
    }
    catch (const std::exception& e)
    {
        state_ = ConnectionState::Failed;
        throw LaunchError("failed to launch '" + name() + "': " + e.what());
    }
    if (!transport_)
    {
        state_ = ConnectionState::Failed;
        throw LaunchError("no transport available for '" + name() + "'");
    }
}

void ServerConnection::handshake(std::chrono::milliseconds timeout)
{
    if (state_ != ConnectionState::Initializing)
        throw InvalidStateError("handshake with '" + name() + "' not allowed: connection is " +
                                to_string(state_));

    auto mark_failed = [this]
    {
        auto expected = ConnectionState::Initializing;
        state_.compare_exchange_strong(expected, ConnectionState::Failed);
    };

    Json params = {{"protocolVersion", wire::PROTOCOL_VERSION},
                   {"capabilities", Json::object()},
                   {"clientInfo", {{"name", kClientName}, {"version", kClientVersion}}}};
    try
    {
        auto reply = request(wire::method::INITIALIZE, params, timeout);
        if (reply.is_error())
            throw HandshakeError("'" + name() + "' rejected initialize: " + reply.error->message);
        init_result_ = parse_initialize_result(name(), *reply.result);
        transport_->send(wire::encode(wire::Notification{wire::method::INITIALIZED, Json::object()}));
    }
    catch (const HandshakeError&)
    {
        mark_failed();
        throw;
    }
    catch (const std::exception& e)
    {
        mark_failed();
        throw HandshakeError("handshake with '" + name() + "' failed: " + e.what());
    }

    auto expected = ConnectionState::Initializing;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Ready))
        throw HandshakeError("'" + name() + "' was closed during the handshake");

    log::info("connection", "'" + name() + "' ready (" + init_result_.serverInfo.name + " " +
                                init_result_.serverInfo.version + ", protocol " +
                                init_result_.protocolVersion + ")");
}

std::vector<ToolDescriptor> ServerConnection::list_tools()
{
    require_ready("list_tools");

    std::vector<ToolDescriptor> out;
    std::string cursor;
    for (int page = 0; page < kMaxToolPages; ++page)
    {
        Json params = Json::object();
        if (!cursor.empty())
            params["cursor"] = cursor;

        auto reply = request(wire::method::TOOLS_LIST, params, default_timeout_);
        if (reply.is_error())
            throw ProtocolError("'" + name() + "' failed tools/list: " + reply.error->message);

        const Json& result = *reply.result;
        if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
            throw ProtocolError("'" + name() + "' sent a tools/list reply without a tools array");

        for (const auto& t : result["tools"])
        {
            if (!t.is_object() || !t.contains("name") || !t["name"].is_string() ||
                t["name"].get<std::string>().empty())
                throw ProtocolError("'" + name() + "' advertised a tool without a name");

            ToolDescriptor d;
            d.name = t["name"].get<std::string>();
            d.description = string_member(t, "description");
            if (t.contains("inputSchema") && t["inputSchema"].is_object())
                d.input_schema = t["inputSchema"];
            else
                d.input_schema = Json{{"type", "object"}, {"properties", Json::object()}};
            d.connection = this;
            d.server_name = name();
            out.push_back(std::move(d));
        }

        cursor = string_member(result, "nextCursor");
        if (cursor.empty())
            return out;
    }

    log::warn("connection", "'" + name() + "' tools/list still paginating after " +
                                std::to_string(kMaxToolPages) + " pages; truncating");
    return out;
}

ToolResult ServerConnection::invoke(const std::string& tool_name, const Json& arguments,
                                    std::optional<std::chrono::milliseconds> timeout)
{
    require_ready("invoke");

    Json params = {{"name", tool_name}, {"arguments", arguments}};
    if (auto meta = telemetry::inject_trace_context(std::nullopt))
        params["_meta"] = *meta;

    auto reply = request(wire::method::TOOLS_CALL, params, timeout.value_or(default_timeout_));
    if (reply.is_error())
        throw ToolExecutionError("tool '" + tool_name + "' on '" + name() +
                                     "' failed: " + reply.error->message,
                                 reply.error->to_json());

    const Json& result = *reply.result;
    if (!result.is_object())
        throw ProtocolError("'" + name() + "' sent a malformed tools/call result");

    ToolResult out;
    out.is_error = result.contains("isError") && result["isError"].is_boolean() &&
                   result["isError"].get<bool>();
    if (result.contains("content"))
        out.content = flatten_content(result["content"]);
    if (out.content.empty() && result.contains("structuredContent"))
        out.content = result["structuredContent"].dump();
    if (!result.contains("content") && !result.contains("structuredContent"))
        throw ProtocolError("'" + name() + "' tools/call result has no content");
    return out;
}

bool ServerConnection::close(std::chrono::milliseconds timeout) noexcept
{
    auto previous = state_.exchange(ConnectionState::Closed);
    if (previous == ConnectionState::Closed || !transport_)
        return true;
    try
    {
        bool graceful = transport_->close(timeout);
        log::debug("connection", "'" + name() + "' closed" + (graceful ? "" : " (forced)"));
        return graceful;
    }
    catch (const std::exception& e)
    {
        log::warn("connection", "closing '" + name() + "' reported: " + e.what());
        return false;
    }
}

void ServerConnection::require_ready(const char* operation) const
{
    auto current = state_.load();
    if (current == ConnectionState::Closed)
        throw ConnectionClosed(std::string(operation) + ": connection to '" + name() +
                               "' is closed");
    if (current != ConnectionState::Ready)
        throw InvalidStateError(std::string(operation) + ": connection to '" + name() +
                                "' is " + to_string(current));
}

void ServerConnection::answer_server_request(const wire::ServerRequest& req)
{
    if (req.method == wire::method::PING)
    {
        transport_->send(wire::encode_result(req.id, Json::object()));
        return;
    }
    log::debug("connection", "'" + name() + "' sent unsupported request " + req.method);
    transport_->send(wire::encode_error(req.id, wire::error_code::METHOD_NOT_FOUND,
                                        "Method not found: " + req.method));
}

void ServerConnection::abandon(int64_t id)
{
    abandoned_ids_.insert(id);
    while (abandoned_ids_.size() > kMaxAbandonedIds)
    {
        abandoned_floor_ = *abandoned_ids_.begin();
        abandoned_ids_.erase(abandoned_ids_.begin());
    }
}

wire::Reply ServerConnection::request(const std::string& method, const Json& params,
                                      std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(request_mutex_);
    if (state_ == ConnectionState::Closed)
        throw ConnectionClosed(method + ": connection to '" + name() + "' is closed");

    auto span = telemetry::request_span(name(), method);
    const int64_t id = next_id_++;
    transport_->send(wire::encode(wire::Request{id, method, params}));

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    try
    {
        while (true)
        {
            if (state_ == ConnectionState::Closed)
                throw ConnectionClosed("connection to '" + name() + "' closed while awaiting " +
                                       method);

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                throw TimeoutError(method + " to '" + name() + "' timed out after " +
                                   std::to_string(timeout.count()) + "ms");

            auto line = transport_->receive(remaining);
            if (!line)
            {
                if (state_ == ConnectionState::Closed || !transport_->is_open())
                    throw ConnectionClosed("connection to '" + name() +
                                           "' closed while awaiting " + method);
                continue;
            }
            if (is_blank(*line))
                continue;

            wire::Inbound inbound = wire::decode(*line);
            if (auto* note = std::get_if<wire::Notification>(&inbound))
            {
                log::debug("connection", "'" + name() + "' notification " + note->method);
                continue;
            }
            if (auto* server_req = std::get_if<wire::ServerRequest>(&inbound))
            {
                answer_server_request(*server_req);
                continue;
            }

            auto& reply = std::get<wire::Reply>(inbound);
            if (reply.id.is_number_integer())
            {
                const auto reply_id = reply.id.get<int64_t>();
                if (reply_id == id)
                    return std::move(reply);
                if (abandoned_ids_.erase(reply_id) > 0 || reply_id <= abandoned_floor_)
                {
                    log::debug("connection", "'" + name() + "' discarded late reply " +
                                                 std::to_string(reply_id));
                    continue;
                }
            }
            throw ProtocolError("reply id " + reply.id.dump() + " from '" + name() +
                                "' does not match in-flight request " + std::to_string(id));
        }
    }
    catch (const TimeoutError&)
    {
        abandon(id);
        throw;
    }
    catch (const ProtocolError&)
    {
        abandon(id);
        throw;
    }
}

} // namespace mcpchat::client
