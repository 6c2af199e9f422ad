#include "mcpchat/types.hpp"

#include "mcpchat/exceptions.hpp"

namespace mcpchat
{

Role role_from_string(const std::string& s)
{
    if (s == "system")
        return Role::System;
    if (s == "user")
        return Role::User;
    if (s == "assistant")
        return Role::Assistant;
    if (s == "tool")
        return Role::Tool;
    throw ValidationError("unknown message role: " + s);
}

Message Message::tool(const ToolCall& call, const ToolResult& result, std::optional<int> round)
{
    Message m;
    m.role = Role::Tool;
    m.content = result.is_error ? "Error: " + result.content : result.content;
    m.tool_call_id = call.id;
    m.answered_call = call;
    m.is_error = result.is_error;
    m.round = round;
    return m;
}

void to_json(Json& j, const ToolCall& call)
{
    j = Json{{"id", call.id}, {"name", call.name}, {"arguments", call.arguments}};
}

void from_json(const Json& j, ToolCall& call)
{
    call.id = j.value("id", "");
    call.name = j.at("name").get<std::string>();
    call.arguments = j.contains("arguments") ? j["arguments"] : Json::object();
}

void to_json(Json& j, const Message& message)
{
    j = Json{{"role", to_string(message.role)}, {"content", message.content}};
    if (message.tool_call_id)
        j["tool_call_id"] = *message.tool_call_id;
    if (!message.tool_calls.empty())
        j["tool_calls"] = message.tool_calls;
    if (message.answered_call)
        j["name"] = message.answered_call->name;
    if (message.is_error)
        j["is_error"] = true;
    if (message.round)
        j["round"] = *message.round;
}

void from_json(const Json& j, Message& message)
{
    message.role = role_from_string(j.value("role", "user"));
    // Presentation layers send null content for tool-only assistant turns.
    if (j.contains("content") && j["content"].is_string())
        message.content = j["content"].get<std::string>();
    if (j.contains("tool_call_id") && j["tool_call_id"].is_string())
        message.tool_call_id = j["tool_call_id"].get<std::string>();
    if (j.contains("tool_calls") && j["tool_calls"].is_array())
        message.tool_calls = j["tool_calls"].get<std::vector<ToolCall>>();
    message.is_error = j.value("is_error", false);
    if (j.contains("round") && j["round"].is_number_integer())
        message.round = j["round"].get<int>();
    if (message.role == Role::Tool && message.tool_call_id && j.contains("name") &&
        j["name"].is_string())
    {
        ToolCall call;
        call.id = *message.tool_call_id;
        call.name = j["name"].get<std::string>();
        message.answered_call = call;
    }
}

} // namespace mcpchat
