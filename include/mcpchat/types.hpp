#pragma once
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcpchat
{

using Json = nlohmann::json;

/// Launch description of one tool-provider process.
struct ServerSpec
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< Overrides merged over the inherited environment
};

enum class Role
{
    System,
    User,
    Assistant,
    Tool
};

inline std::string to_string(Role role)
{
    switch (role)
    {
    case Role::System:
        return "system";
    case Role::User:
        return "user";
    case Role::Assistant:
        return "assistant";
    case Role::Tool:
        return "tool";
    }
    return "user";
}

Role role_from_string(const std::string& s);

/// A tool invocation requested by the model.
struct ToolCall
{
    std::string id;
    std::string name;
    Json arguments = Json::object(); ///< Structured value; a raw string only when undecodable
};

struct ToolResult
{
    std::string tool_call_id;
    std::string content;
    bool is_error{false};
};

struct Message
{
    Role role{Role::User};
    std::string content;
    std::optional<std::string> tool_call_id;   ///< Tool messages: the call being answered
    std::vector<ToolCall> tool_calls;          ///< Assistant messages: calls emitted by the model
    std::optional<ToolCall> answered_call;     ///< Tool messages: full call, for transcript rebuilding
    bool is_error{false};
    std::optional<int> round;                  ///< Tool messages: completion round that issued the call

    static Message system(std::string text)
    {
        return Message{Role::System, std::move(text), std::nullopt, {}, std::nullopt, false, std::nullopt};
    }
    static Message user(std::string text)
    {
        return Message{Role::User, std::move(text), std::nullopt, {}, std::nullopt, false, std::nullopt};
    }
    static Message assistant(std::string text)
    {
        return Message{Role::Assistant, std::move(text), std::nullopt, {}, std::nullopt, false, std::nullopt};
    }
    static Message tool(const ToolCall& call, const ToolResult& result,
                        std::optional<int> round = std::nullopt);
};

/// Ordered, append-only during a run; insertion order is the order sent to the model.
using Conversation = std::vector<Message>;

// nlohmann::json adapters (the interchange shape crossing the session boundary)
void to_json(Json& j, const ToolCall& call);
void from_json(const Json& j, ToolCall& call);
void to_json(Json& j, const Message& message);
void from_json(const Json& j, Message& message);

} // namespace mcpchat
