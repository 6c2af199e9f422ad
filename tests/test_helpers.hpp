/// @file tests/test_helpers.hpp
/// @brief In-process tool providers and a scripted completion service for tests
#pragma once

#include "mcpchat/client/transports.hpp"
#include "mcpchat/completion/completion_service.hpp"
#include "mcpchat/exceptions.hpp"
#include "mcpchat/types.hpp"
#include "mcpchat/wire/codec.hpp"

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcpchat::testing
{

/// {"result": tools/call result} with one text block
inline Json text_reply(const std::string& text, bool is_error = false)
{
    return Json{{"result",
                 Json{{"content", Json::array({Json{{"type", "text"}, {"text", text}}})},
                      {"isError", is_error}}}};
}

/// {"error": {...}}
inline Json error_reply(int code, const std::string& message)
{
    return Json{{"error", Json{{"code", code}, {"message", message}}}};
}

/// A set of named fake providers served over LoopbackTransport.
/// Launches and closes are recorded per server name, in order.
class FakeProviders
{
  public:
    struct Server
    {
        std::vector<std::string> tools;
        std::string init_mode{"ok"}; ///< ok | error | silent | garbage (non-object result)
        /// Returns {"result": ...} or {"error": ...}; nullopt leaves the call unanswered
        std::function<std::optional<Json>(const std::string& tool, const Json& args)> on_call;
        std::vector<std::string> called;
        std::vector<Json> call_params;
    };

    Server& add(const std::string& name, std::vector<std::string> tools)
    {
        auto& s = servers_[name];
        s.tools = std::move(tools);
        return s;
    }

    Server& server(const std::string& name)
    {
        return servers_.at(name);
    }

    void fail_launch(const std::string& name)
    {
        launch_failures_.insert(name);
    }

    client::TransportFactory factory()
    {
        return [this](const ServerSpec& spec) -> std::unique_ptr<client::ITransport>
        {
            if (launch_failures_.count(spec.name))
                throw LaunchError("cannot launch " + spec.name);
            launched.push_back(spec.name);
            const std::string name = spec.name;
            auto transport = std::make_unique<client::LoopbackTransport>(
                [this, name](const Json& msg) { return respond(name, msg); });
            transport->set_on_close([this, name] { closed.push_back(name); });
            return transport;
        };
    }

    std::vector<std::string> launched;
    std::vector<std::string> closed;

  private:
    std::optional<Json> respond(const std::string& name, const Json& msg)
    {
        if (!msg.contains("method") || !msg.contains("id"))
            return std::nullopt;
        auto& s = servers_.at(name);
        const std::string method = msg["method"].get<std::string>();
        const Json params = msg.value("params", Json::object());

        Json body;
        if (method == wire::method::INITIALIZE)
        {
            if (s.init_mode == "silent")
                return std::nullopt;
            if (s.init_mode == "error")
                body = error_reply(wire::error_code::INTERNAL_ERROR, "init refused");
            else if (s.init_mode == "garbage")
                body = Json{{"result", "not an object"}};
            else
                body = Json{{"result",
                             Json{{"protocolVersion", wire::PROTOCOL_VERSION},
                                  {"capabilities", Json{{"tools", Json::object()}}},
                                  {"serverInfo", Json{{"name", name}, {"version", "1.0"}}}}}};
        }
        else if (method == wire::method::TOOLS_LIST)
        {
            Json tools = Json::array();
            for (const auto& t : s.tools)
                tools.push_back(Json{{"name", t},
                                     {"description", name + " tool " + t},
                                     {"inputSchema", Json{{"type", "object"}}}});
            body = Json{{"result", Json{{"tools", tools}}}};
        }
        else if (method == wire::method::TOOLS_CALL)
        {
            const std::string tool = params.value("name", "");
            const Json args = params.value("arguments", Json::object());
            s.called.push_back(tool);
            s.call_params.push_back(params);
            if (s.on_call)
            {
                auto reply = s.on_call(tool, args);
                if (!reply)
                    return std::nullopt;
                body = *reply;
            }
            else
            {
                body = text_reply(name + ":" + tool);
            }
        }
        else
        {
            body = error_reply(wire::error_code::METHOD_NOT_FOUND, "no " + method);
        }
        body["jsonrpc"] = "2.0";
        body["id"] = msg["id"];
        return body;
    }

    std::map<std::string, Server> servers_;
    std::set<std::string> launch_failures_;
};

inline ServerSpec spec_for(const std::string& name)
{
    return ServerSpec{name, "fake-" + name, {}, {}};
}

/// Completion service replaying a fixed script; records what it was sent.
class ScriptedCompletionService : public completion::ICompletionService
{
  public:
    /// Next reply: text only
    void reply_text(const std::string& text)
    {
        completion::CompletionResult r;
        r.text = text;
        r.finish_reason = "stop";
        script_.push_back(r);
    }

    /// Next reply: tool calls
    void reply_calls(std::vector<ToolCall> calls)
    {
        completion::CompletionResult r;
        r.tool_calls = std::move(calls);
        r.finish_reason = "tool_calls";
        script_.push_back(r);
    }

    void fail_next(const std::string& message)
    {
        failures_.insert(calls + static_cast<int>(script_.size()));
        script_.push_back({});
        failure_message_ = message;
    }

    completion::CompletionResult complete(const Conversation& conversation,
                                          const Json& tool_schemas) override
    {
        seen_conversations.push_back(conversation);
        seen_schemas.push_back(tool_schemas);
        const int index = calls++;
        if (failures_.count(index))
        {
            script_.pop_front();
            throw CompletionError(failure_message_, 503);
        }
        if (script_.empty())
        {
            // Keep asking for the same tool so loop limits can be exercised.
            if (!repeat_call)
                throw CompletionError("script exhausted");
            completion::CompletionResult r;
            r.tool_calls.push_back(*repeat_call);
            r.tool_calls.back().id = "loop-" + std::to_string(index);
            return r;
        }
        auto r = script_.front();
        script_.pop_front();
        r.model = "scripted";
        return r;
    }

    std::string model() const override
    {
        return "scripted";
    }

    int calls{0};
    std::optional<ToolCall> repeat_call;
    std::vector<Conversation> seen_conversations;
    std::vector<Json> seen_schemas;

  private:
    std::deque<completion::CompletionResult> script_;
    std::set<int> failures_;
    std::string failure_message_;
};

inline ToolCall make_call(const std::string& id, const std::string& name, Json args = Json::object())
{
    return ToolCall{id, name, std::move(args)};
}

} // namespace mcpchat::testing
