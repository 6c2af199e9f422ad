#include "http.hpp"
#include "mcpchat/completion/providers.hpp"
#include "mcpchat/exceptions.hpp"
#include "mcpchat/logging.hpp"
#include "mcpchat/util/json.hpp"

namespace mcpchat::completion
{
namespace
{

Json convert_tools(const Json& tool_schemas)
{
    Json out = Json::array();
    if (!tool_schemas.is_array())
        return out;
    for (const auto& t : tool_schemas)
    {
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string())
            continue;
        Json input_schema = t.contains("inputSchema") && t["inputSchema"].is_object()
                                ? t["inputSchema"]
                                : Json::object();
        if (!input_schema.contains("type"))
            input_schema["type"] = "object";

        Json tool = {{"name", t["name"]}, {"input_schema", std::move(input_schema)}};
        if (t.contains("description") && t["description"].is_string())
            tool["description"] = t["description"];
        out.push_back(std::move(tool));
    }
    return out;
}

// tool_use input must be an object
Json tool_input(const Json& arguments)
{
    Json normalized = util::json::normalize_arguments(arguments);
    return normalized.is_object() ? normalized : Json::object();
}

Json content_blocks(const Message& m)
{
    Json blocks = Json::array();
    if (m.role == Role::Tool)
    {
        blocks.push_back(Json{{"type", "tool_result"},
                              {"tool_use_id", m.tool_call_id.value_or("")},
                              {"content", m.content},
                              {"is_error", m.is_error}});
        return blocks;
    }
    if (!m.content.empty())
        blocks.push_back(Json{{"type", "text"}, {"text", m.content}});
    for (const auto& tc : m.tool_calls)
        blocks.push_back(Json{{"type", "tool_use"},
                              {"id", tc.id},
                              {"name", tc.name},
                              {"input", tool_input(tc.arguments)}});
    return blocks;
}

} // namespace

CompletionResult decode_anthropic_response(const Json& response,
                                           const std::string& requested_model)
{
    if (!response.is_object() || !response.contains("content") || !response["content"].is_array())
        throw CompletionError("completion response has no content");

    CompletionResult out;
    for (const auto& block : response["content"])
    {
        if (!block.is_object())
            continue;
        std::string type = block.value("type", "");
        if (type == "text" && block.contains("text") && block["text"].is_string())
        {
            if (!out.text.empty())
                out.text.append("\n");
            out.text.append(block["text"].get<std::string>());
        }
        else if (type == "tool_use")
        {
            ToolCall call;
            call.id = block.value("id", "");
            call.name = block.value("name", "");
            if (call.name.empty())
                continue;
            call.arguments = util::json::normalize_arguments(
                block.contains("input") ? block["input"] : Json());
            out.tool_calls.push_back(std::move(call));
        }
    }
    if (response.contains("stop_reason") && response["stop_reason"].is_string())
        out.finish_reason = response["stop_reason"].get<std::string>();
    out.model = response.contains("model") && response["model"].is_string()
                    ? response["model"].get<std::string>()
                    : requested_model;
    return out;
}

AnthropicCompletionService::AnthropicCompletionService(AnthropicOptions options)
    : options_(std::move(options))
{
    if (!options_.api_key)
        options_.api_key = http::get_env(options_.api_key_env);
}

Json AnthropicCompletionService::build_request(const Conversation& conversation,
                                               const Json& tool_schemas) const
{
    std::string system;
    Json messages = Json::array();
    for (const auto& m : reconcile_tool_turns(conversation))
    {
        if (m.role == Role::System)
        {
            if (!system.empty())
                system.append("\n\n");
            system.append(m.content);
            continue;
        }

        const std::string role = m.role == Role::Assistant ? "assistant" : "user";
        Json blocks = content_blocks(m);
        if (blocks.empty())
            continue;
        // Consecutive same-role turns (tool results, then a user line) share one message.
        if (!messages.empty() && messages.back()["role"] == role)
        {
            for (auto& b : blocks)
                messages.back()["content"].push_back(std::move(b));
            continue;
        }
        messages.push_back(Json{{"role", role}, {"content", std::move(blocks)}});
    }

    Json request = {{"model", options_.model},
                    {"max_tokens", options_.max_tokens},
                    {"messages", std::move(messages)}};
    if (!system.empty())
        request["system"] = system;
    if (options_.temperature)
        request["temperature"] = *options_.temperature;
    Json tools = convert_tools(tool_schemas);
    if (!tools.empty())
        request["tools"] = std::move(tools);
    return request;
}

CompletionResult AnthropicCompletionService::complete(const Conversation& conversation,
                                                      const Json& tool_schemas)
{
    const std::string url = http::join_url(options_.base_url, options_.endpoint_path);
    Json request = build_request(conversation, tool_schemas);

    std::vector<std::string> headers{"Content-Type: application/json",
                                     "anthropic-version: " + options_.anthropic_version};
    if (options_.api_key && !options_.api_key->empty())
        headers.push_back("x-api-key: " + *options_.api_key);

    log::debug("completion", "POST " + url + " (" + std::to_string(conversation.size()) +
                                 " messages)");
    auto r = http::post_json(url, headers, request.dump(), options_.timeout_ms);
    if (r.status_code >= 400)
        throw CompletionError("completion request failed with HTTP " +
                                  std::to_string(r.status_code) + ": " +
                                  http::error_message(r.body),
                              r.status_code);

    auto response = util::json::try_parse(r.body);
    if (!response)
        throw CompletionError("completion response is not JSON", r.status_code);
    return decode_anthropic_response(*response, options_.model);
}

} // namespace mcpchat::completion
