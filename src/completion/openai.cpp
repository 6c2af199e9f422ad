#include "http.hpp"
#include "mcpchat/completion/providers.hpp"
#include "mcpchat/exceptions.hpp"
#include "mcpchat/logging.hpp"
#include "mcpchat/util/json.hpp"

#include <atomic>

namespace mcpchat::completion
{
namespace
{

std::string next_generated_call_id()
{
    static std::atomic<unsigned long> counter{0};
    return "call_mcpchat_" + std::to_string(++counter);
}

std::string encode_arguments(const Json& arguments)
{
    if (arguments.is_string())
        return arguments.get<std::string>();
    return arguments.dump();
}

Json convert_tools(const Json& tool_schemas)
{
    Json out = Json::array();
    if (!tool_schemas.is_array())
        return out;

    for (const auto& t : tool_schemas)
    {
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string())
            continue;

        Json parameters = t.contains("inputSchema") && t["inputSchema"].is_object()
                              ? t["inputSchema"]
                              : Json::object();
        if (!parameters.contains("type"))
            parameters["type"] = "object";

        Json fn = {{"name", t["name"]}, {"parameters", std::move(parameters)}};
        if (t.contains("description") && t["description"].is_string())
            fn["description"] = t["description"];
        out.push_back(Json{{"type", "function"}, {"function", std::move(fn)}});
    }
    return out;
}

Json convert_message(const Message& m)
{
    switch (m.role)
    {
    case Role::Tool:
        return Json{{"role", "tool"},
                    {"tool_call_id", m.tool_call_id.value_or("")},
                    {"content", m.content}};
    case Role::Assistant:
        if (!m.tool_calls.empty())
        {
            Json calls = Json::array();
            for (const auto& tc : m.tool_calls)
                calls.push_back(Json{{"id", tc.id},
                                     {"type", "function"},
                                     {"function",
                                      Json{{"name", tc.name},
                                           {"arguments", encode_arguments(tc.arguments)}}}});
            Json j = {{"role", "assistant"}, {"tool_calls", std::move(calls)}};
            j["content"] = m.content.empty() ? Json(nullptr) : Json(m.content);
            return j;
        }
        return Json{{"role", "assistant"}, {"content", m.content}};
    case Role::System:
    case Role::User:
        break;
    }
    return Json{{"role", to_string(m.role)}, {"content", m.content}};
}

} // namespace

CompletionResult decode_openai_response(const Json& response, const std::string& requested_model)
{
    if (!response.is_object() || !response.contains("choices") ||
        !response["choices"].is_array() || response["choices"].empty())
        throw CompletionError("completion response has no choices");

    const auto& choice = response["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object())
        throw CompletionError("completion response has no message");
    const auto& msg = choice["message"];

    CompletionResult out;
    if (msg.contains("content") && msg["content"].is_string())
        out.text = msg["content"].get<std::string>();
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string())
        out.finish_reason = choice["finish_reason"].get<std::string>();
    out.model = response.contains("model") && response["model"].is_string()
                    ? response["model"].get<std::string>()
                    : requested_model;

    if (!msg.contains("tool_calls") || !msg["tool_calls"].is_array())
        return out;

    for (const auto& tc : msg["tool_calls"])
    {
        if (!tc.is_object() || !tc.contains("function") || !tc["function"].is_object())
            continue;
        const auto& fn = tc["function"];
        if (!fn.contains("name") || !fn["name"].is_string())
            continue;

        ToolCall call;
        call.name = fn["name"].get<std::string>();
        if (call.name.empty())
            continue;
        // Ollama omits call ids
        call.id = tc.contains("id") && tc["id"].is_string() && !tc["id"].get<std::string>().empty()
                      ? tc["id"].get<std::string>()
                      : next_generated_call_id();
        call.arguments = util::json::normalize_arguments(
            fn.contains("arguments") ? fn["arguments"] : Json());
        out.tool_calls.push_back(std::move(call));
    }
    return out;
}

OpenAICompatibleCompletionService::OpenAICompatibleCompletionService(
    OpenAICompatibleOptions options)
    : options_(std::move(options))
{
    if (!options_.api_key)
        options_.api_key = http::get_env(options_.api_key_env);
}

Json OpenAICompatibleCompletionService::build_request(const Conversation& conversation,
                                                      const Json& tool_schemas) const
{
    Json messages = Json::array();
    for (const auto& m : reconcile_tool_turns(conversation))
        messages.push_back(convert_message(m));

    Json request = {{"model", options_.model}, {"messages", std::move(messages)}};
    Json tools = convert_tools(tool_schemas);
    if (!tools.empty())
        request["tools"] = std::move(tools);
    if (options_.temperature)
        request["temperature"] = *options_.temperature;
    if (options_.max_tokens)
        request["max_tokens"] = *options_.max_tokens;
    return request;
}

CompletionResult OpenAICompatibleCompletionService::complete(const Conversation& conversation,
                                                             const Json& tool_schemas)
{
    const std::string url = http::join_url(options_.base_url, options_.endpoint_path);
    Json request = build_request(conversation, tool_schemas);

    std::vector<std::string> headers{"Content-Type: application/json"};
    if (options_.api_key && !options_.api_key->empty())
        headers.push_back("Authorization: Bearer " + *options_.api_key);
    if (options_.organization)
        headers.push_back("OpenAI-Organization: " + *options_.organization);
    if (options_.project)
        headers.push_back("OpenAI-Project: " + *options_.project);

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
    return decode_openai_response(*response, options_.model);
}

} // namespace mcpchat::completion
