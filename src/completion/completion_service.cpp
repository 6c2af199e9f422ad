#include "mcpchat/completion/completion_service.hpp"

#include "http.hpp"
#include "mcpchat/completion/providers.hpp"
#include "mcpchat/exceptions.hpp"
#include "mcpchat/logging.hpp"

#include <algorithm>
#include <cctype>

namespace mcpchat::completion
{
namespace
{

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

ToolCall call_answered_by(const Message& message)
{
    if (message.answered_call)
    {
        ToolCall call = *message.answered_call;
        if (message.tool_call_id)
            call.id = *message.tool_call_id;
        return call;
    }
    ToolCall call;
    call.id = message.tool_call_id.value_or("");
    call.name = "unknown_tool";
    return call;
}

} // namespace

Conversation reconcile_tool_turns(const Conversation& conversation)
{
    Conversation out;
    out.reserve(conversation.size());
    // Index of the assistant turn the current run of tool messages answers
    std::optional<size_t> anchor;
    // Round of the tool messages already attached to the anchor
    std::optional<int> anchor_round;

    for (const auto& message : conversation)
    {
        if (message.role != Role::Tool)
        {
            out.push_back(message);
            anchor = out.size() - 1;
            anchor_round.reset();
            continue;
        }

        ToolCall call = call_answered_by(message);
        // A new round's calls were issued after the previous round's results.
        bool next_round = message.round && anchor_round && *message.round != *anchor_round;
        if (!anchor || out[*anchor].role != Role::Assistant || next_round)
        {
            out.push_back(Message::assistant(""));
            anchor = out.size() - 1;
        }
        if (message.round)
            anchor_round = message.round;
        auto& calls = out[*anchor].tool_calls;
        bool present = std::any_of(calls.begin(), calls.end(),
                                   [&](const ToolCall& c) { return c.id == call.id; });
        if (!present)
            calls.push_back(std::move(call));
        out.push_back(message);
    }
    return out;
}

std::unique_ptr<ICompletionService>
create_completion_service(const std::string& provider, const std::optional<std::string>& model)
{
    std::string vendor = provider;
    std::string provider_model;
    auto slash = provider.find('/');
    if (slash != std::string::npos)
    {
        vendor = provider.substr(0, slash);
        provider_model = provider.substr(slash + 1);
    }
    vendor = to_lower(vendor);
    if (model && !model->empty())
        provider_model = *model;

    if (vendor == "anthropic")
    {
        AnthropicOptions opts;
        if (auto base = http::get_env("ANTHROPIC_BASE_URL"))
            opts.base_url = *base;
        if (!provider_model.empty())
            opts.model = provider_model;
        log::info("completion", "using anthropic model " + opts.model);
        return std::make_unique<AnthropicCompletionService>(std::move(opts));
    }

    OpenAICompatibleOptions opts;
    if (vendor == "openai")
    {
        if (auto base = http::get_env("OPENAI_BASE_URL"))
            opts.base_url = *base;
    }
    else if (vendor == "groq")
    {
        opts.base_url = http::get_env("GROQ_BASE_URL").value_or("https://api.groq.com/openai");
        opts.api_key_env = "GROQ_API_KEY";
        opts.model = "llama-3.1-8b-instant";
    }
    else if (vendor == "ollama")
    {
        opts.base_url = http::get_env("OLLAMA_HOST").value_or("http://localhost:11434");
        opts.api_key_env.clear();
        opts.model = "llama3.1";
    }
    else
    {
        throw ValidationError("unknown completion provider: '" + vendor + "'");
    }
    if (!provider_model.empty())
        opts.model = provider_model;
    if (opts.model.empty())
        throw ValidationError("no model configured for provider '" + vendor + "'");

    log::info("completion", "using " + vendor + " model " + opts.model);
    return std::make_unique<OpenAICompatibleCompletionService>(std::move(opts));
}

} // namespace mcpchat::completion
