#include "mcpchat/engine/conversation_engine.hpp"

#include "mcpchat/engine/tool_dispatcher.hpp"
#include "mcpchat/exceptions.hpp"
#include "mcpchat/logging.hpp"
#include "mcpchat/telemetry.hpp"

namespace mcpchat::engine
{

std::string to_string(EngineState state)
{
    switch (state)
    {
    case EngineState::AwaitingCompletion:
        return "awaiting_completion";
    case EngineState::DispatchingTools:
        return "dispatching_tools";
    case EngineState::Done:
        return "done";
    case EngineState::Failed:
        return "failed";
    }
    return "awaiting_completion";
}

EngineOptions EngineOptions::from_settings(const Settings& settings)
{
    EngineOptions options;
    options.max_rounds = settings.max_rounds;
    options.tool_timeout = std::chrono::milliseconds(settings.request_timeout_ms);
    return options;
}

ConversationEngine::ConversationEngine(EngineOptions options) : options_(std::move(options))
{
    if (options_.max_rounds < 1)
        throw ValidationError("max_rounds must be at least 1");
}

Conversation& ConversationEngine::run(Conversation& conversation,
                                      const session::ToolRegistry& registry,
                                      completion::ICompletionService& service,
                                      const RunOptions& options)
{
    state_ = EngineState::AwaitingCompletion;
    rounds_ = 0;

    if (options.add_system_prompt || conversation.empty())
        conversation.insert(conversation.begin(),
                            Message::system(generate_system_prompt(registry, options_.system_prompt)));

    auto span = telemetry::run_span(registry.size());
    const Json schemas = registry.tool_schemas();
    const ToolDispatcher dispatcher(options_.tool_timeout);

    while (true)
    {
        if (rounds_ >= options_.max_rounds)
        {
            state_ = EngineState::Failed;
            log::error("engine", "giving up after " + std::to_string(rounds_) + " rounds");
            throw LoopLimitExceeded(options_.max_rounds);
        }
        ++rounds_;

        completion::CompletionResult result;
        {
            auto round_span = telemetry::completion_span(rounds_);
            try
            {
                result = service.complete(conversation, schemas);
            }
            catch (const CompletionError& e)
            {
                state_ = EngineState::Failed;
                log::error("engine", std::string("completion failed: ") + e.what());
                throw;
            }
            catch (const std::exception& e)
            {
                state_ = EngineState::Failed;
                log::error("engine", std::string("completion failed: ") + e.what());
                throw CompletionError(e.what());
            }
        }

        if (result.tool_calls.empty())
        {
            conversation.push_back(Message::assistant(result.text));
            state_ = EngineState::Done;
            log::debug("engine", "done after " + std::to_string(rounds_) + " round(s)");
            return conversation;
        }

        state_ = EngineState::DispatchingTools;
        log::debug("engine", "round " + std::to_string(rounds_) + ": " +
                                 std::to_string(result.tool_calls.size()) + " tool call(s)");
        for (const auto& call : result.tool_calls)
            conversation.push_back(
                Message::tool(call, dispatcher.dispatch(call, registry), rounds_));
        state_ = EngineState::AwaitingCompletion;
    }
}

} // namespace mcpchat::engine
