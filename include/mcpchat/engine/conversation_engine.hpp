#pragma once
/// @file engine/conversation_engine.hpp
/// @brief Completion / tool-dispatch loop over a borrowed registry and conversation

#include "mcpchat/completion/completion_service.hpp"
#include "mcpchat/engine/system_prompt.hpp"
#include "mcpchat/session/tool_registry.hpp"
#include "mcpchat/settings.hpp"
#include "mcpchat/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace mcpchat::engine
{

enum class EngineState
{
    AwaitingCompletion,
    DispatchingTools,
    Done,
    Failed
};

std::string to_string(EngineState state);

struct EngineOptions
{
    int max_rounds{10};
    std::optional<std::chrono::milliseconds> tool_timeout;
    SystemPromptOptions system_prompt;

    static EngineOptions from_settings(const Settings& settings);
};

struct RunOptions
{
    bool add_system_prompt{false};
};

/// Drives one conversation to a final assistant answer.
///
/// Each round asks the completion service for the next step. A reply without tool
/// calls is appended as an assistant message and ends the run; otherwise every call
/// is dispatched in emission order and one tool message per call is appended before
/// the next round. Tool failures are fed back to the model; only CompletionError and
/// LoopLimitExceeded leave run(), and the conversation keeps everything appended so far.
///
/// @code
/// ConversationEngine engine;
/// Conversation convo{Message::user("read intro.md")};
/// engine.run(convo, session.registry(), *service);
/// std::cout << convo.back().content << "\n";
/// @endcode
class ConversationEngine
{
  public:
    /// @throws ValidationError if max_rounds < 1
    explicit ConversationEngine(EngineOptions options = {});

    /// Appends to `conversation` in place and returns it.
    /// A system message generated from the registry is prepended when requested or
    /// when the conversation is empty.
    /// @throws CompletionError, LoopLimitExceeded (state becomes Failed)
    Conversation& run(Conversation& conversation, const session::ToolRegistry& registry,
                      completion::ICompletionService& service, const RunOptions& options = {});

    EngineState state() const
    {
        return state_;
    }

    /// Completion calls made by the last run
    int rounds() const
    {
        return rounds_;
    }

    const EngineOptions& options() const
    {
        return options_;
    }

  private:
    EngineOptions options_;
    EngineState state_{EngineState::AwaitingCompletion};
    int rounds_{0};
};

} // namespace mcpchat::engine
