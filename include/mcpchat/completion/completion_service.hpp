#pragma once
/// @file completion/completion_service.hpp
/// @brief Boundary to the language model: conversation + tool schemas in, text or tool calls out

#include "mcpchat/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpchat::completion
{

struct CompletionResult
{
    std::string text;
    std::vector<ToolCall> tool_calls; ///< in the order the model emitted them
    std::string model;
    std::string finish_reason;
};

class ICompletionService
{
  public:
    virtual ~ICompletionService() = default;

    /// @param tool_schemas MCP-shaped [{name, description, inputSchema}]
    /// @throws CompletionError on transport or provider failure
    virtual CompletionResult complete(const Conversation& conversation,
                                      const Json& tool_schemas) = 0;

    virtual std::string model() const = 0;
};

/// Returns a transcript where every tool message follows an assistant message that
/// carries the call it answers. Runs of tool messages with no such assistant message
/// get one synthesized from their answered calls.
Conversation reconcile_tool_turns(const Conversation& conversation);

/// Build a service from "<vendor>/<model>" (or a bare vendor) with an optional model
/// override. Vendors: openai, groq, ollama, anthropic.
/// @throws ValidationError for an unknown vendor or an empty model
std::unique_ptr<ICompletionService>
create_completion_service(const std::string& provider,
                          const std::optional<std::string>& model = std::nullopt);

} // namespace mcpchat::completion
