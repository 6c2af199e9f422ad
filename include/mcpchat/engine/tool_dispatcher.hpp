#pragma once

#include "mcpchat/session/tool_registry.hpp"
#include "mcpchat/types.hpp"

#include <chrono>
#include <optional>

namespace mcpchat::engine
{

/// Routes a model-issued ToolCall to the connection that owns the tool.
///
/// Never throws for per-call failures: an unknown tool, non-object arguments, or any
/// provider error (ToolExecutionError, TimeoutError, ProtocolError, ConnectionClosed)
/// becomes a ToolResult with is_error set, so the failure reaches the model as data.
class ToolDispatcher
{
  public:
    explicit ToolDispatcher(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        : timeout_(timeout)
    {
    }

    ToolResult dispatch(const ToolCall& call, const session::ToolRegistry& registry) const;

  private:
    std::optional<std::chrono::milliseconds> timeout_;
};

} // namespace mcpchat::engine
