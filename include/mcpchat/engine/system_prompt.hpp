#pragma once

#include "mcpchat/session/tool_registry.hpp"

#include <string>

namespace mcpchat::engine
{

struct SystemPromptOptions
{
    std::string user_system_prompt =
        "You are an intelligent AI assistant capable of using tools to solve user queries "
        "effectively.";
    std::string tool_config = "No additional configuration is required.";
    bool include_guidelines = true;
};

/// System message text describing every registered tool (JSON schema), followed by
/// the user prompt, tool configuration and general tool-use guidelines.
std::string generate_system_prompt(const session::ToolRegistry& registry,
                                   const SystemPromptOptions& options = {});

} // namespace mcpchat::engine
