#include "mcpchat/engine/system_prompt.hpp"

#include "mcpchat/util/json.hpp"

#include <sstream>

namespace mcpchat::engine
{
namespace
{

constexpr const char* kPreamble =
    "In this environment you have access to a set of tools you can use to answer the "
    "user's question.\n"
    "Call a tool by emitting a tool call with its name and a JSON object of arguments that "
    "matches the tool's input schema. Pass strings and scalars as they are and encode lists "
    "and objects as JSON.\n"
    "Here are the tools available, in JSON Schema format:\n";

constexpr const char* kGuidelines = R"(
**GENERAL GUIDELINES:**

1. Step-by-step reasoning:
   - Analyze the task and break complex problems into smaller parts.
   - Verify assumptions at each step and reflect on results before acting again.

2. Effective tool usage:
   - Explore: check what information is available and how it is structured.
   - Iterate: start with simple calls and build on what works.
   - Handle errors: read tool error messages carefully and adjust the next call.

3. Clear communication:
   - Explain the reasoning behind each decision.
   - Share findings with the user and outline next steps or ask clarifying questions.

REMEMBER:
- Every tool call should have a clear purpose.
- Make reasonable assumptions when a request is ambiguous.
- Keep unnecessary back-and-forth with the user to a minimum.
)";

} // namespace

std::string generate_system_prompt(const session::ToolRegistry& registry,
                                   const SystemPromptOptions& options)
{
    Json definitions = {{"tools", registry.tool_schemas()}};

    std::ostringstream out;
    out << kPreamble << util::json::dump_pretty(definitions) << "\n\n";
    if (!options.user_system_prompt.empty())
        out << options.user_system_prompt << "\n\n";
    if (!options.tool_config.empty())
        out << options.tool_config << "\n";
    if (options.include_guidelines)
        out << kGuidelines;
    return out.str();
}

} // namespace mcpchat::engine
