#pragma once

#include "mcpchat/completion/completion_service.hpp"

#include <optional>
#include <string>

namespace mcpchat::completion
{

struct OpenAICompatibleOptions
{
    std::string base_url = "https://api.openai.com";
    std::string endpoint_path = "/v1/chat/completions";

    std::optional<std::string> api_key;
    std::string api_key_env = "OPENAI_API_KEY";

    std::string model = "gpt-4o-mini";
    std::optional<std::string> organization;
    std::optional<std::string> project;

    std::optional<double> temperature;
    std::optional<int> max_tokens;

    int timeout_ms = 60000;
};

/// Chat Completions client for OpenAI and API-compatible servers (Groq, Ollama, ...).
class OpenAICompatibleCompletionService : public ICompletionService
{
  public:
    explicit OpenAICompatibleCompletionService(OpenAICompatibleOptions options);

    CompletionResult complete(const Conversation& conversation,
                              const Json& tool_schemas) override;

    std::string model() const override
    {
        return options_.model;
    }

    /// Request body sent for a conversation, exposed for inspection
    Json build_request(const Conversation& conversation, const Json& tool_schemas) const;

  private:
    OpenAICompatibleOptions options_;
};

struct AnthropicOptions
{
    std::string base_url = "https://api.anthropic.com";
    std::string endpoint_path = "/v1/messages";

    std::optional<std::string> api_key;
    std::string api_key_env = "ANTHROPIC_API_KEY";

    std::string model = "claude-sonnet-4-5";
    std::string anthropic_version = "2023-06-01";

    std::optional<double> temperature;
    int max_tokens = 1024;

    int timeout_ms = 60000;
};

/// Anthropic Messages API client.
class AnthropicCompletionService : public ICompletionService
{
  public:
    explicit AnthropicCompletionService(AnthropicOptions options);

    CompletionResult complete(const Conversation& conversation,
                              const Json& tool_schemas) override;

    std::string model() const override
    {
        return options_.model;
    }

    Json build_request(const Conversation& conversation, const Json& tool_schemas) const;

  private:
    AnthropicOptions options_;
};

/// Response decoders; @throws CompletionError on an unusable payload
CompletionResult decode_openai_response(const Json& response, const std::string& requested_model);
CompletionResult decode_anthropic_response(const Json& response,
                                           const std::string& requested_model);

} // namespace mcpchat::completion
