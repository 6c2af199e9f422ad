#pragma once
#include "mcpchat/types.hpp"

#include <optional>
#include <string>

namespace mcpchat
{

struct Settings
{
    std::string log_level{"INFO"};
    int handshake_timeout_ms{10000};
    int request_timeout_ms{60000};
    int close_timeout_ms{2000};
    int max_rounds{10};
    std::string duplicate_tools{"replace"};
    std::string provider{"groq/llama-3.1-8b-instant"};
    std::optional<std::string> model;

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace mcpchat
