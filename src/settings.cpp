#include "mcpchat/settings.hpp"

#include "mcpchat/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mcpchat
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int getenv_positive_int(const char* key, int defv)
{
    const char* v = std::getenv(key);
    if (!v || v[0] == '\0')
        return defv;
    try
    {
        size_t pos = 0;
        int value = std::stoi(v, &pos);
        if (pos != std::string(v).size() || value <= 0)
            throw ValidationError(std::string(key) + " must be a positive integer");
        return value;
    }
    catch (const std::logic_error&)
    {
        throw ValidationError(std::string(key) + " must be a positive integer, got '" + v + "'");
    }
}

static int positive_field(const Json& j, const char* key, int defv)
{
    if (!j.contains(key))
        return defv;
    if (!j.at(key).is_number_integer() || j.at(key).get<int>() <= 0)
        throw ValidationError(std::string(key) + " must be a positive integer");
    return j.at(key).get<int>();
}

static std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MCPCHAT_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;
    s.handshake_timeout_ms = getenv_positive_int("MCPCHAT_HANDSHAKE_TIMEOUT_MS", s.handshake_timeout_ms);
    s.request_timeout_ms = getenv_positive_int("MCPCHAT_REQUEST_TIMEOUT_MS", s.request_timeout_ms);
    s.close_timeout_ms = getenv_positive_int("MCPCHAT_CLOSE_TIMEOUT_MS", s.close_timeout_ms);
    s.max_rounds = getenv_positive_int("MCPCHAT_MAX_ROUNDS", s.max_rounds);
    s.duplicate_tools = lowercase(getenv_str("MCPCHAT_DUPLICATE_TOOLS", s.duplicate_tools));
    s.provider = getenv_str("LLM_PROVIDER", s.provider);
    auto model = getenv_str("LLM_MODEL", "");
    if (!model.empty())
        s.model = model;
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    s.handshake_timeout_ms = positive_field(j, "handshake_timeout_ms", s.handshake_timeout_ms);
    s.request_timeout_ms = positive_field(j, "request_timeout_ms", s.request_timeout_ms);
    s.close_timeout_ms = positive_field(j, "close_timeout_ms", s.close_timeout_ms);
    s.max_rounds = positive_field(j, "max_rounds", s.max_rounds);
    if (j.contains("duplicate_tools"))
        s.duplicate_tools = lowercase(j.at("duplicate_tools").get<std::string>());
    if (j.contains("provider"))
        s.provider = j.at("provider").get<std::string>();
    if (j.contains("model") && j.at("model").is_string())
        s.model = j.at("model").get<std::string>();
    return s;
}

} // namespace mcpchat
