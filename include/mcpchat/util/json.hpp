#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mcpchat::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}
inline std::string dump(const json& j)
{
    return j.dump();
}
inline std::string dump_pretty(const json& j, int indent = 2)
{
    return j.dump(indent);
}

/// Parse without throwing; nullopt when the text is not JSON.
inline std::optional<json> try_parse(const std::string& s)
{
    auto j = json::parse(s, nullptr, false);
    if (j.is_discarded())
        return std::nullopt;
    return j;
}

/// Model-issued arguments arrive either structured or JSON-encoded in a string.
/// Decode once; an undecodable string is kept verbatim.
inline json normalize_arguments(const json& raw)
{
    if (raw.is_null())
        return json::object();
    if (!raw.is_string())
        return raw;
    const auto& text = raw.get_ref<const std::string&>();
    if (text.empty())
        return json::object();
    if (auto parsed = try_parse(text))
        return *parsed;
    return raw;
}

} // namespace mcpchat::util::json
