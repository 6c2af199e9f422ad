#include "mcpchat/session/tool_registry.hpp"

#include "mcpchat/exceptions.hpp"
#include "mcpchat/logging.hpp"

#include <algorithm>
#include <cctype>

namespace mcpchat::session
{

DuplicateBehavior duplicate_behavior_from_string(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "replace")
        return DuplicateBehavior::Replace;
    if (lower == "warn")
        return DuplicateBehavior::Warn;
    if (lower == "error")
        return DuplicateBehavior::Error;
    if (lower == "ignore")
        return DuplicateBehavior::Ignore;
    throw ValidationError("unknown duplicate tool policy: " + name);
}

std::string to_string(DuplicateBehavior behavior)
{
    switch (behavior)
    {
    case DuplicateBehavior::Replace:
        return "replace";
    case DuplicateBehavior::Warn:
        return "warn";
    case DuplicateBehavior::Error:
        return "error";
    case DuplicateBehavior::Ignore:
        return "ignore";
    }
    return "replace";
}

bool ToolRegistry::add(client::ToolDescriptor descriptor)
{
    auto it = index_.find(descriptor.name);
    if (it == index_.end())
    {
        log::debug("registry", "registered '" + descriptor.name + "' from '" +
                                   descriptor.server_name + "'");
        index_.emplace(descriptor.name, tools_.size());
        tools_.push_back(std::move(descriptor));
        return true;
    }

    auto& existing = tools_[it->second];
    switch (on_duplicate_)
    {
    case DuplicateBehavior::Error:
        throw DuplicateToolError(descriptor.name, existing.server_name, descriptor.server_name);
    case DuplicateBehavior::Ignore:
        log::debug("registry", "keeping '" + existing.name + "' from '" + existing.server_name +
                                   "', ignoring '" + descriptor.server_name + "'");
        return false;
    case DuplicateBehavior::Warn:
        log::warn("registry", "tool '" + descriptor.name + "' from '" + descriptor.server_name +
                                  "' replaces the one from '" + existing.server_name + "'");
        break;
    case DuplicateBehavior::Replace:
        log::debug("registry", "tool '" + descriptor.name + "' from '" + descriptor.server_name +
                                   "' replaces the one from '" + existing.server_name + "'");
        break;
    }
    existing = std::move(descriptor);
    return true;
}

const client::ToolDescriptor* ToolRegistry::find(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return &tools_[it->second];
}

Json ToolRegistry::tool_schemas() const
{
    Json out = Json::array();
    for (const auto& t : tools_)
        out.push_back(t.to_schema());
    return out;
}

} // namespace mcpchat::session
