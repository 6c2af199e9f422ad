#pragma once

#include "mcpchat/client/types.hpp"
#include "mcpchat/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace mcpchat::session
{

/// What to do when a second provider advertises a tool name already registered.
enum class DuplicateBehavior
{
    Replace, ///< later registration wins
    Warn,    ///< later wins, warning logged
    Error,   ///< DuplicateToolError
    Ignore   ///< first registration wins
};

/// Accepts replace, warn, error, ignore (case-insensitive).
/// @throws ValidationError for any other name
DuplicateBehavior duplicate_behavior_from_string(const std::string& name);
std::string to_string(DuplicateBehavior behavior);

/// Tool name -> descriptor. Built once at session start, read-only afterwards.
/// Iteration follows first-registration order; a replaced entry keeps its slot.
class ToolRegistry
{
  public:
    explicit ToolRegistry(DuplicateBehavior on_duplicate = DuplicateBehavior::Replace)
        : on_duplicate_(on_duplicate)
    {
    }

    /// @return true if the descriptor is now the registered entry for its name
    /// @throws DuplicateToolError under DuplicateBehavior::Error
    bool add(client::ToolDescriptor descriptor);

    /// Non-owning; nullptr when absent
    const client::ToolDescriptor* find(const std::string& name) const;

    bool contains(const std::string& name) const
    {
        return index_.count(name) > 0;
    }
    size_t size() const
    {
        return tools_.size();
    }
    bool empty() const
    {
        return tools_.empty();
    }

    const std::vector<client::ToolDescriptor>& descriptors() const
    {
        return tools_;
    }

    /// [{name, description, inputSchema}] in registry order
    Json tool_schemas() const;

    DuplicateBehavior duplicate_behavior() const
    {
        return on_duplicate_;
    }

  private:
    DuplicateBehavior on_duplicate_;
    std::vector<client::ToolDescriptor> tools_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace mcpchat::session
