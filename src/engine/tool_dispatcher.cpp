#include "mcpchat/engine/tool_dispatcher.hpp"

#include "mcpchat/client/connection.hpp"
#include "mcpchat/exceptions.hpp"
#include "mcpchat/logging.hpp"
#include "mcpchat/telemetry.hpp"
#include "mcpchat/util/json.hpp"

#include <exception>

namespace mcpchat::engine
{
namespace
{

ToolResult error_result(const ToolCall& call, std::string description)
{
    log::warn("dispatch", "tool '" + call.name + "' (" + call.id + ") failed: " + description);
    return ToolResult{call.id, std::move(description), true};
}

} // namespace

ToolResult ToolDispatcher::dispatch(const ToolCall& call,
                                    const session::ToolRegistry& registry) const
{
    auto span = telemetry::tool_span(call.name, call.id);

    const auto* descriptor = registry.find(call.name);
    if (!descriptor || !descriptor->connection)
    {
        if (span.active())
            span.span().record_exception("tool not found");
        return error_result(call, "Tool '" + call.name + "' not found");
    }

    auto arguments = util::json::normalize_arguments(call.arguments);
    if (!arguments.is_object())
    {
        if (span.active())
            span.span().record_exception("arguments not an object");
        return error_result(call, "Arguments for tool '" + call.name +
                                      "' must be a JSON object, got: " + arguments.dump());
    }

    log::info("dispatch", "calling '" + call.name + "' on '" + descriptor->server_name +
                              "' with arguments:\n" + util::json::dump_pretty(arguments));

    try
    {
        ToolResult result = descriptor->connection->invoke(call.name, arguments, timeout_);
        result.tool_call_id = call.id;
        if (result.is_error && span.active())
            span.span().record_exception(result.content);
        return result;
    }
    catch (const Error& e)
    {
        if (span.active())
            span.span().record_exception(e.what());
        return error_result(call, e.what());
    }
    catch (const std::exception& e)
    {
        if (span.active())
            span.span().record_exception(e.what());
        return error_result(call, e.what());
    }
}

} // namespace mcpchat::engine
