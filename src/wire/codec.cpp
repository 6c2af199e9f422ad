#include "mcpchat/wire/codec.hpp"

#include "mcpchat/exceptions.hpp"
#include "mcpchat/util/json.hpp"

namespace mcpchat::wire
{
namespace
{

std::string truncate_for_error(const std::string& line)
{
    constexpr size_t limit = 200;
    if (line.size() <= limit)
        return line;
    return line.substr(0, limit) + "...";
}

bool valid_id(const Json& id)
{
    return id.is_number_integer() || id.is_string();
}

RpcError parse_error_object(const Json& e)
{
    if (!e.is_object())
        throw ProtocolError("error member is not an object");
    RpcError err;
    if (e.contains("code") && e["code"].is_number_integer())
        err.code = e["code"].get<int>();
    if (e.contains("message") && e["message"].is_string())
        err.message = e["message"].get<std::string>();
    if (err.message.empty())
        err.message = "json-rpc error";
    if (e.contains("data"))
        err.data = e["data"];
    return err;
}

} // namespace

Json RpcError::to_json() const
{
    Json j = {{"code", code}, {"message", message}};
    if (!data.is_null())
        j["data"] = data;
    return j;
}

std::string encode(const Request& request)
{
    Json j = {{"jsonrpc", "2.0"},
              {"id", request.id},
              {"method", request.method},
              {"params", request.params}};
    return j.dump();
}

std::string encode(const Notification& notification)
{
    Json j = {{"jsonrpc", "2.0"}, {"method", notification.method}};
    if (!notification.params.is_null() && !notification.params.empty())
        j["params"] = notification.params;
    return j.dump();
}

std::string encode_result(const Json& id, const Json& result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}.dump();
}

std::string encode_error(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}}
        .dump();
}

Inbound decode(const std::string& line)
{
    auto parsed = util::json::try_parse(line);
    if (!parsed)
        throw ProtocolError("undecodable message: " + truncate_for_error(line));
    const Json& msg = *parsed;
    if (!msg.is_object())
        throw ProtocolError("message is not a JSON object: " + truncate_for_error(line));
    if (!msg.contains("jsonrpc") || msg["jsonrpc"] != "2.0")
        throw ProtocolError("missing or unsupported jsonrpc version");

    if (msg.contains("method"))
    {
        if (!msg["method"].is_string())
            throw ProtocolError("method is not a string");
        Json params = msg.contains("params") ? msg["params"] : Json::object();
        if (!msg.contains("id") || msg["id"].is_null())
            return Notification{msg["method"].get<std::string>(), std::move(params)};
        if (!valid_id(msg["id"]))
            throw ProtocolError("request id must be an integer or string");
        return ServerRequest{msg["id"], msg["method"].get<std::string>(), std::move(params)};
    }

    if (!msg.contains("id") || !valid_id(msg["id"]))
        throw ProtocolError("reply without a usable id: " + truncate_for_error(line));

    const bool has_result = msg.contains("result");
    const bool has_error = msg.contains("error");
    if (has_result == has_error)
        throw ProtocolError("reply must carry exactly one of result or error");

    Reply reply;
    reply.id = msg["id"];
    if (has_result)
        reply.result = msg["result"];
    else
        reply.error = parse_error_object(msg["error"]);
    return reply;
}

} // namespace mcpchat::wire
