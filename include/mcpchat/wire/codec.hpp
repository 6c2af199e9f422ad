/// @file wire/codec.hpp
/// @brief Line-delimited JSON-RPC 2.0 codec for the tool-provider pipe protocol.
/// @details One message per line. Every inbound line decodes to exactly one of
///          Reply, Notification or ServerRequest; anything else is a ProtocolError.

#pragma once

#include "mcpchat/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mcpchat::wire
{

constexpr const char* PROTOCOL_VERSION = "2024-11-05";

namespace method
{
constexpr const char* INITIALIZE = "initialize";
constexpr const char* INITIALIZED = "notifications/initialized";
constexpr const char* TOOLS_LIST = "tools/list";
constexpr const char* TOOLS_CALL = "tools/call";
constexpr const char* PING = "ping";
} // namespace method

namespace error_code
{
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
} // namespace error_code

struct Request
{
    int64_t id{0};
    std::string method;
    Json params = Json::object();
};

struct Notification
{
    std::string method;
    Json params = Json::object();
};

struct RpcError
{
    int code{error_code::INTERNAL_ERROR};
    std::string message;
    Json data;

    Json to_json() const;
};

struct Reply
{
    Json id;
    std::optional<Json> result;
    std::optional<RpcError> error;

    bool is_error() const
    {
        return error.has_value();
    }
};

/// Request initiated by the provider (e.g. ping); ids may be strings.
struct ServerRequest
{
    Json id;
    std::string method;
    Json params = Json::object();
};

using Inbound = std::variant<Reply, Notification, ServerRequest>;

std::string encode(const Request& request);
std::string encode(const Notification& notification);
std::string encode_result(const Json& id, const Json& result);
std::string encode_error(const Json& id, int code, const std::string& message);

/// @throws ProtocolError for non-JSON, non-object, wrong jsonrpc version, or
///         replies carrying neither or both of result and error.
Inbound decode(const std::string& line);

} // namespace mcpchat::wire
