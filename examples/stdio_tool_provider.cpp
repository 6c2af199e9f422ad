// Minimal line-delimited JSON-RPC tool provider.
//
// Usage: mcpchat_example_stdio_tool_provider [--name NAME] [--tool NAME]... [--page-size N]
//            [--init-mode ok|error|silent|garbage|exit] [--notify] [--ping] [--stubborn]
//
// Tool behavior is chosen by tool name:
//   fail      -> result with isError:true
//   rpc_error -> JSON-RPC error reply
//   sleep     -> waits arguments.ms milliseconds, then replies "slept"
//   whoami    -> replies with the provider name (--name, else $STDIO_TOOL_PROVIDER_NAME)
//   anything else echoes arguments.text (or the arguments as JSON)

#include "mcpchat/exceptions.hpp"
#include "mcpchat/wire/codec.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using mcpchat::Json;
namespace wire = mcpchat::wire;

namespace
{

struct Options
{
    std::string name{"stdio_tool_provider"};
    std::vector<std::string> tools;
    size_t page_size{0};
    std::string init_mode{"ok"};
    bool notify{false};
    bool ping{false};
    bool stubborn{false};
};

Options parse_args(int argc, char** argv)
{
    Options opts;
    if (const char* env_name = std::getenv("STDIO_TOOL_PROVIDER_NAME"))
        opts.name = env_name;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto next = [&]() -> std::string
        {
            if (i + 1 >= argc)
            {
                std::cerr << "missing value for " << arg << std::endl;
                std::exit(2);
            }
            return argv[++i];
        };
        if (arg == "--name")
            opts.name = next();
        else if (arg == "--tool")
            opts.tools.push_back(next());
        else if (arg == "--page-size")
            opts.page_size = static_cast<size_t>(std::stoul(next()));
        else if (arg == "--init-mode")
            opts.init_mode = next();
        else if (arg == "--notify")
            opts.notify = true;
        else if (arg == "--ping")
            opts.ping = true;
        else if (arg == "--stubborn")
            opts.stubborn = true;
        else
        {
            std::cerr << "unknown argument " << arg << std::endl;
            std::exit(2);
        }
    }
    if (opts.tools.empty())
        opts.tools.push_back("echo");
    return opts;
}

void emit(const std::string& line)
{
    std::cout << line << std::endl;
}

Json text_result(const std::string& text, bool is_error = false)
{
    return Json{{"content", Json::array({Json{{"type", "text"}, {"text", text}}})},
                {"isError", is_error}};
}

Json tool_entry(const std::string& name)
{
    return Json{{"name", name},
                {"description", "Test tool " + name},
                {"inputSchema",
                 Json{{"type", "object"},
                      {"properties", Json{{"text", Json{{"type", "string"}}}}}}}};
}

class Provider
{
  public:
    explicit Provider(Options opts) : opts_(std::move(opts)) {}

    /// @return false when the provider should exit
    bool handle(const wire::ServerRequest& req)
    {
        if (req.method == wire::method::INITIALIZE)
            return initialize(req);
        if (req.method == wire::method::TOOLS_LIST)
        {
            emit(wire::encode_result(req.id, list_tools(req.params)));
            return true;
        }
        if (req.method == wire::method::TOOLS_CALL)
        {
            call_tool(req);
            return true;
        }
        if (req.method == wire::method::PING)
        {
            emit(wire::encode_result(req.id, Json::object()));
            return true;
        }
        emit(wire::encode_error(req.id, wire::error_code::METHOD_NOT_FOUND,
                                "Method not found: " + req.method));
        return true;
    }

  private:
    bool initialize(const wire::ServerRequest& req)
    {
        const auto& mode = opts_.init_mode;
        if (mode == "exit")
            return false;
        if (mode == "silent")
            return true;
        if (mode == "garbage")
        {
            emit("this is not json");
            return true;
        }
        if (mode == "error")
        {
            emit(wire::encode_error(req.id, wire::error_code::INTERNAL_ERROR,
                                    "initialization refused"));
            return true;
        }
        Json result = {{"protocolVersion", wire::PROTOCOL_VERSION},
                       {"capabilities", Json{{"tools", Json::object()}}},
                       {"serverInfo", Json{{"name", opts_.name}, {"version", "1.0.0"}}},
                       {"instructions", "Tools for testing " + opts_.name}};
        emit(wire::encode_result(req.id, result));
        return true;
    }

    Json list_tools(const Json& params) const
    {
        size_t start = 0;
        if (params.is_object() && params.contains("cursor") && params["cursor"].is_string())
            start = static_cast<size_t>(std::stoul(params["cursor"].get<std::string>()));

        size_t end = opts_.tools.size();
        if (opts_.page_size > 0 && start + opts_.page_size < end)
            end = start + opts_.page_size;

        Json tools = Json::array();
        for (size_t i = start; i < end; ++i)
            tools.push_back(tool_entry(opts_.tools[i]));

        Json result = {{"tools", tools}};
        if (end < opts_.tools.size())
            result["nextCursor"] = std::to_string(end);
        return result;
    }

    void call_tool(const wire::ServerRequest& req)
    {
        const std::string name = req.params.value("name", "");
        const Json args = req.params.contains("arguments") ? req.params["arguments"]
                                                           : Json::object();
        bool known = false;
        for (const auto& t : opts_.tools)
            known = known || t == name;
        if (!known)
        {
            emit(wire::encode_error(req.id, wire::error_code::INVALID_PARAMS,
                                    "Unknown tool: " + name));
            return;
        }

        if (opts_.notify)
            emit(wire::encode(wire::Notification{
                "notifications/message",
                Json{{"level", "info"}, {"data", "calling " + name}}}));
        if (opts_.ping)
            emit(wire::encode(wire::Request{9000 + (++pings_), wire::method::PING, Json::object()}));

        if (name == "rpc_error")
        {
            emit(wire::encode_error(req.id, -32000, "tool exploded"));
            return;
        }
        if (name == "fail")
        {
            emit(wire::encode_result(req.id, text_result("failure requested", true)));
            return;
        }
        if (name == "sleep")
        {
            int ms = args.is_object() ? args.value("ms", 0) : 0;
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            emit(wire::encode_result(req.id, text_result("slept")));
            return;
        }
        if (name == "whoami")
        {
            emit(wire::encode_result(req.id, text_result(opts_.name)));
            return;
        }

        std::string text = args.is_object() && args.contains("text") && args["text"].is_string()
                               ? args["text"].get<std::string>()
                               : args.dump();
        emit(wire::encode_result(req.id, text_result(text)));
    }

    Options opts_;
    int pings_{0};
};

} // namespace

int main(int argc, char** argv)
{
    Options opts = parse_args(argc, argv);
    const bool stubborn = opts.stubborn;
    if (stubborn)
        std::signal(SIGTERM, SIG_IGN);

    Provider provider(std::move(opts));
    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line.empty())
            continue;
        try
        {
            auto inbound = wire::decode(line);
            // Replies (to our pings) and notifications need no answer.
            if (auto* req = std::get_if<wire::ServerRequest>(&inbound))
                if (!provider.handle(*req))
                    return 3;
        }
        catch (const mcpchat::ProtocolError& e)
        {
            emit(wire::encode_error(nullptr, wire::error_code::PARSE_ERROR, e.what()));
        }
    }

    // Ignores the stdin shutdown signal; only SIGKILL ends it.
    while (stubborn)
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    return 0;
}
