/// @file tests/engine/tool_dispatcher.cpp
/// @brief Routing tool calls and turning failures into error results

#include "mcpchat/engine/tool_dispatcher.hpp"
#include "mcpchat/session/session_manager.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>

using namespace mcpchat;
using namespace mcpchat::testing;
using engine::ToolDispatcher;

namespace
{

struct Fixture
{
    FakeProviders fakes;
    std::unique_ptr<session::SessionManager> session;

    Fixture()
    {
        fakes.add("fs", {"read_file", "broken", "hangs", "flaky", "mangled", "crashes"});
        fakes.add("web", {"search"});
        fakes.server("fs").on_call = [](const std::string& tool,
                                        const Json& args) -> std::optional<Json>
        {
            if (tool == "read_file")
                return text_reply("contents of " + args.value("path", "?"));
            if (tool == "broken")
                return error_reply(-32000, "disk on fire");
            if (tool == "hangs")
                return std::nullopt;
            if (tool == "mangled")
                return Json{{"result",
                             Json{{"content", Json::array({Json{{"type", 1}, {"text", "x"}}})}}}};
            if (tool == "crashes")
                throw std::runtime_error("provider handler crashed");
            return text_reply("permission denied", true);
        };

        session::SessionOptions opts;
        opts.transport_factory = fakes.factory();
        opts.close_timeout = std::chrono::milliseconds(50);
        session = std::make_unique<session::SessionManager>(opts);
        session->start({spec_for("fs"), spec_for("web")});
    }

    const session::ToolRegistry& registry() const
    {
        return session->registry();
    }
};

void test_routes_to_owner()
{
    Fixture f;
    ToolDispatcher dispatcher;
    auto r = dispatcher.dispatch(make_call("c1", "read_file", Json{{"path", "a.txt"}}), f.registry());
    assert(!r.is_error);
    assert(r.tool_call_id == "c1");
    assert(r.content == "contents of a.txt");

    auto s = dispatcher.dispatch(make_call("c2", "search"), f.registry());
    assert(s.content == "web:search");
    assert((f.fakes.server("web").called == std::vector<std::string>{"search"}));
    assert(f.fakes.server("web").call_params[0]["arguments"].is_object());
    std::cout << "[PASS] call routed to the owning server" << std::endl;
}

void test_unknown_tool()
{
    Fixture f;
    ToolDispatcher dispatcher;
    auto r = dispatcher.dispatch(make_call("c9", "delete_everything"), f.registry());
    assert(r.is_error);
    assert(r.tool_call_id == "c9");
    assert(r.content == "Tool 'delete_everything' not found");
    assert(f.fakes.server("fs").called.empty());
    std::cout << "[PASS] unknown tool becomes an error result" << std::endl;
}

void test_argument_normalization()
{
    Fixture f;
    ToolDispatcher dispatcher;

    // arguments delivered as a JSON-encoded string are decoded first
    auto r = dispatcher.dispatch(make_call("c1", "read_file", Json(R"({"path":"b.md"})")),
                                 f.registry());
    assert(!r.is_error);
    assert(r.content == "contents of b.md");

    auto bad = dispatcher.dispatch(make_call("c2", "read_file", Json::array({1, 2})), f.registry());
    assert(bad.is_error);
    assert(bad.content.find("must be a JSON object") != std::string::npos);

    auto null_args = dispatcher.dispatch(make_call("c3", "search", Json()), f.registry());
    assert(!null_args.is_error);
    std::cout << "[PASS] arguments normalized, non-objects rejected" << std::endl;
}

void test_provider_failures_become_results()
{
    Fixture f;
    ToolDispatcher dispatcher(std::chrono::milliseconds(50));

    auto rpc = dispatcher.dispatch(make_call("c1", "broken"), f.registry());
    assert(rpc.is_error);
    assert(rpc.content.find("disk on fire") != std::string::npos);

    auto soft = dispatcher.dispatch(make_call("c2", "flaky"), f.registry());
    assert(soft.is_error);
    assert(soft.content == "permission denied");
    assert(soft.tool_call_id == "c2");

    auto timeout = dispatcher.dispatch(make_call("c3", "hangs"), f.registry());
    assert(timeout.is_error);
    assert(timeout.tool_call_id == "c3");

    // the connection keeps working after a timeout
    auto ok = dispatcher.dispatch(make_call("c4", "read_file", Json{{"path", "x"}}), f.registry());
    assert(!ok.is_error);
    std::cout << "[PASS] provider errors and timeouts become error results" << std::endl;
}

void test_malformed_replies()
{
    Fixture f;
    ToolDispatcher dispatcher;

    // a content block with a non-string type is rendered, not fatal
    auto mangled = dispatcher.dispatch(make_call("m1", "mangled"), f.registry());
    assert(!mangled.is_error);
    assert(mangled.tool_call_id == "m1");
    assert(mangled.content.find("\"type\":1") != std::string::npos);

    // a non-mcpchat exception from the transport becomes an error result
    auto crashed = dispatcher.dispatch(make_call("m2", "crashes"), f.registry());
    assert(crashed.is_error);
    assert(crashed.tool_call_id == "m2");
    assert(crashed.content == "provider handler crashed");
    std::cout << "[PASS] malformed replies and foreign exceptions become results" << std::endl;
}

void test_closed_connection()
{
    Fixture f;
    f.session->stop();
    ToolDispatcher dispatcher;
    auto r = dispatcher.dispatch(make_call("c1", "search"), f.registry());
    assert(r.is_error);
    assert(r.content.find("closed") != std::string::npos);
    std::cout << "[PASS] call after stop becomes an error result" << std::endl;
}

} // namespace

int main()
{
    std::cout << "=== tool dispatcher tests ===\n\n";
    test_routes_to_owner();
    test_unknown_tool();
    test_argument_normalization();
    test_provider_failures_become_results();
    test_malformed_replies();
    test_closed_connection();
    std::cout << "\n[OK] tool dispatcher tests passed" << std::endl;
    return 0;
}
