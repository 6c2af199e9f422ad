#include "mcpchat/exceptions.hpp"
#include "mcpchat/logging.hpp"
#include "mcpchat/types.hpp"
#include "mcpchat/util/json.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

using mcpchat::Json;
using mcpchat::Message;
using mcpchat::Role;
using mcpchat::ToolCall;
using mcpchat::ToolResult;

void test_tool_message_framing()
{
    ToolCall call{"call_7", "read_file", Json{{"path", "a"}}};
    auto ok = Message::tool(call, ToolResult{"call_7", "Hello", false});
    assert(ok.role == Role::Tool);
    assert(ok.content == "Hello");
    assert(!ok.is_error);
    assert(*ok.tool_call_id == "call_7");
    assert(ok.answered_call->name == "read_file");

    auto failed = Message::tool(call, ToolResult{"call_7", "file not found", true});
    assert(failed.is_error);
    assert(failed.content == "Error: file not found");
    std::cout << "  Tool message framing: PASS\n";
}

void test_message_json()
{
    Message assistant = Message::assistant("");
    assistant.tool_calls.push_back(ToolCall{"c1", "search", Json{{"q", "x"}}});
    Json j = assistant;
    assert(j["role"] == "assistant");
    assert(j["tool_calls"][0]["name"] == "search");
    assert(j["tool_calls"][0]["arguments"]["q"] == "x");

    // null content from presentation layers
    auto parsed = Json::parse(
        R"({"role":"assistant","content":null,"tool_calls":[{"id":"c1","name":"search"}]})")
                      .get<Message>();
    assert(parsed.content.empty());
    assert(parsed.tool_calls.size() == 1);
    assert(parsed.tool_calls[0].arguments.is_object());

    auto tool_msg = Json::parse(
        R"({"role":"tool","content":"Error: boom","tool_call_id":"c1","name":"search","is_error":true})")
                        .get<Message>();
    assert(tool_msg.role == Role::Tool);
    assert(tool_msg.is_error);
    assert(tool_msg.answered_call && tool_msg.answered_call->id == "c1");

    Json back = tool_msg;
    assert(back["name"] == "search");
    assert(back["is_error"] == true);
    assert(!back.contains("round"));

    auto in_round = Message::tool(ToolCall{"c2", "search", Json::object()}, {"c2", "ok", false}, 3);
    Json round_json = in_round;
    assert(round_json["round"] == 3);
    assert(round_json.get<Message>().round == std::optional<int>(3));

    bool threw = false;
    try
    {
        Json{{"role", "narrator"}, {"content", "x"}}.get<Message>();
    }
    catch (const mcpchat::ValidationError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "  Message JSON: PASS\n";
}

void test_normalize_arguments()
{
    using mcpchat::util::json::normalize_arguments;
    assert(normalize_arguments(Json()).is_object());
    assert(normalize_arguments(Json("")).is_object());
    assert(normalize_arguments(Json(R"({"a":1})"))["a"] == 1);
    assert(normalize_arguments(Json("not json")) == Json("not json"));
    assert(normalize_arguments(Json::array()).is_array());
    std::cout << "  Argument normalization: PASS\n";
}

void test_logging_levels()
{
    namespace log = mcpchat::log;
    std::ostringstream out;
    log::set_sink(&out);
    log::set_level(log::level_from_string("warn"));
    log::info("test", "hidden");
    log::warn("test", "shown");
    log::error("test", "also shown");
    log::set_sink(nullptr);
    log::set_level(log::Level::Info);

    const std::string text = out.str();
    assert(text.find("hidden") == std::string::npos);
    assert(text.find("[mcpchat] [WARN] test: shown") != std::string::npos);
    assert(text.find("[ERROR] test: also shown") != std::string::npos);
    assert(log::level_from_string("DEBUG") == log::Level::Debug);
    assert(log::level_from_string("\xC3\x89RROR") == log::Level::Info);
    assert(log::level_from_string("\xFF") == log::Level::Info);
    std::cout << "  Logging levels: PASS\n";
}

int main()
{
    std::cout << "Core types tests\n";
    test_tool_message_framing();
    test_message_json();
    test_normalize_arguments();
    test_logging_levels();
    std::cout << "All core types tests passed\n";
    return 0;
}
