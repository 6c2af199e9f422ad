/// @file tests/engine/conversation_engine.cpp
/// @brief Completion / dispatch loop against fake providers and a scripted model

#include "mcpchat/engine/conversation_engine.hpp"
#include "mcpchat/exceptions.hpp"
#include "mcpchat/session/session_manager.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

using namespace mcpchat;
using namespace mcpchat::testing;
using engine::ConversationEngine;
using engine::EngineOptions;
using engine::EngineState;

namespace
{

struct Fixture
{
    FakeProviders fakes;
    std::unique_ptr<session::SessionManager> session;

    Fixture()
    {
        fakes.add("fs", {"read_file"}).on_call = [](const std::string&,
                                                    const Json& args) -> std::optional<Json>
        {
            if (args.value("path", "") == "intro.md")
                return text_reply("Hello");
            if (args.value("path", "") == "odd.md")
                return Json{{"result",
                             Json{{"content", Json::array({Json{{"type", 1}, {"text", "x"}}})}}}};
            return text_reply("no such file: " + args.value("path", ""), true);
        };
        fakes.add("web", {"search"});

        session::SessionOptions opts;
        opts.transport_factory = fakes.factory();
        session = std::make_unique<session::SessionManager>(opts);
        session->start({spec_for("fs"), spec_for("web")});
    }

    const session::ToolRegistry& registry() const
    {
        return session->registry();
    }
};

EngineOptions rounds(int n)
{
    EngineOptions opts;
    opts.max_rounds = n;
    return opts;
}

void test_plain_answer()
{
    Fixture f;
    ScriptedCompletionService model;
    model.reply_text("Hi there");

    Conversation convo{Message::user("hello")};
    ConversationEngine engine;
    auto& out = engine.run(convo, f.registry(), model);
    assert(&out == &convo);
    assert(model.calls == 1);
    assert(engine.rounds() == 1);
    assert(engine.state() == EngineState::Done);
    assert(convo.size() == 2);
    assert(convo[1].role == Role::Assistant);
    assert(convo[1].content == "Hi there");
    assert(model.seen_schemas[0].size() == 2);
    std::cout << "[PASS] reply without tool calls ends the run" << std::endl;
}

void test_read_file_scenario()
{
    Fixture f;
    ScriptedCompletionService model;
    model.reply_calls({make_call("c1", "read_file", Json{{"path", "intro.md"}})});
    model.reply_text("The file contains: Hello");

    Conversation convo{Message::user("What does intro.md say?")};
    ConversationEngine engine;
    engine.run(convo, f.registry(), model);

    assert(convo.size() == 3);
    assert(convo[0].role == Role::User);
    assert(convo[1].role == Role::Tool);
    assert(convo[1].content == "Hello");
    assert(convo[1].tool_call_id == std::optional<std::string>("c1"));
    assert(convo[1].answered_call->name == "read_file");
    assert(convo[2].role == Role::Assistant);
    assert(convo[2].content == "The file contains: Hello");

    // the second completion saw the tool result
    assert(model.seen_conversations[1].size() == 2);
    assert(model.seen_conversations[1][1].content == "Hello");
    std::cout << "[PASS] one tool round then the answer" << std::endl;
}

void test_multiple_rounds_in_order()
{
    Fixture f;
    ScriptedCompletionService model;
    model.reply_calls({make_call("a1", "read_file", Json{{"path", "intro.md"}}),
                       make_call("a2", "search", Json{{"q", "x"}})});
    model.reply_calls({make_call("b1", "search")});
    model.reply_text("done");

    Conversation convo{Message::user("go")};
    ConversationEngine engine;
    engine.run(convo, f.registry(), model);

    assert(model.calls == 3);
    assert(convo.size() == 5);
    assert(*convo[1].tool_call_id == "a1");
    assert(*convo[2].tool_call_id == "a2");
    assert(convo[2].content == "web:search");
    assert(*convo[3].tool_call_id == "b1");
    assert(convo[1].round == std::optional<int>(1));
    assert(convo[2].round == std::optional<int>(1));
    assert(convo[3].round == std::optional<int>(2));
    assert(convo[4].content == "done");
    assert(f.fakes.server("web").called.size() == 2);
    std::cout << "[PASS] tool results appended in emission order" << std::endl;
}

void test_tool_failures_fed_back()
{
    Fixture f;
    ScriptedCompletionService model;
    model.reply_calls({make_call("c1", "teleport"),
                       make_call("c2", "read_file", Json{{"path", "missing.md"}})});
    model.reply_text("Sorry, I could not do that.");

    Conversation convo{Message::user("teleport me")};
    ConversationEngine engine;
    engine.run(convo, f.registry(), model);

    assert(engine.state() == EngineState::Done);
    assert(convo[1].is_error);
    assert(convo[1].content == "Error: Tool 'teleport' not found");
    assert(convo[2].is_error);
    assert(convo[2].content == "Error: no such file: missing.md");
    assert(convo.back().content == "Sorry, I could not do that.");
    std::cout << "[PASS] tool failures reach the model and the loop continues" << std::endl;
}

void test_malformed_tool_reply_does_not_end_run()
{
    Fixture f;
    ScriptedCompletionService model;
    model.reply_calls({make_call("c1", "read_file", Json{{"path", "odd.md"}})});
    model.reply_text("That file looks odd.");

    Conversation convo{Message::user("read odd.md")};
    ConversationEngine engine;
    engine.run(convo, f.registry(), model);

    assert(engine.state() == EngineState::Done);
    assert(model.calls == 2);
    assert(convo.size() == 3);
    assert(convo[1].role == Role::Tool);
    assert(convo[1].content.find("\"text\":\"x\"") != std::string::npos);
    assert(convo[2].content == "That file looks odd.");
    std::cout << "[PASS] malformed tool reply still reaches the model" << std::endl;
}

void test_completion_failure_preserves_conversation()
{
    Fixture f;
    ScriptedCompletionService model;
    model.reply_calls({make_call("c1", "read_file", Json{{"path", "intro.md"}})});
    model.fail_next("upstream unavailable");

    Conversation convo{Message::user("read it")};
    ConversationEngine engine;
    bool threw = false;
    try
    {
        engine.run(convo, f.registry(), model);
    }
    catch (const CompletionError& e)
    {
        threw = true;
        assert(e.http_status == 503L);
    }
    assert(threw);
    assert(engine.state() == EngineState::Failed);
    assert(convo.size() == 2);
    assert(convo[1].content == "Hello");
    std::cout << "[PASS] CompletionError leaves the conversation intact" << std::endl;
}

void test_loop_limit()
{
    Fixture f;
    ScriptedCompletionService model;
    model.repeat_call = make_call("r", "search");

    Conversation convo{Message::user("loop forever")};
    ConversationEngine engine(rounds(3));
    bool threw = false;
    try
    {
        engine.run(convo, f.registry(), model);
    }
    catch (const LoopLimitExceeded& e)
    {
        threw = true;
        assert(e.rounds == 3);
    }
    assert(threw);
    assert(model.calls == 3);
    assert(engine.state() == EngineState::Failed);
    // user + one tool message per round
    assert(convo.size() == 4);
    assert(convo.back().role == Role::Tool);
    std::cout << "[PASS] loop limit stops runaway tool use" << std::endl;
}

void test_system_prompt_insertion()
{
    Fixture f;
    {
        ScriptedCompletionService model;
        model.reply_text("ok");
        Conversation convo;
        ConversationEngine engine;
        engine.run(convo, f.registry(), model);
        assert(convo.size() == 2);
        assert(convo[0].role == Role::System);
        assert(convo[0].content.find("\"read_file\"") != std::string::npos);
        assert(convo[0].content.find("\"search\"") != std::string::npos);
    }
    {
        ScriptedCompletionService model;
        model.reply_text("ok");
        Conversation convo{Message::user("hi")};
        ConversationEngine engine;
        engine::RunOptions run;
        run.add_system_prompt = true;
        engine.run(convo, f.registry(), model, run);
        assert(convo.size() == 3);
        assert(convo[0].role == Role::System);
        assert(convo[1].role == Role::User);
        assert(model.seen_conversations[0][0].role == Role::System);
    }
    std::cout << "[PASS] system prompt prepended when requested or empty" << std::endl;
}

void test_generated_prompt_sections()
{
    Fixture f;
    engine::SystemPromptOptions opts;
    opts.user_system_prompt = "Be brief.";
    opts.tool_config = "Root is /tmp.";
    auto text = engine::generate_system_prompt(f.registry(), opts);
    auto tools_at = text.find("\"tools\"");
    auto prompt_at = text.find("Be brief.");
    auto config_at = text.find("Root is /tmp.");
    auto guidelines_at = text.find("GENERAL GUIDELINES");
    assert(tools_at != std::string::npos);
    assert(tools_at < prompt_at && prompt_at < config_at && config_at < guidelines_at);

    opts.include_guidelines = false;
    assert(engine::generate_system_prompt(f.registry(), opts).find("GENERAL GUIDELINES") ==
           std::string::npos);
    std::cout << "[PASS] system prompt sections in order" << std::endl;
}

void test_options()
{
    bool threw = false;
    try
    {
        ConversationEngine bad(rounds(0));
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);

    Settings s;
    s.max_rounds = 4;
    s.request_timeout_ms = 1500;
    auto opts = EngineOptions::from_settings(s);
    assert(opts.max_rounds == 4);
    assert(opts.tool_timeout == std::chrono::milliseconds(1500));
    assert(engine::to_string(EngineState::DispatchingTools) == "dispatching_tools");
    std::cout << "[PASS] engine options" << std::endl;
}

} // namespace

int main()
{
    std::cout << "=== conversation engine tests ===\n\n";
    test_plain_answer();
    test_read_file_scenario();
    test_multiple_rounds_in_order();
    test_tool_failures_fed_back();
    test_malformed_tool_reply_does_not_end_run();
    test_completion_failure_preserves_conversation();
    test_loop_limit();
    test_system_prompt_insertion();
    test_generated_prompt_sections();
    test_options();
    std::cout << "\n[OK] conversation engine tests passed" << std::endl;
    return 0;
}
