/// @brief OpenTelemetry-style tracing tests for mcpchat

#include "mcpchat/engine/conversation_engine.hpp"
#include "mcpchat/session/session_manager.hpp"
#include "mcpchat/telemetry.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using namespace mcpchat;
using namespace mcpchat::testing;

namespace
{

const telemetry::Span* find_span(const std::vector<telemetry::Span>& spans,
                                 const std::string& name)
{
    for (const auto& span : spans)
        if (span.name == name)
            return &span;
    return nullptr;
}

size_t count_spans(const std::vector<telemetry::Span>& spans, const std::string& name)
{
    size_t n = 0;
    for (const auto& span : spans)
        n += span.name == name ? 1 : 0;
    return n;
}

} // namespace

int main()
{
    auto exporter = std::make_shared<telemetry::InMemorySpanExporter>();

    // Tracing off: no spans, no _meta on the wire
    {
        FakeProviders fakes;
        fakes.add("fs", {"read_file"});
        session::SessionOptions opts;
        opts.transport_factory = fakes.factory();
        session::SessionManager session(opts);
        session.start({spec_for("fs")});
        session.connection("fs")->invoke("read_file", Json::object());
        assert(!fakes.server("fs").call_params[0].contains("_meta"));
        assert(!telemetry::inject_trace_context(std::nullopt).has_value());
    }

    telemetry::set_span_exporter(exporter);

    exporter->reset();
    {
        auto span = telemetry::start_span("test-span");
        assert(span.active());
        auto meta = telemetry::inject_trace_context(Json{{"progressToken", 1}});
        assert(meta.has_value());
        assert((*meta)["progressToken"] == 1);
        const std::string traceparent = (*meta)[telemetry::TRACE_PARENT_KEY];
        assert(traceparent.rfind("00-" + span.span().context.trace_id + "-", 0) == 0);
    }
    const auto& spans1 = exporter->finished_spans();
    assert(spans1.size() == 1);
    assert(spans1[0].instrumentation_name == telemetry::INSTRUMENTATION_NAME);
    assert(spans1[0].status == telemetry::StatusCode::Ok);
    assert(spans1[0].end_time >= spans1[0].start_time);
    assert(!telemetry::current_span_context().is_valid());

    exporter->reset();
    FakeProviders fakes;
    fakes.add("fs", {"read_file"});
    {
        session::SessionOptions opts;
        opts.transport_factory = fakes.factory();
        session::SessionManager session(opts);
        session.start({spec_for("fs")});

        ScriptedCompletionService model;
        model.reply_calls({make_call("c1", "read_file", Json{{"path", "a"}}), make_call("c2", "nope")});
        model.reply_text("done");

        Conversation convo{Message::user("go")};
        engine::ConversationEngine engine;
        engine.run(convo, session.registry(), model);
    }

    const auto& spans2 = exporter->finished_spans();
    assert(find_span(spans2, "session start") != nullptr);
    assert(count_spans(spans2, "completion") == 2);

    const auto* run = find_span(spans2, "conversation run");
    const auto* tool = find_span(spans2, "tool read_file");
    const auto* call = find_span(spans2, "tools/call fs");
    const auto* missing = find_span(spans2, "tool nope");
    assert(run && tool && call && missing);
    assert(tool->parent && tool->parent->span_id == run->context.span_id);
    assert(call->parent && call->parent->span_id == tool->context.span_id);
    assert(call->kind == telemetry::SpanKind::Client);
    assert(call->attributes.at("rpc.method") == "tools/call");
    assert(call->attributes.at("mcpchat.server.name") == "fs");
    assert(tool->attributes.at("mcpchat.tool.call_id") == "c1");
    assert(missing->status == telemetry::StatusCode::Error);

    // the provider received the caller's trace context
    const auto& params = fakes.server("fs").call_params.at(0);
    assert(params.contains("_meta"));
    const std::string traceparent = params["_meta"][telemetry::TRACE_PARENT_KEY];
    assert(traceparent == "00-" + tool->context.trace_id + "-" + tool->context.span_id + "-01");

    telemetry::set_span_exporter(nullptr);
    std::cout << "mcpchat_telemetry: PASS\n";
    return 0;
}
