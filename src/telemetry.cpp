#include "mcpchat/telemetry.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <random>
#include <sstream>

namespace mcpchat::telemetry
{
namespace
{

std::mutex exporter_mutex;
std::shared_ptr<SpanExporter> installed_exporter;

// Contexts of the live SpanScopes on this thread, innermost last
thread_local std::vector<SpanContext> active_contexts;

std::string random_hex(size_t bytes)
{
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(0, 255);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes; ++i)
        oss << std::setw(2) << dist(gen);
    return oss.str();
}

void forget_context(const std::string& span_id)
{
    auto it = std::find_if(active_contexts.rbegin(), active_contexts.rend(),
                           [&](const SpanContext& c) { return c.span_id == span_id; });
    if (it != active_contexts.rend())
        active_contexts.erase(std::next(it).base());
}

} // namespace

void InMemorySpanExporter::export_span(const Span& span)
{
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.push_back(span);
}

std::vector<Span> InMemorySpanExporter::finished_spans() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_;
}

void InMemorySpanExporter::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.clear();
}

SpanScope::SpanScope(Span span) : span_(std::move(span)), uncaught_on_enter_(std::uncaught_exceptions())
{
    span_->start_time = std::chrono::steady_clock::now();
    active_contexts.push_back(span_->context);
}

SpanScope::SpanScope(SpanScope&& other) noexcept
    : span_(std::move(other.span_)), uncaught_on_enter_(other.uncaught_on_enter_)
{
    other.span_.reset();
}

SpanScope::~SpanScope()
{
    if (span_ && std::uncaught_exceptions() > uncaught_on_enter_)
        span_->status = StatusCode::Error;
    end();
}

void SpanScope::end()
{
    if (!span_)
        return;
    Span finished = std::move(*span_);
    span_.reset();

    finished.end_time = std::chrono::steady_clock::now();
    if (finished.status == StatusCode::Unset)
        finished.status = StatusCode::Ok;
    forget_context(finished.context.span_id);

    if (auto exporter = span_exporter())
        exporter->export_span(finished);
}

void set_span_exporter(std::shared_ptr<SpanExporter> exporter)
{
    std::lock_guard<std::mutex> lock(exporter_mutex);
    installed_exporter = std::move(exporter);
}

std::shared_ptr<SpanExporter> span_exporter()
{
    std::lock_guard<std::mutex> lock(exporter_mutex);
    return installed_exporter;
}

SpanScope start_span(const std::string& name, SpanKind kind)
{
    if (!span_exporter())
        return SpanScope{};

    Span span;
    span.name = name;
    span.kind = kind;
    auto parent = current_span_context();
    if (parent.is_valid())
    {
        span.parent = parent;
        span.context.trace_id = parent.trace_id;
    }
    else
    {
        span.context.trace_id = random_hex(16);
    }
    span.context.span_id = random_hex(8);
    return SpanScope(std::move(span));
}

SpanContext current_span_context()
{
    return active_contexts.empty() ? SpanContext{} : active_contexts.back();
}

std::optional<Json> inject_trace_context(const std::optional<Json>& meta)
{
    auto ctx = current_span_context();
    if (!ctx.is_valid())
        return meta;

    Json out = meta && meta->is_object() ? *meta : Json::object();
    // W3C traceparent, version 00, sampled
    out[TRACE_PARENT_KEY] = "00-" + ctx.trace_id + "-" + ctx.span_id + "-01";
    return out;
}

SpanScope session_span(size_t server_count)
{
    auto scope = start_span("session start");
    if (scope.active())
        scope.span().set_attribute("mcpchat.session.servers", server_count);
    return scope;
}

SpanScope request_span(const std::string& server_name, const std::string& method)
{
    auto scope = start_span(method + " " + server_name, SpanKind::Client);
    if (scope.active())
    {
        scope.span().set_attribute("rpc.system", "jsonrpc");
        scope.span().set_attribute("rpc.method", method);
        scope.span().set_attribute("mcpchat.server.name", server_name);
    }
    return scope;
}

SpanScope run_span(size_t tool_count)
{
    auto scope = start_span("conversation run");
    if (scope.active())
        scope.span().set_attribute("mcpchat.tools.available", tool_count);
    return scope;
}

SpanScope completion_span(int round)
{
    auto scope = start_span("completion", SpanKind::Client);
    if (scope.active())
        scope.span().set_attribute("mcpchat.round", round);
    return scope;
}

SpanScope tool_span(const std::string& tool_name, const std::string& call_id)
{
    auto scope = start_span("tool " + tool_name);
    if (scope.active())
    {
        scope.span().set_attribute("mcpchat.tool.name", tool_name);
        scope.span().set_attribute("mcpchat.tool.call_id", call_id);
    }
    return scope;
}

} // namespace mcpchat::telemetry
