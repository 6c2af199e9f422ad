// mcpchat OpenTelemetry-style tracing (no-op unless an exporter is installed)
#pragma once

#include "mcpchat/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpchat::telemetry
{

constexpr const char* INSTRUMENTATION_NAME = "mcpchat";
/// Key under a tools/call request's `_meta` carrying a W3C traceparent
constexpr const char* TRACE_PARENT_KEY = "mcpchat.traceparent";

struct SpanContext
{
    std::string trace_id; ///< 32 hex chars
    std::string span_id;  ///< 16 hex chars

    bool is_valid() const
    {
        return trace_id.size() == 32 && span_id.size() == 16;
    }
};

enum class SpanKind
{
    Internal,
    Client
};

enum class StatusCode
{
    Unset,
    Ok,
    Error
};

struct Span
{
    std::string name;
    std::string instrumentation_name{INSTRUMENTATION_NAME};
    SpanKind kind{SpanKind::Internal};
    SpanContext context;
    std::optional<SpanContext> parent;
    StatusCode status{StatusCode::Unset};
    std::map<std::string, Json> attributes;
    std::optional<std::string> exception_message;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;

    void set_attribute(const std::string& key, Json value)
    {
        attributes[key] = std::move(value);
    }

    void record_exception(const std::string& message)
    {
        exception_message = message;
        status = StatusCode::Error;
    }

    std::chrono::microseconds duration() const
    {
        return std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
    }
};

class SpanExporter
{
  public:
    virtual ~SpanExporter() = default;
    virtual void export_span(const Span& span) = 0;
};

/// Collects finished spans; safe to share between threads.
class InMemorySpanExporter : public SpanExporter
{
  public:
    void export_span(const Span& span) override;
    std::vector<Span> finished_spans() const;
    void reset();

  private:
    mutable std::mutex mutex_;
    std::vector<Span> spans_;
};

/// Current span of the calling thread while alive. Exported on destruction;
/// unwinding through the scope marks the span Error.
class SpanScope
{
  public:
    SpanScope() = default;
    explicit SpanScope(Span span);
    SpanScope(const SpanScope&) = delete;
    SpanScope& operator=(const SpanScope&) = delete;
    SpanScope(SpanScope&& other) noexcept;
    SpanScope& operator=(SpanScope&& other) = delete;
    ~SpanScope();

    bool active() const
    {
        return span_.has_value();
    }

    /// Requires active()
    Span& span()
    {
        return *span_;
    }

    void end();

  private:
    std::optional<Span> span_;
    int uncaught_on_enter_{0};
};

void set_span_exporter(std::shared_ptr<SpanExporter> exporter);
std::shared_ptr<SpanExporter> span_exporter();

/// Child of the calling thread's current span, or a new trace root.
/// Inactive when no exporter is installed.
SpanScope start_span(const std::string& name, SpanKind kind = SpanKind::Internal);

SpanContext current_span_context();

/// `meta` plus the current traceparent; `meta` unchanged when no span is active.
std::optional<Json> inject_trace_context(const std::optional<Json>& meta);

SpanScope session_span(size_t server_count);
SpanScope request_span(const std::string& server_name, const std::string& method);
SpanScope run_span(size_t tool_count);
SpanScope completion_span(int round);
SpanScope tool_span(const std::string& tool_name, const std::string& call_id);

} // namespace mcpchat::telemetry
