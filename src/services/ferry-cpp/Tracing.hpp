#pragma once

#include <string>

#if FERRY_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/tracer.h>
#endif

struct TraceConfig {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName;
};

struct SpanHandle {
    std::string traceparent;
    bool valid = false;
#if FERRY_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);

    SpanHandle StartSpan(const std::string& name);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void EndSpan(SpanHandle& handle, bool success);
    void Shutdown();

private:
    Tracer() = default;

    bool enabled_ = false;
#if FERRY_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};

// One pipeline step. The span ends as failed unless Succeed() was called.
class StepSpan {
public:
    StepSpan(const std::string& name, const std::string& containerId);
    ~StepSpan();

    StepSpan(const StepSpan&) = delete;
    StepSpan& operator=(const StepSpan&) = delete;

    void Succeed() { success_ = true; }
    void Annotate(const std::string& key, const std::string& value);
    const std::string& TraceParent() const { return handle_.traceparent; }

private:
    SpanHandle handle_;
    bool success_ = false;
};
