#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_config.hpp"

namespace flowstead::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", "flowstead"}};
  if (!config.instance_id.empty()) {
    attrs.SetAttribute("service.instance.id", config.instance_id);
  }
  return resource::Resource::Create(attrs);
}

bool StartTracing(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config, "traces");

  std::unique_ptr<sdktrace::SpanExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcExporterOptions options;
    options.endpoint = endpoint;
    exporter         = otlp::OtlpGrpcExporterFactory::Create(options);
  }

  auto span_processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
  auto provider       = sdktrace::TracerProviderFactory::Create(std::move(span_processor), BuildResource(config));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer("flowstead", "0.1.0");
  return static_cast<bool>(g_tracer);
}

} // namespace

bool InitializeTracing(const flowstead::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }
  return StartTracing(ToOtlpConfig(config));
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    auto provider = trace_api::Provider::GetTracerProvider();
    if (provider) {
      g_tracer = provider->GetTracer("flowstead", "0.1.0");
    }
  }

  if (!g_tracer) {
    return;
  }

  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace flowstead::observability

#endif
