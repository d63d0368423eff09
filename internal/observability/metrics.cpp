#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_config.hpp"

namespace flowstead::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Instrument, typename Value>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value,
                       std::initializer_list<AttributePair> attributes) {
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, attributes);
  }
}

template <typename Instrument, typename Value>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value,
                          std::initializer_list<AttributePair> attributes) {
  if constexpr (requires { instrument->Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      decision_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> activity_attempts;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> workflows_closed;
};

namespace {

bool StartMetrics(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config, "metrics");

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint = endpoint;
    exporter         = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", "flowstead"}};
  if (!config.instance_id.empty()) {
    attrs.SetAttribute("service.instance.id", config.instance_id);
  }
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

bool InitializeMetrics(const flowstead::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }
  return StartMetrics(ToOtlpConfig(config));
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("flowstead", "0.1.0");

  impl_->request_count = impl_->meter->CreateUInt64Counter("flowstead.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms =
      impl_->meter->CreateDoubleHistogram("flowstead.request.latency_ms", "End-to-end request latency in milliseconds", "ms");
  impl_->decision_latency_ms =
      impl_->meter->CreateDoubleHistogram("flowstead.decision.latency_ms", "Decision cycle duration in milliseconds", "ms");
  impl_->activity_attempts =
      impl_->meter->CreateUInt64Counter("flowstead.activity.attempts", "Activity attempts by outcome", "1");
  impl_->workflows_closed =
      impl_->meter->CreateUInt64Counter("flowstead.workflow.closed", "Workflow runs closed by terminal status", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1),
                    {{"route", std::string(route)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, {{"route", std::string(route)}});
}

void Metrics::ObserveDecisionLatencyMs(std::string_view workflow_type, double latency_ms) {
  RecordWithAttributes(impl_->decision_latency_ms, latency_ms, {{"workflow_type", std::string(workflow_type)}});
}

void Metrics::RecordActivityAttempt(std::string_view activity_type, std::string_view outcome) {
  AddWithAttributes(impl_->activity_attempts, static_cast<std::uint64_t>(1),
                    {{"activity_type", std::string(activity_type)}, {"outcome", std::string(outcome)}});
}

void Metrics::RecordWorkflowClosed(std::string_view workflow_type, std::string_view status) {
  AddWithAttributes(impl_->workflows_closed, static_cast<std::uint64_t>(1),
                    {{"workflow_type", std::string(workflow_type)}, {"status", std::string(status)}});
}

} // namespace flowstead::observability

#endif
