#pragma once

#include <string>
#include <string_view>

namespace flowstead::runtime::config {
class RuntimeConfig;
}

namespace flowstead::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings shared by tracing and metrics.
struct OtlpConfig {
  std::string   endpoint;
  OtlpTransport transport = OtlpTransport::kGrpc;
  std::string   instance_id; // service.instance.id; empty when generated at startup
};

OtlpConfig ToOtlpConfig(const flowstead::runtime::config::RuntimeConfig& config);

// Explicit endpoint, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the
// transport. signal is "traces" or "metrics".
std::string ResolveEndpoint(const OtlpConfig& config, std::string_view signal);

} // namespace flowstead::observability
