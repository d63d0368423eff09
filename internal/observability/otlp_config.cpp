#include "internal/observability/otlp_config.hpp"

#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"

namespace flowstead::observability {

OtlpConfig ToOtlpConfig(const flowstead::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint    = observability.otlp_endpoint();
  otlp.transport   = observability.transport() == flowstead::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                 : OtlpTransport::kGrpc;
  otlp.instance_id = config.engine().instance_id();
  return otlp;
}

std::string ResolveEndpoint(const OtlpConfig& config, std::string_view signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  std::string variable = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) {
    variable.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  variable += "_ENDPOINT";
  if (const char* endpoint = std::getenv(variable.c_str())) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return "http://localhost:4318/v1/" + std::string(signal);
  }
  return "localhost:4317";
}

} // namespace flowstead::observability
