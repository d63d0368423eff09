#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace flowstead::observability {
namespace {

constexpr const char* kLoggerName     = "flowstead";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::string ResolveLevel(const flowstead::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("FLOWSTEAD_LOG_LEVEL")) {
    return level;
  }
  return config.logging().level().empty() ? "info" : config.logging().level();
}

std::string ResolvePattern(const flowstead::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("FLOWSTEAD_LOG_PATTERN")) {
    return pattern;
  }
  return config.logging().pattern().empty() ? kDefaultPattern : config.logging().pattern();
}

bool ResolveTraceContextEnabled(const flowstead::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("FLOWSTEAD_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    return value == "1" || value == "true";
  }
  return config.logging().include_trace_context();
}

std::atomic<bool> g_include_trace_context{false};

// Values containing spaces are quoted so the line stays key=value parseable.
std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) out << ' ';
    first = false;

    out << field.key << '=';
    if (field.value.find(' ') != std::string::npos) {
      out << '"' << field.value << '"';
    } else {
      out << field.value;
    }
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) return {};

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return {};

  auto context = span->GetContext();
  if (!context.IsValid()) return {};

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const flowstead::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  auto serialized_fields = SerializeFields(fields);
  auto trace_fields      = TraceContextFields();

  if (!serialized_fields.empty() && !trace_fields.empty()) {
    spdlog::log(level, "{} {} {}", message, serialized_fields, trace_fields);
  } else if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
  } else if (!trace_fields.empty()) {
    spdlog::log(level, "{} {}", message, trace_fields);
  } else {
    spdlog::log(level, "{}", message);
  }
}

} // namespace flowstead::observability
