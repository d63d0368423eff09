#pragma once

#include <memory>
#include <string_view>

namespace flowstead::runtime::config {
class RuntimeConfig;
}

namespace flowstead::observability {

// Install OTLP exporters when the config enables them. Without
// ENABLE_OTEL these return false and spans and metrics are dropped.
bool InitializeTracing(const flowstead::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const flowstead::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span. Without ENABLE_OTEL every member is an inline no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void ObserveDecisionLatencyMs(std::string_view workflow_type, double latency_ms);
  // outcome: completed, retried, failed, timed_out
  void RecordActivityAttempt(std::string_view activity_type, std::string_view outcome);
  void RecordWorkflowClosed(std::string_view workflow_type, std::string_view status);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const flowstead::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const flowstead::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveDecisionLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordActivityAttempt(std::string_view, std::string_view) {
}

inline void Metrics::RecordWorkflowClosed(std::string_view, std::string_view) {
}
#endif

} // namespace flowstead::observability
