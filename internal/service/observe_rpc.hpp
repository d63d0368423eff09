#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace flowstead::service {

// Span, request metrics and an error log line around one service call.
// Exceptions are rethrown unchanged.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view workflow_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!workflow_id.empty()) {
    span.SetAttribute("workflow.id", workflow_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool ok) {
    auto& metrics = observability::Metrics::Instance();
    metrics.RecordRequest(route, ok);
    metrics.ObserveRequestLatencyMs(route,
                                    std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    FLOWSTEAD_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("workflow_id", workflow_id),
                                       observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace flowstead::service
