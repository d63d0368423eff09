#include "workflow_service.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include "internal/engine/workflow_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace flowstead::service {

using namespace flowstead::services::v1;
using flowstead::core::v1::Failure;
using flowstead::core::v1::WorkflowExecutionKey;

namespace {

void RequireExecution(const WorkflowExecutionKey& key, std::string_view operation) {
  if (key.workflow_id().empty()) {
    throw std::invalid_argument(std::string(operation) + ": execution.workflow_id is required");
  }
}

WorkflowExecutionKey KeyOf(const db::model::ExecutionRecord& record) {
  WorkflowExecutionKey key;
  key.set_workflow_id(record.workflow_id);
  key.set_run_id(record.run_id);
  return key;
}

void CopyFailure(const std::string& raw, Failure* failure) {
  if (raw.empty()) return;
  if (!failure->ParseFromString(raw)) {
    failure->Clear();
    failure->set_message("stored failure is unreadable");
  }
}

} // namespace

WorkflowService::WorkflowService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StartWorkflowResponse WorkflowService::StartWorkflow(const StartWorkflowRequest& req) {
  return ObserveRpc("WorkflowService.StartWorkflow", req.workflow_id(), [&] {
    if (req.workflow_type().empty()) {
      throw std::invalid_argument("start workflow: workflow_type is required");
    }

    engine::StartRequest start;
    start.workflow_type = req.workflow_type();
    start.input         = req.input();
    start.workflow_id   = req.workflow_id();
    start.task_queue    = req.task_queue();
    start.run_timeout   = util::FromProto(req.run_timeout());

    StartWorkflowResponse resp;
    *resp.mutable_execution() = ctx_.engine->StartWorkflow(start);
    return resp;
  });
}

GetResultResponse WorkflowService::GetResult(const GetResultRequest& req) {
  return ObserveRpc("WorkflowService.GetResult", req.execution().workflow_id(), [&] {
    RequireExecution(req.execution(), "get result");

    auto record = ctx_.engine->WaitForClose(req.execution(), util::FromProto(req.timeout()));

    GetResultResponse resp;
    *resp.mutable_execution() = KeyOf(record);
    resp.set_status(record.status);
    resp.set_result(record.result);
    CopyFailure(record.failure, resp.mutable_failure());
    return resp;
  });
}

void WorkflowService::SignalWorkflow(const SignalWorkflowRequest& req) {
  ObserveRpc("WorkflowService.SignalWorkflow", req.execution().workflow_id(), [&] {
    RequireExecution(req.execution(), "signal");
    ctx_.engine->Signal(req.execution(), req.name(), req.payload());
  });
}

QueryWorkflowResponse WorkflowService::QueryWorkflow(const QueryWorkflowRequest& req) {
  return ObserveRpc("WorkflowService.QueryWorkflow", req.execution().workflow_id(), [&] {
    RequireExecution(req.execution(), "query");

    const auto  snapshot  = ctx_.engine->Query(req.execution());
    const auto& execution = snapshot.execution;

    QueryWorkflowResponse resp;
    *resp.mutable_execution() = KeyOf(execution);
    resp.set_workflow_type(execution.workflow_type);
    resp.set_status(execution.status);
    resp.set_history_length(execution.history_length);
    for (const auto& activity : snapshot.pending.activities) {
      resp.add_pending_activities(activity.activity_type() + "(" + std::to_string(activity.command_id()) + ")");
    }
    for (const auto& timer : snapshot.pending.timers) {
      resp.add_pending_timers(timer.timer_id());
    }
    for (const auto& child : snapshot.pending.children) {
      *resp.add_pending_children() = child.child();
    }
    resp.set_query_state(snapshot.query_state);
    resp.set_result(execution.result);
    CopyFailure(execution.failure, resp.mutable_failure());
    resp.set_cancel_requested(snapshot.cancel_requested);
    resp.set_halted(execution.halted);
    resp.set_halt_reason(execution.halt_reason);
    return resp;
  });
}

void WorkflowService::ListWorkflows(const ListWorkflowsRequest& req, const SummarySink& sink) {
  ObserveRpc("WorkflowService.ListWorkflows", "", [&] {
    if (req.limit() < 0) {
      throw std::invalid_argument("list workflows: limit must not be negative");
    }

    db::model::ExecutionFilter filter;
    if (req.status() != flowstead::core::v1::WORKFLOW_STATUS_UNSPECIFIED) filter.status = req.status();
    if (!req.workflow_type().empty()) filter.workflow_type = req.workflow_type();

    std::size_t remaining = req.limit() > 0 ? static_cast<std::size_t>(req.limit()) : 0;
    std::string token     = req.page_token();
    for (;;) {
      const auto page_size = remaining > 0 ? std::min(remaining, ctx_.list_page_size) : ctx_.list_page_size;
      auto       page      = ctx_.engine->ListWorkflows(filter, token, page_size);

      for (const auto& record : page.executions) {
        WorkflowSummary summary;
        *summary.mutable_execution() = KeyOf(record);
        summary.set_workflow_type(record.workflow_type);
        summary.set_status(record.status);
        *summary.mutable_start_time() = util::ToProto(util::FromUnixMillis(record.start_time_ms));
        if (record.close_time_ms != 0) {
          *summary.mutable_close_time() = util::ToProto(util::FromUnixMillis(record.close_time_ms));
        }
        summary.set_page_token(engine::WorkflowEngine::PageTokenAfter(record));

        if (!sink(summary)) return;
        if (remaining > 0 && --remaining == 0) return;
      }

      if (page.next_page_token.empty()) return;
      token = page.next_page_token;
    }
  });
}

void WorkflowService::CancelWorkflow(const CancelWorkflowRequest& req) {
  ObserveRpc("WorkflowService.CancelWorkflow", req.execution().workflow_id(), [&] {
    RequireExecution(req.execution(), "cancel");
    ctx_.engine->Cancel(req.execution(), req.reason());
  });
}

GetHistoryResponse WorkflowService::GetHistory(const GetHistoryRequest& req) {
  return ObserveRpc("WorkflowService.GetHistory", req.execution().workflow_id(), [&] {
    RequireExecution(req.execution(), "get history");
    if (req.from_seq() < 0) {
      throw std::invalid_argument("get history: from_seq must not be negative");
    }

    const auto record = ctx_.engine->Describe(req.execution());

    GetHistoryResponse resp;
    *resp.mutable_execution() = KeyOf(record);
    for (auto& event : ctx_.engine->GetHistory(KeyOf(record))) {
      if (event.seq() < req.from_seq()) continue;
      *resp.mutable_history()->add_events() = std::move(event);
    }
    return resp;
  });
}

void WorkflowService::ResumeHaltedWorkflow(const ResumeHaltedWorkflowRequest& req) {
  ObserveRpc("WorkflowService.ResumeHaltedWorkflow", req.execution().workflow_id(), [&] {
    RequireExecution(req.execution(), "resume halted");
    ctx_.engine->ResumeHalted(req.execution());
  });
}

} // namespace flowstead::service
