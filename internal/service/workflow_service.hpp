#pragma once

#include <functional>

#include "flowstead/services/v1/workflow_service.pb.h"
#include "service_context.hpp"

namespace flowstead::service {

/*
  Client-facing operations. Requests are validated here; everything
  else is delegated to the engine. Errors are thrown as util:: types
  (or std::invalid_argument) and mapped to status codes by the caller.
*/
class WorkflowService {
 public:
  // Receives one summary at a time; return false to stop listing.
  using SummarySink = std::function<bool(const flowstead::services::v1::WorkflowSummary&)>;

  explicit WorkflowService(ServiceContext ctx);

  flowstead::services::v1::StartWorkflowResponse StartWorkflow(const flowstead::services::v1::StartWorkflowRequest& req);

  flowstead::services::v1::GetResultResponse GetResult(const flowstead::services::v1::GetResultRequest& req);

  void SignalWorkflow(const flowstead::services::v1::SignalWorkflowRequest& req);

  flowstead::services::v1::QueryWorkflowResponse QueryWorkflow(const flowstead::services::v1::QueryWorkflowRequest& req);

  void ListWorkflows(const flowstead::services::v1::ListWorkflowsRequest& req, const SummarySink& sink);

  void CancelWorkflow(const flowstead::services::v1::CancelWorkflowRequest& req);

  flowstead::services::v1::GetHistoryResponse GetHistory(const flowstead::services::v1::GetHistoryRequest& req);

  void ResumeHaltedWorkflow(const flowstead::services::v1::ResumeHaltedWorkflowRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace flowstead::service
