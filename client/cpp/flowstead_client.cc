#include "client/cpp/flowstead_client.h"

#include <chrono>
#include <string>

#include <grpcpp/client_context.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/util/time.hpp"

namespace flowstead::client {

using namespace flowstead::v1;

namespace {

// Slack on top of a server-side wait so the deadline does not fire first.
constexpr std::chrono::seconds kWaitSlack{5};

void SetDeadlineAfter(::grpc::ClientContext& ctx, util::Millis wait) {
  ctx.set_deadline(std::chrono::system_clock::now() + wait + kWaitSlack);
}

} // namespace

FlowsteadClient::FlowsteadClient(std::shared_ptr<::grpc::Channel> channel) : stub_(WorkflowService::NewStub(channel)) {
}

WorkflowExecutionKey FlowsteadClient::StartWorkflow(const StartWorkflowRequest& request) const {
  ::grpc::ClientContext   ctx;
  StartWorkflowResponse resp;
  flowstead::grpc::ThrowIfFailed(stub_->StartWorkflow(&ctx, request, &resp));
  return resp.execution();
}

GetResultResponse FlowsteadClient::GetResult(const WorkflowExecutionKey& execution, int64_t timeout_ms) const {
  ::grpc::ClientContext ctx;
  if (timeout_ms > 0) {
    SetDeadlineAfter(ctx, util::Millis{timeout_ms});
  }

  GetResultRequest req;
  *req.mutable_execution() = execution;
  *req.mutable_timeout()   = util::ToProto(util::Millis{timeout_ms});

  GetResultResponse resp;
  flowstead::grpc::ThrowIfFailed(stub_->GetResult(&ctx, req, &resp));
  return resp;
}

void FlowsteadClient::Signal(const WorkflowExecutionKey& execution, const std::string& name, const std::string& payload) const {
  ::grpc::ClientContext ctx;

  SignalWorkflowRequest req;
  *req.mutable_execution() = execution;
  req.set_name(name);
  req.set_payload(payload);

  google::protobuf::Empty resp;
  flowstead::grpc::ThrowIfFailed(stub_->SignalWorkflow(&ctx, req, &resp));
}

QueryWorkflowResponse FlowsteadClient::Query(const WorkflowExecutionKey& execution) const {
  ::grpc::ClientContext ctx;

  QueryWorkflowRequest req;
  *req.mutable_execution() = execution;

  QueryWorkflowResponse resp;
  flowstead::grpc::ThrowIfFailed(stub_->QueryWorkflow(&ctx, req, &resp));
  return resp;
}

std::vector<WorkflowSummary> FlowsteadClient::List(const ListWorkflowsRequest& request) const {
  ::grpc::ClientContext ctx;
  auto                reader = stub_->ListWorkflows(&ctx, request);

  std::vector<WorkflowSummary> summaries;
  WorkflowSummary              summary;
  while (reader->Read(&summary)) {
    summaries.push_back(summary);
  }
  flowstead::grpc::ThrowIfFailed(reader->Finish());
  return summaries;
}

void FlowsteadClient::Cancel(const WorkflowExecutionKey& execution, const std::string& reason) const {
  ::grpc::ClientContext ctx;

  CancelWorkflowRequest req;
  *req.mutable_execution() = execution;
  req.set_reason(reason);

  google::protobuf::Empty resp;
  flowstead::grpc::ThrowIfFailed(stub_->CancelWorkflow(&ctx, req, &resp));
}

GetHistoryResponse FlowsteadClient::GetHistory(const WorkflowExecutionKey& execution, int64_t from_seq) const {
  ::grpc::ClientContext ctx;

  GetHistoryRequest req;
  *req.mutable_execution() = execution;
  req.set_from_seq(from_seq);

  GetHistoryResponse resp;
  flowstead::grpc::ThrowIfFailed(stub_->GetHistory(&ctx, req, &resp));
  return resp;
}

void FlowsteadClient::ResumeHalted(const WorkflowExecutionKey& execution) const {
  ::grpc::ClientContext ctx;

  ResumeHaltedWorkflowRequest req;
  *req.mutable_execution() = execution;

  google::protobuf::Empty resp;
  flowstead::grpc::ThrowIfFailed(stub_->ResumeHaltedWorkflow(&ctx, req, &resp));
}

// ---------------------------------------------------------------------

RemoteTaskPoller::RemoteTaskPoller(std::shared_ptr<::grpc::Channel> channel) : stub_(TaskService::NewStub(channel)) {
}

std::string RemoteTaskPoller::Register(const std::string& worker_id, const std::string& task_queue,
                                       const std::vector<std::string>& activity_types) {
  ::grpc::ClientContext ctx;

  RegisterWorkerRequest req;
  req.set_worker_id(worker_id);
  req.set_task_queue(task_queue);
  for (const auto& type : activity_types) {
    req.add_activity_types(type);
  }

  RegisterWorkerResponse resp;
  flowstead::grpc::ThrowIfFailed(stub_->RegisterWorker(&ctx, req, &resp));
  return resp.worker_id();
}

std::optional<ActivityTask> RemoteTaskPoller::Poll(const std::string& worker_id, const std::string& task_queue, util::Millis wait) {
  ::grpc::ClientContext ctx;
  SetDeadlineAfter(ctx, wait);

  PollActivityTaskRequest req;
  req.set_worker_id(worker_id);
  req.set_task_queue(task_queue);
  *req.mutable_timeout() = util::ToProto(wait);

  PollActivityTaskResponse resp;
  flowstead::grpc::ThrowIfFailed(stub_->PollActivityTask(&ctx, req, &resp));
  if (!resp.has_task()) {
    return std::nullopt;
  }
  return std::move(*resp.mutable_task());
}

void RemoteTaskPoller::Complete(const ActivityTask& task, const std::string& result) {
  ::grpc::ClientContext ctx;

  CompleteActivityTaskRequest req;
  req.set_task_id(task.task_id());
  req.set_attempt(task.attempt());
  req.set_result(result);

  google::protobuf::Empty resp;
  flowstead::grpc::ThrowIfFailed(stub_->CompleteActivityTask(&ctx, req, &resp));
}

void RemoteTaskPoller::Fail(const ActivityTask& task, const Failure& failure, bool retryable) {
  ::grpc::ClientContext ctx;

  FailActivityTaskRequest req;
  req.set_task_id(task.task_id());
  req.set_attempt(task.attempt());
  *req.mutable_failure() = failure;
  req.set_retryable(retryable);

  google::protobuf::Empty resp;
  flowstead::grpc::ThrowIfFailed(stub_->FailActivityTask(&ctx, req, &resp));
}

} // namespace flowstead::client
