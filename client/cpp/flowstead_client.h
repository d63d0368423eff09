#pragma once

#include <grpcpp/channel.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "flowstead/services/v1/task_service.grpc.pb.h"
#include "flowstead/services/v1/workflow_service.grpc.pb.h"
#include "flowstead/v1.hpp"
#include "internal/worker/task_poller.hpp"

namespace flowstead::client {

/*
  Thin synchronous wrapper over the WorkflowService stub.

  Failed calls throw the util:: exception matching the status code
  (NotFound, AlreadyExists, InvalidState, DeadlineExceeded, ...).
*/
class FlowsteadClient {
 public:
  explicit FlowsteadClient(std::shared_ptr<::grpc::Channel> channel);

  flowstead::v1::WorkflowExecutionKey StartWorkflow(const flowstead::v1::StartWorkflowRequest& request) const;

  // timeout_ms == 0 waits until the run closes.
  flowstead::v1::GetResultResponse GetResult(const flowstead::v1::WorkflowExecutionKey& execution, int64_t timeout_ms = 0) const;

  void Signal(const flowstead::v1::WorkflowExecutionKey& execution, const std::string& name, const std::string& payload) const;

  flowstead::v1::QueryWorkflowResponse Query(const flowstead::v1::WorkflowExecutionKey& execution) const;

  // Returns every summary the server streams.
  std::vector<flowstead::v1::WorkflowSummary> List(const flowstead::v1::ListWorkflowsRequest& request) const;

  void Cancel(const flowstead::v1::WorkflowExecutionKey& execution, const std::string& reason) const;

  flowstead::v1::GetHistoryResponse GetHistory(const flowstead::v1::WorkflowExecutionKey& execution, int64_t from_seq = 0) const;

  void ResumeHalted(const flowstead::v1::WorkflowExecutionKey& execution) const;

 private:
  std::unique_ptr<flowstead::v1::WorkflowService::Stub> stub_;
};

/*
  TaskPoller over the TaskService RPCs, for ActivityWorkers running in
  a separate process.
*/
class RemoteTaskPoller final : public worker::TaskPoller {
 public:
  explicit RemoteTaskPoller(std::shared_ptr<::grpc::Channel> channel);

  std::string Register(const std::string& worker_id, const std::string& task_queue,
                       const std::vector<std::string>& activity_types) override;

  std::optional<flowstead::v1::ActivityTask> Poll(const std::string& worker_id, const std::string& task_queue,
                                                  util::Millis wait) override;

  void Complete(const flowstead::v1::ActivityTask& task, const std::string& result) override;

  void Fail(const flowstead::v1::ActivityTask& task, const flowstead::v1::Failure& failure, bool retryable) override;

 private:
  std::unique_ptr<flowstead::v1::TaskService::Stub> stub_;
};

} // namespace flowstead::client
