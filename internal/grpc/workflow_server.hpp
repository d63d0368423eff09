#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "flowstead/services/v1/workflow_service.grpc.pb.h"
#include "flowstead/v1.hpp"
#include "internal/service/workflow_service.hpp"

namespace flowstead::grpc {

class WorkflowServer final : public flowstead::services::v1::WorkflowService::Service {
 public:
  explicit WorkflowServer(std::shared_ptr<flowstead::service::WorkflowService> svc);

  ::grpc::Status StartWorkflow(::grpc::ServerContext*, const flowstead::v1::StartWorkflowRequest*,
                               flowstead::v1::StartWorkflowResponse*) override;

  ::grpc::Status GetResult(::grpc::ServerContext*, const flowstead::v1::GetResultRequest*,
                           flowstead::v1::GetResultResponse*) override;

  ::grpc::Status SignalWorkflow(::grpc::ServerContext*, const flowstead::v1::SignalWorkflowRequest*,
                                google::protobuf::Empty*) override;

  ::grpc::Status QueryWorkflow(::grpc::ServerContext*, const flowstead::v1::QueryWorkflowRequest*,
                               flowstead::v1::QueryWorkflowResponse*) override;

  ::grpc::Status ListWorkflows(::grpc::ServerContext*, const flowstead::v1::ListWorkflowsRequest*,
                               ::grpc::ServerWriter<flowstead::v1::WorkflowSummary>*) override;

  ::grpc::Status CancelWorkflow(::grpc::ServerContext*, const flowstead::v1::CancelWorkflowRequest*,
                                google::protobuf::Empty*) override;

  ::grpc::Status GetHistory(::grpc::ServerContext*, const flowstead::v1::GetHistoryRequest*,
                            flowstead::v1::GetHistoryResponse*) override;

  ::grpc::Status ResumeHaltedWorkflow(::grpc::ServerContext*, const flowstead::v1::ResumeHaltedWorkflowRequest*,
                                      google::protobuf::Empty*) override;

 private:
  std::shared_ptr<flowstead::service::WorkflowService> service_;
};

} // namespace flowstead::grpc
