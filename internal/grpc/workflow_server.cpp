#include "workflow_server.hpp"

#include "grpc_error.hpp"

namespace flowstead::grpc {

WorkflowServer::WorkflowServer(std::shared_ptr<flowstead::service::WorkflowService> svc) : service_(std::move(svc)) {
}

::grpc::Status WorkflowServer::StartWorkflow(::grpc::ServerContext*, const flowstead::v1::StartWorkflowRequest* req,
                                             flowstead::v1::StartWorkflowResponse* resp) {
  try {
    *resp = service_->StartWorkflow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::GetResult(::grpc::ServerContext*, const flowstead::v1::GetResultRequest* req,
                                         flowstead::v1::GetResultResponse* resp) {
  try {
    *resp = service_->GetResult(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::SignalWorkflow(::grpc::ServerContext*, const flowstead::v1::SignalWorkflowRequest* req,
                                              google::protobuf::Empty*) {
  try {
    service_->SignalWorkflow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::QueryWorkflow(::grpc::ServerContext*, const flowstead::v1::QueryWorkflowRequest* req,
                                             flowstead::v1::QueryWorkflowResponse* resp) {
  try {
    *resp = service_->QueryWorkflow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::ListWorkflows(::grpc::ServerContext* ctx, const flowstead::v1::ListWorkflowsRequest* req,
                                             ::grpc::ServerWriter<flowstead::v1::WorkflowSummary>* writer) {
  try {
    // Stops early when the client goes away or a write fails.
    service_->ListWorkflows(*req, [&](const flowstead::v1::WorkflowSummary& summary) {
      return !ctx->IsCancelled() && writer->Write(summary);
    });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::CancelWorkflow(::grpc::ServerContext*, const flowstead::v1::CancelWorkflowRequest* req,
                                              google::protobuf::Empty*) {
  try {
    service_->CancelWorkflow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::GetHistory(::grpc::ServerContext*, const flowstead::v1::GetHistoryRequest* req,
                                          flowstead::v1::GetHistoryResponse* resp) {
  try {
    *resp = service_->GetHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::ResumeHaltedWorkflow(::grpc::ServerContext*,
                                                    const flowstead::v1::ResumeHaltedWorkflowRequest* req,
                                                    google::protobuf::Empty*) {
  try {
    service_->ResumeHaltedWorkflow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace flowstead::grpc
