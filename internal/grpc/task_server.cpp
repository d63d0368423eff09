#include "task_server.hpp"

#include "grpc_error.hpp"

namespace flowstead::grpc {

TaskServer::TaskServer(std::shared_ptr<flowstead::service::TaskService> svc) : service_(std::move(svc)) {
}

::grpc::Status TaskServer::RegisterWorker(::grpc::ServerContext*, const flowstead::v1::RegisterWorkerRequest* req,
                                          flowstead::v1::RegisterWorkerResponse* resp) {
  try {
    *resp = service_->RegisterWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::PollActivityTask(::grpc::ServerContext*, const flowstead::v1::PollActivityTaskRequest* req,
                                            flowstead::v1::PollActivityTaskResponse* resp) {
  try {
    *resp = service_->PollActivityTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::CompleteActivityTask(::grpc::ServerContext*, const flowstead::v1::CompleteActivityTaskRequest* req,
                                                google::protobuf::Empty*) {
  try {
    service_->CompleteActivityTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TaskServer::FailActivityTask(::grpc::ServerContext*, const flowstead::v1::FailActivityTaskRequest* req,
                                            google::protobuf::Empty*) {
  try {
    service_->FailActivityTask(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace flowstead::grpc
