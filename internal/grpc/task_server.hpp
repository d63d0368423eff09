#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "flowstead/services/v1/task_service.grpc.pb.h"
#include "flowstead/v1.hpp"
#include "internal/service/task_service.hpp"

namespace flowstead::grpc {

class TaskServer final : public flowstead::services::v1::TaskService::Service {
 public:
  explicit TaskServer(std::shared_ptr<flowstead::service::TaskService> svc);

  ::grpc::Status RegisterWorker(::grpc::ServerContext*, const flowstead::v1::RegisterWorkerRequest*,
                                flowstead::v1::RegisterWorkerResponse*) override;

  ::grpc::Status PollActivityTask(::grpc::ServerContext*, const flowstead::v1::PollActivityTaskRequest*,
                                  flowstead::v1::PollActivityTaskResponse*) override;

  ::grpc::Status CompleteActivityTask(::grpc::ServerContext*, const flowstead::v1::CompleteActivityTaskRequest*,
                                      google::protobuf::Empty*) override;

  ::grpc::Status FailActivityTask(::grpc::ServerContext*, const flowstead::v1::FailActivityTaskRequest*,
                                  google::protobuf::Empty*) override;

 private:
  std::shared_ptr<flowstead::service::TaskService> service_;
};

} // namespace flowstead::grpc
