#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/activity/activity_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/workflow_engine.hpp"
#include "internal/service/task_service.hpp"
#include "internal/service/workflow_service.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/activity_worker.hpp"
#include "internal/workflow/workflow_registry.hpp"

namespace flowstead::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<engine::WorkflowEngine>   engine;
  std::shared_ptr<service::WorkflowService> workflow_service;
  std::shared_ptr<service::TaskService>     task_service;

  std::vector<std::unique_ptr<::grpc::Service>>        grpc_services;
  std::vector<std::shared_ptr<worker::ActivityWorker>> workers;

  // Starts the engine loops, then the in-process workers.
  void Start();
  // Reverse order of Start().
  void Stop();
};

/*
  Build

  Constructs the whole backend from runtime config. This is the
  composition root: the only place that knows concrete DB types.
  Workflow and activity implementations are registered by the caller
  before Build; the registries are frozen from then on.

  With build_grpc == false no transport adapters are created (tests,
  embedded use).
*/
Application Build(const flowstead::runtime::config::RuntimeConfig&          config,
                  std::shared_ptr<const workflow::WorkflowRegistry>        workflows,
                  std::shared_ptr<const activity::ActivityRegistry>        activities,
                  std::shared_ptr<util::Clock>                             clock      = std::make_shared<util::SystemClock>(),
                  bool                                                     build_grpc = true);

std::shared_ptr<db::Repository> BuildRepository(const flowstead::runtime::config::RuntimeConfig& config);

} // namespace flowstead::factory
