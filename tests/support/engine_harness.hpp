#pragma once

#include <algorithm>
#include <memory>
#include <string>

#include "internal/activity/activity_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/workflow_engine.hpp"
#include "internal/service/task_service.hpp"
#include "internal/service/workflow_service.hpp"
#include "internal/worker/activity_worker.hpp"
#include "internal/worker/task_poller.hpp"
#include "internal/workflow/workflow_context.hpp"
#include "internal/workflow/workflow_registry.hpp"

namespace flowstead::testing {

/*
  One engine on a manual clock with an in-process worker. Tests drive
  it step by step:

    h.engine->RunUntilIdle();   // decide
    h.worker->ProcessAvailable(); // run activities
    h.clock->Advance(...);      // let timers and retries come due

  Settle() alternates the first two until nothing moves.
*/
struct EngineHarness {
  std::shared_ptr<util::ManualClock>           clock      = std::make_shared<util::ManualClock>();
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<workflow::WorkflowRegistry>  workflows  = std::make_shared<workflow::WorkflowRegistry>();
  std::shared_ptr<activity::ActivityRegistry>  activities = std::make_shared<activity::ActivityRegistry>();
  std::shared_ptr<engine::WorkflowEngine>      engine;
  std::shared_ptr<service::WorkflowService>    workflow_service;
  std::shared_ptr<service::TaskService>        task_service;
  std::unique_ptr<worker::ActivityWorker>      worker;

  explicit EngineHarness(std::shared_ptr<db::Repository> repo = std::make_shared<db::memory::MemoryRepository>(),
                         const std::string& instance_id = "engine-test") {
    Reopen(std::move(repo), instance_id);
  }

  // Replaces the engine, as a restarted process would, keeping the
  // registries and the clock. Open runs are queued the way Start() does.
  void Reopen(std::shared_ptr<db::Repository> repo, const std::string& instance_id) {
    worker.reset();
    engine.reset();

    repository = std::move(repo);

    engine::EngineOptions options;
    options.instance_id      = instance_id;
    options.decision_threads = 1;
    engine = std::make_shared<engine::WorkflowEngine>(options, repository, clock, workflows);
    engine->RecoverOpenRuns();

    service::ServiceContext ctx;
    ctx.engine       = engine;
    ctx.workflows    = workflows;
    ctx.activities   = activities;
    workflow_service = std::make_shared<service::WorkflowService>(ctx);
    task_service     = std::make_shared<service::TaskService>(ctx);

    worker::WorkerOptions worker_options;
    worker_options.worker_id  = instance_id + "-worker";
    worker_options.task_queue = "default";
    worker = std::make_unique<worker::ActivityWorker>(worker_options, activities,
                                                      std::make_shared<worker::LocalTaskPoller>(task_service));
  }

  // Decides and runs activities until neither makes progress.
  void Settle(int max_rounds = 100) {
    for (int i = 0; i < max_rounds; ++i) {
      const auto cycles   = engine->RunUntilIdle();
      const auto executed = worker->ProcessAvailable();
      if (cycles == 0 && executed == 0) return;
    }
  }

  // Advances the clock in steps so timers and retries fire in order.
  void AdvanceAndSettle(util::Millis total, util::Millis step = util::Millis(1000)) {
    for (util::Millis elapsed{0}; elapsed < total; elapsed += step) {
      clock->Advance(std::min(step, total - elapsed));
      Settle();
    }
  }

  flowstead::core::v1::WorkflowExecutionKey Start(const std::string& workflow_type, const std::string& input,
                                                  const std::string& workflow_id = "") {
    engine::StartRequest request;
    request.workflow_type = workflow_type;
    request.input         = input;
    request.workflow_id   = workflow_id;
    return engine->StartWorkflow(request);
  }

  db::model::ExecutionRecord Describe(const flowstead::core::v1::WorkflowExecutionKey& key) {
    return engine->Describe(key);
  }
};

} // namespace flowstead::testing
