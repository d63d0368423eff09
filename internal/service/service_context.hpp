#pragma once

#include <cstddef>
#include <memory>

namespace flowstead::engine {
class WorkflowEngine;
}
namespace flowstead::workflow {
class WorkflowRegistry;
}
namespace flowstead::activity {
class ActivityRegistry;
}

namespace flowstead::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<flowstead::engine::WorkflowEngine>       engine;
  std::shared_ptr<const flowstead::workflow::WorkflowRegistry> workflows;
  std::shared_ptr<const flowstead::activity::ActivityRegistry> activities;
  std::size_t                                              list_page_size = 100;
};

} // namespace flowstead::service
