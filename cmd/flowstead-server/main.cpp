#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "examples/cpp/research/research_workflows.hpp"
#include "internal/activity/activity_registry.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/workflow/workflow_registry.hpp"

using flowstead::factory::Build;
using flowstead::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: flowstead-server <config.yaml> OR flowstead-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = flowstead::config::ConfigLoader::LoadFromYaml(config_path);

    flowstead::observability::InitializeTracing(config);
    flowstead::observability::InitializeMetrics(config);
    flowstead::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Registries are filled before the engine exists
    // ------------------------------------------------------------
    auto workflows  = std::make_shared<flowstead::workflow::WorkflowRegistry>();
    auto activities = std::make_shared<flowstead::activity::ActivityRegistry>();
    flowstead::examples::research::RegisterResearchWorkflows(*workflows);
    flowstead::examples::research::RegisterResearchActivities(*activities);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config, workflows, activities);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    server.Start();
    FLOWSTEAD_LOG_INFO("Flowstead started", {flowstead::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FLOWSTEAD_LOG_INFO("Shutting down flowstead");

    server.Stop();
    app.Stop();
    flowstead::observability::ShutdownLogging();
    flowstead::observability::ShutdownMetrics();
    flowstead::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    FLOWSTEAD_LOG_ERROR("Fatal error", {flowstead::observability::StringField("error", e.what())});
    flowstead::observability::ShutdownLogging();
    flowstead::observability::ShutdownMetrics();
    flowstead::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
