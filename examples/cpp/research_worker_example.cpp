#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "client/cpp/flowstead_client.h"
#include "examples/cpp/research/research_workflows.hpp"
#include "internal/worker/activity_worker.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  // Runs the research activities in their own process against a server.
  const std::string target = argc > 1 ? argv[1] : "localhost:7233";
  const std::string queue  = argc > 2 ? argv[2] : "default";

  auto activities = std::make_shared<flowstead::activity::ActivityRegistry>();
  flowstead::examples::research::RegisterResearchActivities(*activities);

  auto poller = std::make_shared<flowstead::client::RemoteTaskPoller>(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  flowstead::worker::WorkerOptions options;
  options.task_queue = queue;

  flowstead::worker::ActivityWorker worker(options, activities, poller);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  try {
    worker.Start();
  } catch (const std::exception& e) {
    std::cerr << "worker registration failed: " << e.what() << '\n';
    return 1;
  }
  std::cout << "worker " << worker.worker_id() << " polling " << queue << '\n';

  while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  worker.Stop();
  return 0;
}
