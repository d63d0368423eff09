#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "client/cpp/flowstead_client.h"
#include "examples/cpp/research/research_workflows.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"
#include "internal/worker/activity_worker.hpp"
#include "internal/workflow/workflow_context.hpp"

namespace {

using flowstead::client::FlowsteadClient;
using flowstead::client::RemoteTaskPoller;
namespace core     = flowstead::core::v1;
namespace research = flowstead::examples::research;
namespace v1       = flowstead::v1;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

v1::StartWorkflowRequest StartRequest(const std::string& type, const std::string& input, const std::string& workflow_id = "") {
  v1::StartWorkflowRequest req;
  req.set_workflow_type(type);
  req.set_input(input);
  req.set_workflow_id(workflow_id);
  return req;
}

// One server process and one remote worker process, joined over a real
// channel on a loopback port.
struct Cluster {
  flowstead::factory::Application                   app;
  std::unique_ptr<flowstead::runtime::Server>       server;
  std::shared_ptr<::grpc::Channel>                  channel;
  std::unique_ptr<flowstead::worker::ActivityWorker> worker;

  Cluster() {
    auto config = flowstead::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "127.0.0.1:0"
engine:
  instance_id: "roundtrip"
  decision_threads: 2
  sweep_interval: "0.05s"
)");

    auto workflows  = std::make_shared<flowstead::workflow::WorkflowRegistry>();
    auto activities = std::make_shared<flowstead::activity::ActivityRegistry>();
    research::RegisterResearchWorkflows(*workflows);
    research::RegisterResearchActivities(*activities);
    workflows->Register("gate", [](flowstead::workflow::WorkflowContext& ctx, const std::string&) {
      ctx.SetQueryState("closed");
      return "opened by " + ctx.AwaitSignal("open");
    });

    app = flowstead::factory::Build(config, workflows, activities);
    app.Start();

    server = std::make_unique<flowstead::runtime::Server>(config.server().bind_address(), std::move(app.grpc_services));
    server->Start();
    channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server->selected_port()), ::grpc::InsecureChannelCredentials());

    flowstead::worker::WorkerOptions options;
    options.worker_id = "remote-worker";
    options.threads   = 1;
    options.poll_wait = flowstead::util::Millis(200);
    worker = std::make_unique<flowstead::worker::ActivityWorker>(options, activities, std::make_shared<RemoteTaskPoller>(channel));
    worker->Start();
  }

  ~Cluster() {
    worker->Stop();
    server->Stop();
    app.Stop();
  }
};

void TestResearchRoundTrip(Cluster& cluster) {
  FlowsteadClient client(cluster.channel);

  auto key = client.StartWorkflow(StartRequest(research::kResearchWorkflow, "deep sea vents", "research-vents"));
  assert(key.workflow_id() == "research-vents");

  auto result = client.GetResult(key, 10000);
  assert(result.status() == core::WORKFLOW_STATUS_COMPLETED);
  assert(result.result() == "Report: documents about deep sea vents");

  auto history = client.GetHistory(key);
  // started, two scheduled, two completed, completed
  assert(history.history().events_size() == 6);
  assert(history.history().events(0).type() == flowstead::history::v1::EVENT_TYPE_WORKFLOW_STARTED);
  assert(client.GetHistory(key, 4).history().events_size() == 2);

  assert(Throws<flowstead::util::AlreadyExists>(
      [&] { client.StartWorkflow(StartRequest(research::kResearchWorkflow, "again", "research-vents")); }));
}

void TestOrchestratorRoundTrip(Cluster& cluster) {
  FlowsteadClient client(cluster.channel);

  const auto input = research::EncodeOrchestratorInput(core::JOIN_POLICY_COLLECT_ALL, {"kelp", "plankton"});
  auto       key   = client.StartWorkflow(StartRequest(research::kResearchOrchestrator, input));

  auto result = client.GetResult(key, 20000);
  assert(result.status() == core::WORKFLOW_STATUS_COMPLETED);
  assert(result.result() == "Report: documents about kelp\nReport: documents about plankton");

  v1::ListWorkflowsRequest children;
  children.set_workflow_type(research::kResearchWorkflow);
  children.set_status(core::WORKFLOW_STATUS_COMPLETED);
  assert(client.List(children).size() >= 2);
}

void TestSignalQueryCancel(Cluster& cluster) {
  FlowsteadClient client(cluster.channel);

  auto gate = client.StartWorkflow(StartRequest("gate", "", "gate-1"));
  assert(Throws<flowstead::util::DeadlineExceeded>([&] { client.GetResult(gate, 200); }));

  auto query = client.Query(gate);
  assert(query.status() == core::WORKFLOW_STATUS_RUNNING);
  assert(query.query_state() == "closed");

  client.Signal(gate, "open", "alice");
  auto opened = client.GetResult(gate, 10000);
  assert(opened.result() == "opened by alice");

  auto stuck = client.StartWorkflow(StartRequest("gate", "", "gate-2"));
  client.Cancel(stuck, "no longer needed");
  auto cancelled = client.GetResult(stuck, 10000);
  assert(cancelled.status() == core::WORKFLOW_STATUS_CANCELLED);

  assert(Throws<flowstead::util::InvalidState>([&] { client.Signal(opened.execution(), "open", "bob"); }));
  assert(Throws<flowstead::util::NotFound>([&] {
    v1::WorkflowExecutionKey missing;
    missing.set_workflow_id("nobody");
    client.Query(missing);
  }));
  assert(Throws<std::invalid_argument>([&] { client.StartWorkflow(StartRequest("", "")); }));
}

void TestListingPages(Cluster& cluster) {
  FlowsteadClient client(cluster.channel);

  v1::ListWorkflowsRequest first_page;
  first_page.set_limit(2);
  auto page = client.List(first_page);
  assert(page.size() == 2);

  v1::ListWorkflowsRequest rest;
  rest.set_page_token(page.back().page_token());
  for (const auto& summary : client.List(rest)) {
    for (const auto& seen : page) {
      assert(summary.execution().run_id() != seen.execution().run_id());
    }
  }
}

} // namespace

int main() {
  {
    Cluster cluster;
    TestResearchRoundTrip(cluster);
    TestOrchestratorRoundTrip(cluster);
    TestSignalQueryCancel(cluster);
    TestListingPages(cluster);
  }

  std::cout << "grpc_roundtrip_test: pass\n";
  return 0;
}
