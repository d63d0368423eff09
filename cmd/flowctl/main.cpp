#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "client/cpp/flowstead_client.h"
#include "flowstead/v1.hpp"

using namespace flowstead::v1;
using flowstead::client::FlowsteadClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  flowctl <addr> start <workflow_type> <input> [workflow_id] [task_queue]\n"
            << "  flowctl <addr> result <workflow_id> [run_id] [timeout_ms]\n"
            << "  flowctl <addr> signal <workflow_id> <name> [payload]\n"
            << "  flowctl <addr> query <workflow_id> [run_id]\n"
            << "  flowctl <addr> list [status=running|completed|failed|cancelled|timed_out|continued] [workflow_type]\n"
            << "  flowctl <addr> cancel <workflow_id> [reason]\n"
            << "  flowctl <addr> history <workflow_id> [run_id]\n"
            << "  flowctl <addr> resume <workflow_id> [run_id]\n";
}

static std::optional<WorkflowStatus> ParseStatus(const std::string& value) {
  if (value == "running") return WORKFLOW_STATUS_RUNNING;
  if (value == "completed") return WORKFLOW_STATUS_COMPLETED;
  if (value == "failed") return WORKFLOW_STATUS_FAILED;
  if (value == "cancelled") return WORKFLOW_STATUS_CANCELLED;
  if (value == "timed_out") return WORKFLOW_STATUS_TIMED_OUT;
  if (value == "continued") return WORKFLOW_STATUS_CONTINUED_AS_NEW;
  return std::nullopt;
}

static WorkflowExecutionKey MakeKey(int argc, char** argv, int at) {
  WorkflowExecutionKey key;
  key.set_workflow_id(argv[at]);
  if (argc > at + 1) key.set_run_id(argv[at + 1]);
  return key;
}

static void PrintFailure(const Failure& failure) {
  std::cout << "failure.type=" << failure.type() << "\n"
            << "failure.message=" << failure.message() << "\n";
}

static int Run(FlowsteadClient& client, int argc, char** argv) {
  const std::string cmd = argv[2];

  if (cmd == "start") {
    if (argc < 5) return 1;

    StartWorkflowRequest req;
    req.set_workflow_type(argv[3]);
    req.set_input(argv[4]);
    if (argc >= 6) req.set_workflow_id(argv[5]);
    if (argc >= 7) req.set_task_queue(argv[6]);

    auto key = client.StartWorkflow(req);
    std::cout << "workflow_id=" << key.workflow_id() << "\n"
              << "run_id=" << key.run_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "result") {
    if (argc < 4) return 1;

    WorkflowExecutionKey key;
    key.set_workflow_id(argv[3]);
    if (argc >= 5) key.set_run_id(argv[4]);
    const int64_t timeout_ms = argc >= 6 ? std::stoll(argv[5]) : 0;

    auto resp = client.GetResult(key, timeout_ms);
    std::cout << "run_id=" << resp.execution().run_id() << "\n"
              << "status=" << WorkflowStatus_Name(resp.status()) << "\n";
    if (resp.status() == WORKFLOW_STATUS_COMPLETED) {
      std::cout << "result=" << resp.result() << "\n";
    } else {
      PrintFailure(resp.failure());
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "signal") {
    if (argc < 5) return 1;

    WorkflowExecutionKey key;
    key.set_workflow_id(argv[3]);
    client.Signal(key, argv[4], argc >= 6 ? argv[5] : "");
    std::cout << "signalled\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "query") {
    if (argc < 4) return 1;

    auto resp = client.Query(MakeKey(argc, argv, 3));
    std::cout << "run_id=" << resp.execution().run_id() << "\n"
              << "workflow_type=" << resp.workflow_type() << "\n"
              << "status=" << WorkflowStatus_Name(resp.status()) << "\n"
              << "history_length=" << resp.history_length() << "\n"
              << "query_state=" << resp.query_state() << "\n";
    for (const auto& activity : resp.pending_activities()) std::cout << "pending_activity=" << activity << "\n";
    for (const auto& timer : resp.pending_timers()) std::cout << "pending_timer=" << timer << "\n";
    for (const auto& child : resp.pending_children()) {
      std::cout << "pending_child=" << child.workflow_id() << "/" << child.run_id() << "\n";
    }
    if (resp.cancel_requested()) std::cout << "cancel_requested=true\n";
    if (resp.halted()) std::cout << "halted=" << resp.halt_reason() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListWorkflowsRequest req;
    if (argc >= 4) {
      auto status = ParseStatus(argv[3]);
      if (!status) {
        std::cerr << "unsupported status: " << argv[3] << "\n";
        return 1;
      }
      req.set_status(*status);
    }
    if (argc >= 5) req.set_workflow_type(argv[4]);

    for (const auto& summary : client.List(req)) {
      std::cout << summary.execution().workflow_id() << " " << summary.execution().run_id() << " " << summary.workflow_type() << " "
                << WorkflowStatus_Name(summary.status()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    WorkflowExecutionKey key;
    key.set_workflow_id(argv[3]);
    client.Cancel(key, argc >= 5 ? argv[4] : "cancelled by flowctl");
    std::cout << "cancel requested\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    if (argc < 4) return 1;

    auto resp = client.GetHistory(MakeKey(argc, argv, 3));
    for (const auto& event : resp.history().events()) {
      std::cout << event.seq() << " " << EventType_Name(event.type()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resume") {
    if (argc < 4) return 1;

    client.ResumeHalted(MakeKey(argc, argv, 3));
    std::cout << "resumed\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  FlowsteadClient client(grpc::CreateChannel(argv[1], grpc::InsecureChannelCredentials()));

  try {
    return Run(client, argc, argv);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}
