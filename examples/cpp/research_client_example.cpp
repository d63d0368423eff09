#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>
#include <vector>

#include "client/cpp/flowstead_client.h"
#include "examples/cpp/research/research_workflows.hpp"
#include "flowstead/v1.hpp"

int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:7233";

  flowstead::client::FlowsteadClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  // Fan out three research children and wait for all of them.
  const std::vector<std::string> topics = {"durable execution", "event sourcing", "deterministic replay"};

  flowstead::v1::StartWorkflowRequest req;
  req.set_workflow_type(flowstead::examples::research::kResearchOrchestrator);
  req.set_input(flowstead::examples::research::EncodeOrchestratorInput(flowstead::v1::JOIN_POLICY_COLLECT_ALL, topics));

  try {
    const auto execution = client.StartWorkflow(req);
    std::cout << "started " << execution.workflow_id() << " run " << execution.run_id() << '\n';

    const auto result = client.GetResult(execution, 10 * 60 * 1000);
    if (result.status() != flowstead::v1::WORKFLOW_STATUS_COMPLETED) {
      std::cerr << "orchestrator ended " << flowstead::v1::WorkflowStatus_Name(result.status()) << ": " << result.failure().message()
                << '\n';
      return 1;
    }

    for (const auto& line : flowstead::examples::research::SplitLines(result.result())) {
      std::cout << line << '\n';
    }
  } catch (const std::exception& e) {
    std::cerr << "research failed: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
