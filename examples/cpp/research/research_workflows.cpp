#include "research_workflows.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/workflow/workflow_context.hpp"

namespace flowstead::examples::research {

using flowstead::core::v1::JoinPolicy;

namespace {

JoinPolicy ParsePolicy(const std::string& text) {
  if (text == "fail_fast") return flowstead::core::v1::JOIN_POLICY_FAIL_FAST;
  if (text == "collect_all") return flowstead::core::v1::JOIN_POLICY_COLLECT_ALL;
  throw util::WorkflowExecutionError("unknown join policy: " + text, "InvalidInput");
}

std::string PolicyName(JoinPolicy policy) {
  switch (policy) {
    case flowstead::core::v1::JOIN_POLICY_FAIL_FAST:
      return "fail_fast";
    case flowstead::core::v1::JOIN_POLICY_COLLECT_ALL:
      return "collect_all";
    default:
      throw std::invalid_argument("join policy is required");
  }
}

std::string ResearchWorkflow(workflow::WorkflowContext& ctx, const std::string& topic) {
  if (topic.empty()) {
    throw util::WorkflowExecutionError("topic is required", "InvalidInput");
  }

  workflow::ActivityOptions search;
  search.start_to_close = std::chrono::minutes(3);
  *search.retry_policy.mutable_initial_interval() = util::ToProto(util::Millis{1000});
  search.retry_policy.set_backoff_coefficient(2.0);
  *search.retry_policy.mutable_maximum_interval() = util::ToProto(util::Millis{15000});
  search.retry_policy.set_maximum_attempts(3);

  ctx.SetQueryState("searching");
  const auto documents = ctx.ExecuteActivity(kSearchDocuments, topic, search);

  workflow::ActivityOptions render;
  render.start_to_close = std::chrono::minutes(1);

  ctx.SetQueryState("rendering");
  auto report = ctx.ExecuteActivity(kRenderReport, documents, render);

  ctx.SetQueryState("done");
  return report;
}

std::string ResearchOrchestrator(workflow::WorkflowContext& ctx, const std::string& input) {
  auto lines = SplitLines(input);
  if (lines.size() < 2) {
    throw util::WorkflowExecutionError("expected a policy line and at least one topic", "InvalidInput");
  }
  const auto policy = ParsePolicy(lines.front());

  std::vector<workflow::ChildSpec> specs;
  for (std::size_t i = 1; i < lines.size(); ++i) {
    workflow::ChildSpec spec;
    spec.workflow_type = kResearchWorkflow;
    spec.input         = lines[i];
    specs.push_back(std::move(spec));
  }

  const auto children = ctx.FanOut(specs);
  ctx.SetQueryState("waiting for " + std::to_string(children.size()) + " children");

  const auto joined = ctx.Join(children, policy);

  std::ostringstream out;
  for (std::size_t i = 0; i < joined.outcomes.size(); ++i) {
    const auto& outcome = joined.outcomes[i];
    if (i > 0) out << '\n';
    if (outcome.ok) {
      out << outcome.result;
    } else {
      out << "error(" << specs[i].input << "): " << outcome.failure.message();
    }
  }
  return out.str();
}

} // namespace

void RegisterResearchWorkflows(workflow::WorkflowRegistry& registry) {
  registry.Register(kResearchWorkflow, &ResearchWorkflow);
  registry.Register(kResearchOrchestrator, &ResearchOrchestrator);
}

void RegisterResearchActivities(activity::ActivityRegistry& registry) {
  registry.Register(kSearchDocuments, [](const activity::ActivityContext&, const std::string& topic) {
    if (topic.find("unreachable") != std::string::npos) {
      throw util::NonRetryableActivityError("no search backend for topic: " + topic, "SearchUnavailable");
    }
    return "documents about " + topic;
  });

  registry.Register(kRenderReport, [](const activity::ActivityContext&, const std::string& documents) {
    return "Report: " + documents;
  });
}

std::string EncodeOrchestratorInput(JoinPolicy policy, const std::vector<std::string>& topics) {
  std::string input = PolicyName(policy);
  for (const auto& topic : topics) {
    input += '\n';
    input += topic;
  }
  return input;
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream       in(text);
  std::string              line;
  while (std::getline(in, line)) {
    if (!line.empty()) lines.push_back(line);
  }
  return lines;
}

} // namespace flowstead::examples::research
