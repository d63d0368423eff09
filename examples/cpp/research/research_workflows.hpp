#pragma once

#include <string>
#include <vector>

#include "flowstead/core/v1/types.pb.h"
#include "internal/activity/activity_registry.hpp"
#include "internal/workflow/workflow_registry.hpp"

namespace flowstead::examples::research {

inline constexpr const char* kResearchWorkflow     = "ResearchWorkflow";
inline constexpr const char* kResearchOrchestrator = "ResearchOrchestrator";
inline constexpr const char* kSearchDocuments      = "search_documents";
inline constexpr const char* kRenderReport         = "render_report";

/*
  ResearchWorkflow(topic)
    search_documents  start-to-close 3m, retry 1s x2.0 up to 15s, 3 attempts
    render_report     start-to-close 1m
  returns the rendered report.

  ResearchOrchestrator(policy + topics)
    one ResearchWorkflow child per topic on the parent's queue, joined
    with the requested policy; returns one report line per topic in
    topic order.
*/
void RegisterResearchWorkflows(workflow::WorkflowRegistry& registry);

// Stand-in implementations of the two external collaborators. A topic
// containing "unreachable" fails search_documents without retry.
void RegisterResearchActivities(activity::ActivityRegistry& registry);

// Orchestrator input: first line is the policy, then one topic per line.
std::string EncodeOrchestratorInput(flowstead::core::v1::JoinPolicy policy, const std::vector<std::string>& topics);

std::vector<std::string> SplitLines(const std::string& text);

} // namespace flowstead::examples::research
