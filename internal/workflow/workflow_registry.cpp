#include "internal/workflow/workflow_registry.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace flowstead::workflow {

void WorkflowRegistry::Register(const std::string& name, WorkflowFn fn) {
  if (name.empty()) throw std::invalid_argument("workflow type name must not be empty");
  if (!fn) throw std::invalid_argument("workflow " + name + " has no implementation");

  std::lock_guard lock(mutex_);
  auto [it, inserted] = workflows_.try_emplace(name, std::move(fn));
  if (!inserted) {
    throw util::AlreadyExists("workflow type already registered: " + name);
  }
}

WorkflowFn WorkflowRegistry::Lookup(const std::string& name) const {
  std::lock_guard lock(mutex_);
  if (auto it = workflows_.find(name); it != workflows_.end()) {
    return it->second;
  }
  throw util::NotFound("workflow type not registered: " + name);
}

bool WorkflowRegistry::Contains(const std::string& name) const {
  std::lock_guard lock(mutex_);
  return workflows_.find(name) != workflows_.end();
}

void WorkflowRegistry::Validate(const std::vector<std::string>& names) const {
  std::vector<std::string> unknown;
  for (const auto& name : names) {
    if (!Contains(name)) unknown.push_back(name);
  }
  if (unknown.empty()) return;

  std::string message = "workflow types not registered:";
  for (const auto& name : unknown) {
    message += " " + name;
  }
  throw util::NotFound(message);
}

std::vector<std::string> WorkflowRegistry::Names() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> names;
  for (const auto& entry : workflows_) {
    names.push_back(entry.first);
  }
  return names;
}

} // namespace flowstead::workflow
