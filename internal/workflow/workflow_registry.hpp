#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace flowstead::workflow {

class WorkflowContext;

// Workflow logic. Must be a pure function of its input and what the
// context returns; all side effects go through the context.
using WorkflowFn = std::function<std::string(WorkflowContext&, const std::string& input)>;

/*
  Workflow type name -> implementation. The engine resolves every
  decision cycle through it; start requests and worker registrations
  are validated against it up front.
*/
class WorkflowRegistry {
 public:
  void Register(const std::string& name, WorkflowFn fn);

  // Throws util::NotFound.
  WorkflowFn Lookup(const std::string& name) const;

  bool Contains(const std::string& name) const;

  void Validate(const std::vector<std::string>& names) const;

  std::vector<std::string> Names() const;

 private:
  mutable std::mutex                mutex_;
  std::map<std::string, WorkflowFn> workflows_;
};

} // namespace flowstead::workflow
