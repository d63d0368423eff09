#include "internal/activity/activity_registry.hpp"
#include "internal/workflow/workflow_registry.hpp"

#include <cassert>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/workflow/workflow_context.hpp"

namespace {

using flowstead::activity::ActivityContext;
using flowstead::activity::ActivityRegistry;
using flowstead::workflow::WorkflowContext;
using flowstead::workflow::WorkflowRegistry;

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

void TestWorkflowRegistry() {
  WorkflowRegistry registry;
  registry.Register("greet", [](WorkflowContext&, const std::string& input) { return "hello " + input; });
  registry.Register("audit", [](WorkflowContext&, const std::string&) { return std::string(); });

  assert(registry.Contains("greet"));
  assert(!registry.Contains("missing"));
  assert(registry.Names().size() == 2);

  bool not_found = false;
  try {
    registry.Lookup("missing");
  } catch (const flowstead::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  bool duplicate = false;
  try {
    registry.Register("greet", [](WorkflowContext&, const std::string&) { return std::string(); });
  } catch (const flowstead::util::AlreadyExists&) {
    duplicate = true;
  }
  assert(duplicate);

  assert(Throws([&] { registry.Register("", [](WorkflowContext&, const std::string&) { return std::string(); }); }));
  assert(Throws([&] { registry.Register("empty", nullptr); }));

  registry.Validate({"greet", "audit"});
  assert(Throws([&] { registry.Validate({"greet", "missing"}); }));
}

void TestActivityRegistry() {
  ActivityRegistry registry;
  registry.Register("upper", [](const ActivityContext&, const std::string& input) {
    std::string out = input;
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
  });

  flowstead::runtime::v1::ActivityTask task;
  task.set_attempt(2);
  ActivityContext ctx{task};
  assert(ctx.Attempt() == 2);
  assert(registry.Lookup("upper")(ctx, "abc") == "ABC");

  bool not_found = false;
  try {
    registry.Validate({"upper", "lower", "reverse"});
  } catch (const flowstead::util::NotFound& e) {
    not_found = std::string(e.what()).find("lower") != std::string::npos &&
                std::string(e.what()).find("reverse") != std::string::npos;
  }
  assert(not_found);
}

} // namespace

int main() {
  TestWorkflowRegistry();
  TestActivityRegistry();

  std::cout << "registry_test: pass\n";
  return 0;
}
