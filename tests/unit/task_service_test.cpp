#include "internal/service/task_service.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/engine_harness.hpp"

namespace {

using flowstead::activity::ActivityContext;
using flowstead::testing::EngineHarness;
using flowstead::util::Millis;
using flowstead::workflow::WorkflowContext;
using namespace flowstead::services::v1;
namespace core = flowstead::core::v1;

std::atomic<int> g_codec_calls{0};

void Register(EngineHarness& h) {
  h.activities->Register("resize", [](const ActivityContext&, const std::string& input) { return input + "@2x"; });
  h.activities->Register("corrupt", [](const ActivityContext&, const std::string&) -> std::string {
    throw flowstead::util::NonRetryableActivityError("image is corrupt", "CorruptImage");
  });
  h.workflows->Register("thumbnail", [](WorkflowContext& ctx, const std::string& input) {
    return ctx.ExecuteActivity("resize", input);
  });
  h.workflows->Register("broken", [](WorkflowContext& ctx, const std::string& input) {
    return ctx.ExecuteActivity("corrupt", input);
  });
  h.workflows->Register("phantom", [](WorkflowContext& ctx, const std::string& input) {
    return ctx.ExecuteActivity("not_deployed", input);
  });

  // A plugin that throws something that is not a std::exception.
  h.activities->Register("legacy_codec", [](const ActivityContext&, const std::string&) -> std::string {
    ++g_codec_calls;
    throw 42;
  });
  h.workflows->Register("transcode", [](WorkflowContext& ctx, const std::string& input) {
    flowstead::workflow::ActivityOptions options;
    *options.retry_policy.mutable_initial_interval() = flowstead::util::ToProto(Millis(1000));
    options.retry_policy.set_maximum_attempts(2);
    return ctx.ExecuteActivity("legacy_codec", input, options);
  });
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

core::Failure FailureOf(EngineHarness& h, const core::WorkflowExecutionKey& key) {
  core::Failure failure;
  const bool    parsed = failure.ParseFromString(h.Describe(key).failure);
  assert(parsed);
  return failure;
}

void TestRegistrationIsValidated() {
  EngineHarness h;
  Register(h);

  RegisterWorkerRequest req;
  req.set_task_queue("images");
  req.add_activity_types("resize");
  req.add_workflow_types("thumbnail");
  auto resp = h.task_service->RegisterWorker(req);
  assert(!resp.worker_id().empty());

  req.set_worker_id("fixed-id");
  assert(h.task_service->RegisterWorker(req).worker_id() == "fixed-id");

  RegisterWorkerRequest unknown = req;
  unknown.add_activity_types("sharpen");
  assert(Throws<flowstead::util::NotFound>([&] { h.task_service->RegisterWorker(unknown); }));

  RegisterWorkerRequest unknown_workflow = req;
  unknown_workflow.add_workflow_types("gallery");
  assert(Throws<flowstead::util::NotFound>([&] { h.task_service->RegisterWorker(unknown_workflow); }));

  RegisterWorkerRequest no_queue;
  assert(Throws<std::invalid_argument>([&] { h.task_service->RegisterWorker(no_queue); }));
}

void TestPollCompleteProtocol() {
  EngineHarness h;
  Register(h);

  auto key = h.Start("thumbnail", "cat.png");
  h.engine->RunUntilIdle();

  PollActivityTaskRequest poll;
  poll.set_worker_id("manual");
  poll.set_task_queue("default");
  auto polled = h.task_service->PollActivityTask(poll);
  assert(polled.has_task());
  assert(polled.task().activity_type() == "resize");
  assert(polled.task().input() == "cat.png");
  assert(polled.task().attempt() == 1);
  assert(polled.task().execution().run_id() == key.run_id());

  // Leased: nothing else to hand out.
  assert(!h.task_service->PollActivityTask(poll).has_task());

  CompleteActivityTaskRequest complete;
  complete.set_task_id(polled.task().task_id());
  complete.set_result("cat@2x.png");

  // A report must name the attempt it ran.
  assert(Throws<std::invalid_argument>([&] { h.task_service->CompleteActivityTask(complete); }));
  complete.set_attempt(2);
  assert(Throws<flowstead::util::NotFound>([&] { h.task_service->CompleteActivityTask(complete); }));

  complete.set_attempt(polled.task().attempt());
  h.task_service->CompleteActivityTask(complete);

  // The second acknowledgement finds nothing.
  assert(Throws<flowstead::util::NotFound>([&] { h.task_service->CompleteActivityTask(complete); }));

  h.engine->RunUntilIdle();
  auto record = h.Describe(key);
  assert(record.status == core::WORKFLOW_STATUS_COMPLETED);
  assert(record.result == "cat@2x.png");

  assert(Throws<std::invalid_argument>([&] { h.task_service->CompleteActivityTask(CompleteActivityTaskRequest{}); }));
  assert(Throws<std::invalid_argument>([&] { h.task_service->FailActivityTask(FailActivityTaskRequest{}); }));
  assert(Throws<std::invalid_argument>([&] { h.task_service->PollActivityTask(PollActivityTaskRequest{}); }));
}

void TestBlockingPollTimesOut() {
  EngineHarness h;
  Register(h);

  PollActivityTaskRequest poll;
  poll.set_task_queue("empty");
  *poll.mutable_timeout() = flowstead::util::ToProto(Millis(30));
  assert(!h.task_service->PollActivityTask(poll).has_task());
}

void TestFailReportedThroughService() {
  EngineHarness h;
  Register(h);

  auto key = h.Start("thumbnail", "dog.png");
  h.engine->RunUntilIdle();

  PollActivityTaskRequest poll;
  poll.set_task_queue("default");
  auto polled = h.task_service->PollActivityTask(poll);
  assert(polled.has_task());

  FailActivityTaskRequest fail;
  fail.set_task_id(polled.task().task_id());
  fail.set_attempt(polled.task().attempt());
  fail.mutable_failure()->set_type("DiskFull");
  fail.mutable_failure()->set_message("no space left");
  fail.set_retryable(false);
  h.task_service->FailActivityTask(fail);

  h.engine->RunUntilIdle();
  assert(h.Describe(key).status == core::WORKFLOW_STATUS_FAILED);
  assert(FailureOf(h, key).type() == "DiskFull");
}

void TestWorkerClassifiesErrors() {
  EngineHarness h;
  Register(h);

  auto broken  = h.Start("broken", "x");
  auto phantom = h.Start("phantom", "x");
  h.Settle();

  assert(h.Describe(broken).status == core::WORKFLOW_STATUS_FAILED);
  auto corrupt = FailureOf(h, broken);
  assert(corrupt.type() == "CorruptImage");
  assert(corrupt.non_retryable());

  assert(h.Describe(phantom).status == core::WORKFLOW_STATUS_FAILED);
  assert(FailureOf(h, phantom).type() == "ActivityTypeNotFound");

  // Neither was retried.
  for (const auto& key : {broken, phantom}) {
    int failures = 0;
    for (const auto& event : h.engine->GetHistory(key)) {
      if (event.type() == flowstead::history::v1::EVENT_TYPE_ACTIVITY_FAILED) {
        assert(event.activity_failed().attempt() == 1);
        ++failures;
      }
    }
    assert(failures == 1);
  }
}

} // namespace

void TestNonStandardExceptionIsRetryable() {
  EngineHarness h;
  Register(h);
  g_codec_calls = 0;

  auto key = h.Start("transcode", "clip.avi");
  h.Settle();
  assert(g_codec_calls == 1);
  assert(h.Describe(key).status == core::WORKFLOW_STATUS_RUNNING);

  h.AdvanceAndSettle(Millis(5000));
  assert(g_codec_calls == 2);
  assert(h.Describe(key).status == core::WORKFLOW_STATUS_FAILED);

  auto failure = FailureOf(h, key);
  assert(failure.type() == "ActivityError");
  assert(!failure.non_retryable());

  int failures = 0;
  for (const auto& event : h.engine->GetHistory(key)) {
    if (event.type() == flowstead::history::v1::EVENT_TYPE_ACTIVITY_FAILED) {
      assert(event.activity_failed().attempt() == 2);
      ++failures;
    }
  }
  assert(failures == 1);
}

int main() {
  TestRegistrationIsValidated();
  TestPollCompleteProtocol();
  TestBlockingPollTimesOut();
  TestFailReportedThroughService();
  TestWorkerClassifiesErrors();
  TestNonStandardExceptionIsRetryable();

  std::cout << "task_service_test: pass\n";
  return 0;
}
