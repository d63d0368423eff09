#include "internal/history/event_log.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/history/inbox.hpp"
#include "internal/util/execution_key.hpp"

namespace {

using flowstead::db::ErrorCode;
using flowstead::db::memory::MemoryRepository;
using flowstead::history::EventLog;
using flowstead::history::HistoryEvent;
using flowstead::history::Inbox;
using flowstead::history::MakeEvent;
using namespace flowstead::history::v1;

const auto kNow = flowstead::util::FromUnixMillis(1700000000000ULL);

HistoryEvent Started() {
  auto event = MakeEvent(EVENT_TYPE_WORKFLOW_STARTED, kNow);
  event.mutable_workflow_started()->set_workflow_type("greet");
  event.mutable_workflow_started()->set_input("ada");
  return event;
}

HistoryEvent Signal(const std::string& payload) {
  auto event = MakeEvent(EVENT_TYPE_SIGNAL_RECEIVED, kNow);
  event.mutable_signal_received()->set_name("poke");
  event.mutable_signal_received()->set_payload(payload);
  return event;
}

void TestAppendAssignsContiguousSeqs() {
  auto     repo = std::make_shared<MemoryRepository>();
  EventLog log(repo);
  auto     key = flowstead::util::MakeKey("wf-1", "run-1");

  std::vector<HistoryEvent> first{Started(), Signal("a")};
  assert(log.Append(key, 0, first));
  assert(first[0].seq() == 0);
  assert(first[1].seq() == 1);

  std::vector<HistoryEvent> second{Signal("b")};
  assert(log.Append(key, 2, second));
  assert(log.Length(key) == 3);

  const auto events = log.Read(key);
  assert(events.size() == 3);
  for (std::size_t i = 0; i < events.size(); ++i) {
    assert(events[i].seq() == static_cast<int64_t>(i));
  }
  assert(events[0].workflow_started().input() == "ada");
  assert(events[2].signal_received().payload() == "b");

  const auto tail = log.Read(key, 1);
  assert(tail.size() == 2);
  assert(tail.front().seq() == 1);
}

void TestStaleExpectedSeqConflictsAndWritesNothing() {
  auto     repo = std::make_shared<MemoryRepository>();
  EventLog log(repo);
  auto     key = flowstead::util::MakeKey("wf-2", "run-1");

  std::vector<HistoryEvent> first{Started()};
  assert(log.Append(key, 0, first));

  std::vector<HistoryEvent> stale{Signal("x"), Signal("y")};
  auto                      result = log.Append(key, 0, stale);
  assert(!result);
  assert(result.code == ErrorCode::Conflict);
  assert(log.Length(key) == 1);

  std::vector<HistoryEvent> ahead{Signal("z")};
  assert(log.Append(key, 5, ahead).code == ErrorCode::Conflict);
  assert(log.Length(key) == 1);
}

void TestRunsAreIsolated() {
  auto     repo = std::make_shared<MemoryRepository>();
  EventLog log(repo);

  std::vector<HistoryEvent> a{Started()};
  std::vector<HistoryEvent> b{Started(), Signal("b")};
  assert(log.Append(flowstead::util::MakeKey("wf", "run-a"), 0, a));
  assert(log.Append(flowstead::util::MakeKey("wf", "run-b"), 0, b));

  assert(log.Length(flowstead::util::MakeKey("wf", "run-a")) == 1);
  assert(log.Length(flowstead::util::MakeKey("wf", "run-b")) == 2);
  assert(log.Read(flowstead::util::MakeKey("wf", "missing")).empty());
}

void TestRolledBackAppendIsInvisible() {
  auto     repo = std::make_shared<MemoryRepository>();
  EventLog log(repo);
  auto     key = flowstead::util::MakeKey("wf-3", "run-1");

  {
    auto                      tx = repo->Begin();
    std::vector<HistoryEvent> batch{Started(), Signal("lost")};
    assert(log.AppendInTransaction(*tx, key, 0, batch));
    assert(log.ReadInTransaction(*tx, key).size() == 2);
    tx->Rollback();
  }
  assert(log.Length(key) == 0);
}

void TestInboxKeepsPostingOrder() {
  auto  repo = std::make_shared<MemoryRepository>();
  Inbox inbox(repo);
  auto  key = flowstead::util::MakeKey("wf-4", "run-1");

  {
    auto tx = repo->Begin();
    inbox.Post(*tx, key, Signal("first"));
    inbox.Post(*tx, key, Signal("second"));
    inbox.Post(*tx, flowstead::util::MakeKey("wf-4", "other"), Signal("elsewhere"));
    tx->Commit();
  }

  auto tx      = repo->Begin();
  auto entries = inbox.List(*tx, key);
  assert(entries.size() == 2);
  assert(entries[0].event.signal_received().payload() == "first");
  assert(entries[1].event.signal_received().payload() == "second");

  inbox.Remove(*tx, entries[0].id);
  assert(inbox.List(*tx, key).size() == 1);
  tx->Commit();
}

} // namespace

int main() {
  TestAppendAssignsContiguousSeqs();
  TestStaleExpectedSeqConflictsAndWritesNothing();
  TestRunsAreIsolated();
  TestRolledBackAppendIsInvisible();
  TestInboxKeepsPostingOrder();

  std::cout << "event_log_test: pass\n";
  return 0;
}
