#include "internal/history/event_log.hpp"

#include <stdexcept>

#include "internal/util/execution_key.hpp"

namespace flowstead::history {

EventLog::EventLog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::Result EventLog::Append(const flowstead::core::v1::WorkflowExecutionKey& key, int64_t expected_seq,
                            std::vector<HistoryEvent>& events) {
  auto tx     = repository_->Begin();
  auto result = AppendInTransaction(*tx, key, expected_seq, events);
  if (!result) {
    tx->Rollback();
    return result;
  }
  tx->Commit();
  return result;
}

db::Result EventLog::AppendInTransaction(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key,
                                         int64_t expected_seq, std::vector<HistoryEvent>& events) {
  if (events.empty()) {
    return db::Result::Ok();
  }

  std::vector<db::model::EventRecord> records;
  records.reserve(events.size());

  int64_t seq = expected_seq;
  for (auto& event : events) {
    event.set_seq(seq++);

    db::model::EventRecord record;
    record.seq          = event.seq();
    record.event_type   = static_cast<int32_t>(event.type());
    record.timestamp_ms = util::ToUnixMillis(util::FromProto(event.timestamp()));
    if (!event.SerializeToString(&record.payload)) {
      throw std::runtime_error("serialize history event for " + util::KeyString(key));
    }
    records.push_back(std::move(record));
  }

  return repository_->AppendEvents(tx, key.workflow_id(), key.run_id(), expected_seq, records);
}

std::vector<HistoryEvent> EventLog::Read(const flowstead::core::v1::WorkflowExecutionKey& key, int64_t from_seq) {
  auto tx     = repository_->Begin();
  auto events = ReadInTransaction(*tx, key, from_seq);
  tx->Commit();
  return events;
}

std::vector<HistoryEvent> EventLog::ReadInTransaction(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key,
                                                      int64_t from_seq) {
  auto records = repository_->ReadEvents(tx, key.workflow_id(), key.run_id(), from_seq);

  std::vector<HistoryEvent> events;
  events.reserve(records.size());
  for (const auto& record : records) {
    HistoryEvent event;
    if (!event.ParseFromString(record.payload)) {
      throw std::runtime_error("corrupt history event " + std::to_string(record.seq) + " in " + util::KeyString(key));
    }
    events.push_back(std::move(event));
  }
  return events;
}

int64_t EventLog::Length(const flowstead::core::v1::WorkflowExecutionKey& key) {
  auto tx     = repository_->Begin();
  auto length = repository_->CountEvents(*tx, key.workflow_id(), key.run_id());
  tx->Commit();
  return length;
}

} // namespace flowstead::history
