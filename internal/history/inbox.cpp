#include "internal/history/inbox.hpp"

#include <stdexcept>

#include "internal/util/execution_key.hpp"

namespace flowstead::history {

Inbox::Inbox(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void Inbox::Post(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key, const HistoryEvent& event) {
  db::model::InboxRecord record;
  record.workflow_id   = key.workflow_id();
  record.run_id        = key.run_id();
  record.created_at_ms = util::ToUnixMillis(util::FromProto(event.timestamp()));
  if (!event.SerializeToString(&record.payload)) {
    throw std::runtime_error("serialize inbox event for " + util::KeyString(key));
  }

  db::ThrowIfError(repository_->InsertInbox(tx, record), "post inbox " + util::KeyString(key));
}

std::vector<InboxEntry> Inbox::List(db::Transaction& tx, const flowstead::core::v1::WorkflowExecutionKey& key) {
  std::vector<InboxEntry> entries;
  for (const auto& record : repository_->ListInbox(tx, key.workflow_id(), key.run_id())) {
    InboxEntry entry;
    entry.id = record.id;
    if (!entry.event.ParseFromString(record.payload)) {
      throw std::runtime_error("corrupt inbox entry " + std::to_string(record.id) + " for " + util::KeyString(key));
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

void Inbox::Remove(db::Transaction& tx, uint64_t id) {
  db::ThrowIfError(repository_->DeleteInbox(tx, id), "remove inbox entry");
}

} // namespace flowstead::history
