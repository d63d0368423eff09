#include "pg_pool.hpp"

namespace flowstead::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("count_events", "SELECT COUNT(*) FROM history_events WHERE workflow_id=$1 AND run_id=$2");

  conn.prepare("append_event",
               "INSERT INTO history_events(workflow_id,run_id,seq,event_type,timestamp_ms,payload) "
               "VALUES($1,$2,$3,$4,$5,$6)");

  conn.prepare("read_events",
               "SELECT workflow_id,run_id,seq,event_type,timestamp_ms,payload FROM history_events "
               "WHERE workflow_id=$1 AND run_id=$2 AND seq>=$3 ORDER BY seq ASC");

  conn.prepare("get_run_lock",
               "SELECT workflow_id,run_id,holder_id,lease_expiry_ms,ttl_ms FROM run_locks "
               "WHERE workflow_id=$1 AND run_id=$2 FOR UPDATE");

  conn.prepare("upsert_run_lock",
               "INSERT INTO run_locks(workflow_id,run_id,holder_id,lease_expiry_ms,ttl_ms) VALUES($1,$2,$3,$4,$5) "
               "ON CONFLICT(workflow_id,run_id) DO UPDATE SET holder_id=EXCLUDED.holder_id,"
               " lease_expiry_ms=EXCLUDED.lease_expiry_ms, ttl_ms=EXCLUDED.ttl_ms");

  conn.prepare("insert_inbox",
               "INSERT INTO inbox(workflow_id,run_id,created_at_ms,payload) VALUES($1,$2,$3,$4) RETURNING id");

  conn.prepare("list_inbox",
               "SELECT id,workflow_id,run_id,created_at_ms,payload FROM inbox "
               "WHERE workflow_id=$1 AND run_id=$2 ORDER BY id ASC");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      --live_connections_;
      delete conn;
    }
  }
  cv_.notify_one();
}

} // namespace flowstead::db::postgres
