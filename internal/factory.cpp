#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/task_server.hpp"
#include "internal/grpc/workflow_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/uuid.hpp"
#include "internal/worker/task_poller.hpp"
#if FLOWSTEAD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FLOWSTEAD_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace flowstead::factory {

using namespace flowstead;

namespace {

#if FLOWSTEAD_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT workflow_id,run_id,status,history_length FROM executions LIMIT 1;");
  sqlite_db->Exec("SELECT workflow_id,run_id,seq,payload FROM history_events LIMIT 1;");
  sqlite_db->Exec("SELECT task_id,task_queue,visible_at_ms FROM activity_tasks LIMIT 1;");
}
#endif

#if FLOWSTEAD_DB_POSTGRES
// Runs on a dedicated connection: pooled connections prepare statements
// against these tables.
void BootstrapPostgresSchema(const std::string& conninfo) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT workflow_id,run_id,status,history_length FROM executions LIMIT 1;");
  tx.exec("SELECT workflow_id,run_id,seq,payload FROM history_events LIMIT 1;");
  tx.commit();
}
#endif

engine::EngineOptions BuildEngineOptions(const flowstead::runtime::config::EngineConfig& engine) {
  engine::EngineOptions options;
  options.instance_id            = engine.instance_id().empty() ? "engine-" + util::NewId() : engine.instance_id();
  options.decision_threads       = static_cast<int>(engine.decision_threads());
  options.run_lock_ttl           = util::FromProto(engine.run_lock_ttl());
  options.sweep_interval         = util::FromProto(engine.sweep_interval());
  options.retry_initial          = util::FromProto(engine.engine_retry_initial());
  options.retry_max              = util::FromProto(engine.engine_retry_max());
  options.default_start_to_close = util::FromProto(engine.default_start_to_close_timeout());
  return options;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const flowstead::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FLOWSTEAD_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FLOWSTEAD_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const flowstead::runtime::config::RuntimeConfig& config, std::shared_ptr<const workflow::WorkflowRegistry> workflows,
                  std::shared_ptr<const activity::ActivityRegistry> activities, std::shared_ptr<util::Clock> clock, bool build_grpc) {
  if (!workflows || !activities) {
    throw std::invalid_argument("workflow and activity registries are required");
  }

  Application app;

  // ------------------------------------------------------------------
  // Persistence + engine
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.engine     = std::make_shared<engine::WorkflowEngine>(BuildEngineOptions(config.engine()), app.repository, clock, workflows);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine         = app.engine;
  ctx.workflows      = workflows;
  ctx.activities     = activities;
  ctx.list_page_size = config.engine().list_page_size();

  app.workflow_service = std::make_shared<service::WorkflowService>(ctx);
  app.task_service     = std::make_shared<service::TaskService>(ctx);

  // ------------------------------------------------------------------
  // In-process activity workers, one per configured queue
  // ------------------------------------------------------------------
  auto poller = std::make_shared<worker::LocalTaskPoller>(app.task_service);
  for (const auto& queue : config.workers().task_queues()) {
    worker::WorkerOptions options;
    options.task_queue = queue;
    options.threads    = static_cast<int>(config.workers().threads());
    options.poll_wait  = util::FromProto(config.workers().poll_timeout());
    app.workers.push_back(std::make_shared<worker::ActivityWorker>(options, activities, poller));
  }

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  if (build_grpc) {
    app.grpc_services.push_back(std::make_unique<grpc::WorkflowServer>(app.workflow_service));
    app.grpc_services.push_back(std::make_unique<grpc::TaskServer>(app.task_service));
  }

  FLOWSTEAD_LOG_INFO("Application built", {observability::StringField("instance_id", app.engine->options().instance_id),
                                           observability::IntField("workers", static_cast<int64_t>(app.workers.size()))});
  return app;
}

void Application::Start() {
  engine->Start();
  for (auto& worker : workers) {
    worker->Start();
  }
}

void Application::Stop() {
  for (auto& worker : workers) {
    worker->Stop();
  }
  if (engine) engine->Stop();
}

} // namespace flowstead::factory
