#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/memory_pipeline_store.hpp"
#include "internal/store/persistent_pipeline_store.hpp"
#if PIPELINE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if PIPELINE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace pipeline::factory {

using observability::StringField;

namespace {

#if PIPELINE_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS pipeline_state_document (workspace_id TEXT PRIMARY KEY, document TEXT NOT NULL, revision INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT workspace_id,document,revision,updated_at_ms FROM pipeline_state_document LIMIT 1;");
}
#endif

#if PIPELINE_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS pipeline_state_document (workspace_id TEXT PRIMARY KEY, document JSONB NOT NULL, revision BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);");

  tx.exec("SELECT workspace_id,document,revision,updated_at_ms FROM pipeline_state_document LIMIT 1;");
  tx.commit();
}
#endif

store::PersistenceOptions ToPersistenceOptions(const pipeline::runtime::config::RuntimeConfig& config) {
  store::PersistenceOptions options;
  options.conflict_retries    = config.persistence().conflict_retries();
  options.conflict_backoff_ms = config.persistence().conflict_backoff_ms();
  return options;
}

} // namespace

std::shared_ptr<store::PipelineStore> BuildStore(const pipeline::runtime::config::RuntimeConfig& config,
                                                 std::shared_ptr<util::ClockSource> clock) {
  const auto& backend = config.store();
  const auto  options = ToPersistenceOptions(config);

  if (backend.has_sqlite()) {
#if PIPELINE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(backend.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    return std::make_shared<store::PersistentPipelineStore>(std::move(repository), "sqlite", config.workspace_id(), options, std::move(clock));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (backend.has_postgres()) {
#if PIPELINE_DB_POSTGRES
    const auto max_connections = backend.postgres().max_connections();
    auto pool = std::make_shared<db::postgres::PgPool>(backend.postgres().connection_uri(), max_connections == 0 ? 16 : max_connections);
    BootstrapPostgresSchema(pool);
    auto repository = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    return std::make_shared<store::PersistentPipelineStore>(std::move(repository), "postgres", config.workspace_id(), options,
                                                            std::move(clock));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  if (backend.memory().durable()) {
    return std::make_shared<store::PersistentPipelineStore>(std::make_shared<db::memory::MemoryRepository>(), "memory-durable",
                                                            config.workspace_id(), options, std::move(clock));
  }
  return std::make_shared<store::MemoryPipelineStore>(config.workspace_id(), std::move(clock));
}

Application Build(const pipeline::runtime::config::RuntimeConfig& config, std::shared_ptr<util::ClockSource> clock) {
  Application app;
  app.store          = BuildStore(config, std::move(clock));
  app.stream_service = std::make_shared<service::ProjectStreamService>(app.store);

  PIPELINE_LOG_INFO("pipeline store ready",
                    {StringField("backend", app.store->Backend()), StringField("workspace_id", app.store->WorkspaceId())});
  return app;
}

} // namespace pipeline::factory
