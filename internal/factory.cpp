#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_saga_store.hpp"
#include "internal/db/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if SAGA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_saga_store.hpp"
#endif
#if SAGA_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_saga_store.hpp"
#endif

namespace saga::factory {

core::SagaOptions SagaOptionsFromConfig(const saga::runtime::config::SagaDefaultsConfig& config) {
  core::SagaOptions options;
  if (config.has_max_retries()) options.max_retries = config.max_retries();
  if (config.has_retry_delay_ms()) options.retry_delay = std::chrono::milliseconds(config.retry_delay_ms());
  if (config.has_timeout_ms()) options.timeout = std::chrono::milliseconds(config.timeout_ms());
  if (config.has_persist_state()) options.persist_state = config.persist_state();
  return options;
}

std::shared_ptr<db::SagaStore> BuildSagaStore(const saga::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SAGA_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::BootstrapSqliteSchema(*sqlite_db);
    SAGA_LOG_INFO("Saga store ready", {observability::StringField("backend", "sqlite"),
                                       observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteSagaStore>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SAGA_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::BootstrapPostgresSchema(*pool);
    SAGA_LOG_INFO("Saga store ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgSagaStore>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SAGA_LOG_WARN("Saga store is in-memory; saga state is lost on restart");
  return std::make_shared<db::memory::MemorySagaStore>();
}

Core BuildCore(const saga::runtime::config::RuntimeConfig& config, core::OrchestratorOptions options) {
  Core app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.store        = BuildSagaStore(config);
  app.registry     = std::make_shared<core::SagaRegistry>(SagaOptionsFromConfig(config.saga_defaults()));
  app.orchestrator = std::make_shared<core::SagaOrchestrator>(app.store, app.registry, std::move(options));

  if (config.recovery().recover_on_startup()) {
    const auto recovered = app.orchestrator->RecoverStalledSagas();
    SAGA_LOG_INFO("Startup recovery finished", {observability::IntField("recovered", static_cast<std::int64_t>(recovered.size()))});
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.orchestrator  = app.orchestrator;
  app.admin_service = std::make_shared<service::SagaAdminService>(ctx);

  return app;
}

} // namespace saga::factory
