#include "schema.hpp"

#if SAGA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#endif

#if SAGA_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace saga::db {

#if SAGA_DB_SQLITE
void BootstrapSqliteSchema(sqlite::SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS saga ("
      "saga_id TEXT PRIMARY KEY, "
      "saga_type TEXT NOT NULL, "
      "status INTEGER NOT NULL, "
      "document TEXT NOT NULL, "
      "created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL);");
  db.Exec("CREATE INDEX IF NOT EXISTS saga_status_idx ON saga(status, created_at_ms);");
}
#endif

#if SAGA_DB_POSTGRES
void BootstrapPostgresSchema(postgres::PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);
  tx.exec(
      "CREATE TABLE IF NOT EXISTS saga ("
      "saga_id TEXT PRIMARY KEY, "
      "saga_type TEXT NOT NULL, "
      "status SMALLINT NOT NULL, "
      "document JSONB NOT NULL, "
      "created_at_ms BIGINT NOT NULL, "
      "updated_at_ms BIGINT NOT NULL)");
  tx.exec("CREATE INDEX IF NOT EXISTS saga_status_idx ON saga(status, created_at_ms)");
  tx.commit();
}
#endif

} // namespace saga::db
