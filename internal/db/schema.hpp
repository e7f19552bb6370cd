#pragma once

namespace saga::db {

/*
  Schema bootstrap for the durable stores. Idempotent; run by the factory
  before a store is handed out.
*/

#if SAGA_DB_SQLITE
namespace sqlite {
class SqliteDB;
}

void BootstrapSqliteSchema(sqlite::SqliteDB& db);
#endif

#if SAGA_DB_POSTGRES
namespace postgres {
class PgPool;
}

void BootstrapPostgresSchema(postgres::PgPool& pool);
#endif

} // namespace saga::db
