#include "pg_pool.hpp"

namespace saga::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("saga_lock", "SELECT document::text FROM saga WHERE saga_id=$1 FOR UPDATE");

  conn.prepare("saga_get", "SELECT document::text FROM saga WHERE saga_id=$1");

  conn.prepare("saga_by_status", "SELECT document::text FROM saga WHERE status=$1 ORDER BY created_at_ms, saga_id");

  conn.prepare("saga_upsert",
               "INSERT INTO saga(saga_id,saga_type,status,document,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4::jsonb,$5,$6) "
               "ON CONFLICT (saga_id) DO UPDATE SET saga_type=EXCLUDED.saga_type,status=EXCLUDED.status,"
               "document=EXCLUDED.document,created_at_ms=EXCLUDED.created_at_ms,updated_at_ms=EXCLUDED.updated_at_ms");
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
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace saga::db::postgres
