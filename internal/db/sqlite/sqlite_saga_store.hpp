#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/saga_store.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace saga::db::sqlite {

/*
  Durable saga store on SQLite.

  Table `saga` holds one JSON document per saga plus the columns needed to
  query it (status, created_at_ms). The connection is shared, so operations
  are serialized through mutex_ and each write is its own BEGIN IMMEDIATE
  transaction.
*/
class SqliteSagaStore final : public db::SagaStore {
public:
  explicit SqliteSagaStore(std::shared_ptr<SqliteDB> db);

  Result Save(const Saga& saga) override;
  Result UpdateStatus(const std::string& saga_id, SagaStatus status, const std::optional<std::string>& error,
                      const std::optional<google::protobuf::Struct>& result) override;
  Result UpdateStepStatus(const std::string& saga_id, const std::string& step_name, StepStatus status,
                          const std::optional<google::protobuf::Value>& result, const std::optional<std::string>& error) override;

  std::optional<Saga> FindById(const std::string& saga_id) override;
  std::vector<Saga> FindByStatus(SagaStatus status) override;

private:
  template <typename Mutator>
  Result Modify(const std::string& saga_id, Mutator&& mutate);

  static std::optional<Saga> Load(SqliteDB& db, const std::string& saga_id);
  static Result Write(SqliteDB& db, const Saga& saga);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
  std::mutex mutex_;
};

} // namespace saga::db::sqlite
