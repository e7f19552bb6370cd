#pragma once

#include <memory>

#include "internal/db/api/saga_store.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace saga::db::postgres {

/*
  Durable saga store on PostgreSQL.

  Same layout as the SQLite store with the document held as JSONB.
  Updates lock the row with SELECT ... FOR UPDATE inside one pqxx::work,
  so concurrent writers of one saga are serialized by the database.
*/
class PgSagaStore final : public db::SagaStore {
public:
  explicit PgSagaStore(std::shared_ptr<PgPool> pool);

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

  static void Write(pqxx::work& work, const Saga& saga);
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace saga::db::postgres
