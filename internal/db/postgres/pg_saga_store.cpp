#include "pg_saga_store.hpp"

#include "internal/db/saga_document.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace saga::db::postgres {

PgSagaStore::PgSagaStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

Result PgSagaStore::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

void PgSagaStore::Write(pqxx::work& work, const Saga& saga) {
  work.exec_prepared("saga_upsert", saga.saga_id(), saga.saga_type(), static_cast<int>(saga.status()), EncodeSagaDocument(saga),
                     static_cast<int64_t>(util::ToUnixMillis(saga.created_at())), static_cast<int64_t>(util::ToUnixMillis(saga.updated_at())));
}

template <typename Mutator>
Result PgSagaStore::Modify(const std::string& saga_id, Mutator&& mutate) {
  try {
    PgTransaction tx(pool_);

    auto rows = tx.Work().exec_prepared("saga_lock", saga_id);
    if (rows.empty()) return Result::Err(ErrorCode::NotFound, "saga " + saga_id + " not found");

    auto saga = DecodeSagaDocument(rows[0][0].c_str());
    auto r    = mutate(saga);
    if (!r) return r;

    Write(tx.Work(), saga);
    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgSagaStore::Save(const Saga& saga) {
  if (saga.saga_id().empty()) return Result::Err(ErrorCode::ConstraintViolation, "saga_id is required");

  Saga copy = saga;
  StampUpdated(copy);

  try {
    PgTransaction tx(pool_);
    Write(tx.Work(), copy);
    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgSagaStore::UpdateStatus(const std::string& saga_id, SagaStatus status, const std::optional<std::string>& error,
                                 const std::optional<google::protobuf::Struct>& result) {
  return Modify(saga_id, [&](Saga& saga) { return ApplySagaStatus(saga, status, error, result); });
}

Result PgSagaStore::UpdateStepStatus(const std::string& saga_id, const std::string& step_name, StepStatus status,
                                     const std::optional<google::protobuf::Value>& result, const std::optional<std::string>& error) {
  return Modify(saga_id, [&](Saga& saga) { return ApplyStepStatus(saga, step_name, status, result, error); });
}

std::optional<db::SagaStore::Saga> PgSagaStore::FindById(const std::string& saga_id) {
  try {
    PgTransaction tx(pool_);
    auto          rows = tx.Work().exec_prepared("saga_get", saga_id);
    if (rows.empty()) return std::nullopt;
    return DecodeSagaDocument(rows[0][0].c_str());
  } catch (const std::exception& e) {
    throw util::StoreFailure("postgres FindById " + saga_id + ": " + e.what());
  }
}

std::vector<db::SagaStore::Saga> PgSagaStore::FindByStatus(SagaStatus status) {
  try {
    PgTransaction tx(pool_);
    auto          rows = tx.Work().exec_prepared("saga_by_status", static_cast<int>(status));

    std::vector<Saga> sagas;
    sagas.reserve(rows.size());
    for (const auto& row : rows) {
      sagas.push_back(DecodeSagaDocument(row[0].c_str()));
    }
    SortByCreatedAt(sagas);
    return sagas;
  } catch (const std::exception& e) {
    throw util::StoreFailure("postgres FindByStatus: " + std::string(e.what()));
  }
}

} // namespace saga::db::postgres
