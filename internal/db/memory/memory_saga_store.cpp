#include "memory_saga_store.hpp"

#include "internal/db/saga_document.hpp"

namespace saga::db::memory {

MemorySagaStore::MemorySagaStore() = default;

Result MemorySagaStore::Save(const Saga& saga) {
  if (saga.saga_id().empty()) return Result::Err(ErrorCode::ConstraintViolation, "saga_id is required");

  Saga copy = saga;
  StampUpdated(copy);

  std::lock_guard lock(mutex_);
  sagas_[copy.saga_id()] = std::move(copy);
  return Result::Ok();
}

Result MemorySagaStore::UpdateStatus(const std::string& saga_id, SagaStatus status, const std::optional<std::string>& error,
                                     const std::optional<google::protobuf::Struct>& result) {
  std::lock_guard lock(mutex_);
  auto            it = sagas_.find(saga_id);
  if (it == sagas_.end()) return Result::Err(ErrorCode::NotFound, "saga " + saga_id + " not found");

  // Work on a copy so a rejected update leaves the record untouched.
  Saga updated = it->second;
  auto r       = ApplySagaStatus(updated, status, error, result);
  if (!r) return r;

  it->second = std::move(updated);
  return Result::Ok();
}

Result MemorySagaStore::UpdateStepStatus(const std::string& saga_id, const std::string& step_name, StepStatus status,
                                         const std::optional<google::protobuf::Value>& result, const std::optional<std::string>& error) {
  std::lock_guard lock(mutex_);
  auto            it = sagas_.find(saga_id);
  if (it == sagas_.end()) return Result::Err(ErrorCode::NotFound, "saga " + saga_id + " not found");

  return ApplyStepStatus(it->second, step_name, status, result, error);
}

std::optional<db::SagaStore::Saga> MemorySagaStore::FindById(const std::string& saga_id) {
  std::lock_guard lock(mutex_);
  auto            it = sagas_.find(saga_id);
  if (it == sagas_.end()) return std::nullopt;
  return it->second;
}

std::vector<db::SagaStore::Saga> MemorySagaStore::FindByStatus(SagaStatus status) {
  std::vector<Saga> matches;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [_, saga] : sagas_) {
      if (saga.status() == status) matches.push_back(saga);
    }
  }

  SortByCreatedAt(matches);
  return matches;
}

} // namespace saga::db::memory
