#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/db/api/saga_store.hpp"

namespace saga::db::memory {

/*
  Non-durable saga store.

  Reference implementation of the store contract; used for tests and for
  deployments configured with `database: { memory: {} }`.
*/
class MemorySagaStore final : public db::SagaStore {
public:
  MemorySagaStore();

  Result Save(const Saga& saga) override;
  Result UpdateStatus(const std::string& saga_id, SagaStatus status, const std::optional<std::string>& error,
                      const std::optional<google::protobuf::Struct>& result) override;
  Result UpdateStepStatus(const std::string& saga_id, const std::string& step_name, StepStatus status,
                          const std::optional<google::protobuf::Value>& result, const std::optional<std::string>& error) override;

  std::optional<Saga> FindById(const std::string& saga_id) override;
  std::vector<Saga> FindByStatus(SagaStatus status) override;

private:
  std::mutex mutex_;
  std::unordered_map<std::string, Saga> sagas_;
};

} // namespace saga::db::memory
