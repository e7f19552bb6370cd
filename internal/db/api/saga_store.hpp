#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "saga/orchestrator/core/v1/types.pb.h"

namespace saga::db {

/*
  Saga store contract.

  One document per saga, keyed by saga_id. Every operation is atomic with
  respect to a single saga record: readers never observe a partial write.

  Writes report failures through Result. Reads return the record (or
  nothing) and throw util::StoreFailure when the backend itself fails, so
  "missing" and "unreachable" are never confused.
*/

class SagaStore {
 public:
  using Saga       = saga::orchestrator::core::v1::Saga;
  using SagaStatus = saga::orchestrator::core::v1::SagaStatus;
  using StepStatus = saga::orchestrator::core::v1::StepStatus;

  virtual ~SagaStore() = default;

  // Upsert of the whole document. Stamps updated_at.
  virtual Result Save(const Saga& saga) = 0;

  /*
    Sets the saga status. error and result replace the stored values when
    present. Stamps updated_at, and completed_at for COMPLETED / FAILED.

    NotFound when the saga is missing, Conflict when the transition is not
    allowed from the stored status.
  */
  virtual Result UpdateStatus(const std::string& saga_id, SagaStatus status, const std::optional<std::string>& error,
                              const std::optional<google::protobuf::Struct>& result) = 0;

  /*
    Updates the FIRST step named step_name.

    RUNNING increments attempts and stamps started_at.
    COMPLETED / FAILED / COMPENSATED stamp completed_at.
    NotFound when the saga or the step is missing.
  */
  virtual Result UpdateStepStatus(const std::string& saga_id, const std::string& step_name, StepStatus status,
                                  const std::optional<google::protobuf::Value>& result, const std::optional<std::string>& error) = 0;

  virtual std::optional<Saga> FindById(const std::string& saga_id) = 0;

  // Ordered by created_at ascending.
  virtual std::vector<Saga> FindByStatus(SagaStatus status) = 0;
};

} // namespace saga::db
