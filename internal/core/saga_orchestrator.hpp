#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/saga_definition.hpp"
#include "internal/core/saga_events.hpp"
#include "internal/core/saga_registry.hpp"
#include "internal/core/step_runner.hpp"
#include "internal/db/api/saga_store.hpp"
#include "internal/lease/execution_lease_table.hpp"
#include "saga/orchestrator/core/v1/types.pb.h"

namespace saga::core {

struct OrchestratorOptions {
  // Shown as lease holder and in logs.
  std::string instance_name = "saga-orchestrator";

  // Execution leases are renewed at every step start with this TTL.
  std::chrono::milliseconds lease_ttl{std::chrono::minutes(10)};

  // How long Shutdown() waits for timed-out handlers before detaching them.
  std::chrono::milliseconds shutdown_grace{std::chrono::seconds(10)};

  std::shared_ptr<SagaEventListener> listener;
};

/*
  Drives registered sagas: forward steps in registration order, same-step
  retries with linear back-off, reverse-order compensation on failure.

  Every saga and step transition is written through the store before the
  next one happens (unless the saga type disables persistence). Step
  handler failures never escape Execute(); a store failure does, as
  util::StoreFailure.
*/
class SagaOrchestrator {
 public:
  using Saga                = saga::orchestrator::core::v1::Saga;
  using SagaStatus          = saga::orchestrator::core::v1::SagaStatus;
  using SagaExecutionResult = saga::orchestrator::core::v1::SagaExecutionResult;

  SagaOrchestrator(std::shared_ptr<db::SagaStore> store, std::shared_ptr<SagaRegistry> registry, OrchestratorOptions options = {});
  ~SagaOrchestrator();

  SagaOrchestrator(const SagaOrchestrator&)            = delete;
  SagaOrchestrator& operator=(const SagaOrchestrator&) = delete;

  void RegisterSaga(SagaBlueprint blueprint);

  SagaExecutionResult Execute(const std::string& saga_type, const google::protobuf::Struct& payload,
                              const google::protobuf::Struct& metadata = google::protobuf::Struct());

  /*
    Re-runs a FAILED saga as a new instance from step 0 (retry_of = saga_id).
    The failed record only gets its retry_count bumped.

    util::NotFound / util::InvalidState / util::ExecutionConflict.
  */
  SagaExecutionResult RetrySaga(const std::string& saga_id);

  std::optional<Saga> GetSagaStatus(const std::string& saga_id);
  std::vector<Saga>   GetFailedSagas();
  std::vector<Saga>   ListSagas(SagaStatus status);

  /*
    Marks sagas left RUNNING / PENDING by a dead process as FAILED so they
    can be retried. Sagas executing in this process are skipped. Meant for
    startup; other processes sharing the store are not detected.
  */
  std::vector<std::string> RecoverStalledSagas();

  void Shutdown();
  bool IsShuttingDown() const;

  const std::shared_ptr<SagaRegistry>& Registry() const {
    return registry_;
  }

 private:
  struct Execution;

  SagaExecutionResult ExecuteInternal(const std::string& saga_type, const google::protobuf::Struct& payload,
                                      const google::protobuf::Struct& metadata, const std::string& retry_of);
  SagaExecutionResult Drive(const RegisteredSaga& definition, Execution& execution);

  std::vector<std::string> Compensate(const RegisteredSaga& definition, Execution& execution, const std::vector<std::size_t>& completed);

  StepRunner::Outcome RunStep(const StepDefinition& step, const Execution& execution, std::chrono::milliseconds timeout);

  void SaveSaga(Execution& execution);
  void TransitionSaga(Execution& execution, SagaStatus status, const std::optional<std::string>& error,
                      const std::optional<google::protobuf::Struct>& result);
  void TransitionStep(Execution& execution, const std::string& step_name, saga::orchestrator::core::v1::StepStatus status,
                      const std::optional<google::protobuf::Value>& result, const std::optional<std::string>& error);
  void MarkFailedAfterStoreError(Execution& execution, const std::string& error);

  // false when interrupted by Shutdown().
  bool WaitRetryDelay(std::chrono::milliseconds delay);

  void Emit(SagaEventType type, const Execution& execution, const std::string& step_name = {}, const std::string& error = {},
            bool retryable = false);

  std::shared_ptr<db::SagaStore> store_;
  std::shared_ptr<SagaRegistry>  registry_;
  OrchestratorOptions            options_;

  StepRunner                 runner_;
  lease::ExecutionLeaseTable leases_;

  mutable std::mutex      shutdown_mutex_;
  std::condition_variable shutdown_cv_;
  bool                    shutting_down_ = false;
};

} // namespace saga::core
