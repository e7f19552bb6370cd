#include "saga_orchestrator.hpp"

#include <stdexcept>
#include <utility>

#include "internal/db/saga_document.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace saga::core {

using namespace saga::orchestrator::core::v1;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + ": " + db::ToString(result.code);
  if (!result.message.empty()) {
    message += " (" + result.message + ")";
  }
  throw util::StoreFailure(message);
}

std::int64_t ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

// ------------------------------------------------------------------
// Execution: state owned by one Execute() call
// ------------------------------------------------------------------

struct SagaOrchestrator::Execution {
  Execution(Saga initial, bool persist_state, google::protobuf::Struct caller_metadata, lease::ScopedExecutionLease execution_lease)
      : saga(std::move(initial)),
        persist(persist_state),
        metadata(std::move(caller_metadata)),
        lease(std::move(execution_lease)),
        started(std::chrono::steady_clock::now()) {
  }

  // Local mirror of the stored record, kept in step with every write.
  Saga saga;
  bool persist;

  google::protobuf::Struct metadata;

  // step name -> output, in completion order
  google::protobuf::Struct results;

  lease::ScopedExecutionLease           lease;
  std::chrono::steady_clock::time_point started;

  SagaExecutionResult Finish(SagaStatus status, const std::vector<std::size_t>& completed, const RegisteredSaga& definition) const {
    SagaExecutionResult result;
    result.set_saga_id(saga.saga_id());
    result.set_saga_type(saga.saga_type());
    result.set_status(status);
    for (auto index : completed) {
      result.add_completed_steps(definition.steps[index].name);
    }
    if (status == SAGA_STATUS_COMPLETED) {
      *result.mutable_result() = results;
    }
    result.set_duration_ms(static_cast<uint64_t>(ElapsedMs(started)));
    return result;
  }
};

SagaOrchestrator::SagaOrchestrator(std::shared_ptr<db::SagaStore> store, std::shared_ptr<SagaRegistry> registry, OrchestratorOptions options)
    : store_(std::move(store)), registry_(std::move(registry)), options_(std::move(options)), runner_(options_.shutdown_grace) {
  if (!store_) {
    throw std::invalid_argument("SagaOrchestrator requires a saga store");
  }
  if (!registry_) {
    registry_ = std::make_shared<SagaRegistry>();
  }
}

SagaOrchestrator::~SagaOrchestrator() {
  Shutdown();
}

void SagaOrchestrator::RegisterSaga(SagaBlueprint blueprint) {
  registry_->Register(std::move(blueprint));
}

// ------------------------------------------------------------------
// Execute
// ------------------------------------------------------------------

SagaOrchestrator::SagaExecutionResult SagaOrchestrator::Execute(const std::string& saga_type, const google::protobuf::Struct& payload,
                                                                const google::protobuf::Struct& metadata) {
  return ExecuteInternal(saga_type, payload, metadata, {});
}

SagaOrchestrator::SagaExecutionResult SagaOrchestrator::ExecuteInternal(const std::string& saga_type, const google::protobuf::Struct& payload,
                                                                        const google::protobuf::Struct& metadata, const std::string& retry_of) {
  if (IsShuttingDown()) {
    throw util::InvalidState("orchestrator is shutting down");
  }

  auto definition = registry_->Find(saga_type);
  if (!definition) {
    throw util::UnregisteredSagaType(saga_type);
  }

  Saga saga;
  saga.set_saga_id(util::NewSagaId());
  saga.set_saga_type(saga_type);
  saga.set_status(SAGA_STATUS_PENDING);
  for (const auto& step : definition->steps) {
    auto* record = saga.add_steps();
    record->set_name(step.name);
    record->set_service(step.service);
    record->set_status(STEP_STATUS_PENDING);
  }
  *saga.mutable_payload() = payload;
  saga.set_max_retries(definition->options.max_retries);
  const auto now              = util::NowProto();
  *saga.mutable_created_at()  = now;
  *saga.mutable_updated_at()  = now;
  saga.set_retry_of(retry_of);

  auto acquired = leases_.TryAcquire(saga.saga_id(), options_.instance_name, options_.lease_ttl);
  if (!acquired) {
    throw util::ExecutionConflict("saga " + saga.saga_id() + " is already executing");
  }

  Execution execution(std::move(saga), definition->options.persist_state, metadata,
                      lease::ScopedExecutionLease(leases_, std::move(*acquired)));

  observability::SpanScope span("saga.execute");
  span.SetAttribute("saga.type", saga_type);
  span.SetAttribute("saga.id", execution.saga.saga_id());

  SAGA_LOG_INFO("Starting saga", {StringField("saga_type", saga_type), StringField("saga_id", execution.saga.saga_id()),
                                  StringField("retry_of", retry_of)});

  try {
    auto result = Drive(*definition, execution);

    auto& metrics = observability::Metrics::Instance();
    metrics.RecordSagaOutcome(saga_type, model::ToString(result.status()));
    metrics.ObserveSagaDurationMs(saga_type, static_cast<double>(result.duration_ms()));
    if (result.status() != SAGA_STATUS_COMPLETED) {
      span.RecordException(result.error());
    }
    return result;
  } catch (const util::StoreFailure& e) {
    span.RecordException(e.what());
    SAGA_LOG_ERROR("Saga aborted: state could not be persisted",
                   {StringField("saga_type", saga_type), StringField("saga_id", execution.saga.saga_id()), StringField("error", e.what())});
    MarkFailedAfterStoreError(execution, e.what());
    observability::Metrics::Instance().RecordSagaOutcome(saga_type, "STORE_FAILURE");
    throw;
  }
}

SagaOrchestrator::SagaExecutionResult SagaOrchestrator::Drive(const RegisteredSaga& definition, Execution& execution) {
  const auto& options   = definition.options;
  const auto& saga_id   = execution.saga.saga_id();
  const auto& saga_type = execution.saga.saga_type();

  SaveSaga(execution);
  TransitionSaga(execution, SAGA_STATUS_RUNNING, std::nullopt, std::nullopt);
  Emit(SagaEventType::kStarted, execution);

  std::vector<std::size_t> completed;

  for (std::size_t index = 0; index < definition.steps.size(); ++index) {
    const auto& step    = definition.steps[index];
    const auto  timeout = step.timeout.value_or(options.timeout);

    for (;;) {
      if (!execution.lease.Renew(options_.lease_ttl)) {
        SAGA_LOG_WARN("Execution lease expired", {StringField("saga_id", saga_id), StringField("step", step.name)});
      }

      TransitionStep(execution, step.name, STEP_STATUS_RUNNING, std::nullopt, std::nullopt);

      auto outcome = RunStep(step, execution, timeout);
      observability::Metrics::Instance().RecordStepAttempt(saga_type, step.name, outcome.Ok());

      if (outcome.Ok()) {
        TransitionStep(execution, step.name, STEP_STATUS_COMPLETED, outcome.value, std::nullopt);
        (*execution.results.mutable_fields())[step.name] = outcome.value;
        completed.push_back(index);

        SAGA_LOG_INFO("Step completed", {StringField("saga_id", saga_id), StringField("step", step.name)});
        Emit(SagaEventType::kStepCompleted, execution, step.name);
        break;
      }

      std::string error = outcome.error;
      if (outcome.kind == StepRunner::OutcomeKind::kTimedOut) {
        error = "Step " + step.name + " timeout";
      } else if (outcome.kind == StepRunner::OutcomeKind::kCancelled) {
        error = "Step " + step.name + " cancelled: " + outcome.error;
      }

      TransitionStep(execution, step.name, STEP_STATUS_FAILED, std::nullopt, error);

      // retry_count is a saga-wide budget shared by every retryable step
      const uint32_t budget = step.max_retries.value_or(options.max_retries);
      const bool     retry  = step.retryable && execution.saga.retry_count() < budget && !IsShuttingDown();

      SAGA_LOG_ERROR("Step failed", {StringField("saga_id", saga_id), StringField("step", step.name), StringField("error", error),
                                     BoolField("retrying", retry), IntField("retry_count", execution.saga.retry_count())});
      Emit(SagaEventType::kStepFailed, execution, step.name, error, retry);

      if (retry) {
        execution.saga.set_retry_count(execution.saga.retry_count() + 1);
        SaveSaga(execution);

        if (WaitRetryDelay(options.retry_delay * execution.saga.retry_count())) {
          continue;
        }
        SAGA_LOG_WARN("Retry interrupted by shutdown", {StringField("saga_id", saga_id), StringField("step", step.name)});
      }

      auto compensated = Compensate(definition, execution, completed);

      TransitionSaga(execution, SAGA_STATUS_FAILED, error, std::nullopt);
      SAGA_LOG_ERROR("Saga failed", {StringField("saga_id", saga_id), StringField("saga_type", saga_type), StringField("failed_step", step.name),
                                     IntField("compensated", static_cast<std::int64_t>(compensated.size()))});
      Emit(SagaEventType::kFailed, execution, step.name, error);

      auto result = execution.Finish(SAGA_STATUS_FAILED, completed, definition);
      result.set_error(error);
      result.set_failed_step(step.name);
      for (auto& name : compensated) {
        result.add_compensated_steps(std::move(name));
      }
      return result;
    }
  }

  TransitionSaga(execution, SAGA_STATUS_COMPLETED, std::nullopt, execution.results);

  auto result = execution.Finish(SAGA_STATUS_COMPLETED, completed, definition);
  SAGA_LOG_INFO("Saga completed", {StringField("saga_id", saga_id), StringField("saga_type", saga_type),
                                   IntField("duration_ms", static_cast<std::int64_t>(result.duration_ms()))});
  Emit(SagaEventType::kCompleted, execution);
  return result;
}

StepRunner::Outcome SagaOrchestrator::RunStep(const StepDefinition& step, const Execution& execution, std::chrono::milliseconds timeout) {
  SagaContext context;
  context.saga_id          = execution.saga.saga_id();
  context.saga_type        = execution.saga.saga_type();
  context.current_step     = step.name;
  context.previous_results = execution.results;
  context.metadata         = execution.metadata;

  // The invocation owns copies: it may outlive this call when abandoned.
  auto work = [handler = step.handler, payload = execution.saga.payload(), context = std::move(context)](std::stop_token stop) mutable {
    context.stop_token = stop;
    return handler->Execute(payload, context);
  };

  return runner_.Run(std::move(work), timeout);
}

// ------------------------------------------------------------------
// Compensation
// ------------------------------------------------------------------

std::vector<std::string> SagaOrchestrator::Compensate(const RegisteredSaga& definition, Execution& execution,
                                                      const std::vector<std::size_t>& completed) {
  std::vector<std::string> compensated;
  if (completed.empty()) {
    return compensated;
  }

  const auto& saga_id   = execution.saga.saga_id();
  const auto& saga_type = execution.saga.saga_type();

  SAGA_LOG_WARN("Starting compensation for saga",
                {StringField("saga_id", saga_id), IntField("steps", static_cast<std::int64_t>(completed.size()))});
  Emit(SagaEventType::kCompensating, execution);

  for (auto it = completed.rbegin(); it != completed.rend(); ++it) {
    const auto& step = definition.steps[*it];

    TransitionStep(execution, step.name, STEP_STATUS_COMPENSATING, std::nullopt, std::nullopt);

    SagaContext context;
    context.saga_id          = saga_id;
    context.saga_type        = saga_type;
    context.current_step     = step.name;
    context.previous_results = execution.results;
    context.metadata         = execution.metadata;

    std::optional<std::string> failure;
    try {
      step.handler->Compensate(execution.saga.payload(), context);
    } catch (const std::exception& e) {
      failure = e.what();
    } catch (...) {
      failure = "unknown error";
    }

    observability::Metrics::Instance().RecordCompensation(saga_type, step.name, !failure);

    if (failure) {
      // step stays COMPENSATING; the loop still visits the earlier steps
      SAGA_LOG_ERROR("Compensation failed for step", {StringField("saga_id", saga_id), StringField("step", step.name), StringField("error", *failure)});
      continue;
    }

    TransitionStep(execution, step.name, STEP_STATUS_COMPENSATED, std::nullopt, std::nullopt);
    compensated.push_back(step.name);

    SAGA_LOG_INFO("Step compensated", {StringField("saga_id", saga_id), StringField("step", step.name)});
    Emit(SagaEventType::kStepCompensated, execution, step.name);
  }

  return compensated;
}

// ------------------------------------------------------------------
// Persistence
// ------------------------------------------------------------------

void SagaOrchestrator::SaveSaga(Execution& execution) {
  db::StampUpdated(execution.saga);
  if (!execution.persist) {
    return;
  }
  ThrowIfDbError(store_->Save(execution.saga), "save saga " + execution.saga.saga_id());
}

void SagaOrchestrator::TransitionSaga(Execution& execution, SagaStatus status, const std::optional<std::string>& error,
                                      const std::optional<google::protobuf::Struct>& result) {
  auto applied = db::ApplySagaStatus(execution.saga, status, error, result);
  if (!applied) {
    throw util::InvalidState(applied.message);
  }
  if (!execution.persist) {
    return;
  }
  ThrowIfDbError(store_->UpdateStatus(execution.saga.saga_id(), status, error, result),
                 "update saga " + execution.saga.saga_id() + " to " + std::string(model::ToString(status)));
}

void SagaOrchestrator::TransitionStep(Execution& execution, const std::string& step_name, StepStatus status,
                                      const std::optional<google::protobuf::Value>& result, const std::optional<std::string>& error) {
  auto applied = db::ApplyStepStatus(execution.saga, step_name, status, result, error);
  if (!applied) {
    throw util::InvalidState(applied.message);
  }
  if (!execution.persist) {
    return;
  }
  ThrowIfDbError(store_->UpdateStepStatus(execution.saga.saga_id(), step_name, status, result, error),
                 "update step " + step_name + " of saga " + execution.saga.saga_id() + " to " + std::string(model::ToString(status)));
}

void SagaOrchestrator::MarkFailedAfterStoreError(Execution& execution, const std::string& error) {
  if (!execution.persist) {
    return;
  }

  try {
    auto r = store_->UpdateStatus(execution.saga.saga_id(), SAGA_STATUS_FAILED, error, std::nullopt);
    if (!r) {
      SAGA_LOG_ERROR("Could not mark saga failed", {StringField("saga_id", execution.saga.saga_id()), StringField("code", db::ToString(r.code)),
                                                    StringField("error", r.message)});
    }
  } catch (const std::exception& e) {
    SAGA_LOG_ERROR("Could not mark saga failed", {StringField("saga_id", execution.saga.saga_id()), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// Retry / queries / recovery
// ------------------------------------------------------------------

SagaOrchestrator::SagaExecutionResult SagaOrchestrator::RetrySaga(const std::string& saga_id) {
  if (IsShuttingDown()) {
    throw util::InvalidState("orchestrator is shutting down");
  }

  auto acquired = leases_.TryAcquire(saga_id, options_.instance_name, options_.lease_ttl);
  if (!acquired) {
    throw util::ExecutionConflict("saga " + saga_id + " is already being executed or retried");
  }
  lease::ScopedExecutionLease guard(leases_, std::move(*acquired));

  auto saga = store_->FindById(saga_id);
  if (!saga) {
    throw util::NotFound("saga " + saga_id + " not found");
  }
  if (saga->status() != SAGA_STATUS_FAILED) {
    throw util::InvalidState("saga " + saga_id + " is " + std::string(model::ToString(saga->status())) + ", only FAILED sagas can be retried");
  }

  saga->set_retry_count(saga->retry_count() + 1);
  ThrowIfDbError(store_->Save(*saga), "save saga " + saga_id);

  SAGA_LOG_INFO("Retrying saga", {StringField("saga_id", saga_id), StringField("saga_type", saga->saga_type()),
                                  IntField("retry_count", saga->retry_count())});

  return ExecuteInternal(saga->saga_type(), saga->payload(), google::protobuf::Struct(), saga_id);
}

std::optional<SagaOrchestrator::Saga> SagaOrchestrator::GetSagaStatus(const std::string& saga_id) {
  return store_->FindById(saga_id);
}

std::vector<SagaOrchestrator::Saga> SagaOrchestrator::GetFailedSagas() {
  return store_->FindByStatus(SAGA_STATUS_FAILED);
}

std::vector<SagaOrchestrator::Saga> SagaOrchestrator::ListSagas(SagaStatus status) {
  return store_->FindByStatus(status);
}

std::vector<std::string> SagaOrchestrator::RecoverStalledSagas() {
  static const std::string kInterrupted = "saga interrupted before completion";

  std::vector<std::string> recovered;
  for (auto status : {SAGA_STATUS_RUNNING, SAGA_STATUS_PENDING}) {
    for (const auto& saga : store_->FindByStatus(status)) {
      if (leases_.IsLeased(saga.saga_id())) {
        continue;
      }

      // outcome of a step caught RUNNING is unknown; treat it as failed
      for (const auto& step : saga.steps()) {
        if (step.status() != STEP_STATUS_RUNNING) continue;
        ThrowIfDbError(store_->UpdateStepStatus(saga.saga_id(), step.name(), STEP_STATUS_FAILED, std::nullopt, kInterrupted),
                       "recover step " + step.name() + " of saga " + saga.saga_id());
      }
      ThrowIfDbError(store_->UpdateStatus(saga.saga_id(), SAGA_STATUS_FAILED, kInterrupted, std::nullopt), "recover saga " + saga.saga_id());

      SAGA_LOG_WARN("Recovered stalled saga", {StringField("saga_id", saga.saga_id()), StringField("saga_type", saga.saga_type()),
                                               StringField("was", model::ToString(status))});
      if (options_.listener) {
        SagaEvent event{SagaEventType::kFailed, saga.saga_id(), saga.saga_type(), {}, kInterrupted, false};
        try {
          options_.listener->OnSagaEvent(event);
        } catch (const std::exception& e) {
          SAGA_LOG_WARN("Saga event listener failed", {StringField("event", RoutingKey(event.type)), StringField("error", e.what())});
        }
      }
      recovered.push_back(saga.saga_id());
    }
  }
  return recovered;
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

bool SagaOrchestrator::WaitRetryDelay(std::chrono::milliseconds delay) {
  std::unique_lock lock(shutdown_mutex_);
  return !shutdown_cv_.wait_for(lock, delay, [this] { return shutting_down_; });
}

void SagaOrchestrator::Shutdown() {
  bool first = false;
  {
    std::lock_guard lock(shutdown_mutex_);
    first          = !shutting_down_;
    shutting_down_ = true;
  }
  shutdown_cv_.notify_all();
  const auto detached = runner_.Shutdown();

  if (first) {
    SAGA_LOG_INFO("Saga orchestrator stopped",
                  {StringField("instance", options_.instance_name), IntField("detached_steps", static_cast<std::int64_t>(detached))});
  }
}

bool SagaOrchestrator::IsShuttingDown() const {
  std::lock_guard lock(shutdown_mutex_);
  return shutting_down_;
}

void SagaOrchestrator::Emit(SagaEventType type, const Execution& execution, const std::string& step_name, const std::string& error,
                            bool retryable) {
  if (!options_.listener) {
    return;
  }

  SagaEvent event{type, execution.saga.saga_id(), execution.saga.saga_type(), step_name, error, retryable};
  try {
    options_.listener->OnSagaEvent(event);
  } catch (const std::exception& e) {
    SAGA_LOG_WARN("Saga event listener failed", {StringField("event", RoutingKey(type)), StringField("error", e.what())});
  }
}

} // namespace saga::core
