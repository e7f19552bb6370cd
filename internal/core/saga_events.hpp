#pragma once

#include <string>
#include <string_view>

namespace saga::core {

enum class SagaEventType {
  kStarted,
  kStepCompleted,
  kStepFailed,
  kCompensating,
  kStepCompensated,
  kCompleted,
  kFailed,
};

// Routing keys used when events are forwarded to a broker.
constexpr std::string_view RoutingKey(SagaEventType type) {
  switch (type) {
    case SagaEventType::kStarted:
      return "saga.started";
    case SagaEventType::kStepCompleted:
      return "saga.step.completed";
    case SagaEventType::kStepFailed:
      return "saga.step.failed";
    case SagaEventType::kCompensating:
      return "saga.compensating";
    case SagaEventType::kStepCompensated:
      return "saga.step.compensated";
    case SagaEventType::kCompleted:
      return "saga.completed";
    case SagaEventType::kFailed:
      return "saga.failed";
  }
  return "saga.unknown";
}

struct SagaEvent {
  SagaEventType type;
  std::string   saga_id;
  std::string   saga_type;
  std::string   step_name;
  std::string   error;

  // kStepFailed only: whether the orchestrator will retry the step.
  bool retryable = false;
};

/*
  Observer of saga lifecycle events. Called synchronously on the executing
  thread; exceptions are logged and dropped.
*/
class SagaEventListener {
 public:
  virtual ~SagaEventListener() = default;

  virtual void OnSagaEvent(const SagaEvent& event) = 0;
};

} // namespace saga::core
