#pragma once

#include <string_view>

#include "saga/orchestrator/core/v1/types.pb.h"

namespace saga::model {

using SagaStatus = ::saga::orchestrator::core::v1::SagaStatus;
using StepStatus = ::saga::orchestrator::core::v1::StepStatus;

constexpr bool IsTerminal(SagaStatus status) {
  return status == ::saga::orchestrator::core::v1::SAGA_STATUS_COMPLETED || status == ::saga::orchestrator::core::v1::SAGA_STATUS_FAILED;
}

/*
  PENDING -> RUNNING -> {COMPLETED | FAILED}

  Nothing leaves COMPLETED or FAILED. A manual retry creates a new saga
  instead of reopening the failed record. PENDING -> FAILED is allowed so
  that recovery can close sagas whose process died before they started.
*/
constexpr bool CanTransition(SagaStatus from, SagaStatus to) {
  using namespace ::saga::orchestrator::core::v1;

  if (from == to) {
    return true;
  }
  if (IsTerminal(from) || to == SAGA_STATUS_UNSPECIFIED) {
    return false;
  }

  switch (from) {
    case SAGA_STATUS_UNSPECIFIED:
      return to == SAGA_STATUS_PENDING;
    case SAGA_STATUS_PENDING:
      return to == SAGA_STATUS_RUNNING || to == SAGA_STATUS_FAILED;
    case SAGA_STATUS_RUNNING:
      return to == SAGA_STATUS_COMPLETED || to == SAGA_STATUS_FAILED;
    default:
      return false;
  }
}

/*
  forward:       PENDING -> RUNNING -> COMPLETED
  failure:       RUNNING -> FAILED
  retry:         FAILED  -> RUNNING
  compensation:  COMPLETED -> COMPENSATING -> COMPENSATED

  A failed compensation leaves the step in COMPENSATING.
*/
constexpr bool CanTransition(StepStatus from, StepStatus to) {
  using namespace ::saga::orchestrator::core::v1;

  switch (from) {
    case STEP_STATUS_PENDING:
      return to == STEP_STATUS_RUNNING;
    case STEP_STATUS_RUNNING:
      return to == STEP_STATUS_COMPLETED || to == STEP_STATUS_FAILED;
    case STEP_STATUS_FAILED:
      return to == STEP_STATUS_RUNNING;
    case STEP_STATUS_COMPLETED:
      return to == STEP_STATUS_COMPENSATING;
    case STEP_STATUS_COMPENSATING:
      return to == STEP_STATUS_COMPENSATED;
    default:
      return false;
  }
}

constexpr std::string_view ToString(SagaStatus status) {
  using namespace ::saga::orchestrator::core::v1;

  switch (status) {
    case SAGA_STATUS_PENDING:
      return "PENDING";
    case SAGA_STATUS_RUNNING:
      return "RUNNING";
    case SAGA_STATUS_COMPLETED:
      return "COMPLETED";
    case SAGA_STATUS_FAILED:
      return "FAILED";
    default:
      return "UNSPECIFIED";
  }
}

constexpr std::string_view ToString(StepStatus status) {
  using namespace ::saga::orchestrator::core::v1;

  switch (status) {
    case STEP_STATUS_PENDING:
      return "PENDING";
    case STEP_STATUS_RUNNING:
      return "RUNNING";
    case STEP_STATUS_COMPLETED:
      return "COMPLETED";
    case STEP_STATUS_FAILED:
      return "FAILED";
    case STEP_STATUS_COMPENSATING:
      return "COMPENSATING";
    case STEP_STATUS_COMPENSATED:
      return "COMPENSATED";
    default:
      return "UNSPECIFIED";
  }
}

} // namespace saga::model
