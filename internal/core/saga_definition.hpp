#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/step_handler.hpp"

namespace saga::core {

struct StepDefinition {
  std::string                  name;
  std::string                  service;
  std::shared_ptr<StepHandler> handler;

  bool retryable = false;

  // Unset falls back to the saga's max_retries.
  std::optional<uint32_t> max_retries;

  // Unset falls back to the saga's timeout.
  std::optional<std::chrono::milliseconds> timeout;
};

struct SagaOptions {
  uint32_t                  max_retries = 3;
  std::chrono::milliseconds retry_delay{1000};
  std::chrono::milliseconds timeout{30000};
  bool                      persist_state = true;
};

// Registration-time options; unset fields take the registry defaults.
struct SagaOptionOverrides {
  std::optional<uint32_t>                  max_retries;
  std::optional<std::chrono::milliseconds> retry_delay;
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<bool>                      persist_state;

  SagaOptions ResolveAgainst(const SagaOptions& defaults) const {
    SagaOptions resolved;
    resolved.max_retries   = max_retries.value_or(defaults.max_retries);
    resolved.retry_delay   = retry_delay.value_or(defaults.retry_delay);
    resolved.timeout       = timeout.value_or(defaults.timeout);
    resolved.persist_state = persist_state.value_or(defaults.persist_state);
    return resolved;
  }
};

// What callers register.
struct SagaBlueprint {
  std::string                 saga_type;
  std::vector<StepDefinition> steps;
  SagaOptionOverrides         options;
};

// What the registry hands to the orchestrator: options fully resolved.
struct RegisteredSaga {
  std::string                 saga_type;
  std::vector<StepDefinition> steps;
  SagaOptions                 options;
};

} // namespace saga::core
