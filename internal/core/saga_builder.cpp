#include "saga_builder.hpp"

namespace saga::core {

SagaBuilder::SagaBuilder(std::string saga_type) {
  blueprint_.saga_type = std::move(saga_type);
}

SagaBuilder SagaBuilder::Create(std::string saga_type) {
  return SagaBuilder(std::move(saga_type));
}

SagaBuilder& SagaBuilder::Step(std::string name, std::string service, std::shared_ptr<StepHandler> handler, StepOptions options) {
  StepDefinition step;
  step.name        = std::move(name);
  step.service     = std::move(service);
  step.handler     = std::move(handler);
  step.retryable   = options.retryable;
  step.max_retries = options.max_retries;
  step.timeout     = options.timeout;
  blueprint_.steps.push_back(std::move(step));
  return *this;
}

SagaBuilder& SagaBuilder::WithRetries(uint32_t max_retries) {
  blueprint_.options.max_retries = max_retries;
  return *this;
}

SagaBuilder& SagaBuilder::WithRetryDelay(std::chrono::milliseconds retry_delay) {
  blueprint_.options.retry_delay = retry_delay;
  return *this;
}

SagaBuilder& SagaBuilder::WithTimeout(std::chrono::milliseconds timeout) {
  blueprint_.options.timeout = timeout;
  return *this;
}

SagaBuilder& SagaBuilder::WithPersistence(bool persist_state) {
  blueprint_.options.persist_state = persist_state;
  return *this;
}

SagaBlueprint SagaBuilder::Build() const {
  return blueprint_;
}

} // namespace saga::core
