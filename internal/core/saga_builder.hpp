#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/saga_definition.hpp"

namespace saga::core {

struct StepOptions {
  bool                                     retryable = false;
  std::optional<uint32_t>                  max_retries;
  std::optional<std::chrono::milliseconds> timeout;
};

/*
  Fluent construction of a SagaBlueprint:

    auto blueprint = SagaBuilder::Create("order-fulfillment")
                         .Step("reserve-inventory", "inventory", reserve)
                         .Step("charge-payment", "billing", charge, {.retryable = true})
                         .WithRetries(2)
                         .Build();
*/
class SagaBuilder {
 public:
  static SagaBuilder Create(std::string saga_type);

  SagaBuilder& Step(std::string name, std::string service, std::shared_ptr<StepHandler> handler, StepOptions options = {});

  SagaBuilder& WithRetries(uint32_t max_retries);
  SagaBuilder& WithRetryDelay(std::chrono::milliseconds retry_delay);
  SagaBuilder& WithTimeout(std::chrono::milliseconds timeout);
  SagaBuilder& WithPersistence(bool persist_state);

  SagaBlueprint Build() const;

 private:
  explicit SagaBuilder(std::string saga_type);

  SagaBlueprint blueprint_;
};

} // namespace saga::core
