#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/saga_builder.hpp"
#include "internal/core/saga_orchestrator.hpp"
#include "internal/core/saga_registry.hpp"
#include "internal/db/memory/memory_saga_store.hpp"
#include "saga/orchestrator/v1.hpp"

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;
using saga::core::SagaContext;

class CarrierUnavailable : public std::runtime_error {
public:
  CarrierUnavailable() : std::runtime_error("CarrierUnavailable: no carrier accepts the parcel") {
  }
};

Value StringValue(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

std::shared_ptr<saga::core::StepHandler> LoggingStep(const std::string& name, const std::string& output) {
  return saga::core::MakeStepHandler(
      [name, output](const Struct&, const SagaContext& ctx) {
        std::cout << "  execute " << name << " (saga " << ctx.saga_id << ")\n";
        return StringValue(output);
      },
      [name](const Struct&, const SagaContext&) { std::cout << "  compensate " << name << "\n"; });
}

} // namespace

int main() {
  auto store        = std::make_shared<saga::db::memory::MemorySagaStore>();
  auto registry     = std::make_shared<saga::core::SagaRegistry>();
  auto orchestrator = std::make_shared<saga::core::SagaOrchestrator>(store, registry);

  auto ship = saga::core::MakeStepHandler([](const Struct&, const SagaContext&) -> Value { throw CarrierUnavailable(); });

  orchestrator->RegisterSaga(saga::core::SagaBuilder::Create("order-fulfillment")
                                 .Step("reserve-inventory", "inventory", LoggingStep("reserve-inventory", "reservation-42"))
                                 .Step("charge-payment", "billing", LoggingStep("charge-payment", "charge-7"))
                                 .Step("ship-order", "shipping", ship)
                                 .WithRetryDelay(std::chrono::milliseconds(10))
                                 .Build());

  Struct payload;
  (*payload.mutable_fields())["order_id"] = StringValue("order-1001");

  std::cout << "running order-fulfillment\n";
  auto result = orchestrator->Execute("order-fulfillment", payload);

  std::string json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;
  if (!google::protobuf::util::MessageToJsonString(result, &json, options).ok()) {
    std::cerr << "failed to render result\n";
    return 1;
  }
  std::cout << json;

  // The stored record carries the per-step audit trail.
  auto stored = orchestrator->GetSagaStatus(result.saga_id());
  if (stored) {
    for (const auto& step : stored->steps()) {
      std::cout << step.name() << ": " << saga::orchestrator::v1::StepStatus_Name(step.status()) << "\n";
    }
  }

  orchestrator->Shutdown();
  return result.status() == saga::orchestrator::v1::SAGA_STATUS_FAILED ? 0 : 1;
}
