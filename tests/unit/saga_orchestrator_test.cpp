#include "internal/core/saga_orchestrator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/saga_builder.hpp"
#include "internal/db/memory/memory_saga_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace saga::orchestrator::core::v1;
using google::protobuf::Struct;
using google::protobuf::Value;
using saga::core::SagaBuilder;
using saga::core::SagaContext;
using saga::core::SagaEvent;
using saga::core::SagaEventType;
using saga::core::SagaOptions;
using saga::core::SagaOrchestrator;
using saga::core::SagaRegistry;
using saga::db::memory::MemorySagaStore;
using namespace std::chrono_literals;

Value StringValue(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

Struct OrderPayload() {
  Struct payload;
  (*payload.mutable_fields())["order_id"] = StringValue("order-1001");
  return payload;
}

class CarrierUnavailable : public std::runtime_error {
 public:
  CarrierUnavailable() : std::runtime_error("CarrierUnavailable") {
  }
};

// Ordered log of handler calls, shared with handlers running on step threads.
class CallLog {
 public:
  void Add(const std::string& entry) {
    std::lock_guard lock(mutex_);
    entries_.push_back(entry);
  }

  std::vector<std::string> Entries() const {
    std::lock_guard lock(mutex_);
    return entries_;
  }

  std::size_t Count(const std::string& entry) const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& e : entries_) n += e == entry ? 1 : 0;
    return n;
  }

 private:
  mutable std::mutex       mutex_;
  std::vector<std::string> entries_;
};

class RecordingListener : public saga::core::SagaEventListener {
 public:
  void OnSagaEvent(const SagaEvent& event) override {
    std::lock_guard lock(mutex_);
    events.push_back(event);
  }

  std::vector<std::string> Keys() {
    std::lock_guard          lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& event : events) keys.emplace_back(saga::core::RoutingKey(event.type));
    return keys;
  }

  std::mutex             mutex_;
  std::vector<SagaEvent> events;
};

// Memory store whose step updates start failing after a number of calls.
class FlakyStore : public saga::db::SagaStore {
 public:
  explicit FlakyStore(int healthy_step_updates) : remaining_(healthy_step_updates) {
  }

  saga::db::Result Save(const Saga& saga) override {
    return inner_.Save(saga);
  }

  saga::db::Result UpdateStatus(const std::string& saga_id, SagaStatus status, const std::optional<std::string>& error,
                                const std::optional<Struct>& result) override {
    return inner_.UpdateStatus(saga_id, status, error, result);
  }

  saga::db::Result UpdateStepStatus(const std::string& saga_id, const std::string& step_name, StepStatus status,
                                    const std::optional<Value>& result, const std::optional<std::string>& error) override {
    if (remaining_-- <= 0) {
      return saga::db::Result::Err(saga::db::ErrorCode::IOError, "disk unavailable");
    }
    return inner_.UpdateStepStatus(saga_id, step_name, status, result, error);
  }

  std::optional<Saga> FindById(const std::string& saga_id) override {
    return inner_.FindById(saga_id);
  }

  std::vector<Saga> FindByStatus(SagaStatus status) override {
    return inner_.FindByStatus(status);
  }

 private:
  std::atomic<int> remaining_;
  MemorySagaStore  inner_;
};

SagaOptions FastDefaults() {
  SagaOptions defaults;
  defaults.retry_delay = 1ms;
  defaults.timeout     = 5s;
  return defaults;
}

struct Harness {
  explicit Harness(std::shared_ptr<saga::db::SagaStore> backing = std::make_shared<MemorySagaStore>())
      : store(std::move(backing)), registry(std::make_shared<SagaRegistry>(FastDefaults())), listener(std::make_shared<RecordingListener>()) {
    saga::core::OrchestratorOptions options;
    options.instance_name = "orchestrator-test";
    options.listener      = listener;
    orchestrator          = std::make_unique<SagaOrchestrator>(store, registry, options);
  }

  std::shared_ptr<saga::db::SagaStore> store;
  std::shared_ptr<SagaRegistry>        registry;
  std::shared_ptr<RecordingListener>   listener;
  std::unique_ptr<SagaOrchestrator>    orchestrator;
};

std::shared_ptr<saga::core::StepHandler> Recorded(CallLog& log, const std::string& name) {
  return saga::core::MakeStepHandler(
      [&log, name](const Struct&, const SagaContext&) {
        log.Add("execute:" + name);
        return StringValue(name + "-done");
      },
      [&log, name](const Struct&, const SagaContext&) { log.Add("compensate:" + name); });
}

void RegisterOrderFulfillment(SagaOrchestrator& orchestrator, CallLog& log) {
  auto ship = saga::core::MakeStepHandler(
      [&log](const Struct&, const SagaContext&) -> Value {
        log.Add("execute:ship-order");
        throw CarrierUnavailable();
      },
      [&log](const Struct&, const SagaContext&) { log.Add("compensate:ship-order"); });

  orchestrator.RegisterSaga(SagaBuilder::Create("order-fulfillment")
                                .Step("reserve-inventory", "inventory", Recorded(log, "reserve-inventory"))
                                .Step("charge-payment", "billing", Recorded(log, "charge-payment"))
                                .Step("ship-order", "shipping", ship)
                                .Build());
}

// ------------------------------------------------------------------

void TestForwardExecutionCompletesEveryStep() {
  Harness h;
  CallLog log;

  auto second = saga::core::MakeStepHandler([&log](const Struct& payload, const SagaContext& ctx) {
    // earlier outputs and caller metadata are visible to later steps
    assert(ctx.previous_results.fields().at("reserve").string_value() == "reserve-done");
    assert(ctx.metadata.fields().at("tenant").string_value() == "acme");
    assert(ctx.current_step == "charge");
    assert(payload.fields().at("order_id").string_value() == "order-1001");
    log.Add("execute:charge");
    return StringValue("charge-done");
  });

  h.orchestrator->RegisterSaga(SagaBuilder::Create("checkout")
                                   .Step("reserve", "inventory", Recorded(log, "reserve"))
                                   .Step("charge", "billing", second)
                                   .Step("notify", "mail", Recorded(log, "notify"))
                                   .Build());

  Struct metadata;
  (*metadata.mutable_fields())["tenant"] = StringValue("acme");

  auto result = h.orchestrator->Execute("checkout", OrderPayload(), metadata);

  assert(result.status() == SAGA_STATUS_COMPLETED);
  assert(result.saga_type() == "checkout");
  assert(!result.has_error());
  assert(!result.has_failed_step());
  assert(result.completed_steps_size() == 3);
  assert(result.completed_steps(0) == "reserve");
  assert(result.completed_steps(1) == "charge");
  assert(result.completed_steps(2) == "notify");
  assert(result.compensated_steps_size() == 0);
  assert(result.result().fields().at("notify").string_value() == "notify-done");

  const auto expected = std::vector<std::string>{"execute:reserve", "execute:charge", "execute:notify"};
  assert(log.Entries() == expected);

  auto stored = h.orchestrator->GetSagaStatus(result.saga_id());
  assert(stored.has_value());
  assert(stored->status() == SAGA_STATUS_COMPLETED);
  assert(stored->has_completed_at());
  assert(stored->result().fields().at("charge").string_value() == "charge-done");
  assert(stored->retry_of().empty());
  for (const auto& step : stored->steps()) {
    assert(step.status() == STEP_STATUS_COMPLETED);
    assert(step.attempts() == 1);
  }
}

void TestOrderFulfillmentCompensatesInReverse() {
  Harness h;
  CallLog log;
  RegisterOrderFulfillment(*h.orchestrator, log);

  auto result = h.orchestrator->Execute("order-fulfillment", OrderPayload());

  assert(result.status() == SAGA_STATUS_FAILED);
  assert(result.failed_step() == "ship-order");
  assert(result.error() == "CarrierUnavailable");
  assert(result.completed_steps_size() == 2);
  assert(result.completed_steps(0) == "reserve-inventory");
  assert(result.completed_steps(1) == "charge-payment");
  assert(result.compensated_steps_size() == 2);
  assert(result.compensated_steps(0) == "charge-payment");
  assert(result.compensated_steps(1) == "reserve-inventory");
  assert(!result.has_result());

  const auto expected = std::vector<std::string>{"execute:reserve-inventory", "execute:charge-payment", "execute:ship-order",
                                                 "compensate:charge-payment", "compensate:reserve-inventory"};
  assert(log.Entries() == expected);

  auto stored = *h.orchestrator->GetSagaStatus(result.saga_id());
  assert(stored.status() == SAGA_STATUS_FAILED);
  assert(stored.error() == "CarrierUnavailable");
  assert(stored.steps(0).status() == STEP_STATUS_COMPENSATED);
  assert(stored.steps(1).status() == STEP_STATUS_COMPENSATED);
  assert(stored.steps(2).status() == STEP_STATUS_FAILED);
  assert(stored.steps(2).error() == "CarrierUnavailable");

  const auto events = std::vector<std::string>{"saga.started",     "saga.step.completed",   "saga.step.completed",   "saga.step.failed",
                                               "saga.compensating", "saga.step.compensated", "saga.step.compensated", "saga.failed"};
  assert(h.listener->Keys() == events);
  assert(!h.listener->events[3].retryable);
  assert(h.listener->events[3].step_name == "ship-order");
}

void TestFirstStepFailureSkipsCompensation() {
  Harness h;
  CallLog log;

  auto fail = saga::core::MakeStepHandler([](const Struct&, const SagaContext&) -> Value { throw std::runtime_error("out of stock"); },
                                          [&log](const Struct&, const SagaContext&) { log.Add("compensate:reserve"); });
  h.orchestrator->RegisterSaga(SagaBuilder::Create("reserve-only").Step("reserve", "inventory", fail).Build());

  auto result = h.orchestrator->Execute("reserve-only", OrderPayload());
  assert(result.status() == SAGA_STATUS_FAILED);
  assert(result.compensated_steps_size() == 0);
  assert(log.Entries().empty());

  for (const auto& key : h.listener->Keys()) {
    assert(key != "saga.compensating");
  }
}

void TestRetryableStepExhaustsBudget() {
  Harness           h;
  std::atomic<int>  attempts{0};
  auto flaky = saga::core::MakeStepHandler([&attempts](const Struct&, const SagaContext&) -> Value {
    ++attempts;
    throw std::runtime_error("gateway unavailable");
  });

  h.orchestrator->RegisterSaga(
      SagaBuilder::Create("payment").Step("charge", "billing", flaky, {.retryable = true}).WithRetries(2).WithRetryDelay(1ms).Build());

  auto result = h.orchestrator->Execute("payment", OrderPayload());

  assert(result.status() == SAGA_STATUS_FAILED);
  assert(attempts == 3);

  auto stored = *h.orchestrator->GetSagaStatus(result.saga_id());
  assert(stored.retry_count() == 2);
  assert(stored.max_retries() == 2);
  assert(stored.steps(0).attempts() == 3);
  assert(stored.steps(0).status() == STEP_STATUS_FAILED);

  std::vector<bool> retry_flags;
  for (const auto& event : h.listener->events) {
    if (event.type == SagaEventType::kStepFailed) retry_flags.push_back(event.retryable);
  }
  assert((retry_flags == std::vector<bool>{true, true, false}));
}

void TestRetryRecoversTransientFailure() {
  Harness          h;
  std::atomic<int> attempts{0};
  auto flaky = saga::core::MakeStepHandler([&attempts](const Struct&, const SagaContext&) -> Value {
    if (++attempts < 2) throw std::runtime_error("gateway unavailable");
    return StringValue("charged");
  });

  h.orchestrator->RegisterSaga(SagaBuilder::Create("payment").Step("charge", "billing", flaky, {.retryable = true, .max_retries = 1}).Build());

  auto result = h.orchestrator->Execute("payment", OrderPayload());
  assert(result.status() == SAGA_STATUS_COMPLETED);
  assert(attempts == 2);

  auto stored = *h.orchestrator->GetSagaStatus(result.saga_id());
  assert(stored.steps(0).attempts() == 2);
  assert(!stored.steps(0).has_error());
  assert(stored.steps(0).result().string_value() == "charged");
}

void TestStepTimeoutFailsSaga() {
  Harness h;
  auto    slow = saga::core::MakeStepHandler([](const Struct&, const SagaContext& ctx) {
    while (!ctx.stop_token.stop_requested()) std::this_thread::sleep_for(1ms);
    return Value();
  });

  h.orchestrator->RegisterSaga(SagaBuilder::Create("slow").Step("lookup", "catalog", slow).WithTimeout(50ms).Build());

  const auto started = std::chrono::steady_clock::now();
  auto       result  = h.orchestrator->Execute("slow", OrderPayload());

  assert(result.status() == SAGA_STATUS_FAILED);
  assert(result.error() == "Step lookup timeout");
  assert(result.failed_step() == "lookup");
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(elapsed >= 45ms);
  assert(elapsed < 500ms);

  auto stored = *h.orchestrator->GetSagaStatus(result.saga_id());
  assert(stored.steps(0).error() == "Step lookup timeout");
}

void TestUncooperativeHandlerDoesNotBlockShutdown() {
  auto store    = std::make_shared<MemorySagaStore>();
  auto registry = std::make_shared<SagaRegistry>(FastDefaults());

  saga::core::OrchestratorOptions options;
  options.shutdown_grace = 100ms;
  auto orchestrator      = std::make_unique<SagaOrchestrator>(store, registry, options);

  // ignores its stop token; owns nothing from this scope
  auto stuck = saga::core::MakeStepHandler([](const Struct&, const SagaContext&) {
    std::this_thread::sleep_for(3s);
    return Value();
  });
  orchestrator->RegisterSaga(SagaBuilder::Create("stuck").Step("lookup", "catalog", stuck).WithTimeout(50ms).Build());

  auto started = std::chrono::steady_clock::now();
  auto result  = orchestrator->Execute("stuck", OrderPayload());
  assert(result.status() == SAGA_STATUS_FAILED);
  assert(result.error() == "Step lookup timeout");
  assert(std::chrono::steady_clock::now() - started < 500ms);

  started = std::chrono::steady_clock::now();
  orchestrator.reset();
  const auto teardown = std::chrono::steady_clock::now() - started;
  assert(teardown >= 90ms);
  assert(teardown < 1s);
}

void TestDuplicateStepNamesRunInOrder() {
  Harness h;

  std::atomic<int> calls{0};
  auto             counted = saga::core::MakeStepHandler([&calls](const Struct&, const SagaContext&) {
    Value v;
    v.set_number_value(++calls);
    return v;
  });

  h.orchestrator->RegisterSaga(SagaBuilder::Create("dup").Step("x", "svc", counted).Step("x", "svc", counted).Build());

  auto result = h.orchestrator->Execute("dup", OrderPayload());
  assert(result.status() == SAGA_STATUS_COMPLETED);
  assert(calls == 2);

  auto stored = *h.orchestrator->GetSagaStatus(result.saga_id());
  assert(stored.steps(0).status() == STEP_STATUS_COMPLETED);
  assert(stored.steps(1).status() == STEP_STATUS_COMPLETED);
  assert(stored.steps(0).attempts() == 1);
  assert(stored.steps(1).attempts() == 1);
  assert(stored.steps(0).result().number_value() == 1);
  assert(stored.steps(1).result().number_value() == 2);

  // a failure after both unwinds each record once
  CallLog log;
  auto    boom = saga::core::MakeStepHandler([](const Struct&, const SagaContext&) -> Value { throw std::runtime_error("boom"); });
  h.orchestrator->RegisterSaga(
      SagaBuilder::Create("dup-fail").Step("x", "svc", Recorded(log, "x")).Step("x", "svc", Recorded(log, "x")).Step("y", "svc", boom).Build());

  auto failed = h.orchestrator->Execute("dup-fail", OrderPayload());
  assert(failed.status() == SAGA_STATUS_FAILED);
  assert(failed.compensated_steps_size() == 2);
  assert(log.Count("compensate:x") == 2);

  auto unwound = *h.orchestrator->GetSagaStatus(failed.saga_id());
  assert(unwound.steps(0).status() == STEP_STATUS_COMPENSATED);
  assert(unwound.steps(1).status() == STEP_STATUS_COMPENSATED);
  assert(unwound.steps(2).status() == STEP_STATUS_FAILED);
}

void TestCompensationFailureDoesNotStopUnwinding() {
  Harness h;
  CallLog log;

  auto broken = saga::core::MakeStepHandler([](const Struct&, const SagaContext&) { return Value(); },
                                            [&log](const Struct&, const SagaContext&) -> void {
                                              log.Add("compensate:charge");
                                              throw std::runtime_error("refund rejected");
                                            });
  auto fail = saga::core::MakeStepHandler([](const Struct&, const SagaContext&) -> Value { throw std::runtime_error("no carrier"); });

  h.orchestrator->RegisterSaga(SagaBuilder::Create("unwind")
                                   .Step("reserve", "inventory", Recorded(log, "reserve"))
                                   .Step("charge", "billing", broken)
                                   .Step("ship", "shipping", fail)
                                   .Build());

  auto result = h.orchestrator->Execute("unwind", OrderPayload());

  assert(result.status() == SAGA_STATUS_FAILED);
  assert(result.error() == "no carrier");
  assert(result.compensated_steps_size() == 1);
  assert(result.compensated_steps(0) == "reserve");
  assert(log.Count("compensate:charge") == 1);
  assert(log.Count("compensate:reserve") == 1);

  auto stored = *h.orchestrator->GetSagaStatus(result.saga_id());
  assert(stored.steps(0).status() == STEP_STATUS_COMPENSATED);
  assert(stored.steps(1).status() == STEP_STATUS_COMPENSATING);
}

void TestRetrySagaRestartsFromFirstStep() {
  Harness           h;
  CallLog           log;
  std::atomic<bool> ship_fails{true};

  auto ship = saga::core::MakeStepHandler([&](const Struct&, const SagaContext&) -> Value {
    log.Add("execute:ship-order");
    if (ship_fails) throw CarrierUnavailable();
    return StringValue("shipped");
  });
  h.orchestrator->RegisterSaga(SagaBuilder::Create("order-fulfillment")
                                   .Step("reserve-inventory", "inventory", Recorded(log, "reserve-inventory"))
                                   .Step("ship-order", "shipping", ship)
                                   .Build());

  auto failed = h.orchestrator->Execute("order-fulfillment", OrderPayload());
  assert(failed.status() == SAGA_STATUS_FAILED);

  ship_fails = false;
  auto retried = h.orchestrator->RetrySaga(failed.saga_id());

  assert(retried.status() == SAGA_STATUS_COMPLETED);
  assert(retried.saga_id() != failed.saga_id());
  assert(log.Count("execute:reserve-inventory") == 2);

  auto fresh = *h.orchestrator->GetSagaStatus(retried.saga_id());
  assert(fresh.retry_of() == failed.saga_id());
  assert(fresh.payload().fields().at("order_id").string_value() == "order-1001");

  // the failed record stays as history; only its retry counter moves
  auto original = *h.orchestrator->GetSagaStatus(failed.saga_id());
  assert(original.status() == SAGA_STATUS_FAILED);
  assert(original.retry_count() == 1);

  bool threw = false;
  try {
    h.orchestrator->RetrySaga(retried.saga_id());
  } catch (const saga::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    h.orchestrator->RetrySaga("missing-saga");
  } catch (const saga::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentRetryIsRejected() {
  Harness           h;
  std::atomic<bool> fail{true};
  std::promise<void> entered;
  std::promise<void> release;
  auto               release_future = release.get_future().share();

  auto step = saga::core::MakeStepHandler([&](const Struct&, const SagaContext&) -> Value {
    if (fail) throw std::runtime_error("first attempt fails");
    entered.set_value();
    release_future.wait();
    return Value();
  });
  h.orchestrator->RegisterSaga(SagaBuilder::Create("exclusive").Step("only", "svc", step).Build());

  auto failed = h.orchestrator->Execute("exclusive", OrderPayload());
  assert(failed.status() == SAGA_STATUS_FAILED);

  fail = false;
  std::thread first([&] {
    auto r = h.orchestrator->RetrySaga(failed.saga_id());
    assert(r.status() == SAGA_STATUS_COMPLETED);
  });
  entered.get_future().wait();

  bool conflict = false;
  try {
    h.orchestrator->RetrySaga(failed.saga_id());
  } catch (const saga::util::ExecutionConflict&) {
    conflict = true;
  }
  assert(conflict);

  release.set_value();
  first.join();
}

void TestStoreFailureAbortsExecution() {
  // two healthy step updates: RUNNING then COMPLETED of the first step
  auto    store = std::make_shared<FlakyStore>(2);
  Harness h(store);
  CallLog log;

  h.orchestrator->RegisterSaga(SagaBuilder::Create("fragile")
                                   .Step("first", "svc", Recorded(log, "first"))
                                   .Step("second", "svc", Recorded(log, "second"))
                                   .Build());

  bool threw = false;
  try {
    h.orchestrator->Execute("fragile", OrderPayload());
  } catch (const saga::util::StoreFailure&) {
    threw = true;
  }
  assert(threw);
  assert(log.Count("execute:second") == 0);

  // best-effort marking still reaches the record
  const auto failed = store->FindByStatus(SAGA_STATUS_FAILED);
  assert(failed.size() == 1);
  assert(failed[0].has_error());
}

void TestTransientSagaIsNotPersisted() {
  Harness h;
  CallLog log;

  h.orchestrator->RegisterSaga(SagaBuilder::Create("transient").Step("only", "svc", Recorded(log, "only")).WithPersistence(false).Build());

  auto result = h.orchestrator->Execute("transient", OrderPayload());
  assert(result.status() == SAGA_STATUS_COMPLETED);
  assert(!h.orchestrator->GetSagaStatus(result.saga_id()).has_value());
  assert(h.orchestrator->ListSagas(SAGA_STATUS_COMPLETED).empty());
}

void TestReRegistrationUsesLatestDefinition() {
  Harness h;
  CallLog log;

  h.orchestrator->RegisterSaga(SagaBuilder::Create("versioned").Step("v1", "svc", Recorded(log, "v1")).Build());
  h.orchestrator->RegisterSaga(SagaBuilder::Create("versioned").Step("v2", "svc", Recorded(log, "v2")).Build());
  assert(h.registry->Size() == 1);

  auto result = h.orchestrator->Execute("versioned", OrderPayload());
  assert(result.completed_steps_size() == 1);
  assert(result.completed_steps(0) == "v2");
  assert(log.Count("execute:v1") == 0);
}

void TestUnregisteredTypeIsRejected() {
  Harness h;

  bool threw = false;
  try {
    h.orchestrator->Execute("nobody-registered-this", OrderPayload());
  } catch (const saga::util::UnregisteredSagaType&) {
    threw = true;
  }
  assert(threw);
  assert(h.orchestrator->ListSagas(SAGA_STATUS_PENDING).empty());
}

void TestShutdownInterruptsRetryDelay() {
  Harness h;
  auto    always_fails = saga::core::MakeStepHandler([](const Struct&, const SagaContext&) -> Value { throw std::runtime_error("down"); });
  h.orchestrator->RegisterSaga(
      SagaBuilder::Create("patient").Step("call", "svc", always_fails, {.retryable = true}).WithRetries(5).WithRetryDelay(10s).Build());

  SagaOrchestrator::SagaExecutionResult result;
  const auto                            started = std::chrono::steady_clock::now();
  std::thread                           caller([&] { result = h.orchestrator->Execute("patient", OrderPayload()); });

  std::this_thread::sleep_for(100ms);
  h.orchestrator->Shutdown();
  caller.join();

  assert(result.status() == SAGA_STATUS_FAILED);
  assert(std::chrono::steady_clock::now() - started < 5s);
  assert(h.orchestrator->IsShuttingDown());

  bool threw = false;
  try {
    h.orchestrator->Execute("patient", OrderPayload());
  } catch (const saga::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestRecoverStalledSagas() {
  Harness h;
  auto&   store = *h.store;

  auto make = [](const std::string& id, SagaStatus status, StepStatus step_status) {
    Saga saga;
    saga.set_saga_id(id);
    saga.set_saga_type("order-fulfillment");
    saga.set_status(status);
    auto* step = saga.add_steps();
    step->set_name("charge-payment");
    step->set_status(step_status);
    return saga;
  };

  assert(store.Save(make("stalled-running", SAGA_STATUS_RUNNING, STEP_STATUS_RUNNING)));
  assert(store.Save(make("stalled-pending", SAGA_STATUS_PENDING, STEP_STATUS_PENDING)));
  assert(store.Save(make("finished", SAGA_STATUS_COMPLETED, STEP_STATUS_COMPLETED)));

  auto recovered = h.orchestrator->RecoverStalledSagas();
  assert((recovered == std::vector<std::string>{"stalled-running", "stalled-pending"}));

  auto running = *store.FindById("stalled-running");
  assert(running.status() == SAGA_STATUS_FAILED);
  assert(running.error() == "saga interrupted before completion");
  assert(running.steps(0).status() == STEP_STATUS_FAILED);

  assert(store.FindById("stalled-pending")->status() == SAGA_STATUS_FAILED);
  assert(store.FindById("finished")->status() == SAGA_STATUS_COMPLETED);
  assert(h.orchestrator->GetFailedSagas().size() == 2);
  assert(h.listener->events.size() == 2);

  // nothing left to recover
  assert(h.orchestrator->RecoverStalledSagas().empty());
}

} // namespace

int main() {
  TestForwardExecutionCompletesEveryStep();
  TestOrderFulfillmentCompensatesInReverse();
  TestFirstStepFailureSkipsCompensation();
  TestRetryableStepExhaustsBudget();
  TestRetryRecoversTransientFailure();
  TestStepTimeoutFailsSaga();
  TestUncooperativeHandlerDoesNotBlockShutdown();
  TestDuplicateStepNamesRunInOrder();
  TestCompensationFailureDoesNotStopUnwinding();
  TestRetrySagaRestartsFromFirstStep();
  TestConcurrentRetryIsRejected();
  TestStoreFailureAbortsExecution();
  TestTransientSagaIsNotPersisted();
  TestReRegistrationUsesLatestDefinition();
  TestUnregisteredTypeIsRejected();
  TestShutdownInterruptsRetryDelay();
  TestRecoverStalledSagas();

  std::cout << "saga_orchestrator_unit_saga_orchestrator: pass\n";
  return 0;
}
