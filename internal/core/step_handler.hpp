#pragma once

#include <google/protobuf/struct.pb.h>

#include <functional>
#include <memory>
#include <stop_token>
#include <string>

namespace saga::core {

/*
  Per-invocation view handed to a step handler. Built fresh for every
  attempt and never persisted.

  previous_results holds the outputs of the steps before current_step
  (keyed by step name). stop_token is signalled when the step's deadline
  expires or the orchestrator shuts down; a handler that ignores it keeps
  running in the background after the orchestrator has moved on.
*/
struct SagaContext {
  std::string              saga_id;
  std::string              saga_type;
  std::string              current_step;
  google::protobuf::Struct previous_results;
  google::protobuf::Struct metadata;
  std::stop_token          stop_token;
};

/*
  Forward and compensating action of one saga step.

  Failures are reported by throwing. Execute may be called again for the
  same saga after a failure (same-step retry, or a manual retry that
  restarts the saga), so implementations should be idempotent.
*/
class StepHandler {
 public:
  virtual ~StepHandler() = default;

  virtual google::protobuf::Value Execute(const google::protobuf::Struct& payload, const SagaContext& context) = 0;

  virtual void Compensate(const google::protobuf::Struct& payload, const SagaContext& context) = 0;
};

using ExecuteFn    = std::function<google::protobuf::Value(const google::protobuf::Struct&, const SagaContext&)>;
using CompensateFn = std::function<void(const google::protobuf::Struct&, const SagaContext&)>;

// Handler from two callables. An empty compensate makes compensation a no-op.
std::shared_ptr<StepHandler> MakeStepHandler(ExecuteFn execute, CompensateFn compensate = {});

} // namespace saga::core
