#include "step_handler.hpp"

#include "internal/util/errors.hpp"

namespace saga::core {

namespace {

class FunctionStepHandler final : public StepHandler {
 public:
  FunctionStepHandler(ExecuteFn execute, CompensateFn compensate) : execute_(std::move(execute)), compensate_(std::move(compensate)) {
  }

  google::protobuf::Value Execute(const google::protobuf::Struct& payload, const SagaContext& context) override {
    return execute_(payload, context);
  }

  void Compensate(const google::protobuf::Struct& payload, const SagaContext& context) override {
    if (compensate_) compensate_(payload, context);
  }

 private:
  ExecuteFn    execute_;
  CompensateFn compensate_;
};

} // namespace

std::shared_ptr<StepHandler> MakeStepHandler(ExecuteFn execute, CompensateFn compensate) {
  if (!execute) {
    throw util::InvalidDefinition("step handler requires an execute function");
  }
  return std::make_shared<FunctionStepHandler>(std::move(execute), std::move(compensate));
}

} // namespace saga::core
