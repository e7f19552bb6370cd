#include "saga_registry.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace saga::core {

using observability::IntField;
using observability::StringField;

SagaRegistry::SagaRegistry(SagaOptions defaults) : defaults_(defaults) {
}

void SagaRegistry::Validate(const SagaBlueprint& blueprint) {
  if (blueprint.saga_type.empty()) {
    throw util::InvalidDefinition("saga type must not be empty");
  }
  if (blueprint.steps.empty()) {
    throw util::InvalidDefinition("saga " + blueprint.saga_type + " has no steps");
  }

  std::unordered_set<std::string> seen;
  for (const auto& step : blueprint.steps) {
    if (step.name.empty()) {
      throw util::InvalidDefinition("saga " + blueprint.saga_type + " has a step without a name");
    }
    if (!step.handler) {
      throw util::InvalidDefinition("step " + step.name + " of saga " + blueprint.saga_type + " has no handler");
    }
    if (step.timeout && step.timeout->count() <= 0) {
      throw util::InvalidDefinition("step " + step.name + " of saga " + blueprint.saga_type + " has a non-positive timeout");
    }
    // later results shadow earlier ones under the same name
    if (!seen.insert(step.name).second) {
      SAGA_LOG_WARN("Duplicate step name in saga definition",
                    {StringField("saga_type", blueprint.saga_type), StringField("step", step.name)});
    }
  }

  if (blueprint.options.timeout && blueprint.options.timeout->count() <= 0) {
    throw util::InvalidDefinition("saga " + blueprint.saga_type + " has a non-positive timeout");
  }
}

std::shared_ptr<const RegisteredSaga> SagaRegistry::Register(SagaBlueprint blueprint) {
  Validate(blueprint);

  auto registered       = std::make_shared<RegisteredSaga>();
  registered->saga_type = std::move(blueprint.saga_type);
  registered->steps     = std::move(blueprint.steps);
  registered->options   = blueprint.options.ResolveAgainst(defaults_);

  {
    std::unique_lock lock(mutex_);
    sagas_[registered->saga_type] = registered;
  }

  SAGA_LOG_INFO("Saga registered: " + registered->saga_type + " with " + std::to_string(registered->steps.size()) + " steps",
                {StringField("saga_type", registered->saga_type), IntField("steps", static_cast<std::int64_t>(registered->steps.size()))});
  return registered;
}

std::shared_ptr<const RegisteredSaga> SagaRegistry::Find(const std::string& saga_type) const {
  std::shared_lock lock(mutex_);
  auto             it = sagas_.find(saga_type);
  return it == sagas_.end() ? nullptr : it->second;
}

bool SagaRegistry::Contains(const std::string& saga_type) const {
  std::shared_lock lock(mutex_);
  return sagas_.contains(saga_type);
}

std::vector<std::string> SagaRegistry::Types() const {
  std::vector<std::string> types;
  {
    std::shared_lock lock(mutex_);
    types.reserve(sagas_.size());
    for (const auto& [type, _] : sagas_) {
      types.push_back(type);
    }
  }
  std::sort(types.begin(), types.end());
  return types;
}

std::size_t SagaRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return sagas_.size();
}

} // namespace saga::core
