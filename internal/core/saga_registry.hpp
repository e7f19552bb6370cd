#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/saga_definition.hpp"

namespace saga::core {

/*
  Saga type -> ordered step list + resolved options.

  Registering an existing type replaces it; executions already running keep
  the definition they started with. Safe for concurrent use.
*/
class SagaRegistry {
 public:
  explicit SagaRegistry(SagaOptions defaults = {});

  // Throws util::InvalidDefinition on an unusable blueprint.
  std::shared_ptr<const RegisteredSaga> Register(SagaBlueprint blueprint);

  // nullptr when saga_type is not registered.
  std::shared_ptr<const RegisteredSaga> Find(const std::string& saga_type) const;

  bool                     Contains(const std::string& saga_type) const;
  std::vector<std::string> Types() const;
  std::size_t              Size() const;

  const SagaOptions& Defaults() const {
    return defaults_;
  }

 private:
  static void Validate(const SagaBlueprint& blueprint);

  const SagaOptions defaults_;

  mutable std::shared_mutex                                              mutex_;
  std::unordered_map<std::string, std::shared_ptr<const RegisteredSaga>> sagas_;
};

} // namespace saga::core
