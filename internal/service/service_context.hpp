#pragma once

#include <memory>

namespace saga::core {
class SagaOrchestrator;
}

namespace saga::service {

/*
  Dependency container shared by the services.
*/
struct ServiceContext {
  std::shared_ptr<saga::core::SagaOrchestrator> orchestrator;
};

} // namespace saga::service
