#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/saga_definition.hpp"
#include "internal/core/saga_orchestrator.hpp"
#include "internal/core/saga_registry.hpp"
#include "internal/db/api/saga_store.hpp"
#include "internal/service/saga_admin_service.hpp"

namespace grpc {
class Service;
}

namespace saga::factory {

/*
  Core

  Everything an embedding process needs to run sagas. Lives for the
  lifetime of the process.
*/
struct Core {
  std::shared_ptr<db::SagaStore>            store;
  std::shared_ptr<core::SagaRegistry>       registry;
  std::shared_ptr<core::SagaOrchestrator>   orchestrator;
  std::shared_ptr<service::SagaAdminService> admin_service;
};

/*
  Application

  Core plus the transport adapters served by runtime::Server.
*/
struct Application {
  Core core;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

core::SagaOptions SagaOptionsFromConfig(const saga::runtime::config::SagaDefaultsConfig& config);

// Composition root for the store: the only place that knows concrete backends.
std::shared_ptr<db::SagaStore> BuildSagaStore(const saga::runtime::config::RuntimeConfig& config);

/*
  Builds store, registry, orchestrator and admin service. Runs
  RecoverStalledSagas() when recovery.recover_on_startup is set.
*/
Core BuildCore(const saga::runtime::config::RuntimeConfig& config, core::OrchestratorOptions options = {});

Application Build(const saga::runtime::config::RuntimeConfig& config, core::OrchestratorOptions options = {});

} // namespace saga::factory
