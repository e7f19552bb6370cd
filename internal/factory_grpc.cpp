#include "factory.hpp"

#include "internal/grpc/saga_admin_server.hpp"

namespace saga::factory {

/*
    Build full application dependency graph
*/
Application Build(const saga::runtime::config::RuntimeConfig& config, core::OrchestratorOptions options) {
  Application app;
  app.core = BuildCore(config, std::move(options));

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::SagaAdminServer>(app.core.admin_service));

  return app;
}

} // namespace saga::factory
