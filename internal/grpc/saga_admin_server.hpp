#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/saga_admin_service.hpp"
#include "saga/orchestrator/services/v1/saga_admin_service.grpc.pb.h"

namespace saga::grpc {

class SagaAdminServer final : public saga::orchestrator::services::v1::SagaAdminService::Service {
public:
  explicit SagaAdminServer(std::shared_ptr<saga::service::SagaAdminService> svc);

  ::grpc::Status GetSaga(::grpc::ServerContext*,
                         const saga::orchestrator::services::v1::GetSagaRequest*,
                         saga::orchestrator::services::v1::GetSagaResponse*) override;

  ::grpc::Status ListSagas(::grpc::ServerContext*,
                           const saga::orchestrator::services::v1::ListSagasRequest*,
                           saga::orchestrator::services::v1::ListSagasResponse*) override;

  ::grpc::Status ListFailedSagas(::grpc::ServerContext*,
                                 const saga::orchestrator::services::v1::ListFailedSagasRequest*,
                                 saga::orchestrator::services::v1::ListSagasResponse*) override;

  ::grpc::Status RetrySaga(::grpc::ServerContext*,
                           const saga::orchestrator::services::v1::RetrySagaRequest*,
                           saga::orchestrator::services::v1::RetrySagaResponse*) override;

  ::grpc::Status RecoverStalledSagas(::grpc::ServerContext*,
                                     const saga::orchestrator::services::v1::RecoverStalledSagasRequest*,
                                     saga::orchestrator::services::v1::RecoverStalledSagasResponse*) override;

private:
  std::shared_ptr<saga::service::SagaAdminService> service_;
};

} // namespace saga::grpc
