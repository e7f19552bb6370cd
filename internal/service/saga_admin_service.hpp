#pragma once

#include "saga/orchestrator/services/v1/saga_admin_service.pb.h"
#include "service_context.hpp"

namespace saga::service {

/*
  Operator-facing queries and recovery actions over the orchestrator.

  Transport agnostic: errors are thrown as util:: exceptions and mapped to
  a wire status by the transport adapter.
*/
class SagaAdminService {
public:
  explicit SagaAdminService(ServiceContext ctx);

  saga::orchestrator::services::v1::GetSagaResponse
  GetSaga(const saga::orchestrator::services::v1::GetSagaRequest& req);

  saga::orchestrator::services::v1::ListSagasResponse
  ListSagas(const saga::orchestrator::services::v1::ListSagasRequest& req);

  saga::orchestrator::services::v1::ListSagasResponse
  ListFailedSagas(const saga::orchestrator::services::v1::ListFailedSagasRequest& req);

  saga::orchestrator::services::v1::RetrySagaResponse
  RetrySaga(const saga::orchestrator::services::v1::RetrySagaRequest& req);

  saga::orchestrator::services::v1::RecoverStalledSagasResponse
  RecoverStalledSagas(const saga::orchestrator::services::v1::RecoverStalledSagasRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace saga::service
