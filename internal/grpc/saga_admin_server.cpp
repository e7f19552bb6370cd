#include "saga_admin_server.hpp"

#include "grpc_error.hpp"

namespace saga::grpc {

using namespace saga::orchestrator::services::v1;

namespace {

template <typename Fn>
::grpc::Status Dispatch(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

SagaAdminServer::SagaAdminServer(std::shared_ptr<saga::service::SagaAdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status SagaAdminServer::GetSaga(::grpc::ServerContext*, const GetSagaRequest* req, GetSagaResponse* resp) {
  return Dispatch([&] { *resp = service_->GetSaga(*req); });
}

::grpc::Status SagaAdminServer::ListSagas(::grpc::ServerContext*, const ListSagasRequest* req, ListSagasResponse* resp) {
  return Dispatch([&] { *resp = service_->ListSagas(*req); });
}

::grpc::Status SagaAdminServer::ListFailedSagas(::grpc::ServerContext*, const ListFailedSagasRequest* req, ListSagasResponse* resp) {
  return Dispatch([&] { *resp = service_->ListFailedSagas(*req); });
}

::grpc::Status SagaAdminServer::RetrySaga(::grpc::ServerContext*, const RetrySagaRequest* req, RetrySagaResponse* resp) {
  return Dispatch([&] { *resp = service_->RetrySaga(*req); });
}

::grpc::Status SagaAdminServer::RecoverStalledSagas(::grpc::ServerContext*, const RecoverStalledSagasRequest* req,
                                                    RecoverStalledSagasResponse* resp) {
  return Dispatch([&] { *resp = service_->RecoverStalledSagas(*req); });
}

} // namespace saga::grpc
