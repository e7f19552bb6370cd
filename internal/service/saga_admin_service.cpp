#include "saga_admin_service.hpp"

#include <chrono>
#include <stdexcept>
#include <string_view>

#include "internal/core/saga_orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace saga::service {

using namespace saga::orchestrator::services::v1;
using namespace saga::orchestrator::core::v1;

namespace {

void RequireSagaId(const std::string& saga_id) {
  if (saga_id.empty()) {
    throw std::invalid_argument("saga_id is required");
  }
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& saga_id, Fn&& fn) {
  saga::observability::SpanScope span(route);
  if (!saga_id.empty()) {
    span.SetAttribute("saga.id", saga_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto result = fn();
    saga::observability::Metrics::Instance().RecordRequest(route, true);
    saga::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SAGA_LOG_ERROR("RPC failed", {saga::observability::StringField("route", route), saga::observability::StringField("error", ex.what()),
                                  saga::observability::StringField("saga_id", saga_id)});
    saga::observability::Metrics::Instance().RecordRequest(route, false);
    saga::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace

SagaAdminService::SagaAdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.orchestrator) {
    throw std::invalid_argument("SagaAdminService requires an orchestrator");
  }
}

GetSagaResponse SagaAdminService::GetSaga(const GetSagaRequest& req) {
  return ObserveRpc("SagaAdminService.GetSaga", req.saga_id(), [&] {
    RequireSagaId(req.saga_id());

    auto saga = ctx_.orchestrator->GetSagaStatus(req.saga_id());
    if (!saga) {
      throw saga::util::NotFound("saga " + req.saga_id() + " not found");
    }

    GetSagaResponse resp;
    *resp.mutable_saga() = std::move(*saga);
    return resp;
  });
}

ListSagasResponse SagaAdminService::ListSagas(const ListSagasRequest& req) {
  return ObserveRpc("SagaAdminService.ListSagas", {}, [&] {
    if (req.status() == SAGA_STATUS_UNSPECIFIED) {
      throw std::invalid_argument("status is required");
    }

    ListSagasResponse resp;
    for (auto& saga : ctx_.orchestrator->ListSagas(req.status())) {
      *resp.add_sagas() = std::move(saga);
    }
    return resp;
  });
}

ListSagasResponse SagaAdminService::ListFailedSagas(const ListFailedSagasRequest&) {
  return ObserveRpc("SagaAdminService.ListFailedSagas", {}, [&] {
    ListSagasResponse resp;
    for (auto& saga : ctx_.orchestrator->GetFailedSagas()) {
      *resp.add_sagas() = std::move(saga);
    }
    return resp;
  });
}

RetrySagaResponse SagaAdminService::RetrySaga(const RetrySagaRequest& req) {
  return ObserveRpc("SagaAdminService.RetrySaga", req.saga_id(), [&] {
    RequireSagaId(req.saga_id());

    RetrySagaResponse resp;
    *resp.mutable_execution() = ctx_.orchestrator->RetrySaga(req.saga_id());
    return resp;
  });
}

RecoverStalledSagasResponse SagaAdminService::RecoverStalledSagas(const RecoverStalledSagasRequest&) {
  return ObserveRpc("SagaAdminService.RecoverStalledSagas", {}, [&] {
    RecoverStalledSagasResponse resp;
    for (auto& saga_id : ctx_.orchestrator->RecoverStalledSagas()) {
      resp.add_saga_ids(std::move(saga_id));
    }
    return resp;
  });
}

} // namespace saga::service
