#include "saga_document.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <tuple>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace saga::db {

namespace v1 = saga::orchestrator::core::v1;

std::string EncodeSagaDocument(const SagaRecord& saga) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string document;
  auto        status = google::protobuf::util::MessageToJsonString(saga, &document, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode saga " + saga.saga_id() + ": " + std::string(status.message()));
  }
  return document;
}

SagaRecord DecodeSagaDocument(const std::string& document) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  SagaRecord saga;
  auto       status = google::protobuf::util::JsonStringToMessage(document, &saga, options);
  if (!status.ok()) {
    throw std::runtime_error("Malformed saga document: " + std::string(status.message()));
  }
  return saga;
}

void StampUpdated(SagaRecord& saga) {
  *saga.mutable_updated_at() = util::NowProto();
}

Result ApplySagaStatus(SagaRecord& saga, v1::SagaStatus status, const std::optional<std::string>& error,
                       const std::optional<google::protobuf::Struct>& result) {
  if (!model::CanTransition(saga.status(), status)) {
    return Result::Err(ErrorCode::Conflict, "saga " + saga.saga_id() + " cannot move from " + std::string(model::ToString(saga.status())) +
                                                " to " + std::string(model::ToString(status)));
  }

  saga.set_status(status);
  if (error) {
    saga.set_error(*error);
  }
  if (result) {
    *saga.mutable_result() = *result;
  }

  const auto now = util::NowProto();
  *saga.mutable_updated_at() = now;
  if (model::IsTerminal(status)) {
    *saga.mutable_completed_at() = now;
  }
  return Result::Ok();
}

Result ApplyStepStatus(SagaRecord& saga, const std::string& step_name, v1::StepStatus status,
                       const std::optional<google::protobuf::Value>& result, const std::optional<std::string>& error) {
  auto* steps = saga.mutable_steps();

  const auto named = std::find_if(steps->begin(), steps->end(), [&](const v1::SagaStep& step) { return step.name() == step_name; });
  if (named == steps->end()) {
    return Result::Err(ErrorCode::NotFound, "step " + step_name + " not found in saga " + saga.saga_id());
  }

  // Steps sharing a name are told apart by status. Compensation walks the
  // completed steps last to first, everything else walks first to last.
  const auto movable = [&](const v1::SagaStep& step) { return step.name() == step_name && model::CanTransition(step.status(), status); };

  auto it = steps->end();
  if (status == v1::STEP_STATUS_COMPENSATING) {
    auto rit = std::find_if(steps->rbegin(), steps->rend(), movable);
    if (rit != steps->rend()) it = std::prev(rit.base());
  } else {
    it = std::find_if(steps->begin(), steps->end(), movable);
  }

  if (it == steps->end()) {
    return Result::Err(ErrorCode::Conflict, "step " + step_name + " of saga " + saga.saga_id() + " cannot move from " +
                                                std::string(model::ToString(named->status())) + " to " + std::string(model::ToString(status)));
  }

  const auto now = util::NowProto();

  it->set_status(status);
  switch (status) {
    case v1::STEP_STATUS_RUNNING:
      it->set_attempts(it->attempts() + 1);
      *it->mutable_started_at() = now;
      it->clear_completed_at();
      it->clear_error();
      break;
    case v1::STEP_STATUS_COMPLETED:
    case v1::STEP_STATUS_FAILED:
    case v1::STEP_STATUS_COMPENSATED:
      *it->mutable_completed_at() = now;
      break;
    default:
      break;
  }

  if (result) {
    *it->mutable_result() = *result;
  }
  if (error) {
    it->set_error(*error);
  }

  *saga.mutable_updated_at() = now;
  return Result::Ok();
}

void SortByCreatedAt(std::vector<SagaRecord>& sagas) {
  std::sort(sagas.begin(), sagas.end(), [](const SagaRecord& a, const SagaRecord& b) {
    return std::make_tuple(a.created_at().seconds(), a.created_at().nanos(), std::cref(a.saga_id())) <
           std::make_tuple(b.created_at().seconds(), b.created_at().nanos(), std::cref(b.saga_id()));
  });
}

} // namespace saga::db
