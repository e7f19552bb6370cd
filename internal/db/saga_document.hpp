#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "saga/orchestrator/core/v1/types.pb.h"

namespace saga::db {

/*
  Saga document helpers shared by every store backend.

  Durable backends keep the whole Saga message as one protobuf-JSON
  document; the mutation helpers implement the store contract on an
  in-memory copy so that all backends agree on stamping and lookup rules.
*/

using SagaRecord = saga::orchestrator::core::v1::Saga;

std::string EncodeSagaDocument(const SagaRecord& saga);

// Throws std::runtime_error on a malformed document.
SagaRecord DecodeSagaDocument(const std::string& document);

Result ApplySagaStatus(SagaRecord& saga, saga::orchestrator::core::v1::SagaStatus status, const std::optional<std::string>& error,
                       const std::optional<google::protobuf::Struct>& result);

Result ApplyStepStatus(SagaRecord& saga, const std::string& step_name, saga::orchestrator::core::v1::StepStatus status,
                       const std::optional<google::protobuf::Value>& result, const std::optional<std::string>& error);

void StampUpdated(SagaRecord& saga);

// created_at ascending, saga_id as tie breaker.
void SortByCreatedAt(std::vector<SagaRecord>& sagas);

} // namespace saga::db
