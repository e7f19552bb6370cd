#pragma once

#include "saga/orchestrator/core/v1/types.pb.h"

#include "saga/orchestrator/services/v1/saga_admin_service.pb.h"

namespace saga::orchestrator::v1 {
using namespace ::saga::orchestrator::core::v1;
using namespace ::saga::orchestrator::services::v1;
}
