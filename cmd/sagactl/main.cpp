#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "saga/orchestrator/services/v1/saga_admin_service.grpc.pb.h"
#include "saga/orchestrator/v1.hpp"

using namespace saga::orchestrator::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  sagactl <addr> get <saga_id>\n"
            << "  sagactl <addr> list <pending|running|completed|failed>\n"
            << "  sagactl <addr> failed\n"
            << "  sagactl <addr> retry <saga_id>\n"
            << "  sagactl <addr> recover\n";
}

static std::optional<SagaStatus> ParseStatus(const std::string& value) {
  if (value == "pending") {
    return SAGA_STATUS_PENDING;
  }
  if (value == "running") {
    return SAGA_STATUS_RUNNING;
  }
  if (value == "completed") {
    return SAGA_STATUS_COMPLETED;
  }
  if (value == "failed") {
    return SAGA_STATUS_FAILED;
  }
  return std::nullopt;
}

static int PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.ToString() << "\n";
    return 2;
  }

  std::cout << json;
  return 0;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = SagaAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetSagaRequest req;
    req.set_saga_id(argv[3]);

    GetSagaResponse resp;

    auto status = stub->GetSaga(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return PrintJson(resp.saga());
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    if (argc < 4) return 1;

    auto parsed = ParseStatus(argv[3]);
    if (!parsed.has_value()) {
      std::cerr << "unsupported status: " << argv[3] << "\n";
      return 1;
    }

    ListSagasRequest req;
    req.set_status(parsed.value());

    ListSagasResponse resp;

    auto status = stub->ListSagas(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return PrintJson(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "failed") {
    ListFailedSagasRequest req;
    ListSagasResponse      resp;

    auto status = stub->ListFailedSagas(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return PrintJson(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "retry") {
    if (argc < 4) return 1;

    RetrySagaRequest req;
    req.set_saga_id(argv[3]);

    RetrySagaResponse resp;

    auto status = stub->RetrySaga(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return PrintJson(resp.execution());
  }

  // ------------------------------------------------------------

  if (cmd == "recover") {
    RecoverStalledSagasRequest  req;
    RecoverStalledSagasResponse resp;

    auto status = stub->RecoverStalledSagas(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "recovered=" << resp.saga_ids_size() << "\n";
    for (const auto& id : resp.saga_ids()) std::cout << id << "\n";
    return 0;
  }

  Usage();
  return 1;
}
