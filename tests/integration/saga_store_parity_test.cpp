#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/saga_store.hpp"
#include "internal/db/memory/memory_saga_store.hpp"
#include "internal/db/schema.hpp"
#include "internal/util/time.hpp"

#if SAGA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_saga_store.hpp"
#endif

#if SAGA_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_saga_store.hpp"
#endif

namespace {

using namespace saga::orchestrator::core::v1;
using saga::db::ErrorCode;
using saga::db::SagaStore;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                      name;
  std::function<std::shared_ptr<SagaStore>()>      make_store;
  std::function<bool()>                            supports_restart;
  std::function<void(std::shared_ptr<SagaStore>&)> restart;
  std::function<void()>                            cleanup;
};

Saga MakeSaga(const std::string& id) {
  Saga saga;
  saga.set_saga_id(id);
  saga.set_saga_type("order-fulfillment");
  saga.set_status(SAGA_STATUS_PENDING);
  for (const char* name : {"reserve-inventory", "charge-payment", "ship-order"}) {
    auto* step = saga.add_steps();
    step->set_name(name);
    step->set_service("svc");
    step->set_status(STEP_STATUS_PENDING);
  }
  (*saga.mutable_payload()->mutable_fields())["order_id"].set_string_value("order-1001");
  saga.set_max_retries(3);
  *saga.mutable_created_at() = saga::util::NowProto();
  *saga.mutable_updated_at() = saga.created_at();
  return saga;
}

void VerifyForwardLifecycle(SagaStore& store, const std::string& id) {
  assert(store.Save(MakeSaga(id)));
  assert(store.UpdateStatus(id, SAGA_STATUS_RUNNING, std::nullopt, std::nullopt));

  google::protobuf::Struct results;
  for (const char* name : {"reserve-inventory", "charge-payment", "ship-order"}) {
    google::protobuf::Value out;
    out.set_string_value(std::string(name) + "-done");

    assert(store.UpdateStepStatus(id, name, STEP_STATUS_RUNNING, std::nullopt, std::nullopt));
    assert(store.UpdateStepStatus(id, name, STEP_STATUS_COMPLETED, out, std::nullopt));
    (*results.mutable_fields())[name] = out;
  }
  assert(store.UpdateStatus(id, SAGA_STATUS_COMPLETED, std::nullopt, results));

  auto saga = store.FindById(id);
  assert(saga.has_value());
  assert(saga->status() == SAGA_STATUS_COMPLETED);
  assert(saga->has_completed_at());
  assert(saga->payload().fields().at("order_id").string_value() == "order-1001");
  assert(saga->result().fields().at("ship-order").string_value() == "ship-order-done");
  for (const auto& step : saga->steps()) {
    assert(step.status() == STEP_STATUS_COMPLETED);
    assert(step.attempts() == 1);
  }
}

void VerifyFailureAndCompensation(SagaStore& store, const std::string& id) {
  assert(store.Save(MakeSaga(id)));
  assert(store.UpdateStatus(id, SAGA_STATUS_RUNNING, std::nullopt, std::nullopt));

  assert(store.UpdateStepStatus(id, "reserve-inventory", STEP_STATUS_RUNNING, std::nullopt, std::nullopt));
  assert(store.UpdateStepStatus(id, "reserve-inventory", STEP_STATUS_COMPLETED, google::protobuf::Value(), std::nullopt));
  assert(store.UpdateStepStatus(id, "charge-payment", STEP_STATUS_RUNNING, std::nullopt, std::nullopt));
  assert(store.UpdateStepStatus(id, "charge-payment", STEP_STATUS_FAILED, std::nullopt, std::string("card declined")));
  assert(store.UpdateStepStatus(id, "reserve-inventory", STEP_STATUS_COMPENSATING, std::nullopt, std::nullopt));
  assert(store.UpdateStepStatus(id, "reserve-inventory", STEP_STATUS_COMPENSATED, std::nullopt, std::nullopt));
  assert(store.UpdateStatus(id, SAGA_STATUS_FAILED, std::string("card declined"), std::nullopt));

  auto saga = store.FindById(id);
  assert(saga->status() == SAGA_STATUS_FAILED);
  assert(saga->error() == "card declined");
  assert(saga->steps(0).status() == STEP_STATUS_COMPENSATED);
  assert(saga->steps(1).status() == STEP_STATUS_FAILED);
  assert(saga->steps(1).error() == "card declined");
  assert(saga->steps(2).status() == STEP_STATUS_PENDING);

  // FAILED is terminal
  assert(store.UpdateStatus(id, SAGA_STATUS_RUNNING, std::nullopt, std::nullopt).code == ErrorCode::Conflict);
  assert(store.FindById(id)->status() == SAGA_STATUS_FAILED);

  // a retry bump rewrites the whole record
  saga->set_retry_count(saga->retry_count() + 1);
  assert(store.Save(*saga));
  assert(store.FindById(id)->retry_count() == 1);
}

void VerifyMissingRecords(SagaStore& store, const std::string& id) {
  assert(!store.FindById(id).has_value());
  assert(store.UpdateStatus(id, SAGA_STATUS_RUNNING, std::nullopt, std::nullopt).code == ErrorCode::NotFound);
  assert(store.UpdateStepStatus(id, "charge-payment", STEP_STATUS_RUNNING, std::nullopt, std::nullopt).code == ErrorCode::NotFound);

  assert(store.Save(MakeSaga(id)));
  assert(store.UpdateStepStatus(id, "no-such-step", STEP_STATUS_RUNNING, std::nullopt, std::nullopt).code == ErrorCode::NotFound);
  assert(store.UpdateStepStatus(id, "charge-payment", STEP_STATUS_COMPENSATED, std::nullopt, std::nullopt).code == ErrorCode::Conflict);
}

void VerifyStatusQueries(SagaStore& store, const std::string& prefix) {
  std::vector<std::string> ids;
  for (int i = 0; i < 3; ++i) {
    ids.push_back(prefix + "-" + std::to_string(i));
    assert(store.Save(MakeSaga(ids.back())));
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  for (const auto& id : ids) {
    assert(store.UpdateStatus(id, SAGA_STATUS_RUNNING, std::nullopt, std::nullopt));
  }

  std::vector<std::string> running;
  for (const auto& saga : store.FindByStatus(SAGA_STATUS_RUNNING)) {
    if (saga.saga_id().rfind(prefix, 0) == 0) running.push_back(saga.saga_id());
  }
  assert(running == ids);

  for (const auto& id : ids) {
    assert(store.UpdateStatus(id, SAGA_STATUS_FAILED, std::string("saga interrupted before completion"), std::nullopt));
  }
}

void VerifyConcurrentStepUpdates(SagaStore& store, const std::string& id) {
  assert(store.Save(MakeSaga(id)));

  std::vector<std::thread> workers;
  for (const char* name : {"reserve-inventory", "charge-payment", "ship-order"}) {
    workers.emplace_back([&store, id, step = std::string(name)] {
      for (int i = 0; i < 20; ++i) {
        assert(store.UpdateStepStatus(id, step, STEP_STATUS_RUNNING, std::nullopt, std::nullopt));
        assert(store.UpdateStepStatus(id, step, STEP_STATUS_FAILED, std::nullopt, std::string("retry")));
      }
    });
  }
  for (auto& worker : workers) worker.join();

  // no lost updates between steps of the same record
  auto saga = store.FindById(id);
  for (const auto& step : saga->steps()) {
    assert(step.attempts() == 20);
  }
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto store = backend.make_store();
  assert(store->Save(MakeSaga(id)));
  assert(store->UpdateStatus(id, SAGA_STATUS_RUNNING, std::nullopt, std::nullopt));

  backend.restart(store);

  auto saga = store->FindById(id);
  assert(saga.has_value());
  assert(saga->status() == SAGA_STATUS_RUNNING);
  assert(saga->steps_size() == 3);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<saga::db::memory::MemorySagaStore>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<SagaStore>&) {},
      .cleanup          = []() {},
  };
}

#if SAGA_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("saga_orchestrator_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_store = [db_path]() {
    auto db = std::make_shared<saga::db::sqlite::SqliteDB>(db_path);
    saga::db::BootstrapSqliteSchema(*db);
    return std::make_shared<saga::db::sqlite::SqliteSagaStore>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<SagaStore>& store) { store = make_store(); },
      .cleanup =
          [db_path]() {
            std::error_code ec;
            std::filesystem::remove(db_path, ec);
            std::filesystem::remove(db_path + "-wal", ec);
            std::filesystem::remove(db_path + "-shm", ec);
          },
  };
}
#endif

#if SAGA_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SAGA_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SAGA_TEST_POSTGRES_URI is not set");
  }

  auto conninfo   = std::string(uri);
  auto make_store = [conninfo]() {
    auto pool = std::make_shared<saga::db::postgres::PgPool>(conninfo);
    saga::db::BootstrapPostgresSchema(*pool);
    return std::make_shared<saga::db::postgres::PgSagaStore>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_store       = make_store,
      .supports_restart = []() { return true; },
      .restart          = [make_store](std::shared_ptr<SagaStore>& store) { store = make_store(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto store = backend.make_store();

  // ids are unique per run so a shared postgres database can be reused
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyForwardLifecycle(*store, run + "-forward");
  VerifyFailureAndCompensation(*store, run + "-failure");
  VerifyMissingRecords(*store, run + "-missing");
  VerifyStatusQueries(*store, run + "-query");
  VerifyConcurrentStepUpdates(*store, run + "-concurrency");

  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SAGA_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SAGA_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "saga_orchestrator_integration_saga_store_parity: pass\n";
  return 0;
}
