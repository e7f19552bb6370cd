#include "sqlite_saga_store.hpp"

#include <exception>
#include <stdexcept>

#include "internal/db/saga_document.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace saga::db::sqlite {

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

SqliteSagaStore::SqliteSagaStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

Result SqliteSagaStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

std::optional<db::SagaStore::Saga> SqliteSagaStore::Load(SqliteDB& db, const std::string& saga_id) {
  auto st = db.Prepare("SELECT document FROM saga WHERE saga_id=?;");
  BindText(st.get(), 1, saga_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(Translate(db.Handle(), rc).message);

  return DecodeSagaDocument(ColText(st.get(), 0));
}

Result SqliteSagaStore::Write(SqliteDB& db, const Saga& saga) {
  auto st = db.Prepare(
      "INSERT INTO saga(saga_id,saga_type,status,document,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?,?) "
      "ON CONFLICT(saga_id) DO UPDATE SET saga_type=excluded.saga_type,status=excluded.status,document=excluded.document,"
      "created_at_ms=excluded.created_at_ms,updated_at_ms=excluded.updated_at_ms;");

  BindText(st.get(), 1, saga.saga_id());
  BindText(st.get(), 2, saga.saga_type());
  BindI64(st.get(), 3, static_cast<int64_t>(saga.status()));
  BindText(st.get(), 4, EncodeSagaDocument(saga));
  BindI64(st.get(), 5, static_cast<int64_t>(util::ToUnixMillis(saga.created_at())));
  BindI64(st.get(), 6, static_cast<int64_t>(util::ToUnixMillis(saga.updated_at())));

  return Translate(db.Handle(), sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

template <typename Mutator>
Result SqliteSagaStore::Modify(const std::string& saga_id, Mutator&& mutate) {
  std::lock_guard lock(mutex_);
  try {
    SqliteTransaction tx(db_);

    auto saga = Load(tx.DB(), saga_id);
    if (!saga) return Result::Err(ErrorCode::NotFound, "saga " + saga_id + " not found");

    auto r = mutate(*saga);
    if (!r) return r;

    r = Write(tx.DB(), *saga);
    if (!r) return r;

    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

Result SqliteSagaStore::Save(const Saga& saga) {
  if (saga.saga_id().empty()) return Result::Err(ErrorCode::ConstraintViolation, "saga_id is required");

  Saga copy = saga;
  StampUpdated(copy);

  std::lock_guard lock(mutex_);
  try {
    SqliteTransaction tx(db_);
    auto              r = Write(tx.DB(), copy);
    if (!r) return r;
    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

Result SqliteSagaStore::UpdateStatus(const std::string& saga_id, SagaStatus status, const std::optional<std::string>& error,
                                     const std::optional<google::protobuf::Struct>& result) {
  return Modify(saga_id, [&](Saga& saga) { return ApplySagaStatus(saga, status, error, result); });
}

Result SqliteSagaStore::UpdateStepStatus(const std::string& saga_id, const std::string& step_name, StepStatus status,
                                         const std::optional<google::protobuf::Value>& result, const std::optional<std::string>& error) {
  return Modify(saga_id, [&](Saga& saga) { return ApplyStepStatus(saga, step_name, status, result, error); });
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<db::SagaStore::Saga> SqliteSagaStore::FindById(const std::string& saga_id) {
  std::lock_guard lock(mutex_);
  try {
    return Load(*db_, saga_id);
  } catch (const std::exception& e) {
    throw util::StoreFailure("sqlite FindById " + saga_id + ": " + e.what());
  }
}

std::vector<db::SagaStore::Saga> SqliteSagaStore::FindByStatus(SagaStatus status) {
  std::lock_guard lock(mutex_);
  try {
    auto st = db_->Prepare("SELECT document FROM saga WHERE status=? ORDER BY created_at_ms, saga_id;");
    BindI64(st.get(), 1, static_cast<int64_t>(status));

    std::vector<Saga> sagas;
    int               rc = SQLITE_OK;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
      sagas.push_back(DecodeSagaDocument(ColText(st.get(), 0)));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(Translate(db_->Handle(), rc).message);

    // millisecond column ties are resolved on the full timestamp
    SortByCreatedAt(sagas);
    return sagas;
  } catch (const std::exception& e) {
    throw util::StoreFailure("sqlite FindByStatus: " + std::string(e.what()));
  }
}

} // namespace saga::db::sqlite
