#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/time.hpp"

namespace relay::db::sqlite {

using relay::db::ErrorCode;
using relay::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::PayloadRecord ReadPayload(sqlite3_stmt* st) {
  model::PayloadRecord r;
  r.payload_key    = ColText(st, 0);
  r.subsystem      = ColText(st, 1);
  r.filename       = ColText(st, 2);
  r.run_identifier = ColText(st, 3);
  r.size_bytes     = ColU64(st, 4);
  r.received_at_ms = ColU64(st, 5);
  r.location       = static_cast<relay::model::StagingLocation>(ColI32(st, 6));
  r.flagged        = ColI32(st, 7) != 0;
  return r;
}

relay::model::DeliveryRecord ReadDelivery(sqlite3_stmt* st) {
  relay::model::DeliveryRecord r;
  r.payload_key   = ColText(st, 0);
  r.destination   = ColText(st, 1);
  r.state         = static_cast<relay::model::DeliveryState>(ColI32(st, 2));
  r.attempt_count = static_cast<uint32_t>(ColU64(st, 3));
  r.terminal      = ColI32(st, 4) != 0;
  r.last_error    = ColText(st, 5);
  r.updated_at    = util::FromUnixMillis(ColU64(st, 6));
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

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

// ------------------------------------------------------------------
// Staged payloads
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPayload(Transaction& t, const model::PayloadRecord& r) {
  auto* db = TX(t).Handle();
  if (r.payload_key.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty payload key");

  auto st = Prepare(db, sql::UPSERT_PAYLOAD);
  BindText(st.get(), 1, r.payload_key);
  BindText(st.get(), 2, r.subsystem);
  BindText(st.get(), 3, r.filename);
  BindText(st.get(), 4, r.run_identifier);
  BindU64(st.get(), 5, r.size_bytes);
  BindU64(st.get(), 6, r.received_at_ms);
  BindI32(st.get(), 7, static_cast<int>(r.location));
  BindI32(st.get(), 8, r.flagged ? 1 : 0);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::PayloadRecord> SqliteRepository::GetPayload(Transaction& t, const std::string& payload_key) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::SELECT_PAYLOAD);
  BindText(st.get(), 1, payload_key);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadPayload(st.get());
}

std::vector<model::PayloadRecord> SqliteRepository::ListPayloads(Transaction& t) {
  auto* db = TX(t).Handle();

  auto                              st = Prepare(db, sql::SELECT_ALL_PAYLOADS);
  std::vector<model::PayloadRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadPayload(st.get()));
  }
  return out;
}

Result SqliteRepository::DeletePayload(Transaction& t, const std::string& payload_key) {
  auto* db = TX(t).Handle();

  // delivery rows go with it through ON DELETE CASCADE
  auto st = Prepare(db, sql::DELETE_PAYLOAD);
  BindText(st.get(), 1, payload_key);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Deliveries
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDelivery(Transaction& t, const relay::model::DeliveryRecord& r) {
  auto* db = TX(t).Handle();

  {
    auto exists = Prepare(db, sql::PAYLOAD_EXISTS);
    BindText(exists.get(), 1, r.payload_key);
    if (sqlite3_step(exists.get()) != SQLITE_ROW) {
      return Result::Err(ErrorCode::NotFound, "payload not staged: " + r.payload_key);
    }
  }

  auto st = Prepare(db, sql::UPSERT_DELIVERY);
  BindText(st.get(), 1, r.payload_key);
  BindText(st.get(), 2, r.destination);
  BindI32(st.get(), 3, static_cast<int>(r.state));
  BindU64(st.get(), 4, r.attempt_count);
  BindI32(st.get(), 5, r.terminal ? 1 : 0);
  BindText(st.get(), 6, r.last_error);
  BindU64(st.get(), 7, util::ToUnixMillis(r.updated_at));

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<relay::model::DeliveryRecord> SqliteRepository::GetDelivery(Transaction& t, const std::string& payload_key,
                                                                          const std::string& destination) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::SELECT_DELIVERY);
  BindText(st.get(), 1, payload_key);
  BindText(st.get(), 2, destination);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadDelivery(st.get());
}

std::vector<relay::model::DeliveryRecord> SqliteRepository::ListDeliveries(Transaction& t, const std::string& payload_key) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::SELECT_DELIVERIES_FOR_PAYLOAD);
  BindText(st.get(), 1, payload_key);

  std::vector<relay::model::DeliveryRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadDelivery(st.get()));
  }
  return out;
}

std::vector<relay::model::DeliveryRecord> SqliteRepository::ListAllDeliveries(Transaction& t) {
  auto* db = TX(t).Handle();

  auto                                      st = Prepare(db, sql::SELECT_ALL_DELIVERIES);
  std::vector<relay::model::DeliveryRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadDelivery(st.get()));
  }
  return out;
}

} // namespace relay::db::sqlite
