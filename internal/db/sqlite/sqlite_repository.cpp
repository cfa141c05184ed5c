#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace pipeline::db::sqlite {

using pipeline::db::ErrorCode;
using pipeline::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// Lock contention surfaces as Conflict so the store retries the operation.
[[noreturn]] static void ThrowReadFailure(const Result& res) {
  if (res.LostRace()) throw util::Conflict("find pipeline state: " + res.message);
  throw std::runtime_error("find pipeline state: " + res.Describe());
}

std::optional<model::StateDocumentRecord> SqliteRepository::FindDocument(Transaction& t, const std::string& workspace_id) {
  auto* db = TX(t).Handle();

  const char* sql = "SELECT workspace_id,document,revision,updated_at_ms FROM pipeline_state_document WHERE workspace_id=?;";

  sqlite3_stmt* st = nullptr;
  if (int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr); rc != SQLITE_OK) ThrowReadFailure(Translate(db, rc));

  BindText(st, 1, workspace_id);

  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(st);
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    const auto res = Translate(db, rc);
    sqlite3_finalize(st);
    ThrowReadFailure(res);
  }

  model::StateDocumentRecord r;
  r.workspace_id  = ColText(st, 0);
  r.document      = ColText(st, 1);
  r.revision      = ColU64(st, 2);
  r.updated_at_ms = ColU64(st, 3);

  sqlite3_finalize(st);
  return r;
}

Result SqliteRepository::SaveDocumentIfRevision(Transaction& t, const model::StateDocumentRecord& r, uint64_t expected_revision) {
  auto* db = TX(t).Handle();

  const bool  insert = expected_revision == 0;
  const char* sql    = insert ? "INSERT INTO pipeline_state_document(workspace_id,document,revision,updated_at_ms) VALUES(?,?,?,?);"
                              : "UPDATE pipeline_state_document SET document=?,revision=?,updated_at_ms=? WHERE workspace_id=? AND revision=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  if (insert) {
    BindText(st, 1, r.workspace_id);
    BindText(st, 2, r.document);
    BindU64(st, 3, r.revision);
    BindU64(st, 4, r.updated_at_ms);
  } else {
    BindText(st, 1, r.document);
    BindU64(st, 2, r.revision);
    BindU64(st, 3, r.updated_at_ms);
    BindText(st, 4, r.workspace_id);
    BindU64(st, 5, expected_revision);
  }

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (insert && (rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::Conflict, "document already exists: " + r.workspace_id);
  }
  if (auto res = Translate(db, rc); !res) return res;

  if (sqlite3_changes(db) != 1) {
    return Result::Err(ErrorCode::Conflict, "document revision changed: " + r.workspace_id);
  }
  return Result::Ok();
}

} // namespace pipeline::db::sqlite
