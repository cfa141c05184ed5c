#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pipeline::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  // busy past busy_timeout means another writer held the database throughout
  int rc = sqlite3_exec(db_->Handle(), "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr);
  if ((rc & 0xFF) == SQLITE_BUSY) {
    throw util::Conflict("sqlite begin: database is busy");
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite begin: ") + sqlite3_errmsg(db_->Handle()));
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  // destructor must not throw; report a failed rollback instead
  int rc = sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    PIPELINE_LOG_WARN("sqlite rollback failed",
                      {observability::StringField("path", db_->Path()), observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace pipeline::db::sqlite
