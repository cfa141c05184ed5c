#pragma once

#include <memory>

#include "internal/db/api/document_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace pipeline::db::sqlite {

class SqliteRepository final : public db::DocumentRepository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::StateDocumentRecord> FindDocument(Transaction&, const std::string& workspace_id) override;
  Result SaveDocumentIfRevision(Transaction&, const model::StateDocumentRecord& record, uint64_t expected_revision) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace pipeline::db::sqlite
