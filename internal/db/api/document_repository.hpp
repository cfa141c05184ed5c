#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/state_document_record.hpp"

namespace pipeline::db {

/*
  DocumentRepository

  Stores one serialized pipeline state document per workspace.

  Writes are conditional on the revision the caller read, so two
  writers racing on the same workspace cannot both succeed:

    SaveDocumentIfRevision(tx, record, expected)
      expected == 0  -> INSERT, fails if a row exists
      expected  > 0  -> UPDATE ... WHERE revision = expected

  Any outcome other than exactly one affected row is ErrorCode::Conflict.
*/
class DocumentRepository {
 public:
  virtual ~DocumentRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // nullopt only when no row exists; read failures throw (util::Conflict
  // for lock contention).
  virtual std::optional<model::StateDocumentRecord> FindDocument(Transaction&, const std::string& workspace_id) = 0;

  virtual Result SaveDocumentIfRevision(Transaction&, const model::StateDocumentRecord& record, uint64_t expected_revision) = 0;
};

} // namespace pipeline::db
