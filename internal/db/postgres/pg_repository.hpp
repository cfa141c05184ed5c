#pragma once

#include <memory>

#include "internal/db/api/document_repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace pipeline::db::postgres {

class PgRepository final : public db::DocumentRepository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::StateDocumentRecord> FindDocument(Transaction&, const std::string& workspace_id) override;
  Result SaveDocumentIfRevision(Transaction&, const model::StateDocumentRecord& record, uint64_t expected_revision) override;

 private:
  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace pipeline::db::postgres
