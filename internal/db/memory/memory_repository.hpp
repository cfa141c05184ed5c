#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/document_repository.hpp"

namespace pipeline::db::memory {

class MemoryTransaction;

/*
  Process-local document table.

  Several PersistentPipelineStores may share one MemoryRepository; they
  then race exactly like stores sharing a database file, which is how
  the durable code path is exercised without a database.
*/
class MemoryRepository final : public db::DocumentRepository {
 public:
  using Documents = std::unordered_map<std::string, model::StateDocumentRecord>;

  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::StateDocumentRecord> FindDocument(Transaction&, const std::string& workspace_id) override;
  Result SaveDocumentIfRevision(Transaction&, const model::StateDocumentRecord& record, uint64_t expected_revision) override;

 private:
  friend class MemoryTransaction;

  static MemoryTransaction& TX(Transaction& t);

  std::mutex mutex_;
  Documents  documents_;
  uint64_t   commit_count_ = 0;
};

} // namespace pipeline::db::memory
