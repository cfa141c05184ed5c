#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace pipeline::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

MemoryTransaction& MemoryRepository::TX(Transaction& t) {
  return static_cast<MemoryTransaction&>(t);
}

std::optional<model::StateDocumentRecord> MemoryRepository::FindDocument(Transaction& t, const std::string& workspace_id) {
  const auto& docs = TX(t).Snapshot();
  auto        it   = docs.find(workspace_id);
  if (it == docs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::SaveDocumentIfRevision(Transaction& t, const model::StateDocumentRecord& record, uint64_t expected_revision) {
  auto& docs = TX(t).Working();
  auto  it   = docs.find(record.workspace_id);

  if (expected_revision == 0) {
    if (it != docs.end()) return Result::Err(ErrorCode::Conflict, "document already exists: " + record.workspace_id);
    docs.emplace(record.workspace_id, record);
    return Result::Ok();
  }

  if (it == docs.end() || it->second.revision != expected_revision) {
    return Result::Err(ErrorCode::Conflict, "document revision changed: " + record.workspace_id);
  }
  it->second = record;
  return Result::Ok();
}

} // namespace pipeline::db::memory
