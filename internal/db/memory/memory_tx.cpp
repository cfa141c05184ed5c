#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace pipeline::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  documents_   = repo_.documents_;
  base_commit_ = repo_.commit_count_;
}

void MemoryTransaction::Commit() {
  if (committed_) return;
  if (!dirty_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.commit_count_ != base_commit_) {
    throw util::Conflict("memory document table changed since the transaction began");
  }
  repo_.documents_ = std::move(documents_);
  ++repo_.commit_count_;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  documents_.clear();
  dirty_ = false;
}

} // namespace pipeline::db::memory
