#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace pipeline::db::memory {

// Copy of the document table taken at Begin(). Commit publishes the
// copy only if no other transaction committed in between.
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const MemoryRepository::Documents& Snapshot() const {
    return documents_;
  }
  MemoryRepository::Documents& Working() {
    dirty_ = true;
    return documents_;
  }

 private:
  MemoryRepository&           repo_;
  MemoryRepository::Documents documents_;
  uint64_t                    base_commit_ = 0;
  bool                        dirty_       = false;
  bool                        committed_   = false;
};

} // namespace pipeline::db::memory
