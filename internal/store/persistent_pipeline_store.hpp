#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/db/api/document_repository.hpp"
#include "internal/store/state_store.hpp"

namespace pipeline::store {

struct PersistenceOptions {
  uint32_t conflict_retries    = 5;
  uint32_t conflict_backoff_ms = 30;
};

/*
  PersistentPipelineStore

  Durable backend over a DocumentRepository. Each operation is one
  storage transaction:

    begin -> read document row -> state (cache hit or decode)
          -> apply operation to a working copy
          -> conditional save at revision+1 -> commit

  The conditional save turns every mutation, claim included, into an
  atomic check-and-set: of two stores racing on one database exactly
  one commits, the other sees Conflict, drops its cache and replays the
  operation against the winner's state.

  After `conflict_retries` lost races util::Conflict reaches the caller.
*/
class PersistentPipelineStore final : public StateStore {
 public:
  PersistentPipelineStore(std::shared_ptr<db::DocumentRepository> repository, std::string backend, std::string workspace_id,
                          PersistenceOptions options = {}, std::shared_ptr<util::ClockSource> clock = nullptr);

  std::string_view Backend() const override {
    return backend_;
  }

 protected:
  void Execute(std::string_view op, AccessMode mode, const Operation& fn) override;

 private:
  void                 ExecuteOnce(AccessMode mode, const Operation& fn);
  model::PipelineState Load(const db::model::StateDocumentRecord& row) const;
  void                 DropCache();

  std::shared_ptr<db::DocumentRepository> repository_;
  std::string                             backend_;
  PersistenceOptions                      options_;

  std::mutex                          mutex_;
  std::optional<uint64_t>             cached_revision_;
  std::optional<model::PipelineState> cached_state_;
};

} // namespace pipeline::store
