#include "memory_pipeline_store.hpp"

#include <mutex>

#include "internal/persistence/state_codec.hpp"

namespace pipeline::store {

MemoryPipelineStore::MemoryPipelineStore(std::string workspace_id, std::shared_ptr<util::ClockSource> clock)
    : StateStore(persistence::NormalizeWorkspaceId(workspace_id), std::move(clock)), state_(persistence::NewState(WorkspaceId())) {
}

void MemoryPipelineStore::Execute(std::string_view, AccessMode mode, const Operation& fn) {
  if (mode == AccessMode::kRead) {
    std::shared_lock lock(mutex_);
    StoreContext     ctx(state_, Now());
    fn(ctx);
    return;
  }

  std::unique_lock lock(mutex_);
  StoreContext     ctx(state_, Now());
  fn(ctx);
}

} // namespace pipeline::store
