#pragma once

#include <memory>
#include <shared_mutex>
#include <string>

#include "internal/store/state_store.hpp"

namespace pipeline::store {

/*
  Transient backend: one PipelineState in process memory.

  Writers are exclusive, readers shared. Operations validate before they
  mutate, so a throwing operation leaves the state untouched.
*/
class MemoryPipelineStore final : public StateStore {
 public:
  explicit MemoryPipelineStore(std::string workspace_id, std::shared_ptr<util::ClockSource> clock = nullptr);

  std::string_view Backend() const override {
    return "memory";
  }

 protected:
  void Execute(std::string_view op, AccessMode mode, const Operation& fn) override;

 private:
  mutable std::shared_mutex mutex_;
  model::PipelineState      state_;
};

} // namespace pipeline::store
