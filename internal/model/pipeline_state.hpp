#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <google/protobuf/repeated_ptr_field.h>

#include "internal/lease/lease_table.hpp"
#include "internal/queue/pending_queue.hpp"
#include "pipeline/store/v1.hpp"

namespace pipeline::model {

namespace v1 = pipeline::store::v1;

inline constexpr int32_t kMaxFolderDepth = 3;

/*
  PipelineState

  Complete mutable state of one workspace. Repositories operate on it by
  reference; stores own exactly one instance (or a working copy of one
  inside a durable transaction). Copyable, so a copy is a full snapshot.

  Ordered maps keep listing and persistence output deterministic.
*/
struct PipelineState {
  std::string workspace_id;

  uint64_t next_job_id       = 1;
  uint64_t next_entity_nonce = 1;
  int64_t  next_seq          = 1;

  std::map<std::string, v1::Project> projects;
  std::map<std::string, v1::Folder>  folders;
  google::protobuf::RepeatedPtrField<v1::TreeChildRef> root_children;

  std::map<std::string, v1::Job> jobs;
  queue::PendingQueue            pending;
  lease::LeaseTable              leases;

  std::map<std::string, v1::ProjectLock>               project_locks;
  std::map<std::string, std::vector<v1::ProjectEvent>> project_events;
};

} // namespace pipeline::model
