#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/pipeline_state.hpp"

namespace pipeline::events {

namespace v1 = pipeline::store::v1;

inline constexpr const char* kProjectSnapshotEvent = "project_snapshot";

/*
  EventLog

  Per-project append-only list of full project snapshots. Sequence
  numbers come from one counter shared by every project in the state,
  so a cursor is comparable across projects and never reused.
*/
class EventLog {
 public:
  explicit EventLog(model::PipelineState& state) : state_(state) {
  }

  // Records a copy of `project` under the next sequence number.
  const v1::ProjectEvent& Append(const v1::Project& project);

  // Events of `project_id` with seq > last_seq, ascending.
  std::vector<v1::ProjectEvent> Since(const std::string& project_id, int64_t last_seq) const;

  // Drops all history and emits one fresh snapshot per project in id order.
  void RebuildSnapshots();

 private:
  model::PipelineState& state_;
};

} // namespace pipeline::events
