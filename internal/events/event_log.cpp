#include "event_log.hpp"

namespace pipeline::events {

const v1::ProjectEvent& EventLog::Append(const v1::Project& project) {
  v1::ProjectEvent event;
  event.set_seq(state_.next_seq++);
  event.set_event(kProjectSnapshotEvent);
  *event.mutable_data() = project;

  auto& bucket = state_.project_events[project.project_id()];
  bucket.push_back(std::move(event));
  return bucket.back();
}

std::vector<v1::ProjectEvent> EventLog::Since(const std::string& project_id, int64_t last_seq) const {
  std::vector<v1::ProjectEvent> out;
  auto                          it = state_.project_events.find(project_id);
  if (it == state_.project_events.end()) return out;

  for (const auto& event : it->second) {
    if (event.seq() > last_seq) out.push_back(event);
  }
  return out;
}

void EventLog::RebuildSnapshots() {
  state_.project_events.clear();
  for (const auto& [_, project] : state_.projects) {
    Append(project);
  }
}

} // namespace pipeline::events
