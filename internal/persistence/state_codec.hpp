#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/pipeline_state.hpp"

namespace pipeline::persistence {

namespace v1 = pipeline::store::v1;

inline constexpr int32_t kPersistedStateVersion = 3;

/*
  State codec

  PipelineState <-> PersistedPipelineState (and its JSON text). Decoding
  never trusts the document: malformed entries are dropped, dangling
  references repaired, orphans reattached, counters reconciled against
  the ids actually present, and event history rebuilt as one snapshot
  per project.

  JSON is salvaged entry by entry: a project, folder, job, lock, event or
  tree reference that does not parse is skipped on its own, as are
  nested hierarchy nodes and child references. Only a document that is
  not an object, carries another version, or lacks one of the top-level
  lists decodes to nullopt (projectLocks may be absent).
*/

// Trimmed id, or "ws_default" when blank.
std::string          NormalizeWorkspaceId(const std::string& workspace_id);
model::PipelineState NewState(const std::string& workspace_id);

v1::PersistedPipelineState Encode(const model::PipelineState& state);
std::string                EncodeJson(const model::PipelineState& state);

std::optional<model::PipelineState> Decode(const v1::PersistedPipelineState& document);
std::optional<model::PipelineState> DecodeJson(const std::string& json);

} // namespace pipeline::persistence
