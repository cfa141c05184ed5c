#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/store/pipeline_store.hpp"
#include "pipeline/store/v1.hpp"

namespace pipeline::service {

namespace v1 = pipeline::store::v1;

inline constexpr int64_t     kNoLastEventId  = -1;
inline constexpr const char* kDefaultTenantId = "default-tenant";
inline constexpr const char* kDefaultExportFile = "export.json";

// Leading base-10 integer of `text` (after optional whitespace/sign); nullopt otherwise.
std::optional<int64_t> ParseLastEventId(std::string_view text);

// Absent -> -1; anything below -1 -> -1.
int64_t NormalizeLastEventId(std::optional<int64_t> value);

// "id: <id>\nevent: <event>\ndata: <data>\n\n"
std::string FormatSseFrame(std::string_view event, int64_t id, std::string_view data);

// "<tenant>/<project>/<sanitized path>" for the blob holding an export.
std::string BuildExportKey(std::string_view tenant_id, std::string_view project_id, std::string_view export_path);

// result.output.exportPath of a completed gltf.convert job, when non-blank.
std::optional<std::string> ReadExportPath(const v1::Job& job);

struct StreamBatch {
  std::vector<v1::ProjectEvent> events;
  int64_t                       cursor = kNoLastEventId;
};

/*
  ProjectStreamService

  Cursor bookkeeping for server-push consumers of one project's event
  log. Resume answers a (re)connect, Poll each later tick; the returned
  cursor is what the caller passes next time.
*/
class ProjectStreamService {
 public:
  explicit ProjectStreamService(std::shared_ptr<pipeline::store::PipelineStore> store);

  // Every event after `cursor`; if there is none yet, one synthesized
  // snapshot at cursor+1 with revision max(project.revision, cursor+1).
  // Throws util::NotFound for an unknown project.
  StreamBatch Resume(const std::string& project_id, int64_t cursor);

  // Events after `cursor`, possibly none. Throws util::NotFound once the
  // project is gone.
  StreamBatch Poll(const std::string& project_id, int64_t cursor);

  static std::string Frame(const v1::ProjectEvent& event);

 private:
  std::shared_ptr<pipeline::store::PipelineStore> store_;
};

} // namespace pipeline::service
