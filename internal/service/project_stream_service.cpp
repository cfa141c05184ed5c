#include "project_stream_service.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

#include "internal/events/event_log.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"

namespace pipeline::service {

namespace {

std::string SanitizeBlobPath(std::string_view value) {
  std::string normalized(value);
  std::replace(normalized.begin(), normalized.end(), '\\', '/');

  std::string out;
  std::size_t pos = 0;
  while (pos <= normalized.size()) {
    auto next = normalized.find('/', pos);
    if (next == std::string::npos) next = normalized.size();

    const auto segment = std::string_view(normalized).substr(pos, next - pos);
    if (!segment.empty() && segment != "." && segment != "..") {
      if (!out.empty()) out.push_back('/');
      out.append(segment);
    }
    pos = next + 1;
  }
  return out;
}

const v1::Project& RequireProject(const std::optional<v1::Project>& project, const std::string& project_id) {
  if (!project) throw util::NotFound("Project not found: " + project_id);
  return *project;
}

} // namespace

std::optional<int64_t> ParseLastEventId(std::string_view text) {
  std::size_t pos = 0;
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
  if (pos < text.size() && text[pos] == '+') ++pos;

  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + text.size(), value);
  if (ec != std::errc()) return std::nullopt;
  return value;
}

int64_t NormalizeLastEventId(std::optional<int64_t> value) {
  if (!value) return kNoLastEventId;
  return std::max(*value, kNoLastEventId);
}

std::string FormatSseFrame(std::string_view event, int64_t id, std::string_view data) {
  std::string frame;
  frame.reserve(event.size() + data.size() + 40);
  frame.append("id: ").append(std::to_string(id));
  frame.append("\nevent: ").append(event);
  frame.append("\ndata: ").append(data);
  frame.append("\n\n");
  return frame;
}

std::string BuildExportKey(std::string_view tenant_id, std::string_view project_id, std::string_view export_path) {
  auto path = SanitizeBlobPath(export_path);
  if (path.empty()) path = kDefaultExportFile;
  return std::string(tenant_id) + "/" + std::string(project_id) + "/" + path;
}

std::optional<std::string> ReadExportPath(const v1::Job& job) {
  if (job.kind() != v1::JOB_KIND_GLTF_CONVERT || job.status() != v1::JOB_STATUS_COMPLETED) return std::nullopt;
  if (!job.has_result() || !job.result().has_output()) return std::nullopt;

  const auto& fields = job.result().output().fields();
  auto        it     = fields.find("exportPath");
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue) return std::nullopt;

  const auto& path = it->second.string_value();
  if (std::all_of(path.begin(), path.end(), [](unsigned char c) { return std::isspace(c); })) return std::nullopt;
  return path;
}

ProjectStreamService::ProjectStreamService(std::shared_ptr<pipeline::store::PipelineStore> store) : store_(std::move(store)) {
  if (!store_) throw std::invalid_argument("ProjectStreamService requires a store");
}

StreamBatch ProjectStreamService::Resume(const std::string& project_id, int64_t cursor) {
  const auto  current = store_->GetProject(project_id);
  const auto& project = RequireProject(current, project_id);

  StreamBatch batch;
  batch.events = store_->GetProjectEventsSince(project_id, cursor);
  if (!batch.events.empty()) {
    batch.cursor = batch.events.back().seq();
    return batch;
  }

  v1::ProjectEvent synthesized;
  synthesized.set_seq(cursor + 1);
  synthesized.set_event(events::kProjectSnapshotEvent);
  *synthesized.mutable_data() = project;
  synthesized.mutable_data()->set_revision(std::max(project.revision(), cursor + 1));

  batch.events.push_back(std::move(synthesized));
  batch.cursor = cursor + 1;
  return batch;
}

StreamBatch ProjectStreamService::Poll(const std::string& project_id, int64_t cursor) {
  RequireProject(store_->GetProject(project_id), project_id);

  StreamBatch batch;
  batch.events = store_->GetProjectEventsSince(project_id, cursor);
  batch.cursor = batch.events.empty() ? cursor : batch.events.back().seq();
  return batch;
}

std::string ProjectStreamService::Frame(const v1::ProjectEvent& event) {
  return FormatSseFrame(event.event(), event.seq(), util::ToJson(event.data()));
}

} // namespace pipeline::service
