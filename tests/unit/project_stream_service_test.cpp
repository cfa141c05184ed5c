#include "internal/service/project_stream_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/store/memory_pipeline_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"

namespace {

namespace service = pipeline::service;
namespace v1      = pipeline::store::v1;

void TestLastEventIdParsing() {
  assert(service::ParseLastEventId("42") == std::optional<int64_t>(42));
  assert(service::ParseLastEventId("  7") == std::optional<int64_t>(7));
  assert(service::ParseLastEventId("+3") == std::optional<int64_t>(3));
  assert(service::ParseLastEventId("12abc") == std::optional<int64_t>(12));
  assert(service::ParseLastEventId("-5") == std::optional<int64_t>(-5));
  assert(!service::ParseLastEventId("").has_value());
  assert(!service::ParseLastEventId("abc").has_value());

  assert(service::NormalizeLastEventId(std::nullopt) == -1);
  assert(service::NormalizeLastEventId(-5) == -1);
  assert(service::NormalizeLastEventId(9) == 9);
}

void TestFrameFormatting() {
  assert(service::FormatSseFrame("project_snapshot", 3, "{}") == "id: 3\nevent: project_snapshot\ndata: {}\n\n");
}

void TestExportHelpers() {
  assert(service::BuildExportKey("tenant", "prj_1", "models/../out//scene.gltf") == "tenant/prj_1/models/out/scene.gltf");
  assert(service::BuildExportKey("tenant", "prj_1", "..\\..\\") == "tenant/prj_1/export.json");

  v1::Job job;
  job.set_kind(v1::JOB_KIND_GLTF_CONVERT);
  job.set_status(v1::JOB_STATUS_COMPLETED);
  assert(!service::ReadExportPath(job).has_value());

  (*job.mutable_result()->mutable_output()->mutable_fields())["exportPath"].set_string_value("out/model.gltf");
  assert(service::ReadExportPath(job) == std::optional<std::string>("out/model.gltf"));

  (*job.mutable_result()->mutable_output()->mutable_fields())["exportPath"].set_string_value("   ");
  assert(!service::ReadExportPath(job).has_value());

  job.set_status(v1::JOB_STATUS_RUNNING);
  (*job.mutable_result()->mutable_output()->mutable_fields())["exportPath"].set_string_value("out/model.gltf");
  assert(!service::ReadExportPath(job).has_value());
}

void TestResumeReplaysOrSynthesizes() {
  auto clock = std::make_shared<pipeline::util::ManualClockSource>(pipeline::util::FromUnixMillis(1700000000000));
  auto store = std::make_shared<pipeline::store::MemoryPipelineStore>("ws_stream", clock);
  service::ProjectStreamService stream(store);

  pipeline::model::CreateProjectInput input;
  input.name   = "Streamed";
  auto project = store->CreateProject(input);

  auto replay = stream.Resume(project.project_id(), service::kNoLastEventId);
  assert(replay.events.size() == 1);
  assert(replay.cursor == replay.events.back().seq());

  // caught up: a synthesized snapshot one past the cursor
  auto synthesized = stream.Resume(project.project_id(), 10);
  assert(synthesized.events.size() == 1);
  assert(synthesized.events.front().seq() == 11);
  assert(synthesized.events.front().event() == "project_snapshot");
  assert(synthesized.events.front().data().revision() == 11);
  assert(synthesized.cursor == 11);

  auto idle = stream.Poll(project.project_id(), replay.cursor);
  assert(idle.events.empty());
  assert(idle.cursor == replay.cursor);

  store->RenameProject(project.project_id(), "Renamed");
  auto next = stream.Poll(project.project_id(), replay.cursor);
  assert(next.events.size() == 1);
  assert(next.events.front().data().name() == "Renamed");
  assert(next.cursor > replay.cursor);

  const auto frame = service::ProjectStreamService::Frame(next.events.front());
  assert(frame.rfind("id: " + std::to_string(next.cursor) + "\nevent: project_snapshot\ndata: {", 0) == 0);
  assert(frame.find("\"name\":\"Renamed\"") != std::string::npos);
}

void TestUnknownProjectIsNotFound() {
  auto store = std::make_shared<pipeline::store::MemoryPipelineStore>("ws_stream");
  service::ProjectStreamService stream(store);

  bool threw = false;
  try {
    stream.Resume("prj_missing", service::kNoLastEventId);
  } catch (const pipeline::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    stream.Poll("prj_missing", 0);
  } catch (const pipeline::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLastEventIdParsing();
  TestFrameFormatting();
  TestExportHelpers();
  TestResumeReplaysOrSynthesizes();
  TestUnknownProjectIsNotFound();

  std::cout << "project_stream_service_test: pass\n";
  return 0;
}
