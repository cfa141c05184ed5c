#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/store/persistent_pipeline_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"

namespace {

namespace v1 = pipeline::store::v1;

using pipeline::runtime::config::RuntimeConfig;
using pipeline::store::PipelineStore;
using pipeline::util::ManualClockSource;
using std::chrono::milliseconds;

std::string UniqueSuffix() {
  static int counter = 0;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
  return std::to_string(ms) + "_" + std::to_string(++counter);
}

struct BackendFactory {
  std::string                                                                          name;
  std::function<std::shared_ptr<PipelineStore>(std::shared_ptr<ManualClockSource>)> make_store;
  std::function<bool()>                                                                supports_restart;
  std::function<void()>                                                                cleanup;
  bool                                                                                 supports_shared_file = false;
};

RuntimeConfig BaseConfig(const std::string& workspace_id) {
  auto config = pipeline::config::ConfigLoader::LoadFromYamlString("workspace_id: \"" + workspace_id + "\"\n");
  config.mutable_persistence()->set_conflict_retries(200);
  config.mutable_persistence()->set_conflict_backoff_ms(1);
  return config;
}

google::protobuf::Value Json(const std::string& text) {
  auto value = pipeline::util::ParseJsonValue(text);
  assert(value.has_value());
  return *value;
}

std::string Describe(const std::optional<v1::Job>& job) {
  if (!job) return "none";
  return job->id() + " " + std::to_string(job->status()) + " attempts=" + std::to_string(job->attempt_count()) +
         " worker=" + job->worker_id() + " dead=" + std::to_string(job->dead_letter());
}

std::string Describe(const v1::Project& project) {
  return project.name() + " rev=" + std::to_string(project.revision()) + " bones=" + std::to_string(project.stats().bones()) +
         " cubes=" + std::to_string(project.stats().cubes()) + " active=" + project.active_job().id() + "/" +
         std::to_string(project.active_job().status()) + " lock=" + project.project_lock().owner_agent_id();
}

void DescribeTree(const google::protobuf::RepeatedPtrField<v1::ProjectTreeNode>& nodes, std::vector<std::string>& out) {
  for (const auto& node : nodes) {
    out.push_back("tree " + std::to_string(node.kind()) + " " + node.name() + " depth=" + std::to_string(node.depth()));
    DescribeTree(node.children(), out);
  }
}

// Drives one store through the whole job and project surface and
// records every observable answer. Ids derived from the workspace are
// left out so backends on different workspaces stay comparable.
std::vector<std::string> RunScenario(PipelineStore& store, ManualClockSource& clock) {
  std::vector<std::string> out;

  pipeline::model::CreateFolderInput folder_input;
  folder_input.name = "Assets";
  auto folder       = store.CreateFolder(folder_input);
  out.push_back("folder " + folder.name());

  pipeline::model::CreateProjectInput project_input;
  project_input.name             = "Hero";
  project_input.parent_folder_id = folder.folder_id();
  const auto hero                = store.CreateProject(project_input).project_id();

  pipeline::model::SubmitJobInput convert;
  convert.project_id   = hero;
  convert.kind         = "gltf.convert";
  convert.payload      = Json(R"({"codecId":"draco"})");
  convert.max_attempts = 2;
  out.push_back("submit " + Describe(store.SubmitJob(convert)));

  pipeline::model::SubmitJobInput preflight;
  preflight.project_id = "prj_adhoc";
  preflight.kind       = "texture.preflight";
  preflight.lease_ms   = 5000;
  out.push_back("submit " + Describe(store.SubmitJob(preflight)));
  out.push_back("adhoc events " + std::to_string(store.GetProjectEventsSince("prj_adhoc", -1).size()));

  bool rejected = false;
  try {
    pipeline::model::SubmitJobInput bad;
    bad.project_id = hero;
    bad.kind       = "mesh.bake";
    store.SubmitJob(bad);
  } catch (const pipeline::util::ContractViolation&) {
    rejected = true;
  }
  out.push_back("rejected " + std::to_string(rejected));

  out.push_back("claim " + Describe(store.ClaimNextJob("w1")));
  out.push_back("fail " + Describe(store.FailJob("job-1", "transient")));
  out.push_back("claim " + Describe(store.ClaimNextJob("w2")));
  out.push_back("claim " + Describe(store.ClaimNextJob("w2")));

  clock.Advance(milliseconds(250));
  out.push_back("claim " + Describe(store.ClaimNextJob("w3")));

  const auto result = Json(R"({"kind":"gltf.convert","status":"converted","hierarchy":[
    {"id":"root","name":"Root","kind":"bone","children":[{"id":"c","name":"C","kind":"cube","children":[]}]}]})");
  out.push_back("complete " + Describe(store.CompleteJob("job-1", result)));
  out.push_back("project " + Describe(*store.GetProject(hero)));

  clock.Advance(milliseconds(5000));
  out.push_back("claim " + Describe(store.ClaimNextJob("w4")));
  out.push_back("fail " + Describe(store.FailJob("job-2", "oops")));

  pipeline::model::AcquireLockInput lock;
  lock.project_id     = hero;
  lock.owner_agent_id = "agent-a";
  store.AcquireProjectLock(lock);

  lock.owner_agent_id = "agent-b";
  bool conflicted     = false;
  try {
    store.AcquireProjectLock(lock);
  } catch (const pipeline::util::LockConflict& e) {
    conflicted = e.owner_agent_id() == "agent-a";
  }
  out.push_back("conflict " + std::to_string(conflicted));
  out.push_back("project " + Describe(*store.GetProject(hero)));
  out.push_back("lock " + store.GetProjectLock(hero)->owner_agent_id());

  for (const auto& event : store.GetProjectEventsSince(hero, -1)) {
    out.push_back("event " + std::to_string(event.seq()) + " " + event.event() + " rev=" + std::to_string(event.data().revision()));
  }
  DescribeTree(store.GetProjectTree(std::nullopt).roots(), out);
  for (const auto& job : store.ListProjectJobs(hero)) out.push_back("listed " + Describe(job));

  pipeline::model::ReleaseLockInput release;
  release.project_id     = hero;
  release.owner_agent_id = "agent-a";
  out.push_back("released " + std::to_string(store.ReleaseProjectLock(release)));

  out.push_back("deleted " + std::to_string(store.DeleteFolder(folder.folder_id())));
  out.push_back("hero " + std::to_string(store.GetProject(hero).has_value()));
  out.push_back("job-1 " + Describe(store.GetJob("job-1")));
  out.push_back("projects " + std::to_string(store.ListProjects(std::nullopt).size()));
  return out;
}

void VerifyRestartKeepsState(const BackendFactory& backend) {
  auto clock = std::make_shared<ManualClockSource>(pipeline::util::FromUnixMillis(1700000000000));
  auto store = backend.make_store(clock);

  pipeline::model::SubmitJobInput submit;
  submit.project_id = "prj_durable";
  submit.kind       = "gltf.convert";
  store->SubmitJob(submit);
  store->SubmitJob(submit);
  auto running = store->ClaimNextJob("w1");
  assert(running.has_value());

  pipeline::model::AcquireLockInput lock;
  lock.project_id     = "prj_durable";
  lock.owner_agent_id = "agent-a";
  store->AcquireProjectLock(lock);
  const auto last_seq = store->GetProjectEventsSince("prj_durable", -1).back().seq();
  store.reset();

  auto restarted = backend.make_store(clock);
  auto job       = restarted->GetJob(running->id());
  assert(job.has_value());
  assert(job->status() == v1::JOB_STATUS_RUNNING);
  assert(restarted->GetProjectLock("prj_durable")->owner_agent_id() == "agent-a");

  // history collapses to one fresh snapshot after a reload
  auto events = restarted->GetProjectEventsSince("prj_durable", -1);
  assert(events.size() == 1);
  assert(events.front().seq() > last_seq);

  clock->Advance(milliseconds(1000));
  auto next = restarted->ClaimNextJob("w2");
  assert(next.has_value());
  assert(next->id() == "job-2");

  // only the first lease has run out
  clock->Advance(milliseconds(29500));
  auto recovered = restarted->ClaimNextJob("w3");
  assert(recovered.has_value());
  assert(recovered->id() == running->id());
  assert(recovered->attempt_count() == 2);
}

void VerifySharedFileClaims(const BackendFactory& backend) {
  auto first  = backend.make_store(nullptr);
  auto second = backend.make_store(nullptr);

  for (int i = 0; i < 20; ++i) {
    pipeline::model::SubmitJobInput submit;
    submit.project_id = "prj_shared";
    submit.kind       = "texture.preflight";
    (i % 2 == 0 ? first : second)->SubmitJob(submit);
  }

  std::mutex               mutex;
  std::vector<std::string> claimed;
  std::vector<std::thread> workers;
  for (int w = 0; w < 6; ++w) {
    auto store = w % 2 == 0 ? first : second;
    workers.emplace_back([store, &mutex, &claimed, w] {
      while (auto job = store->ClaimNextJob("worker-" + std::to_string(w))) {
        std::lock_guard lock(mutex);
        claimed.push_back(job->id());
      }
    });
  }
  for (auto& worker : workers) worker.join();

  assert(claimed.size() == 20);
  assert(std::set<std::string>(claimed.begin(), claimed.end()).size() == 20);
  assert(first->ListProjectJobs("prj_shared").size() == 20);
}

std::vector<BackendFactory> Backends() {
  std::vector<BackendFactory> backends;

  backends.push_back(BackendFactory{
      "memory",
      [](std::shared_ptr<ManualClockSource> clock) { return pipeline::factory::BuildStore(BaseConfig("ws_parity"), clock); },
      [] { return false; },
      [] {},
  });

  auto shared_repository = std::make_shared<pipeline::db::memory::MemoryRepository>();
  backends.push_back(BackendFactory{
      "memory-durable",
      [shared_repository](std::shared_ptr<ManualClockSource> clock) -> std::shared_ptr<PipelineStore> {
        pipeline::store::PersistenceOptions options;
        options.conflict_retries    = 200;
        options.conflict_backoff_ms = 1;
        return std::make_shared<pipeline::store::PersistentPipelineStore>(shared_repository, "memory-durable", "ws_parity", options,
                                                                         clock);
      },
      [] { return true; },
      [] {},
      true,
  });

#if PIPELINE_DB_SQLITE
  const auto sqlite_path =
      (std::filesystem::temp_directory_path() / ("pipeline_store_parity_" + UniqueSuffix() + ".db")).string();
  backends.push_back(BackendFactory{
      "sqlite",
      [sqlite_path](std::shared_ptr<ManualClockSource> clock) {
        auto config = BaseConfig("ws_parity");
        config.mutable_store()->mutable_sqlite()->set_path(sqlite_path);
        return pipeline::factory::BuildStore(config, clock);
      },
      [] { return true; },
      [sqlite_path] {
        std::error_code ec;
        for (const auto* suffix : {"", "-wal", "-shm"}) std::filesystem::remove(sqlite_path + suffix, ec);
      },
      true,
  });
#endif

#if PIPELINE_DB_POSTGRES
  if (const char* uri = std::getenv("PIPELINE_TEST_POSTGRES_URI"); uri && *uri) {
    const std::string workspace = "ws_parity_" + UniqueSuffix();
    const std::string conn      = uri;
    backends.push_back(BackendFactory{
        "postgres",
        [workspace, conn](std::shared_ptr<ManualClockSource> clock) {
          auto config = BaseConfig(workspace);
          config.mutable_store()->mutable_postgres()->set_connection_uri(conn);
          config.mutable_store()->mutable_postgres()->set_max_connections(4);
          return pipeline::factory::BuildStore(config, clock);
        },
        [] { return true; },
        [] {},
        true,
    });
  }
#endif

  return backends;
}

// Each phase gets a fresh backend set so stores never see one another's state.
void RunPhase(const std::function<void(const BackendFactory&)>& phase, bool durable_only) {
  for (auto& backend : Backends()) {
    if (!durable_only || backend.supports_restart()) phase(backend);
    backend.cleanup();
  }
}

} // namespace

int main() {
  std::vector<std::string> reference;
  std::string              reference_name;
  RunPhase(
      [&](const BackendFactory& backend) {
        auto clock  = std::make_shared<ManualClockSource>(pipeline::util::FromUnixMillis(1700000000000));
        auto store  = backend.make_store(clock);
        auto result = RunScenario(*store, *clock);

        if (reference.empty()) {
          reference      = result;
          reference_name = backend.name;
          return;
        }
        if (result != reference) {
          std::cerr << backend.name << " diverges from " << reference_name << "\n";
          for (std::size_t i = 0; i < std::max(result.size(), reference.size()); ++i) {
            const auto& got  = i < result.size() ? result[i] : std::string("<missing>");
            const auto& want = i < reference.size() ? reference[i] : std::string("<missing>");
            if (got != want) std::cerr << "  [" << i << "] " << got << " != " << want << "\n";
          }
          assert(false);
        }
        std::cout << "parity ok: " << backend.name << "\n";
      },
      false);

  RunPhase(VerifyRestartKeepsState, true);
  RunPhase(
      [](const BackendFactory& backend) {
        if (backend.supports_shared_file) VerifySharedFileClaims(backend);
      },
      true);

  std::cout << "store_parity_test: pass\n";
  return 0;
}
