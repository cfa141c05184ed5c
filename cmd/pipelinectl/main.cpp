#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/project_stream_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"

using pipeline::store::PipelineStore;

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitUsage    = 1;
constexpr int kExitFailure  = 2;
constexpr int kExitNotFound = 3;

class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

void Usage() {
  std::cerr << "Usage:\n"
            << "  pipelinectl --config <file.yaml> submit <projectId> <kind> [payloadJson] [maxAttempts] [leaseMs]\n"
            << "  pipelinectl --config <file.yaml> claim <workerId>\n"
            << "  pipelinectl --config <file.yaml> complete <jobId> [resultJson]\n"
            << "  pipelinectl --config <file.yaml> fail <jobId> <error>\n"
            << "  pipelinectl --config <file.yaml> job <jobId>\n"
            << "  pipelinectl --config <file.yaml> jobs <projectId>\n"
            << "  pipelinectl --config <file.yaml> projects [query]\n"
            << "  pipelinectl --config <file.yaml> tree [query]\n"
            << "  pipelinectl --config <file.yaml> events <projectId> [lastEventId]\n"
            << "  pipelinectl --config <file.yaml> create-folder <name> [parentFolderId]\n"
            << "  pipelinectl --config <file.yaml> create-project <name> [parentFolderId]\n"
            << "  pipelinectl --config <file.yaml> lock <projectId> <ownerAgentId> [ttlMs]\n"
            << "  pipelinectl --config <file.yaml> unlock <projectId> <ownerAgentId>\n";
}

std::optional<std::string> Arg(const std::vector<std::string>& args, std::size_t index) {
  if (index >= args.size()) return std::nullopt;
  return args[index];
}

const std::string& RequireArg(const std::vector<std::string>& args, std::size_t index, const char* name) {
  if (index >= args.size()) throw UsageError(std::string("missing argument: ") + name);
  return args[index];
}

std::optional<double> NumberArg(const std::vector<std::string>& args, std::size_t index, const char* name) {
  auto raw = Arg(args, index);
  if (!raw) return std::nullopt;

  char*        end   = nullptr;
  const double value = std::strtod(raw->c_str(), &end);
  if (end == raw->c_str() || *end != '\0') throw UsageError(std::string(name) + " must be a number");
  return value;
}

std::optional<google::protobuf::Value> JsonArg(const std::vector<std::string>& args, std::size_t index, const char* name) {
  auto raw = Arg(args, index);
  if (!raw) return std::nullopt;

  auto value = pipeline::util::ParseJsonValue(*raw);
  if (!value) throw UsageError(std::string(name) + " is not valid JSON");
  return value;
}

template <typename Message>
void PrintList(const std::vector<Message>& items) {
  std::cout << "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) std::cout << ",";
    std::cout << pipeline::util::ToJson(items[i]);
  }
  std::cout << "]\n";
}

template <typename Message>
int PrintOrNotFound(const std::optional<Message>& item, const std::string& what) {
  if (!item) {
    std::cerr << what << " not found\n";
    return kExitNotFound;
  }
  std::cout << pipeline::util::ToJson(*item) << "\n";
  return kExitOk;
}

int Run(const pipeline::factory::Application& app, const std::string& cmd, const std::vector<std::string>& args) {
  PipelineStore& store = *app.store;

  if (cmd == "submit") {
    pipeline::model::SubmitJobInput input;
    input.project_id   = RequireArg(args, 0, "projectId");
    input.kind         = RequireArg(args, 1, "kind");
    input.payload      = JsonArg(args, 2, "payloadJson");
    input.max_attempts = NumberArg(args, 3, "maxAttempts");
    input.lease_ms     = NumberArg(args, 4, "leaseMs");
    std::cout << pipeline::util::ToJson(store.SubmitJob(input)) << "\n";
    return kExitOk;
  }

  if (cmd == "claim") {
    auto job = store.ClaimNextJob(RequireArg(args, 0, "workerId"));
    if (!job) {
      std::cout << "null\n";
      return kExitOk;
    }
    std::cout << pipeline::util::ToJson(*job) << "\n";
    return kExitOk;
  }

  if (cmd == "complete") {
    const auto& job_id = RequireArg(args, 0, "jobId");
    return PrintOrNotFound(store.CompleteJob(job_id, JsonArg(args, 1, "resultJson")), "job " + job_id);
  }

  if (cmd == "fail") {
    const auto& job_id = RequireArg(args, 0, "jobId");
    return PrintOrNotFound(store.FailJob(job_id, RequireArg(args, 1, "error")), "job " + job_id);
  }

  if (cmd == "job") {
    const auto& job_id = RequireArg(args, 0, "jobId");
    return PrintOrNotFound(store.GetJob(job_id), "job " + job_id);
  }

  if (cmd == "jobs") {
    PrintList(store.ListProjectJobs(RequireArg(args, 0, "projectId")));
    return kExitOk;
  }

  if (cmd == "projects") {
    PrintList(store.ListProjects(Arg(args, 0)));
    return kExitOk;
  }

  if (cmd == "tree") {
    std::cout << pipeline::util::ToJson(store.GetProjectTree(Arg(args, 0))) << "\n";
    return kExitOk;
  }

  if (cmd == "events") {
    const auto& project_id = RequireArg(args, 0, "projectId");
    std::optional<int64_t> last_event_id;
    if (auto raw = Arg(args, 1)) last_event_id = pipeline::service::ParseLastEventId(*raw);

    auto batch = app.stream_service->Resume(project_id, pipeline::service::NormalizeLastEventId(last_event_id));
    for (const auto& event : batch.events) {
      std::cout << pipeline::service::ProjectStreamService::Frame(event);
    }
    return kExitOk;
  }

  if (cmd == "create-folder") {
    pipeline::model::CreateFolderInput input;
    input.name             = RequireArg(args, 0, "name");
    input.parent_folder_id = Arg(args, 1);
    std::cout << pipeline::util::ToJson(store.CreateFolder(input)) << "\n";
    return kExitOk;
  }

  if (cmd == "create-project") {
    pipeline::model::CreateProjectInput input;
    input.name             = RequireArg(args, 0, "name");
    input.parent_folder_id = Arg(args, 1);
    std::cout << pipeline::util::ToJson(store.CreateProject(input)) << "\n";
    return kExitOk;
  }

  if (cmd == "lock") {
    pipeline::model::AcquireLockInput input;
    input.project_id     = RequireArg(args, 0, "projectId");
    input.owner_agent_id = RequireArg(args, 1, "ownerAgentId");
    input.ttl_ms         = NumberArg(args, 2, "ttlMs");
    std::cout << pipeline::util::ToJson(store.AcquireProjectLock(input)) << "\n";
    return kExitOk;
  }

  if (cmd == "unlock") {
    pipeline::model::ReleaseLockInput input;
    input.project_id     = RequireArg(args, 0, "projectId");
    input.owner_agent_id = RequireArg(args, 1, "ownerAgentId");
    if (!store.ReleaseProjectLock(input)) {
      std::cerr << "lock not held by " << input.owner_agent_id << "\n";
      return kExitNotFound;
    }
    std::cout << "released\n";
    return kExitOk;
  }

  throw UsageError("unknown command: " + cmd);
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return kExitUsage;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  int rc = kExitOk;
  try {
    auto config = pipeline::config::ConfigLoader::LoadFromYaml(config_path);

    pipeline::observability::InitializeTracing(config);
    pipeline::observability::InitializeMetrics(config);
    pipeline::observability::InitializeLogging(config);

    auto app = pipeline::factory::Build(config);
    rc       = Run(app, cmd, args);
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    rc = kExitUsage;
  } catch (const pipeline::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    rc = kExitNotFound;
  } catch (const pipeline::util::ContractViolation& e) {
    std::cerr << e.code() << ": " << e.what() << "\n";
    rc = kExitFailure;
  } catch (const std::exception& e) {
    PIPELINE_LOG_ERROR("Fatal error", {pipeline::observability::StringField("command", cmd),
                                       pipeline::observability::StringField("error", e.what())});
    rc = kExitFailure;
  }

  pipeline::observability::ShutdownLogging();
  pipeline::observability::ShutdownMetrics();
  pipeline::observability::ShutdownTracing();
  return rc;
}
