#include "state_store.hpp"

#include <chrono>
#include <exception>

#include "internal/observability/spans.hpp"

namespace pipeline::store {

StateStore::StateStore(std::string workspace_id, std::shared_ptr<util::ClockSource> clock)
    : workspace_id_(std::move(workspace_id)), clock_(std::move(clock)) {
  if (!clock_) clock_ = std::make_shared<util::SystemClockSource>();
}

template <typename T>
T StateStore::Run(std::string_view op, AccessMode mode, const std::function<T(StoreContext&)>& fn) {
  observability::SpanScope span("pipeline." + std::string(op));
  span.SetAttribute("pipeline.backend", Backend());
  span.SetAttribute("pipeline.workspace_id", workspace_id_);

  auto&      metrics = observability::Metrics::Instance();
  const auto start   = std::chrono::steady_clock::now();
  const auto elapsed = [&start] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  };

  try {
    std::optional<T> out;
    Execute(op, mode, [&](StoreContext& ctx) { out = fn(ctx); });
    metrics.RecordOperation(op, true);
    metrics.ObserveOperationLatencyMs(op, elapsed());
    return std::move(*out);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    metrics.RecordOperation(op, false);
    metrics.ObserveOperationLatencyMs(op, elapsed());
    throw;
  }
}

v1::Job StateStore::SubmitJob(const model::SubmitJobInput& input) {
  return Run<v1::Job>("submit_job", AccessMode::kWrite, [&](StoreContext& ctx) { return ctx.jobs.Submit(input, ctx.now); });
}

std::optional<v1::Job> StateStore::ClaimNextJob(const std::string& worker_id) {
  return Run<std::optional<v1::Job>>("claim_next_job", AccessMode::kWrite,
                                     [&](StoreContext& ctx) { return ctx.jobs.Claim(worker_id, ctx.now); });
}

std::optional<v1::Job> StateStore::CompleteJob(const std::string& job_id, const std::optional<google::protobuf::Value>& result) {
  return Run<std::optional<v1::Job>>("complete_job", AccessMode::kWrite, [&](StoreContext& ctx) {
    return ctx.jobs.Complete(job_id, result ? &*result : nullptr, ctx.now);
  });
}

std::optional<v1::Job> StateStore::FailJob(const std::string& job_id, const std::string& error) {
  return Run<std::optional<v1::Job>>("fail_job", AccessMode::kWrite,
                                     [&](StoreContext& ctx) { return ctx.jobs.Fail(job_id, error, ctx.now); });
}

std::vector<v1::Job> StateStore::ListProjectJobs(const std::string& project_id) {
  return Run<std::vector<v1::Job>>("list_project_jobs", AccessMode::kRead,
                                   [&](StoreContext& ctx) { return ctx.jobs.ListProjectJobs(project_id); });
}

std::optional<v1::Job> StateStore::GetJob(const std::string& job_id) {
  return Run<std::optional<v1::Job>>("get_job", AccessMode::kRead, [&](StoreContext& ctx) { return ctx.jobs.Get(job_id); });
}

std::vector<v1::Project> StateStore::ListProjects(const std::optional<std::string>& query) {
  return Run<std::vector<v1::Project>>("list_projects", AccessMode::kRead, [&](StoreContext& ctx) { return ctx.projects.List(query); });
}

v1::ProjectTree StateStore::GetProjectTree(const std::optional<std::string>& query) {
  return Run<v1::ProjectTree>("get_project_tree", AccessMode::kRead, [&](StoreContext& ctx) { return ctx.projects.Tree(query); });
}

std::optional<v1::Project> StateStore::GetProject(const std::string& project_id) {
  return Run<std::optional<v1::Project>>("get_project", AccessMode::kRead, [&](StoreContext& ctx) { return ctx.projects.Get(project_id); });
}

v1::Folder StateStore::CreateFolder(const model::CreateFolderInput& input) {
  return Run<v1::Folder>("create_folder", AccessMode::kWrite, [&](StoreContext& ctx) { return ctx.projects.CreateFolder(input); });
}

std::optional<v1::Folder> StateStore::RenameFolder(const std::string& folder_id, const std::string& name) {
  return Run<std::optional<v1::Folder>>("rename_folder", AccessMode::kWrite,
                                        [&](StoreContext& ctx) { return ctx.projects.RenameFolder(folder_id, name); });
}

std::optional<v1::Folder> StateStore::MoveFolder(const model::MoveFolderInput& input) {
  return Run<std::optional<v1::Folder>>("move_folder", AccessMode::kWrite, [&](StoreContext& ctx) { return ctx.projects.MoveFolder(input); });
}

bool StateStore::DeleteFolder(const std::string& folder_id) {
  return Run<bool>("delete_folder", AccessMode::kWrite, [&](StoreContext& ctx) { return ctx.projects.DeleteFolder(folder_id); });
}

v1::Project StateStore::CreateProject(const model::CreateProjectInput& input) {
  return Run<v1::Project>("create_project", AccessMode::kWrite, [&](StoreContext& ctx) { return ctx.projects.CreateProject(input); });
}

std::optional<v1::Project> StateStore::RenameProject(const std::string& project_id, const std::string& name) {
  return Run<std::optional<v1::Project>>("rename_project", AccessMode::kWrite,
                                         [&](StoreContext& ctx) { return ctx.projects.RenameProject(project_id, name); });
}

std::optional<v1::Project> StateStore::MoveProject(const model::MoveProjectInput& input) {
  return Run<std::optional<v1::Project>>("move_project", AccessMode::kWrite,
                                         [&](StoreContext& ctx) { return ctx.projects.MoveProject(input); });
}

bool StateStore::DeleteProject(const std::string& project_id) {
  return Run<bool>("delete_project", AccessMode::kWrite, [&](StoreContext& ctx) { return ctx.projects.DeleteProject(project_id); });
}

v1::ProjectLock StateStore::AcquireProjectLock(const model::AcquireLockInput& input) {
  return Run<v1::ProjectLock>("acquire_project_lock", AccessMode::kWrite,
                              [&](StoreContext& ctx) { return ctx.locks.Acquire(input, ctx.now); });
}

std::optional<v1::ProjectLock> StateStore::RenewProjectLock(const model::RenewLockInput& input) {
  return Run<std::optional<v1::ProjectLock>>("renew_project_lock", AccessMode::kWrite,
                                             [&](StoreContext& ctx) { return ctx.locks.Renew(input, ctx.now); });
}

bool StateStore::ReleaseProjectLock(const model::ReleaseLockInput& input) {
  return Run<bool>("release_project_lock", AccessMode::kWrite, [&](StoreContext& ctx) { return ctx.locks.Release(input, ctx.now); });
}

int StateStore::ReleaseProjectLocksByOwner(const std::string& owner_agent_id, const std::optional<std::string>& owner_session_id) {
  return Run<int>("release_project_locks_by_owner", AccessMode::kWrite,
                  [&](StoreContext& ctx) { return ctx.locks.ReleaseByOwner(owner_agent_id, owner_session_id, ctx.now); });
}

int StateStore::ReleaseExpiredProjectLocks() {
  return Run<int>("release_expired_project_locks", AccessMode::kWrite, [&](StoreContext& ctx) { return ctx.locks.ReleaseExpired(ctx.now); });
}

std::optional<v1::ProjectLock> StateStore::GetProjectLock(const std::string& project_id) {
  return Run<std::optional<v1::ProjectLock>>("get_project_lock", AccessMode::kRead,
                                             [&](StoreContext& ctx) { return ctx.locks.Get(project_id, ctx.now); });
}

std::vector<v1::ProjectEvent> StateStore::GetProjectEventsSince(const std::string& project_id, int64_t last_seq) {
  return Run<std::vector<v1::ProjectEvent>>("get_project_events_since", AccessMode::kRead,
                                            [&](StoreContext& ctx) { return ctx.events.Since(project_id, last_seq); });
}

} // namespace pipeline::store
