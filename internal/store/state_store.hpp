#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/events/event_log.hpp"
#include "internal/jobs/job_repository.hpp"
#include "internal/model/pipeline_state.hpp"
#include "internal/project/lock_repository.hpp"
#include "internal/project/project_repository.hpp"
#include "internal/store/pipeline_store.hpp"
#include "internal/util/time.hpp"

namespace pipeline::store {

/*
  Repositories bound to one PipelineState for the duration of a single
  store operation, plus the clock reading that operation runs at.
*/
struct StoreContext {
  StoreContext(model::PipelineState& s, util::TimePoint at)
      : state(s), events(s), projects(s, events), locks(s, events), jobs(s, events, projects), now(at) {
  }

  model::PipelineState&      state;
  events::EventLog           events;
  project::ProjectRepository projects;
  project::LockRepository    locks;
  jobs::JobRepository        jobs;
  util::TimePoint            now;
};

enum class AccessMode {
  kRead,
  kWrite,
};

/*
  StateStore

  Implements every PipelineStore operation once, on top of a single
  primitive: Execute(op, mode, fn) runs `fn` against the backend's
  current state with whatever isolation the backend provides. Spans,
  operation metrics and latency are recorded here for all backends.
*/
class StateStore : public PipelineStore {
 public:
  using Operation = std::function<void(StoreContext&)>;

  const std::string& WorkspaceId() const override {
    return workspace_id_;
  }

  v1::Job                SubmitJob(const model::SubmitJobInput& input) override;
  std::optional<v1::Job> ClaimNextJob(const std::string& worker_id) override;
  std::optional<v1::Job> CompleteJob(const std::string& job_id, const std::optional<google::protobuf::Value>& result) override;
  std::optional<v1::Job> FailJob(const std::string& job_id, const std::string& error) override;
  std::vector<v1::Job>   ListProjectJobs(const std::string& project_id) override;
  std::optional<v1::Job> GetJob(const std::string& job_id) override;

  std::vector<v1::Project>   ListProjects(const std::optional<std::string>& query) override;
  v1::ProjectTree            GetProjectTree(const std::optional<std::string>& query) override;
  std::optional<v1::Project> GetProject(const std::string& project_id) override;

  v1::Folder                CreateFolder(const model::CreateFolderInput& input) override;
  std::optional<v1::Folder> RenameFolder(const std::string& folder_id, const std::string& name) override;
  std::optional<v1::Folder> MoveFolder(const model::MoveFolderInput& input) override;
  bool                      DeleteFolder(const std::string& folder_id) override;

  v1::Project                CreateProject(const model::CreateProjectInput& input) override;
  std::optional<v1::Project> RenameProject(const std::string& project_id, const std::string& name) override;
  std::optional<v1::Project> MoveProject(const model::MoveProjectInput& input) override;
  bool                       DeleteProject(const std::string& project_id) override;

  v1::ProjectLock                AcquireProjectLock(const model::AcquireLockInput& input) override;
  std::optional<v1::ProjectLock> RenewProjectLock(const model::RenewLockInput& input) override;
  bool                           ReleaseProjectLock(const model::ReleaseLockInput& input) override;
  int  ReleaseProjectLocksByOwner(const std::string& owner_agent_id, const std::optional<std::string>& owner_session_id) override;
  int  ReleaseExpiredProjectLocks() override;
  std::optional<v1::ProjectLock> GetProjectLock(const std::string& project_id) override;

  std::vector<v1::ProjectEvent> GetProjectEventsSince(const std::string& project_id, int64_t last_seq) override;

 protected:
  StateStore(std::string workspace_id, std::shared_ptr<util::ClockSource> clock);

  // Runs `fn` against current state. A write must apply every change
  // `fn` made or none of them; an exception from `fn` propagates.
  virtual void Execute(std::string_view op, AccessMode mode, const Operation& fn) = 0;

  util::TimePoint Now() const {
    return clock_->Now();
  }

 private:
  template <typename T>
  T Run(std::string_view op, AccessMode mode, const std::function<T(StoreContext&)>& fn);

  std::string                        workspace_id_;
  std::shared_ptr<util::ClockSource> clock_;
};

} // namespace pipeline::store
