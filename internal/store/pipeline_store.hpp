#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/model/inputs.hpp"
#include "pipeline/store/v1.hpp"

namespace pipeline::store {

/*
  PipelineStore

  The one port every caller talks to. Implementations differ only in
  durability; each must give identical answers for the same sequence
  of calls and clock readings.

  All returned records are copies.
*/
class PipelineStore {
 public:
  virtual ~PipelineStore() = default;

  // "memory", "memory-durable", "sqlite", "postgres"
  virtual std::string_view Backend() const = 0;
  virtual const std::string& WorkspaceId() const = 0;

  // jobs
  virtual v1::Job                SubmitJob(const model::SubmitJobInput& input) = 0;
  virtual std::optional<v1::Job> ClaimNextJob(const std::string& worker_id) = 0;
  virtual std::optional<v1::Job> CompleteJob(const std::string& job_id, const std::optional<google::protobuf::Value>& result) = 0;
  virtual std::optional<v1::Job> FailJob(const std::string& job_id, const std::string& error) = 0;
  virtual std::vector<v1::Job>   ListProjectJobs(const std::string& project_id) = 0;
  virtual std::optional<v1::Job> GetJob(const std::string& job_id) = 0;

  // project tree
  virtual std::vector<v1::Project>   ListProjects(const std::optional<std::string>& query) = 0;
  virtual v1::ProjectTree            GetProjectTree(const std::optional<std::string>& query) = 0;
  virtual std::optional<v1::Project> GetProject(const std::string& project_id) = 0;

  virtual v1::Folder                CreateFolder(const model::CreateFolderInput& input) = 0;
  virtual std::optional<v1::Folder> RenameFolder(const std::string& folder_id, const std::string& name) = 0;
  virtual std::optional<v1::Folder> MoveFolder(const model::MoveFolderInput& input) = 0;
  virtual bool                      DeleteFolder(const std::string& folder_id) = 0;

  virtual v1::Project                CreateProject(const model::CreateProjectInput& input) = 0;
  virtual std::optional<v1::Project> RenameProject(const std::string& project_id, const std::string& name) = 0;
  virtual std::optional<v1::Project> MoveProject(const model::MoveProjectInput& input) = 0;
  virtual bool                       DeleteProject(const std::string& project_id) = 0;

  // edit locks
  virtual v1::ProjectLock                AcquireProjectLock(const model::AcquireLockInput& input) = 0;
  virtual std::optional<v1::ProjectLock> RenewProjectLock(const model::RenewLockInput& input) = 0;
  virtual bool                           ReleaseProjectLock(const model::ReleaseLockInput& input) = 0;
  virtual int  ReleaseProjectLocksByOwner(const std::string& owner_agent_id, const std::optional<std::string>& owner_session_id) = 0;
  virtual int  ReleaseExpiredProjectLocks() = 0;
  virtual std::optional<v1::ProjectLock> GetProjectLock(const std::string& project_id) = 0;

  // event stream
  virtual std::vector<v1::ProjectEvent> GetProjectEventsSince(const std::string& project_id, int64_t last_seq) = 0;
};

} // namespace pipeline::store
