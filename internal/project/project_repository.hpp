#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/events/event_log.hpp"
#include "internal/model/inputs.hpp"
#include "internal/model/pipeline_state.hpp"
#include "internal/project/tree_ops.hpp"

namespace pipeline::project {

namespace v1 = pipeline::store::v1;

/*
  ProjectRepository

  Folder/project forest of one workspace. Structural edits keep every
  node referenced from exactly one children list; project edits emit a
  snapshot event but never touch revision, which belongs to job
  resolution.

  Unknown ids on rename/move/delete come back as nullopt/false. Unknown
  parent folders and illegal moves throw (util::NotFound,
  util::InvalidState).
*/
class ProjectRepository {
 public:
  ProjectRepository(model::PipelineState& state, events::EventLog& events) : state_(state), events_(events) {
  }

  // Case-insensitive substring match on id or name; empty query lists all.
  std::vector<v1::Project> List(const std::optional<std::string>& query) const;
  v1::ProjectTree          Tree(const std::optional<std::string>& query) const;
  std::optional<v1::Project> Get(const std::string& project_id) const;

  v1::Folder                CreateFolder(const model::CreateFolderInput& input);
  std::optional<v1::Folder> RenameFolder(const std::string& folder_id, const std::string& name);
  std::optional<v1::Folder> MoveFolder(const model::MoveFolderInput& input);
  bool                      DeleteFolder(const std::string& folder_id);

  v1::Project                CreateProject(const model::CreateProjectInput& input);
  std::optional<v1::Project> RenameProject(const std::string& project_id, const std::string& name);
  std::optional<v1::Project> MoveProject(const model::MoveProjectInput& input);
  bool                       DeleteProject(const std::string& project_id);

  // Creates `project_id` at root, named after itself, when unknown.
  v1::Project& EnsureProject(const std::string& project_id);

  v1::Project* Find(const std::string& project_id);

 private:
  v1::Project NewProject(const std::string& project_id, const std::string& name, const std::optional<std::string>& parent) const;
  void        RemoveProjectInternal(const std::string& project_id);
  void        BuildTreeNodes(const ChildList& children, int32_t depth, const std::string& query,
                             google::protobuf::RepeatedPtrField<v1::ProjectTreeNode>* out) const;

  model::PipelineState& state_;
  events::EventLog&     events_;
};

} // namespace pipeline::project
