#include "project_repository.hpp"

#include <algorithm>
#include <cctype>

#include "internal/project/snapshot_sync.hpp"
#include "internal/project/tree_ops.hpp"
#include "internal/util/errors.hpp"

namespace pipeline::project {

namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string NormalizeQuery(const std::optional<std::string>& query) {
  if (!query) return {};
  const auto begin = query->find_first_not_of(" \t\r\n\f\v");
  if (begin == std::string::npos) return {};
  const auto end = query->find_last_not_of(" \t\r\n\f\v");
  return Lower(std::string_view(*query).substr(begin, end - begin + 1));
}

bool Matches(const std::string& query, const std::string& id, const std::string& name) {
  if (query.empty()) return true;
  return Lower(id).find(query) != std::string::npos || Lower(name).find(query) != std::string::npos;
}

std::optional<std::string> ParentOf(const v1::Project& project) {
  if (!project.has_parent_folder_id()) return std::nullopt;
  return project.parent_folder_id();
}

std::optional<std::string> ParentOf(const v1::Folder& folder) {
  if (!folder.has_parent_folder_id()) return std::nullopt;
  return folder.parent_folder_id();
}

void SetParent(v1::Project& project, const std::optional<std::string>& parent) {
  if (parent) {
    project.set_parent_folder_id(*parent);
  } else {
    project.clear_parent_folder_id();
  }
}

void SetParent(v1::Folder& folder, const std::optional<std::string>& parent) {
  if (parent) {
    folder.set_parent_folder_id(*parent);
  } else {
    folder.clear_parent_folder_id();
  }
}

v1::TreeChildRef ChildRef(v1::TreeChildKind kind, const std::string& id) {
  v1::TreeChildRef ref;
  ref.set_kind(kind);
  ref.set_id(id);
  return ref;
}

} // namespace

std::vector<v1::Project> ProjectRepository::List(const std::optional<std::string>& query) const {
  const auto               normalized = NormalizeQuery(query);
  std::vector<v1::Project> out;
  for (const auto& [id, project] : state_.projects) {
    if (Matches(normalized, id, project.name())) out.push_back(project);
  }
  return out;
}

v1::ProjectTree ProjectRepository::Tree(const std::optional<std::string>& query) const {
  v1::ProjectTree tree;
  tree.set_max_folder_depth(model::kMaxFolderDepth);
  BuildTreeNodes(state_.root_children, 1, NormalizeQuery(query), tree.mutable_roots());
  return tree;
}

void ProjectRepository::BuildTreeNodes(const ChildList& children, int32_t depth, const std::string& query,
                                       google::protobuf::RepeatedPtrField<v1::ProjectTreeNode>* out) const {
  for (const auto& child : children) {
    if (child.kind() == v1::TREE_CHILD_KIND_FOLDER) {
      auto it = state_.folders.find(child.id());
      if (it == state_.folders.end()) continue;
      const auto& folder = it->second;

      v1::ProjectTreeNode node;
      BuildTreeNodes(folder.children(), depth + 1, query, node.mutable_children());
      if (!Matches(query, folder.folder_id(), folder.name()) && node.children().empty()) continue;

      node.set_kind(v1::TREE_CHILD_KIND_FOLDER);
      node.set_id(folder.folder_id());
      node.set_name(folder.name());
      if (folder.has_parent_folder_id()) node.set_parent_folder_id(folder.parent_folder_id());
      node.set_depth(depth);
      *out->Add() = std::move(node);
      continue;
    }

    auto it = state_.projects.find(child.id());
    if (it == state_.projects.end()) continue;
    const auto& project = it->second;
    if (!Matches(query, project.project_id(), project.name())) continue;

    auto* node = out->Add();
    node->set_kind(v1::TREE_CHILD_KIND_PROJECT);
    node->set_id(project.project_id());
    node->set_name(project.name());
    if (project.has_parent_folder_id()) node->set_parent_folder_id(project.parent_folder_id());
    node->set_depth(depth);
    if (project.has_active_job()) node->set_active_job_status(project.active_job().status());
    if (project.has_project_lock()) node->set_lock_owner_agent_id(project.project_lock().owner_agent_id());
  }
}

std::optional<v1::Project> ProjectRepository::Get(const std::string& project_id) const {
  auto it = state_.projects.find(project_id);
  if (it == state_.projects.end()) return std::nullopt;
  return it->second;
}

v1::Project* ProjectRepository::Find(const std::string& project_id) {
  auto it = state_.projects.find(project_id);
  return it == state_.projects.end() ? nullptr : &it->second;
}

v1::Folder ProjectRepository::CreateFolder(const model::CreateFolderInput& input) {
  const auto parent = NormalizeParentFolderId(input.parent_folder_id);
  EnsureTargetFolderExists(state_, parent);
  EnsureFolderDepthLimit(state_, parent, 1);

  const auto name      = NormalizeName(input.name, kDefaultFolderName);
  const auto folder_id = ComputeEntityId(state_, kFolderIdPrefix, parent.value_or("root") + ":" + name);

  v1::Folder folder;
  folder.set_folder_id(folder_id);
  folder.set_name(name);
  SetParent(folder, parent);
  state_.folders[folder_id] = folder;

  InsertChildRef(ContainerChildren(state_, parent), ChildRef(v1::TREE_CHILD_KIND_FOLDER, folder_id), input.index);
  return folder;
}

std::optional<v1::Folder> ProjectRepository::RenameFolder(const std::string& folder_id, const std::string& name) {
  auto it = state_.folders.find(folder_id);
  if (it == state_.folders.end()) return std::nullopt;

  it->second.set_name(NormalizeName(name, it->second.name()));
  return it->second;
}

std::optional<v1::Folder> ProjectRepository::MoveFolder(const model::MoveFolderInput& input) {
  auto it = state_.folders.find(input.folder_id);
  if (it == state_.folders.end()) return std::nullopt;
  auto& folder = it->second;

  const auto previous = ParentOf(folder);
  const auto parent   = NormalizeParentFolderId(input.parent_folder_id);
  if (parent && *parent == folder.folder_id()) throw util::InvalidState("Cannot move a folder into itself.");
  EnsureTargetFolderExists(state_, parent);
  if (parent && IsFolderDescendant(state_, folder.folder_id(), *parent)) {
    throw util::InvalidState("Cannot move a folder into a descendant folder.");
  }
  EnsureFolderDepthLimit(state_, parent, SubtreeFolderHeight(state_, folder.folder_id()));

  const auto index = previous == parent ? ResolveReorderInsertIndex(ContainerChildren(state_, previous), v1::TREE_CHILD_KIND_FOLDER,
                                                                    folder.folder_id(), input.index)
                                        : input.index;

  DetachFolder(state_, folder);
  InsertChildRef(ContainerChildren(state_, parent), ChildRef(v1::TREE_CHILD_KIND_FOLDER, folder.folder_id()), index);
  SetParent(folder, parent);
  return folder;
}

bool ProjectRepository::DeleteFolder(const std::string& folder_id) {
  auto it = state_.folders.find(folder_id);
  if (it == state_.folders.end()) return false;

  DetachFolder(state_, it->second);
  const auto folder_ids = CollectFolderSubtree(state_, folder_id);
  for (const auto& project_id : CollectProjectsInFolders(state_, folder_ids)) {
    RemoveProjectInternal(project_id);
  }
  for (const auto& id : folder_ids) {
    state_.folders.erase(id);
  }
  return true;
}

v1::Project ProjectRepository::NewProject(const std::string& project_id, const std::string& name,
                                          const std::optional<std::string>& parent) const {
  v1::Project project;
  project.set_project_id(project_id);
  project.set_workspace_id(state_.workspace_id);
  project.set_name(name);
  SetParent(project, parent);
  project.set_revision(1);
  project.mutable_focus_anchor()->set_y(24);
  project.mutable_stats();
  SynchronizeSnapshot(project);
  return project;
}

v1::Project ProjectRepository::CreateProject(const model::CreateProjectInput& input) {
  const auto parent = NormalizeParentFolderId(input.parent_folder_id);
  EnsureTargetFolderExists(state_, parent);

  const auto name       = NormalizeName(input.name, kDefaultProjectName);
  const auto project_id = ComputeEntityId(state_, kProjectIdPrefix, "project:" + state_.workspace_id);

  auto& project = state_.projects[project_id] = NewProject(project_id, name, parent);
  InsertChildRef(ContainerChildren(state_, parent), ChildRef(v1::TREE_CHILD_KIND_PROJECT, project_id), input.index);
  events_.Append(project);
  return project;
}

std::optional<v1::Project> ProjectRepository::RenameProject(const std::string& project_id, const std::string& name) {
  auto* project = Find(project_id);
  if (!project) return std::nullopt;

  project->set_name(NormalizeName(name, project->name()));
  SynchronizeSnapshot(*project);
  events_.Append(*project);
  return *project;
}

std::optional<v1::Project> ProjectRepository::MoveProject(const model::MoveProjectInput& input) {
  auto* project = Find(input.project_id);
  if (!project) return std::nullopt;

  const auto previous = ParentOf(*project);
  const auto parent   = NormalizeParentFolderId(input.parent_folder_id);
  EnsureTargetFolderExists(state_, parent);

  const auto index = previous == parent ? ResolveReorderInsertIndex(ContainerChildren(state_, previous), v1::TREE_CHILD_KIND_PROJECT,
                                                                    project->project_id(), input.index)
                                        : input.index;

  DetachProject(state_, *project);
  InsertChildRef(ContainerChildren(state_, parent), ChildRef(v1::TREE_CHILD_KIND_PROJECT, project->project_id()), index);
  SetParent(*project, parent);
  SynchronizeSnapshot(*project);
  events_.Append(*project);
  return *project;
}

bool ProjectRepository::DeleteProject(const std::string& project_id) {
  if (!state_.projects.contains(project_id)) return false;
  RemoveProjectInternal(project_id);
  return true;
}

v1::Project& ProjectRepository::EnsureProject(const std::string& project_id) {
  if (auto* existing = Find(project_id)) return *existing;

  auto& project = state_.projects[project_id] = NewProject(project_id, project_id, std::nullopt);
  *state_.root_children.Add() = ChildRef(v1::TREE_CHILD_KIND_PROJECT, project_id);
  events_.Append(project);
  return project;
}

void ProjectRepository::RemoveProjectInternal(const std::string& project_id) {
  auto it = state_.projects.find(project_id);
  if (it == state_.projects.end()) return;

  DetachProject(state_, it->second);
  state_.projects.erase(it);
  state_.project_locks.erase(project_id);
  state_.project_events.erase(project_id);

  for (auto job = state_.jobs.begin(); job != state_.jobs.end();) {
    if (job->second.project_id() != project_id) {
      ++job;
      continue;
    }
    state_.pending.Remove(job->first);
    state_.leases.Remove(job->first);
    job = state_.jobs.erase(job);
  }
}

} // namespace pipeline::project
