#include "tree_ops.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace pipeline::project {

namespace {

constexpr int kMaxLoopGuard      = 64;
constexpr int kMaxTraversalGuard = 1024;

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Cut at `max` bytes without splitting a UTF-8 sequence.
std::string TruncateUtf8(std::string s, std::size_t max) {
  if (s.size() <= max) return s;
  std::size_t cut = max;
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
  s.resize(cut);
  return s;
}

int FindChild(const ChildList& children, v1::TreeChildKind kind, const std::string& id) {
  for (int i = 0; i < children.size(); ++i) {
    if (children.Get(i).kind() == kind && children.Get(i).id() == id) return i;
  }
  return -1;
}

} // namespace

std::string NormalizeName(std::string_view value, std::string_view fallback) {
  std::string collapsed;
  collapsed.reserve(value.size());
  bool pending_space = false;
  for (char c : value) {
    if (IsSpace(c)) {
      pending_space = !collapsed.empty();
      continue;
    }
    if (pending_space) collapsed.push_back(' ');
    pending_space = false;
    collapsed.push_back(c);
  }

  if (collapsed.empty()) return std::string(fallback);
  return TruncateUtf8(std::move(collapsed), kMaxNameLength);
}

std::optional<std::string> NormalizeParentFolderId(const std::optional<std::string>& value) {
  if (!value) return std::nullopt;
  auto begin = std::find_if_not(value->begin(), value->end(), IsSpace);
  auto end   = std::find_if_not(value->rbegin(), value->rend(), IsSpace).base();
  if (begin >= end) return std::nullopt;
  return std::string(begin, end);
}

std::size_t NormalizeIndex(std::optional<int64_t> index, std::size_t max_length) {
  if (!index) return max_length;
  if (*index < 0) return 0;
  if (static_cast<uint64_t>(*index) > max_length) return max_length;
  return static_cast<std::size_t>(*index);
}

ChildList& ContainerChildren(model::PipelineState& state, const std::optional<std::string>& parent_folder_id) {
  if (!parent_folder_id) return state.root_children;

  auto it = state.folders.find(*parent_folder_id);
  if (it == state.folders.end()) throw util::NotFound("Folder not found: " + *parent_folder_id);
  return *it->second.mutable_children();
}

bool RemoveChildRef(ChildList& children, v1::TreeChildKind kind, const std::string& id) {
  const int index = FindChild(children, kind, id);
  if (index < 0) return false;
  children.erase(children.begin() + index);
  return true;
}

void InsertChildRef(ChildList& children, v1::TreeChildRef entry, std::optional<int64_t> index) {
  const auto target = static_cast<int>(NormalizeIndex(index, static_cast<std::size_t>(children.size())));
  *children.Add()   = std::move(entry);
  for (int i = children.size() - 1; i > target; --i) {
    children.SwapElements(i, i - 1);
  }
}

std::optional<int64_t> ResolveReorderInsertIndex(const ChildList& children, v1::TreeChildKind kind, const std::string& id,
                                                 std::optional<int64_t> index) {
  if (!index) return index;

  const auto target = static_cast<int64_t>(NormalizeIndex(index, static_cast<std::size_t>(children.size())));
  const int  source = FindChild(children, kind, id);
  if (source >= 0 && target > source) return target - 1;
  return target;
}

void DetachFolder(model::PipelineState& state, const v1::Folder& folder) {
  const std::optional<std::string> parent =
      folder.has_parent_folder_id() ? std::optional<std::string>(folder.parent_folder_id()) : std::nullopt;

  // a dangling parent id falls through to the full scan below
  if (!parent || state.folders.contains(*parent)) {
    if (RemoveChildRef(ContainerChildren(state, parent), v1::TREE_CHILD_KIND_FOLDER, folder.folder_id())) return;
  }
  for (auto& [_, candidate] : state.folders) {
    if (RemoveChildRef(*candidate.mutable_children(), v1::TREE_CHILD_KIND_FOLDER, folder.folder_id())) return;
  }
  RemoveChildRef(state.root_children, v1::TREE_CHILD_KIND_FOLDER, folder.folder_id());
}

void DetachProject(model::PipelineState& state, const v1::Project& project) {
  const std::optional<std::string> parent =
      project.has_parent_folder_id() ? std::optional<std::string>(project.parent_folder_id()) : std::nullopt;

  if (!parent || state.folders.contains(*parent)) {
    if (RemoveChildRef(ContainerChildren(state, parent), v1::TREE_CHILD_KIND_PROJECT, project.project_id())) return;
  }
  for (auto& [_, candidate] : state.folders) {
    if (RemoveChildRef(*candidate.mutable_children(), v1::TREE_CHILD_KIND_PROJECT, project.project_id())) return;
  }
  RemoveChildRef(state.root_children, v1::TREE_CHILD_KIND_PROJECT, project.project_id());
}

int32_t FolderDepth(const model::PipelineState& state, const std::string& folder_id) {
  int32_t                    depth = 0;
  std::optional<std::string> current{folder_id};
  int                        guard = 0;
  while (current) {
    auto it = state.folders.find(*current);
    if (it == state.folders.end()) break;

    ++depth;
    current = it->second.has_parent_folder_id() ? std::optional<std::string>(it->second.parent_folder_id()) : std::nullopt;
    if (++guard > kMaxLoopGuard) throw util::InvalidState("Folder hierarchy cycle detected.");
  }
  return depth;
}

int32_t SubtreeFolderHeight(const model::PipelineState& state, const std::string& folder_id) {
  auto it = state.folders.find(folder_id);
  if (it == state.folders.end()) return 1;

  int32_t max_child_height = 0;
  for (const auto& child : it->second.children()) {
    if (child.kind() != v1::TREE_CHILD_KIND_FOLDER) continue;
    max_child_height = std::max(max_child_height, SubtreeFolderHeight(state, child.id()));
  }
  return max_child_height + 1;
}

void EnsureFolderDepthLimit(const model::PipelineState& state, const std::optional<std::string>& parent_folder_id, int32_t subtree_height) {
  const int32_t parent_depth = parent_folder_id ? FolderDepth(state, *parent_folder_id) : 0;
  if (parent_depth + subtree_height > model::kMaxFolderDepth) {
    throw util::InvalidState("Folder depth limit exceeded (max depth " + std::to_string(model::kMaxFolderDepth) + ").");
  }
}

bool IsFolderDescendant(const model::PipelineState& state, const std::string& folder_id, const std::string& candidate_id) {
  std::vector<std::string> stack{folder_id};
  int                      guard = 0;
  while (!stack.empty()) {
    auto current = std::move(stack.back());
    stack.pop_back();
    if (current == candidate_id) return true;

    auto it = state.folders.find(current);
    if (it == state.folders.end()) continue;
    for (const auto& child : it->second.children()) {
      if (child.kind() == v1::TREE_CHILD_KIND_FOLDER) stack.push_back(child.id());
    }
    if (++guard > kMaxTraversalGuard) throw util::InvalidState("Folder hierarchy traversal overflow.");
  }
  return false;
}

std::vector<std::string> CollectFolderSubtree(const model::PipelineState& state, const std::string& folder_id) {
  std::vector<std::string> collected;
  std::vector<std::string> stack{folder_id};
  while (!stack.empty()) {
    auto current = std::move(stack.back());
    stack.pop_back();
    collected.push_back(current);

    auto it = state.folders.find(current);
    if (it == state.folders.end()) continue;
    for (const auto& child : it->second.children()) {
      if (child.kind() == v1::TREE_CHILD_KIND_FOLDER) stack.push_back(child.id());
    }
  }
  return collected;
}

std::vector<std::string> CollectProjectsInFolders(const model::PipelineState& state, const std::vector<std::string>& folder_ids) {
  std::vector<std::string> project_ids;
  for (const auto& folder_id : folder_ids) {
    auto it = state.folders.find(folder_id);
    if (it == state.folders.end()) continue;
    for (const auto& child : it->second.children()) {
      if (child.kind() != v1::TREE_CHILD_KIND_PROJECT) continue;
      if (std::find(project_ids.begin(), project_ids.end(), child.id()) == project_ids.end()) project_ids.push_back(child.id());
    }
  }
  return project_ids;
}

void EnsureTargetFolderExists(const model::PipelineState& state, const std::optional<std::string>& parent_folder_id) {
  if (!parent_folder_id) return;
  if (!state.folders.contains(*parent_folder_id)) throw util::NotFound("Folder not found: " + *parent_folder_id);
}

std::string ComputeEntityId(model::PipelineState& state, std::string_view prefix, std::string_view seed) {
  for (;;) {
    const auto nonce = state.next_entity_nonce++;
    auto candidate   = std::string(prefix) + "_" +
                     util::ShortDigestHex(std::string(prefix) + ":" + std::to_string(nonce) + ":" + std::string(seed), 12);

    if (prefix == kProjectIdPrefix && state.projects.contains(candidate)) continue;
    if (prefix == kFolderIdPrefix && state.folders.contains(candidate)) continue;
    return candidate;
  }
}

} // namespace pipeline::project
