#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/repeated_ptr_field.h>

#include "internal/model/pipeline_state.hpp"

namespace pipeline::project {

namespace v1 = pipeline::store::v1;

using ChildList = google::protobuf::RepeatedPtrField<v1::TreeChildRef>;

/*
  Forest primitives over PipelineState.

  Every folder/project id is referenced from exactly one children list
  (a folder's or root_children). Callers keep that invariant by pairing
  Detach* with InsertChildRef.
*/

inline constexpr std::size_t kMaxNameLength      = 96;
inline constexpr const char* kProjectIdPrefix    = "prj";
inline constexpr const char* kFolderIdPrefix     = "fld";
inline constexpr const char* kDefaultFolderName  = "New Folder";
inline constexpr const char* kDefaultProjectName = "My Project";

// Trim, collapse inner whitespace, cap length; empty -> fallback.
std::string NormalizeName(std::string_view value, std::string_view fallback);

// Blank -> nullopt (root).
std::optional<std::string> NormalizeParentFolderId(const std::optional<std::string>& value);

// nullopt -> max_length; otherwise clamped into [0, max_length].
std::size_t NormalizeIndex(std::optional<int64_t> index, std::size_t max_length);

// Children list of `parent_folder_id`, or root. Throws util::NotFound.
ChildList& ContainerChildren(model::PipelineState& state, const std::optional<std::string>& parent_folder_id);

bool RemoveChildRef(ChildList& children, v1::TreeChildKind kind, const std::string& id);
void InsertChildRef(ChildList& children, v1::TreeChildRef entry, std::optional<int64_t> index);

// Index to insert at after the entry itself has been removed from the
// same list: moving forward shifts the target down by one.
std::optional<int64_t> ResolveReorderInsertIndex(const ChildList& children, v1::TreeChildKind kind, const std::string& id,
                                                 std::optional<int64_t> index);

void DetachFolder(model::PipelineState& state, const v1::Folder& folder);
void DetachProject(model::PipelineState& state, const v1::Project& project);

int32_t FolderDepth(const model::PipelineState& state, const std::string& folder_id);
int32_t SubtreeFolderHeight(const model::PipelineState& state, const std::string& folder_id);

// Throws util::InvalidState when parent depth + subtree height > kMaxFolderDepth.
void EnsureFolderDepthLimit(const model::PipelineState& state, const std::optional<std::string>& parent_folder_id, int32_t subtree_height);

bool IsFolderDescendant(const model::PipelineState& state, const std::string& folder_id, const std::string& candidate_id);

// `folder_id` and every folder below it.
std::vector<std::string> CollectFolderSubtree(const model::PipelineState& state, const std::string& folder_id);
std::vector<std::string> CollectProjectsInFolders(const model::PipelineState& state, const std::vector<std::string>& folder_ids);

// Throws util::NotFound for an unknown folder; nullopt (root) always passes.
void EnsureTargetFolderExists(const model::PipelineState& state, const std::optional<std::string>& parent_folder_id);

// `<prefix>_<12 hex>`, drawing nonces until the id is unused.
std::string ComputeEntityId(model::PipelineState& state, std::string_view prefix, std::string_view seed);

} // namespace pipeline::project
