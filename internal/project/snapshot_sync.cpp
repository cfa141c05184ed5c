#include "snapshot_sync.hpp"

#include <vector>

namespace pipeline::project {

void SynchronizeSnapshot(v1::Project& project) {
  int64_t bones = 0;
  int64_t cubes = 0;

  std::vector<const v1::HierarchyNode*> stack;
  for (const auto& node : project.hierarchy()) stack.push_back(&node);

  while (!stack.empty()) {
    const auto* node = stack.back();
    stack.pop_back();

    if (node->kind() == v1::NODE_KIND_BONE) ++bones;
    if (node->kind() == v1::NODE_KIND_CUBE) ++cubes;
    for (const auto& child : node->children()) stack.push_back(&child);
  }

  project.mutable_stats()->set_bones(bones);
  project.mutable_stats()->set_cubes(cubes);
  project.set_has_geometry(bones > 0 || cubes > 0);
}

} // namespace pipeline::project
