#pragma once

#include "pipeline/store/v1.hpp"

namespace pipeline::project {

namespace v1 = pipeline::store::v1;

// Recomputes stats.bones / stats.cubes from the hierarchy and derives
// has_geometry. Must run after every hierarchy change.
void SynchronizeSnapshot(v1::Project& project);

} // namespace pipeline::project
