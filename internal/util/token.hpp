#pragma once

#include <string>

namespace pipeline::util {

// Random RFC 4122 version 4 identifier in canonical 8-4-4-4-12 form.
// Used as the opaque token of a project edit lock.
std::string GenerateLockToken();

} // namespace pipeline::util
