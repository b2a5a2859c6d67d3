#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Spawn a child process that outlives the caller: its own session
// (DETACHED_PROCESS on Windows), stdin/stdout/stderr on the null device.
// Returns the child pid.
Result<int> spawn_detached(const std::string& program,
                           const std::vector<std::string>& args);

} // namespace platform
