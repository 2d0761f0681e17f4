#pragma once

#include "buckle/error.hpp"
#include "buckle/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace buckle {

// Spawn argv[0] (an absolute path) with exactly env as its environment and
// cwd as its working directory, block until it exits, and return everything
// it wrote to stdout and stderr. Only a failure to start or wait for the
// child is an error; its exit code is reported as-is (128 + signal when
// killed by a signal).
Result<ScriptResult> spawn_and_capture(const std::vector<std::string>& argv,
                                       const std::unordered_map<std::string, std::string>& env,
                                       const std::string& cwd);

} // namespace buckle
