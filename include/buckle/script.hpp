#pragma once

#include "buckle/error.hpp"
#include "buckle/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace buckle {

// ============================================================================
// Script Discovery
// ============================================================================

// Build a ScriptFile for path. An extension outside the interpreter table is
// a CONFIGURATION_ERROR.
Result<ScriptFile> make_script_file(const std::string& path);

// All scripts directly inside dir, in lexical filename order. A missing
// directory yields no scripts.
Result<std::vector<ScriptFile>> discover_scripts(const std::string& dir);

// ============================================================================
// Script Execution
// ============================================================================

// Interpreter command line preceding the script path ("bash", "pwsh -File", ...)
std::vector<std::string> interpreter_argv(Interpreter interpreter);

/**
 * Run a script to completion and capture its output.
 *
 * The child environment is the current process environment overlaid with
 * env. The call blocks until the child exits; there is no timeout. Failure to
 * start the interpreter is an EXECUTION_ERROR; a non-zero exit is NOT an
 * error at this level (see run_required_script).
 */
Result<ScriptResult> run_script(const ScriptFile& script,
                                const std::unordered_map<std::string, std::string>& env);

// run_script, with a non-zero exit turned into an EXECUTION_ERROR carrying
// the captured stdout and stderr.
Result<ScriptResult> run_required_script(const ScriptFile& script,
                                         const std::unordered_map<std::string, std::string>& env);

} // namespace buckle
