#pragma once

#include "buckle/error.hpp"
#include "buckle/types.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace buckle {

// ============================================================================
// Variable Store
// ============================================================================

/**
 * @brief Immutable snapshot of merged variables
 *
 * A store is never modified after construction; merge() returns a new
 * snapshot. Precedence is decided by the order in which layers are merged:
 * global config < global secrets < package config < package secrets.
 */
class VariableStore {
public:
    VariableStore() = default;

    // Merge layers in the given order, last write wins per key.
    static VariableStore merge(const std::vector<const ConfigLayer*>& layers);

    // A new snapshot with layer applied on top of this one
    VariableStore merged_with(const ConfigLayer& layer) const;

    const Variable* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }
    bool empty() const { return variables_.empty(); }
    size_t size() const { return variables_.size(); }

    const std::map<std::string, Variable>& variables() const { return variables_; }

    // name -> value, for templates and child process environments
    std::unordered_map<std::string, std::string> flatten() const;

    // Value for display: "******" for secrets, the value otherwise
    std::string display_value(const std::string& name) const;

    // Values of every secret variable
    std::vector<std::string> secret_values() const;

private:
    void apply(const ConfigLayer& layer);

    std::map<std::string, Variable> variables_;
};

// ============================================================================
// Layer Loading
// ============================================================================

struct ParsedLine {
    std::string key;
    std::string value;
    int line = 0;
};

// Parse "KEY=value" lines. Blank and '#' lines are skipped; any other line
// without '=' or with an empty key is a CONFIGURATION_ERROR carrying the line
// number and source_path.
Result<std::vector<ParsedLine>> parse_variable_lines(const std::string& content,
                                                     const std::string& source_path);

// Load one variable file. ".env" files are read; ".sh/.ps1/.bat/.cmd" files
// are executed with env and their stdout parsed. A non-zero exit is an
// EXECUTION_ERROR. When secret is set the parsed values are registered with
// the log redactor before any output is logged, and a failing script's stdout
// is left out of the error.
Result<std::vector<ParsedLine>> load_variable_file(
    const std::string& path,
    const std::unordered_map<std::string, std::string>& env,
    bool secret = false);

// Load every file in dir (lexical order) into a layer of the given kind. A
// missing directory yields an empty layer. Values of secret-kind layers are
// registered with the log redactor as they are read.
Result<ConfigLayer> load_layer(const std::string& dir,
                               LayerKind kind,
                               const std::unordered_map<std::string, std::string>& env = {});

} // namespace buckle
