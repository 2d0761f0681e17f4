#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace buckle {

// ============================================================================
// Layer Kind (lowest to highest precedence)
// ============================================================================

enum class LayerKind {
    GlobalConfig,
    GlobalSecrets,
    PackageConfig,
    PackageSecrets,
};

inline const char* layer_kind_to_string(LayerKind k) {
    switch (k) {
        case LayerKind::GlobalConfig: return "global_config";
        case LayerKind::GlobalSecrets: return "global_secrets";
        case LayerKind::PackageConfig: return "package_config";
        case LayerKind::PackageSecrets: return "package_secrets";
        default: return "unknown";
    }
}

inline bool layer_is_secret(LayerKind k) {
    return k == LayerKind::GlobalSecrets || k == LayerKind::PackageSecrets;
}

// ============================================================================
// Variable
// ============================================================================

struct Variable {
    std::string name;
    std::string value;
    bool is_secret = false;
    LayerKind origin = LayerKind::GlobalConfig;
    std::string source_path;  // file that supplied the value
};

// ============================================================================
// Config Layer
// ============================================================================

struct ConfigLayer {
    LayerKind kind = LayerKind::GlobalConfig;
    std::string source_path;                    // directory the layer was read from
    std::map<std::string, Variable> variables;  // keyed by name, lexical order
};

// ============================================================================
// Interpreter (closed set, selected by extension)
// ============================================================================

enum class Interpreter {
    Bash,
    PowerShell,
    Cmd,
};

inline const char* interpreter_to_string(Interpreter i) {
    switch (i) {
        case Interpreter::Bash: return "bash";
        case Interpreter::PowerShell: return "pwsh";
        case Interpreter::Cmd: return "cmd.exe";
        default: return "unknown";
    }
}

// Returns nullopt for extensions outside the table (".sh", ".ps1", ".bat", ".cmd")
std::optional<Interpreter> interpreter_for_extension(const std::string& extension);

struct ScriptFile {
    std::string name;  // file name, used for ordering and display
    std::string path;
    Interpreter interpreter = Interpreter::Bash;
};

struct ScriptResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
};

// ============================================================================
// Package
// ============================================================================

struct Package {
    std::string id;
    std::string description;
    std::vector<std::string> needs;              // sorted, unique
    std::map<std::string, std::string> files;    // group -> target path

    std::string root_dir;
    std::string config_dir;
    std::string secrets_dir;
    std::string scripts_dir;
    std::string files_dir;
};

// ============================================================================
// File Mapping
// ============================================================================

struct FileMapping {
    std::string group;                  // files/<group>
    std::string source_relative_path;   // relative to files/<group>, portable separators
    std::string source_path;            // absolute source path
    std::string destination_path;       // absolute destination, ".tpl" stripped
    bool is_template = false;
};

} // namespace buckle
