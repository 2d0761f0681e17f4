#include "buckle/script.hpp"
#include "buckle/platform.hpp"
#include "process.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace buckle {

namespace fs = std::filesystem;

namespace {

struct ExtensionEntry {
    const char* extension;
    Interpreter interpreter;
};

constexpr ExtensionEntry EXTENSION_TABLE[] = {
    {".sh", Interpreter::Bash},
    {".ps1", Interpreter::PowerShell},
    {".bat", Interpreter::Cmd},
    {".cmd", Interpreter::Cmd},
};

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Interpreter> interpreter_for_extension(const std::string& extension) {
    std::string ext = to_lower(extension);
    for (const auto& entry : EXTENSION_TABLE) {
        if (ext == entry.extension) return entry.interpreter;
    }
    return std::nullopt;
}

// ============================================================================
// Discovery
// ============================================================================

Result<ScriptFile> make_script_file(const std::string& path) {
    fs::path p(path);
    std::string ext = p.extension().string();

    if (ext.empty()) {
        return Result<ScriptFile>::err(
            Error(ErrorCode::CONFIGURATION_ERROR,
                  "could not determine how to run the file because it has no extension")
                .withPath(path));
    }

    auto interpreter = interpreter_for_extension(ext);
    if (!interpreter) {
        return Result<ScriptFile>::err(
            Error(ErrorCode::CONFIGURATION_ERROR,
                  "the '" + ext + "' extension is not supported for scripts")
                .withPath(path));
    }

    ScriptFile script;
    script.name = p.filename().string();
    script.path = path;
    script.interpreter = *interpreter;
    return Result<ScriptFile>::ok(std::move(script));
}

Result<std::vector<ScriptFile>> discover_scripts(const std::string& dir) {
    auto names = list_regular_files(dir);
    if (names.isErr()) {
        return Result<std::vector<ScriptFile>>::err(names.error());
    }

    std::vector<ScriptFile> scripts;
    for (const auto& name : names.value()) {
        auto script = make_script_file(join_path(dir, name));
        if (script.isErr()) {
            return Result<std::vector<ScriptFile>>::err(script.error());
        }
        scripts.push_back(std::move(script.value()));
    }

    return Result<std::vector<ScriptFile>>::ok(std::move(scripts));
}

// ============================================================================
// Execution
// ============================================================================

std::vector<std::string> interpreter_argv(Interpreter interpreter) {
    switch (interpreter) {
        case Interpreter::Bash: return {"bash"};
        case Interpreter::PowerShell: return {"pwsh", "-NoProfile", "-NonInteractive", "-File"};
        case Interpreter::Cmd: return {"cmd.exe", "/C"};
    }
    return {};
}

Result<ScriptResult> run_script(const ScriptFile& script,
                                const std::unordered_map<std::string, std::string>& env) {
    auto child_env = get_all_env();
    for (const auto& [key, value] : env) {
        child_env[key] = value;
    }

    std::vector<std::string> argv = interpreter_argv(script.interpreter);

    auto path_it = child_env.find("PATH");
    auto resolved = find_executable(argv[0], path_it != child_env.end() ? path_it->second : "");
    if (!resolved) {
        return Result<ScriptResult>::err(
            Error(ErrorCode::EXECUTION_ERROR,
                  "failed to execute '" + argv[0] + "': make sure it is installed and on your PATH")
                .withPath(script.path));
    }
    std::string script_path = fs::absolute(script.path).string();
    argv[0] = *resolved;
    argv.push_back(script_path);

    auto result = spawn_and_capture(argv, child_env, get_parent_directory(script_path));
    if (result.isErr()) {
        result.error().withPath(script.path);
    }
    return result;
}

Result<ScriptResult> run_required_script(const ScriptFile& script,
                                         const std::unordered_map<std::string, std::string>& env) {
    auto result = run_script(script, env);
    if (result.isErr()) {
        return result;
    }

    const ScriptResult& run = result.value();
    if (run.exit_code != 0) {
        return Result<ScriptResult>::err(
            Error(ErrorCode::EXECUTION_ERROR,
                  "script '" + script.name + "' exited with code " + std::to_string(run.exit_code) +
                  "\n---- STDOUT: ----\n" + run.stdout_text +
                  "\n\n---- STDERR: ----\n" + run.stderr_text)
                .withPath(script.path));
    }

    return result;
}

} // namespace buckle
