#include "buckle/variables.hpp"
#include "buckle/logging.hpp"
#include "buckle/platform.hpp"
#include "buckle/script.hpp"

#include <cctype>
#include <filesystem>

namespace buckle {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string lowercase_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

} // namespace

// ============================================================================
// VariableStore
// ============================================================================

VariableStore VariableStore::merge(const std::vector<const ConfigLayer*>& layers) {
    VariableStore store;
    for (const auto* layer : layers) {
        if (layer) store.apply(*layer);
    }
    return store;
}

VariableStore VariableStore::merged_with(const ConfigLayer& layer) const {
    VariableStore store = *this;
    store.apply(layer);
    return store;
}

void VariableStore::apply(const ConfigLayer& layer) {
    for (const auto& [name, var] : layer.variables) {
        auto it = variables_.find(name);
        // A key that was secret in a lower layer stays secret
        bool was_secret = it != variables_.end() && it->second.is_secret;

        Variable merged = var;
        merged.is_secret = var.is_secret || was_secret;
        variables_[name] = std::move(merged);
    }
}

const Variable* VariableStore::find(const std::string& name) const {
    auto it = variables_.find(name);
    if (it == variables_.end()) return nullptr;
    return &it->second;
}

std::unordered_map<std::string, std::string> VariableStore::flatten() const {
    std::unordered_map<std::string, std::string> result;
    result.reserve(variables_.size());
    for (const auto& [name, var] : variables_) {
        result[name] = var.value;
    }
    return result;
}

std::string VariableStore::display_value(const std::string& name) const {
    const Variable* var = find(name);
    if (!var) return "";
    return var->is_secret ? std::string(log::REDACTED) : var->value;
}

std::vector<std::string> VariableStore::secret_values() const {
    std::vector<std::string> result;
    for (const auto& [name, var] : variables_) {
        if (var.is_secret) result.push_back(var.value);
    }
    return result;
}

// ============================================================================
// Line Parsing
// ============================================================================

Result<std::vector<ParsedLine>> parse_variable_lines(const std::string& content,
                                                     const std::string& source_path) {
    std::vector<ParsedLine> lines;

    int line_no = 0;
    size_t pos = 0;
    while (pos <= content.size()) {
        size_t end = content.find('\n', pos);
        if (end == std::string::npos) end = content.size();
        std::string line = trim(content.substr(pos, end - pos));
        pos = end + 1;
        ++line_no;

        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Result<std::vector<ParsedLine>>::err(
                Error(ErrorCode::CONFIGURATION_ERROR, "expected KEY=value")
                    .withPath(source_path)
                    .withLine(line_no));
        }

        std::string key = trim(line.substr(0, eq));
        if (key.empty()) {
            return Result<std::vector<ParsedLine>>::err(
                Error(ErrorCode::CONFIGURATION_ERROR, "empty variable name")
                    .withPath(source_path)
                    .withLine(line_no));
        }

        lines.push_back({key, line.substr(eq + 1), line_no});
    }

    return Result<std::vector<ParsedLine>>::ok(std::move(lines));
}

// ============================================================================
// Layer Loading
// ============================================================================

Result<std::vector<ParsedLine>> load_variable_file(
    const std::string& path,
    const std::unordered_map<std::string, std::string>& env,
    bool secret) {

    std::string ext = lowercase_extension(path);

    if (ext == ".env") {
        auto content = read_file(path);
        if (!content) {
            return Result<std::vector<ParsedLine>>::err(
                Error(ErrorCode::IO_ERROR, "unable to read configuration file").withPath(path));
        }
        auto lines = parse_variable_lines(*content, path);
        if (lines.isOk() && secret) {
            for (const auto& parsed : lines.value()) log::register_secret(parsed.value);
        }
        return lines;
    }

    auto script = make_script_file(path);
    if (script.isErr()) {
        return Result<std::vector<ParsedLine>>::err(
            Error(ErrorCode::CONFIGURATION_ERROR,
                  "the '" + ext + "' extension is not supported for config files")
                .withPath(path));
    }

    auto output = run_script(script.value(), env);
    if (output.isErr()) {
        return Result<std::vector<ParsedLine>>::err(output.error());
    }
    const ScriptResult& run = output.value();

    auto lines = parse_variable_lines(run.stdout_text, path);

    // Register before anything derived from the output can reach a log sink
    if (secret && lines.isOk()) {
        for (const auto& parsed : lines.value()) log::register_secret(parsed.value);
    }

    if (run.exit_code != 0) {
        std::string detail = "---- STDOUT: ----\n" +
            (secret ? std::string("(withheld for secret layer)") : run.stdout_text) +
            "\n\n---- STDERR: ----\n" + run.stderr_text;
        return Result<std::vector<ParsedLine>>::err(
            Error(ErrorCode::EXECUTION_ERROR,
                  "failed to load configuration from script (exit code " +
                  std::to_string(run.exit_code) + ")\n" + detail)
                .withPath(path));
    }

    if (!run.stderr_text.empty()) {
        log::logger()->debug("{} stderr:\n{}", path, run.stderr_text);
    }

    return lines;
}

Result<ConfigLayer> load_layer(const std::string& dir,
                               LayerKind kind,
                               const std::unordered_map<std::string, std::string>& env) {
    ConfigLayer layer;
    layer.kind = kind;
    layer.source_path = dir;

    auto names = list_regular_files(dir);
    if (names.isErr()) {
        return Result<ConfigLayer>::err(names.error());
    }

    bool secret = layer_is_secret(kind);

    for (const auto& name : names.value()) {
        std::string path = join_path(dir, name);
        log::logger()->debug("loading {} from {}", layer_kind_to_string(kind), path);

        auto lines = load_variable_file(path, env, secret);
        if (lines.isErr()) {
            return Result<ConfigLayer>::err(lines.error());
        }

        for (auto& parsed : lines.value()) {
            Variable var;
            var.name = parsed.key;
            var.value = std::move(parsed.value);
            var.is_secret = secret;
            var.origin = kind;
            var.source_path = path;
            layer.variables[var.name] = std::move(var);
        }
    }

    return Result<ConfigLayer>::ok(std::move(layer));
}

} // namespace buckle
