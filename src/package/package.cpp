#include "buckle/package.hpp"
#include "buckle/logging.hpp"
#include "buckle/platform.hpp"

#include <algorithm>
#include <filesystem>

#include <yaml-cpp/yaml.h>

namespace buckle {

namespace fs = std::filesystem;

namespace {

int mark_line(const YAML::Mark& mark) {
    return mark.line >= 0 ? mark.line + 1 : 0;
}

Error manifest_error(const std::string& message, const std::string& source_path, int line) {
    Error error(ErrorCode::CONFIGURATION_ERROR, message);
    if (!source_path.empty()) error.withPath(source_path);
    if (line > 0) error.withLine(line);
    return error;
}

} // namespace

Result<Package> parse_package_manifest(const std::string& yaml_text,
                                       const std::string& id,
                                       const std::string& source_path) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return Result<Package>::err(
            manifest_error("invalid YAML: " + e.msg, source_path, mark_line(e.mark)));
    }

    if (!root.IsMap()) {
        return Result<Package>::err(
            manifest_error("package.yml must be a mapping", source_path, mark_line(root.Mark())));
    }

    Package pkg;
    pkg.id = id;

    try {
        YAML::Node description = root["description"];
        if (!description) {
            return Result<Package>::err(
                manifest_error("missing required field 'description'", source_path, 0));
        }
        if (!description.IsScalar()) {
            return Result<Package>::err(manifest_error(
                "'description' must be a string", source_path, mark_line(description.Mark())));
        }
        pkg.description = description.as<std::string>();

        YAML::Node needs = root["needs"];
        if (needs && !needs.IsNull()) {
            if (!needs.IsSequence()) {
                return Result<Package>::err(manifest_error(
                    "'needs' must be a list of package ids", source_path, mark_line(needs.Mark())));
            }
            for (const auto& need : needs) {
                if (!need.IsScalar() || need.as<std::string>().empty()) {
                    return Result<Package>::err(manifest_error(
                        "'needs' entries must be package ids", source_path, mark_line(need.Mark())));
                }
                pkg.needs.push_back(need.as<std::string>());
            }
            std::sort(pkg.needs.begin(), pkg.needs.end());
            pkg.needs.erase(std::unique(pkg.needs.begin(), pkg.needs.end()), pkg.needs.end());
        }

        YAML::Node files = root["files"];
        if (files && !files.IsNull()) {
            if (!files.IsMap()) {
                return Result<Package>::err(manifest_error(
                    "'files' must map file groups to target paths", source_path,
                    mark_line(files.Mark())));
            }
            for (const auto& entry : files) {
                if (!entry.first.IsScalar() || !entry.second.IsScalar()) {
                    return Result<Package>::err(manifest_error(
                        "'files' entries must be 'group: /target/path'", source_path,
                        mark_line(entry.first.Mark())));
                }
                std::string group = entry.first.as<std::string>();
                std::string target = entry.second.as<std::string>();
                if (target.empty() || !fs::path(target).has_root_directory()) {
                    return Result<Package>::err(manifest_error(
                        "target for file group '" + group + "' must be an absolute path",
                        source_path, mark_line(entry.second.Mark())));
                }
                pkg.files[group] = target;
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<Package>::err(manifest_error(e.msg, source_path, mark_line(e.mark)));
    }

    return Result<Package>::ok(std::move(pkg));
}

Result<Package> load_package(const std::string& dir) {
    std::string id = fs::path(dir).filename().string();
    std::string manifest_path = join_path(dir, PACKAGE_MANIFEST);

    auto content = read_file(manifest_path);
    if (!content) {
        return Result<Package>::err(
            Error(ErrorCode::IO_ERROR, "failed to read package.yml")
                .withPath(manifest_path)
                .withPackage(id));
    }

    auto parsed = parse_package_manifest(*content, id, manifest_path);
    if (parsed.isErr()) {
        parsed.error().withPackage(id);
        return parsed;
    }

    Package& pkg = parsed.value();
    pkg.root_dir = dir;
    pkg.config_dir = join_path(dir, CONFIG_DIR);
    pkg.secrets_dir = join_path(dir, SECRETS_DIR);
    pkg.scripts_dir = join_path(dir, SCRIPTS_DIR);
    pkg.files_dir = join_path(dir, FILES_DIR);

    log::logger()->debug("loaded package '{}' ({} needs, {} file groups)",
                         pkg.id, pkg.needs.size(), pkg.files.size());
    return parsed;
}

Result<std::vector<Package>> load_all_packages(const std::string& packages_dir) {
    std::vector<Package> packages;

    auto names = list_subdirectories(packages_dir);
    if (names.isErr()) {
        return Result<std::vector<Package>>::err(names.error());
    }
    if (names.value().empty()) {
        log::logger()->debug("no packages under {}", packages_dir);
    }

    for (const auto& name : names.value()) {
        if (!name.empty() && name[0] == '.') continue;

        auto pkg = load_package(join_path(packages_dir, name));
        if (pkg.isErr()) {
            return Result<std::vector<Package>>::err(pkg.error());
        }
        packages.push_back(std::move(pkg.value()));
    }

    return Result<std::vector<Package>>::ok(std::move(packages));
}

} // namespace buckle
