#include "buckle/files.hpp"
#include "buckle/logging.hpp"
#include "buckle/platform.hpp"
#include "buckle/template.hpp"

#include <algorithm>
#include <filesystem>

namespace buckle {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_template_name(const std::string& name) {
    return name.size() > std::char_traits<char>::length(TEMPLATE_SUFFIX) &&
           ends_with(name, TEMPLATE_SUFFIX);
}

// Depth-first walk with siblings sorted by name. active holds the canonical
// paths of the directories being walked; a symlink back into one of them is
// skipped.
Result<void> walk_group(const fs::path& dir,
                        const fs::path& relative,
                        std::vector<fs::path>& active,
                        std::vector<fs::path>& out) {
    std::error_code ec;
    fs::path canonical = fs::canonical(dir, ec);
    if (ec) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, "failed to resolve directory: " + ec.message())
                .withPath(dir.string()));
    }
    if (std::find(active.begin(), active.end(), canonical) != active.end()) {
        log::logger()->warn("skipping '{}': symlink loop back to {}",
                            to_portable_path(dir.string()), to_portable_path(canonical.string()));
        return Result<void>::ok();
    }

    std::vector<fs::path> children;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, "failed to list directory: " + ec.message())
                .withPath(dir.string()));
    }

    std::sort(children.begin(), children.end(),
              [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });

    active.push_back(canonical);
    for (const auto& child : children) {
        fs::path child_relative = relative / child.filename();
        if (fs::is_directory(child, ec)) {
            auto nested = walk_group(child, child_relative, active, out);
            if (nested.isErr()) return nested;
        } else if (fs::is_regular_file(child, ec)) {
            out.push_back(child_relative);
        }
    }
    active.pop_back();

    return Result<void>::ok();
}

} // namespace

std::string strip_template_suffix(const std::string& relative_path) {
    fs::path p(relative_path);
    std::string name = p.filename().string();
    if (!is_template_name(name)) return relative_path;

    name.resize(name.size() - std::char_traits<char>::length(TEMPLATE_SUFFIX));
    return to_portable_path((p.parent_path() / name).string());
}

// ============================================================================
// Mapping
// ============================================================================

Result<std::vector<FileMapping>> collect_file_mappings(const Package& pkg,
                                                       const std::string& target_root) {
    std::vector<FileMapping> mappings;

    auto groups = list_subdirectories(pkg.files_dir);
    if (groups.isErr()) {
        groups.error().withPackage(pkg.id);
        return Result<std::vector<FileMapping>>::err(groups.error());
    }

    for (const auto& group : groups.value()) {
        auto target_it = pkg.files.find(group);
        std::string target = target_it != pkg.files.end() ? target_it->second
                                                           : std::string(DEFAULT_GROUP_TARGET);

        fs::path group_dir = fs::path(pkg.files_dir) / group;
        std::vector<fs::path> relative_paths;
        std::vector<fs::path> active;
        auto walked = walk_group(group_dir, fs::path(), active, relative_paths);
        if (walked.isErr()) {
            walked.error().withPackage(pkg.id);
            return Result<std::vector<FileMapping>>::err(walked.error());
        }

        for (const auto& rel : relative_paths) {
            FileMapping mapping;
            mapping.group = group;
            mapping.source_relative_path = to_portable_path(rel.string());
            mapping.source_path = to_portable_path((group_dir / rel).string());
            mapping.is_template = is_template_name(rel.filename().string());

            std::string dest_relative = mapping.is_template
                ? strip_template_suffix(mapping.source_relative_path)
                : mapping.source_relative_path;
            mapping.destination_path = rebase_path(target_root, join_path(target, dest_relative));

            mappings.push_back(std::move(mapping));
        }
    }

    return Result<std::vector<FileMapping>>::ok(std::move(mappings));
}

// ============================================================================
// Rendering and Deployment
// ============================================================================

Result<std::vector<PreparedFile>> prepare_files(
    const std::vector<FileMapping>& mappings,
    const std::unordered_map<std::string, std::string>& vars) {

    std::vector<PreparedFile> prepared;
    prepared.reserve(mappings.size());

    for (const auto& mapping : mappings) {
        PreparedFile file;
        file.mapping = mapping;

        if (mapping.is_template) {
            auto content = read_file(mapping.source_path);
            if (!content) {
                return Result<std::vector<PreparedFile>>::err(
                    Error(ErrorCode::IO_ERROR, "failed to read template")
                        .withPath(mapping.source_path));
            }

            auto rendered = render_template(*content, vars, mapping.source_path);
            if (rendered.isErr()) {
                return Result<std::vector<PreparedFile>>::err(rendered.error());
            }
            file.rendered = std::move(rendered.value());
        }

        prepared.push_back(std::move(file));
    }

    return Result<std::vector<PreparedFile>>::ok(std::move(prepared));
}

Result<void> deploy_file(const PreparedFile& file) {
    const FileMapping& mapping = file.mapping;

    std::string parent = get_parent_directory(mapping.destination_path);
    if (!parent.empty()) {
        if (auto err = create_directories(parent)) {
            return Result<void>::err(
                Error(ErrorCode::PERMISSION_ERROR, "failed to create directory: " + *err)
                    .withPath(parent));
        }
    }

    if (file.rendered) {
        return atomic_write_file(mapping.destination_path, *file.rendered, mapping.source_path);
    }

    std::error_code ec;
    fs::copy_file(mapping.source_path, mapping.destination_path,
                  fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result<void>::err(
            Error(ErrorCode::PERMISSION_ERROR,
                  "failed to copy '" + mapping.source_path + "': " + ec.message())
                .withPath(mapping.destination_path));
    }

    return Result<void>::ok();
}

} // namespace buckle
