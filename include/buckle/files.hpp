#pragma once

#include "buckle/error.hpp"
#include "buckle/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace buckle {

constexpr const char* TEMPLATE_SUFFIX = ".tpl";

// Destination root for groups that package.yml does not map
constexpr const char* DEFAULT_GROUP_TARGET = "/";

// ============================================================================
// File Mappings
// ============================================================================

// Relative path with a trailing ".tpl" removed from its last component
std::string strip_template_suffix(const std::string& relative_path);

/**
 * Enumerate the files of every group under pkg.files_dir.
 *
 * Groups are visited in lexical order and each group's tree is walked
 * depth-first with siblings in lexical order, following symlinks (a symlink
 * back to a directory already being walked is skipped). The
 * destination is the group's target from package.yml (or "/") joined with the
 * relative path, re-based under target_root when it is non-empty.
 */
Result<std::vector<FileMapping>> collect_file_mappings(const Package& pkg,
                                                       const std::string& target_root = "");

// ============================================================================
// Deployment
// ============================================================================

struct PreparedFile {
    FileMapping mapping;
    std::optional<std::string> rendered;  // set for templates
};

// Render every template among mappings against vars. Nothing is written; a
// failure leaves the host untouched.
Result<std::vector<PreparedFile>> prepare_files(
    const std::vector<FileMapping>& mappings,
    const std::unordered_map<std::string, std::string>& vars);

// Write one file to its destination, creating parent directories and
// replacing whatever is there. A rendered template keeps the permission bits
// of the file it replaces, or takes the template's own when new; a plain file
// takes its source's. Write failures are PERMISSION_ERROR.
Result<void> deploy_file(const PreparedFile& file);

} // namespace buckle
