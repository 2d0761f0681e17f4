#pragma once

#include "buckle/error.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace buckle {

// ============================================================================
// File Writes
// ============================================================================

// Replace path with content via a sibling temp file that is flushed to disk
// and renamed over the destination. The new file keeps the permission bits of
// the file it replaces; a new destination takes those of mode_source (0644
// when it is empty or unreadable). Failures are PERMISSION_ERROR.
Result<void> atomic_write_file(const std::string& path,
                               const std::string& content,
                               const std::string& mode_source = "");

// Create a directory and its parents; returns the OS error text on failure
std::optional<std::string> create_directories(const std::string& path);

// Read a whole file; nullopt when it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Paths
// ============================================================================

// Backslashes become forward slashes
std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);

// base/rel with portable separators
std::string join_path(const std::string& base, const std::string& rel);

// Re-base an absolute path under root ("/etc/app" under "/tmp/x" -> "/tmp/x/etc/app").
// An empty root returns path unchanged.
std::string rebase_path(const std::string& root, const std::string& path);

// ============================================================================
// Directory Listing
// ============================================================================

bool is_directory(const std::string& path);

// Sorted names of the regular files directly inside path (symlinks followed).
// Hidden entries (leading '.') are skipped. A missing path yields no names; a
// path that cannot be read, or is not a directory, is an IO_ERROR.
Result<std::vector<std::string>> list_regular_files(const std::string& path);

// Sorted names of the directories directly inside path, hidden ones included.
// Errors as for list_regular_files.
Result<std::vector<std::string>> list_subdirectories(const std::string& path);

// ============================================================================
// Process Environment
// ============================================================================

std::unordered_map<std::string, std::string> get_all_env();

// Search the directories of path_value (PATH syntax) for an executable named name.
// Names containing a separator are returned unchanged if executable.
std::optional<std::string> find_executable(const std::string& name, const std::string& path_value);

// Random version 4 UUID, used for temp file names
std::string generate_uuid();

} // namespace buckle
