#pragma once

#include "buckle/error.hpp"
#include "buckle/types.hpp"

#include <string>
#include <vector>

namespace buckle {

// ============================================================================
// Package Layout
// ============================================================================

constexpr const char* PACKAGE_MANIFEST = "package.yml";
constexpr const char* CONFIG_DIR = "config";
constexpr const char* SECRETS_DIR = "secrets";
constexpr const char* SCRIPTS_DIR = "scripts";
constexpr const char* FILES_DIR = "files";
constexpr const char* PACKAGES_DIR = "packages";

// ============================================================================
// Package Loading
// ============================================================================

/**
 * Parse package.yml text into a Package with the given id.
 *
 * Required: description (string). Optional: needs (sequence of ids) and
 * files (mapping of group -> target path with a root directory). Unknown keys
 * are ignored. Malformed YAML or a wrongly typed field is a
 * CONFIGURATION_ERROR carrying source_path and, where yaml-cpp reports one,
 * the line number.
 */
Result<Package> parse_package_manifest(const std::string& yaml_text,
                                       const std::string& id,
                                       const std::string& source_path = "");

// Load packages/<id>. The id is the directory name; a missing package.yml is
// an IO_ERROR.
Result<Package> load_package(const std::string& dir);

// Load every package directory under packages_dir in lexical order. Hidden
// directories are skipped and a missing packages_dir yields no packages.
Result<std::vector<Package>> load_all_packages(const std::string& packages_dir);

} // namespace buckle
