#pragma once

#include "buckle/error.hpp"
#include "buckle/types.hpp"

#include <string>
#include <vector>

namespace buckle {

// ============================================================================
// Package Graph
// ============================================================================

/**
 * @brief Arena of packages with needs resolved to indices
 *
 * Packages are held sorted by id, so index order is lexical id order.
 */
struct PackageGraph {
    std::vector<Package> packages;
    std::vector<std::vector<size_t>> needs;  // needs[i]: indices package i depends on

    // Index of the package with the given id, or packages.size() if absent
    size_t index_of(const std::string& id) const;
};

// Build the arena. A duplicate id, or a needs entry naming an unknown id, is
// a DEPENDENCY_ERROR.
Result<PackageGraph> build_package_graph(std::vector<Package> packages);

// Shortest cycle in the graph as a list of ids (first id repeated at the
// end), ties broken by the lexically smallest starting id. Empty when the
// graph is acyclic.
std::vector<std::string> find_minimal_cycle(const PackageGraph& graph);

// "a -> b -> a"
std::string format_cycle(const std::vector<std::string>& cycle);

// Topological order of package indices. Every package appears exactly once
// and after all of its needs; packages with no constraint between them are
// ordered by id. A cycle is a DEPENDENCY_ERROR naming the minimal cycle.
Result<std::vector<size_t>> resolve_order(const PackageGraph& graph);

} // namespace buckle
