#include "buckle/graph.hpp"

#include <algorithm>
#include <deque>
#include <set>

namespace buckle {

namespace {

enum class Color { White, Gray, Black };

// Depth-first coloring; true when a back edge (and therefore a cycle) exists
bool has_cycle_from(const PackageGraph& graph, size_t node, std::vector<Color>& color) {
    color[node] = Color::Gray;
    for (size_t next : graph.needs[node]) {
        if (color[next] == Color::Gray) return true;
        if (color[next] == Color::White && has_cycle_from(graph, next, color)) return true;
    }
    color[node] = Color::Black;
    return false;
}

bool has_cycle(const PackageGraph& graph) {
    std::vector<Color> color(graph.packages.size(), Color::White);
    for (size_t i = 0; i < graph.packages.size(); ++i) {
        if (color[i] == Color::White && has_cycle_from(graph, i, color)) return true;
    }
    return false;
}

// Shortest path start -> ... -> start, as indices without the repeated start
std::vector<size_t> shortest_cycle_through(const PackageGraph& graph, size_t start) {
    const size_t n = graph.packages.size();
    std::vector<size_t> parent(n, n);
    std::vector<bool> seen(n, false);
    std::deque<size_t> queue;

    queue.push_back(start);
    seen[start] = true;

    while (!queue.empty()) {
        size_t node = queue.front();
        queue.pop_front();

        // needs are sorted by index, so equal-length paths resolve the same way every run
        for (size_t next : graph.needs[node]) {
            if (next == start) {
                std::vector<size_t> path;
                for (size_t at = node; at != n; at = parent[at]) path.push_back(at);
                std::reverse(path.begin(), path.end());
                return path;
            }
            if (!seen[next]) {
                seen[next] = true;
                parent[next] = node;
                queue.push_back(next);
            }
        }
    }

    return {};
}

} // namespace

size_t PackageGraph::index_of(const std::string& id) const {
    auto it = std::lower_bound(packages.begin(), packages.end(), id,
                               [](const Package& p, const std::string& key) { return p.id < key; });
    if (it == packages.end() || it->id != id) return packages.size();
    return static_cast<size_t>(it - packages.begin());
}

Result<PackageGraph> build_package_graph(std::vector<Package> packages) {
    PackageGraph graph;
    graph.packages = std::move(packages);
    std::sort(graph.packages.begin(), graph.packages.end(),
              [](const Package& a, const Package& b) { return a.id < b.id; });

    for (size_t i = 1; i < graph.packages.size(); ++i) {
        if (graph.packages[i].id == graph.packages[i - 1].id) {
            return Result<PackageGraph>::err(
                Error(ErrorCode::DEPENDENCY_ERROR,
                      "package '" + graph.packages[i].id + "' is defined more than once")
                    .withPackage(graph.packages[i].id));
        }
    }

    graph.needs.resize(graph.packages.size());
    for (size_t i = 0; i < graph.packages.size(); ++i) {
        const Package& pkg = graph.packages[i];
        for (const auto& need : pkg.needs) {
            size_t target = graph.index_of(need);
            if (target == graph.packages.size()) {
                return Result<PackageGraph>::err(
                    Error(ErrorCode::DEPENDENCY_ERROR,
                          "package '" + pkg.id + "' needs unknown package '" + need + "'")
                        .withPackage(pkg.id));
            }
            graph.needs[i].push_back(target);
        }
        std::sort(graph.needs[i].begin(), graph.needs[i].end());
        graph.needs[i].erase(std::unique(graph.needs[i].begin(), graph.needs[i].end()),
                             graph.needs[i].end());
    }

    return Result<PackageGraph>::ok(std::move(graph));
}

std::vector<std::string> find_minimal_cycle(const PackageGraph& graph) {
    std::vector<size_t> best;
    for (size_t i = 0; i < graph.packages.size(); ++i) {
        auto cycle = shortest_cycle_through(graph, i);
        if (!cycle.empty() && (best.empty() || cycle.size() < best.size())) {
            best = std::move(cycle);
        }
    }

    std::vector<std::string> ids;
    if (best.empty()) return ids;
    for (size_t index : best) ids.push_back(graph.packages[index].id);
    ids.push_back(graph.packages[best.front()].id);
    return ids;
}

std::string format_cycle(const std::vector<std::string>& cycle) {
    std::string out;
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) out += " -> ";
        out += cycle[i];
    }
    return out;
}

Result<std::vector<size_t>> resolve_order(const PackageGraph& graph) {
    const size_t n = graph.packages.size();

    if (has_cycle(graph)) {
        auto cycle = find_minimal_cycle(graph);
        Error error(ErrorCode::DEPENDENCY_ERROR,
                    "circular dependency between packages: " + format_cycle(cycle));
        if (!cycle.empty()) error.withPackage(cycle.front());
        return Result<std::vector<size_t>>::err(error);
    }

    // Kahn's algorithm; the ready set is ordered by index, i.e. by id
    std::vector<size_t> pending(n, 0);
    std::vector<std::vector<size_t>> dependents(n);
    for (size_t i = 0; i < n; ++i) {
        pending[i] = graph.needs[i].size();
        for (size_t need : graph.needs[i]) dependents[need].push_back(i);
    }

    std::set<size_t> ready;
    for (size_t i = 0; i < n; ++i) {
        if (pending[i] == 0) ready.insert(i);
    }

    std::vector<size_t> order;
    order.reserve(n);
    while (!ready.empty()) {
        size_t next = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(next);

        for (size_t dependent : dependents[next]) {
            if (--pending[dependent] == 0) ready.insert(dependent);
        }
    }

    return Result<std::vector<size_t>>::ok(std::move(order));
}

} // namespace buckle
