#pragma once

/**
 * @file orchestrator.hpp
 * @brief Main buckle library interface
 *
 * The orchestrator turns a config root into an ExecutionPlan and applies it
 * package by package.
 *
 * @example
 * ```cpp
 * #include <buckle/orchestrator.hpp>
 *
 * auto orchestrator = buckle::Orchestrator::create("/etc/buckle");
 * auto plan = orchestrator->resolve();
 * if (plan.isOk()) {
 *     auto outcome = orchestrator->apply(plan.value());
 * }
 * ```
 */

#include "buckle/error.hpp"
#include "buckle/files.hpp"
#include "buckle/graph.hpp"
#include "buckle/types.hpp"
#include "buckle/variables.hpp"

#include <memory>
#include <string>
#include <vector>

namespace buckle {

// ============================================================================
// State Machine
// ============================================================================

enum class State {
    Init,
    GlobalConfigLoaded,
    PackagesDiscovered,
    PlanResolved,
    Executing,
    Done,
    Failed,
};

const char* state_to_string(State state);

// ============================================================================
// Plan and Outcome
// ============================================================================

/**
 * @brief Dependency-ordered packages plus everything needed to apply them
 *
 * Computed once by resolve() and never modified afterwards.
 */
struct ExecutionPlan {
    std::string config_root;
    std::string target_root;  // empty: deploy to the real destinations

    ConfigLayer global_config;
    ConfigLayer global_secrets;
    VariableStore global_variables;  // global config < global secrets

    PackageGraph graph;
    std::vector<size_t> order;  // indices into graph.packages

    std::vector<std::string> ordered_ids() const;
};

struct Outcome {
    std::vector<std::string> applied;  // package ids, in apply order
    size_t files_written = 0;
    size_t scripts_run = 0;
};

// ============================================================================
// Plan Report
// ============================================================================

struct VariableReport {
    std::string name;
    std::string value;  // "******" for secrets
    bool is_secret = false;
};

struct PackageReport {
    std::string id;
    std::string description;
    std::vector<std::string> needs;
    std::vector<VariableReport> variables;  // from the package's own layers
    std::vector<FileMapping> files;
    std::vector<std::string> scripts;
};

struct PlanReport {
    std::vector<VariableReport> global_variables;
    std::vector<PackageReport> packages;  // in plan order
};

// ============================================================================
// Orchestrator
// ============================================================================

struct OrchestratorOptions {
    std::string target_root;  // re-base every file destination under this directory
};

class Orchestrator {
public:
    /**
     * @brief Create an orchestrator for a config root
     * @param config_root Directory holding config/, secrets/ and packages/
     * @param options Deployment options
     */
    static std::unique_ptr<Orchestrator> create(const std::string& config_root,
                                                OrchestratorOptions options = {});

    const std::string& config_root() const { return config_root_; }

    State state() const { return state_; }

    /// Error that moved the orchestrator to Failed, empty otherwise
    const std::string& failure() const { return failure_; }

    /// Id of the package being applied while Executing
    const std::string& current_package() const { return current_package_; }

    /**
     * @brief Load global layers and packages and compute the execution plan
     *
     * Global config is loaded first, then global secrets (their scripts see
     * the global config in their environment), then every package.yml. Fails
     * with DEPENDENCY_ERROR on unknown or circular needs.
     */
    Result<ExecutionPlan> resolve();

    /**
     * @brief Apply every package of the plan in order
     *
     * For each package: merge its config and secret layers onto the global
     * variables, render its templates, deploy its files, then run its
     * scripts. The first error stops the run; packages already applied stay
     * applied.
     */
    Result<Outcome> apply(const ExecutionPlan& plan);

    /**
     * @brief Describe what apply would do
     *
     * Runs config-discovery scripts to resolve variables but writes no files
     * and runs no provisioning scripts.
     */
    Result<PlanReport> describe(const ExecutionPlan& plan) const;

private:
    Orchestrator(std::string config_root, OrchestratorOptions options);

    void transition(State next);

    template<typename T>
    Result<T> fail(Error error);

    std::string config_root_;
    OrchestratorOptions options_;
    State state_ = State::Init;
    std::string failure_;
    std::string current_package_;
};

// ============================================================================
// Convenience Entry Points
// ============================================================================

Result<ExecutionPlan> resolve(const std::string& config_root, OrchestratorOptions options = {});

Result<Outcome> apply(const ExecutionPlan& plan);

Result<PlanReport> describe(const ExecutionPlan& plan);

} // namespace buckle
