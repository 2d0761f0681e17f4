#include "buckle/orchestrator.hpp"
#include "buckle/logging.hpp"
#include "buckle/package.hpp"
#include "buckle/platform.hpp"
#include "buckle/script.hpp"

namespace buckle {

namespace {

struct PackageVariables {
    ConfigLayer config;
    ConfigLayer secrets;
    VariableStore store;  // global < package config < package secrets
};

// Package config scripts see the global variables; package secret scripts
// additionally see the package config.
Result<PackageVariables> load_package_variables(const Package& pkg, const VariableStore& global) {
    PackageVariables vars;

    auto config = load_layer(pkg.config_dir, LayerKind::PackageConfig, global.flatten());
    if (config.isErr()) {
        return Result<PackageVariables>::err(config.error());
    }
    vars.config = std::move(config.value());
    VariableStore with_config = global.merged_with(vars.config);

    auto secrets = load_layer(pkg.secrets_dir, LayerKind::PackageSecrets, with_config.flatten());
    if (secrets.isErr()) {
        return Result<PackageVariables>::err(secrets.error());
    }
    vars.secrets = std::move(secrets.value());
    vars.store = with_config.merged_with(vars.secrets);

    return Result<PackageVariables>::ok(std::move(vars));
}

std::vector<VariableReport> report_variables(const VariableStore& store,
                                             bool package_layers_only) {
    std::vector<VariableReport> report;
    for (const auto& [name, var] : store.variables()) {
        if (package_layers_only && var.origin != LayerKind::PackageConfig &&
            var.origin != LayerKind::PackageSecrets) {
            continue;
        }
        report.push_back({name, store.display_value(name), var.is_secret});
    }
    return report;
}

} // namespace

const char* state_to_string(State state) {
    switch (state) {
        case State::Init: return "init";
        case State::GlobalConfigLoaded: return "global_config_loaded";
        case State::PackagesDiscovered: return "packages_discovered";
        case State::PlanResolved: return "plan_resolved";
        case State::Executing: return "executing";
        case State::Done: return "done";
        case State::Failed: return "failed";
        default: return "unknown";
    }
}

std::vector<std::string> ExecutionPlan::ordered_ids() const {
    std::vector<std::string> ids;
    ids.reserve(order.size());
    for (size_t index : order) {
        ids.push_back(graph.packages[index].id);
    }
    return ids;
}

// ============================================================================
// Orchestrator
// ============================================================================

std::unique_ptr<Orchestrator> Orchestrator::create(const std::string& config_root,
                                                   OrchestratorOptions options) {
    return std::unique_ptr<Orchestrator>(new Orchestrator(config_root, std::move(options)));
}

Orchestrator::Orchestrator(std::string config_root, OrchestratorOptions options)
    : config_root_(std::move(config_root)), options_(std::move(options)) {}

void Orchestrator::transition(State next) {
    log::logger()->debug("state {} -> {}", state_to_string(state_), state_to_string(next));
    state_ = next;
}

template<typename T>
Result<T> Orchestrator::fail(Error error) {
    if (!current_package_.empty()) {
        error.withPackage(current_package_);
    }
    failure_ = error.toString();
    transition(State::Failed);
    return Result<T>::err(std::move(error));
}

Result<ExecutionPlan> Orchestrator::resolve() {
    ExecutionPlan plan;
    plan.config_root = config_root_;
    plan.target_root = options_.target_root;
    current_package_.clear();

    if (!is_directory(config_root_)) {
        return fail<ExecutionPlan>(
            Error(ErrorCode::IO_ERROR, "configuration directory does not exist")
                .withPath(config_root_));
    }

    auto global_config = load_layer(join_path(config_root_, CONFIG_DIR), LayerKind::GlobalConfig);
    if (global_config.isErr()) {
        return fail<ExecutionPlan>(global_config.error());
    }
    plan.global_config = std::move(global_config.value());

    auto global_secrets = load_layer(join_path(config_root_, SECRETS_DIR),
                                     LayerKind::GlobalSecrets,
                                     VariableStore::merge({&plan.global_config}).flatten());
    if (global_secrets.isErr()) {
        return fail<ExecutionPlan>(global_secrets.error());
    }
    plan.global_secrets = std::move(global_secrets.value());
    plan.global_variables = VariableStore::merge({&plan.global_config, &plan.global_secrets});
    log::logger()->debug("loaded {} global variables", plan.global_variables.size());
    transition(State::GlobalConfigLoaded);

    auto packages = load_all_packages(join_path(config_root_, PACKAGES_DIR));
    if (packages.isErr()) {
        return fail<ExecutionPlan>(packages.error());
    }
    log::logger()->debug("discovered {} packages", packages.value().size());
    transition(State::PackagesDiscovered);

    auto graph = build_package_graph(std::move(packages.value()));
    if (graph.isErr()) {
        return fail<ExecutionPlan>(graph.error());
    }
    plan.graph = std::move(graph.value());

    auto order = resolve_order(plan.graph);
    if (order.isErr()) {
        return fail<ExecutionPlan>(order.error());
    }
    plan.order = std::move(order.value());
    transition(State::PlanResolved);

    return Result<ExecutionPlan>::ok(std::move(plan));
}

Result<Outcome> Orchestrator::apply(const ExecutionPlan& plan) {
    Outcome outcome;
    auto logger = log::logger();

    transition(State::Executing);

    for (const auto& [name, var] : plan.global_variables.variables()) {
        logger->debug(" = {} {}={}", var.is_secret ? "secret" : "config", name,
                      plan.global_variables.display_value(name));
    }

    for (size_t index : plan.order) {
        const Package& pkg = plan.graph.packages[index];
        current_package_ = pkg.id;
        logger->info(" + package '{}'", pkg.id);

        auto vars = load_package_variables(pkg, plan.global_variables);
        if (vars.isErr()) {
            return fail<Outcome>(vars.error());
        }
        const VariableStore& store = vars.value().store;
        for (const auto& entry : report_variables(store, true)) {
            logger->debug("   = {} {}={}", entry.is_secret ? "secret" : "config", entry.name, entry.value);
        }
        auto flat = store.flatten();

        auto mappings = collect_file_mappings(pkg, plan.target_root);
        if (mappings.isErr()) {
            return fail<Outcome>(mappings.error());
        }

        // Render everything before the first write
        auto prepared = prepare_files(mappings.value(), flat);
        if (prepared.isErr()) {
            return fail<Outcome>(prepared.error());
        }

        for (const auto& file : prepared.value()) {
            logger->info("   + {} '{}'", file.mapping.is_template ? "template" : "file",
                         file.mapping.destination_path);
            auto deployed = deploy_file(file);
            if (deployed.isErr()) {
                return fail<Outcome>(deployed.error());
            }
            outcome.files_written++;
        }

        auto scripts = discover_scripts(pkg.scripts_dir);
        if (scripts.isErr()) {
            return fail<Outcome>(scripts.error());
        }

        for (const auto& script : scripts.value()) {
            logger->info("   + task '{}'", script.name);
            auto run = run_required_script(script, flat);
            if (run.isErr()) {
                return fail<Outcome>(run.error());
            }
            if (!run.value().stdout_text.empty()) {
                logger->debug("{} stdout:\n{}", script.name, run.value().stdout_text);
            }
            if (!run.value().stderr_text.empty()) {
                logger->debug("{} stderr:\n{}", script.name, run.value().stderr_text);
            }
            outcome.scripts_run++;
        }

        outcome.applied.push_back(pkg.id);
    }

    current_package_.clear();
    transition(State::Done);
    return Result<Outcome>::ok(std::move(outcome));
}

Result<PlanReport> Orchestrator::describe(const ExecutionPlan& plan) const {
    PlanReport report;
    report.global_variables = report_variables(plan.global_variables, false);

    for (size_t index : plan.order) {
        const Package& pkg = plan.graph.packages[index];

        PackageReport entry;
        entry.id = pkg.id;
        entry.description = pkg.description;
        entry.needs = pkg.needs;

        auto vars = load_package_variables(pkg, plan.global_variables);
        if (vars.isErr()) {
            vars.error().withPackage(pkg.id);
            return Result<PlanReport>::err(vars.error());
        }
        entry.variables = report_variables(vars.value().store, true);

        auto mappings = collect_file_mappings(pkg, plan.target_root);
        if (mappings.isErr()) {
            mappings.error().withPackage(pkg.id);
            return Result<PlanReport>::err(mappings.error());
        }
        entry.files = std::move(mappings.value());

        auto scripts = discover_scripts(pkg.scripts_dir);
        if (scripts.isErr()) {
            scripts.error().withPackage(pkg.id);
            return Result<PlanReport>::err(scripts.error());
        }
        for (const auto& script : scripts.value()) {
            entry.scripts.push_back(script.name);
        }

        report.packages.push_back(std::move(entry));
    }

    return Result<PlanReport>::ok(std::move(report));
}

// ============================================================================
// Convenience Entry Points
// ============================================================================

Result<ExecutionPlan> resolve(const std::string& config_root, OrchestratorOptions options) {
    return Orchestrator::create(config_root, std::move(options))->resolve();
}

Result<Outcome> apply(const ExecutionPlan& plan) {
    OrchestratorOptions options;
    options.target_root = plan.target_root;
    return Orchestrator::create(plan.config_root, options)->apply(plan);
}

Result<PlanReport> describe(const ExecutionPlan& plan) {
    OrchestratorOptions options;
    options.target_root = plan.target_root;
    return Orchestrator::create(plan.config_root, options)->describe(plan);
}

} // namespace buckle
