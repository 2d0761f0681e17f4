/**
 * Buckle CLI - apply command
 *
 * Apply every package in dependency order. Progress is logged; the first
 * failure stops the run with exit status 1.
 */

#include "../common.hpp"
#include <buckle/package.hpp>
#include <CLI/CLI.hpp>

namespace buckle::cli::commands {

namespace {

int cmd_apply(const GlobalOptions& opts) {
    ExecutionPlan plan;
    if (!resolve_plan(opts, plan)) {
        return 1;
    }

    if (plan.order.empty()) {
        log::logger()->warn("no packages found under {}", join_path(plan.config_root, PACKAGES_DIR));
    }

    auto outcome = apply(plan);
    if (outcome.isErr()) {
        print_error(outcome.error(), opts.json);
        return 1;
    }

    const Outcome& result = outcome.value();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["applied"] = result.applied;
        j["files_written"] = result.files_written;
        j["scripts_run"] = result.scripts_run;
        output_json(j);
    } else {
        print_success("Applied " + std::to_string(result.applied.size()) + " package(s): " +
                      std::to_string(result.files_written) + " file(s) written, " +
                      std::to_string(result.scripts_run) + " script(s) run",
                      opts.json);
    }

    return 0;
}

} // anonymous namespace

void setup_apply(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        init_cli_logging(opts);
        finish(cmd_apply(opts));
    });
}

} // namespace buckle::cli::commands
