/**
 * Buckle CLI - Entry Point
 *
 * Applies dependency-ordered packages to bootstrap the local host.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace buckle::cli::commands {
    void setup_plan(CLI::App* app, GlobalOptions& opts);
    void setup_apply(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace buckle::cli;

    CLI::App app{"buckle - host bootstrapping from composable packages"};
    app.set_version_flag("-V,--version", BUCKLE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("-c,--config", opts.config_root, "Buckle configuration directory")
        ->envname(CONFIG_ENV);
    app.add_option("--target-root", opts.target_root,
                   "Re-base every file destination under this directory");
    app.add_option("--log-file", opts.log_file, "Also write the (redacted) log to this file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug output, including script output");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Commands
    auto* plan_cmd = app.add_subcommand("plan", "Show what apply would do");
    commands::setup_plan(plan_cmd, opts);

    auto* apply_cmd = app.add_subcommand("apply", "Apply the configuration to this host");
    commands::setup_apply(apply_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
