/**
 * Buckle CLI - plan command
 *
 * Print the packages, variables, files and tasks apply would process, in
 * order. Config-discovery scripts run; nothing is written to the host.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace buckle::cli::commands {

namespace {

nlohmann::json variables_to_json(const std::vector<VariableReport>& variables) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& var : variables) {
        j.push_back({{"name", var.name}, {"value", var.value}, {"secret", var.is_secret}});
    }
    return j;
}

nlohmann::json report_to_json(const PlanReport& report) {
    nlohmann::json j;
    j["ok"] = true;
    j["variables"] = variables_to_json(report.global_variables);
    j["packages"] = nlohmann::json::array();

    for (const auto& pkg : report.packages) {
        nlohmann::json p;
        p["id"] = pkg.id;
        p["description"] = pkg.description;
        p["needs"] = pkg.needs;
        p["variables"] = variables_to_json(pkg.variables);

        p["files"] = nlohmann::json::array();
        for (const auto& file : pkg.files) {
            p["files"].push_back({
                {"group", file.group},
                {"source", file.source_relative_path},
                {"destination", file.destination_path},
                {"template", file.is_template},
            });
        }
        p["scripts"] = pkg.scripts;
        j["packages"].push_back(std::move(p));
    }

    return j;
}

void print_variable(const std::string& indent, const VariableReport& var) {
    std::cout << indent << "= " << (var.is_secret ? "secret " : "config ")
              << var.name << "=" << var.value << std::endl;
}

void print_report(const PlanReport& report) {
    for (const auto& var : report.global_variables) {
        print_variable(" ", var);
    }

    for (const auto& pkg : report.packages) {
        std::cout << std::endl;
        std::cout << " + package '" << pkg.id << "'" << std::endl;
        for (const auto& var : pkg.variables) {
            print_variable("   ", var);
        }
        for (const auto& file : pkg.files) {
            std::cout << "   + " << (file.is_template ? "template" : "file")
                      << " '" << file.destination_path << "'" << std::endl;
        }
        for (const auto& script : pkg.scripts) {
            std::cout << "   + task '" << script << "'" << std::endl;
        }
    }
}

int cmd_plan(const GlobalOptions& opts) {
    ExecutionPlan plan;
    if (!resolve_plan(opts, plan)) {
        return 1;
    }

    auto report = describe(plan);
    if (report.isErr()) {
        print_error(report.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        output_json(report_to_json(report.value()));
    } else {
        print_report(report.value());
    }

    return 0;
}

} // anonymous namespace

void setup_plan(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        init_cli_logging(opts);
        finish(cmd_plan(opts));
    });
}

} // namespace buckle::cli::commands
