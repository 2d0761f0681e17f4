/**
 * Buckle CLI - Common utilities and types
 */

#pragma once

#include <buckle/error.hpp>
#include <buckle/logging.hpp>
#include <buckle/orchestrator.hpp>
#include <buckle/platform.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

namespace buckle::cli {

constexpr const char* CONFIG_ENV = "BUCKLE_CONFIG";

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config_root;       // -c, --config (or BUCKLE_CONFIG)
    std::string target_root;       // --target-root
    std::string log_file;          // --log-file
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

inline void init_cli_logging(const GlobalOptions& opts) {
    log::LoggingOptions logging;
    logging.verbose = opts.verbose;
    logging.quiet = opts.quiet;
    logging.log_file = opts.log_file;
    log::init_logging(logging);
}

/**
 * Flush the log (joining the async file writer) and exit.
 */
[[noreturn]] inline void finish(int code) {
    log::shutdown_logging();
    std::exit(code);
}

/**
 * Output utilities. Everything printed here passes through the secret
 * redactor, since error messages can carry script output.
 */
inline void print_error(const Error& error, bool json_mode) {
    std::string message = log::default_redactor()->redact(error.message());

    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"]["kind"] = error.kind_name();
        j["error"]["message"] = message;
        if (!error.package_id().empty()) j["error"]["package"] = error.package_id();
        if (!error.path().empty()) j["error"]["path"] = error.path();
        if (error.line() > 0) j["error"]["line"] = error.line();
        std::cout << j.dump(2) << std::endl;
    } else {
        Error redacted(error.code(), message);
        redacted.withPath(error.path()).withPackage(error.package_id()).withLine(error.line());
        std::cerr << redacted.toString() << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << log::default_redactor()->redact(j.dump(2)) << std::endl;
}

/**
 * Resolve an execution plan for the configured root, printing any error.
 * Returns false when the command should exit with status 1.
 */
inline bool resolve_plan(const GlobalOptions& opts, ExecutionPlan& plan) {
    if (opts.config_root.empty()) {
        print_error(Error(ErrorCode::CONFIGURATION_ERROR,
                          "no configuration directory provided; pass --config or set " +
                          std::string(CONFIG_ENV)),
                    opts.json);
        return false;
    }

    OrchestratorOptions options;
    options.target_root = opts.target_root;

    auto resolved = resolve(opts.config_root, options);
    if (resolved.isErr()) {
        print_error(resolved.error(), opts.json);
        return false;
    }

    plan = std::move(resolved.value());
    return true;
}

} // namespace buckle::cli
