/**
 * Integration tests for resolve + apply
 *
 * Each test builds a config root in a temporary directory and applies it
 * with every file destination re-based under a staging directory. Scripts
 * are real bash scripts, so these tests are POSIX-only.
 */

#include <doctest/doctest.h>
#include <buckle/logging.hpp>
#include <buckle/orchestrator.hpp>

#include "../test_helpers.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <sstream>

#ifndef _WIN32

namespace fs = std::filesystem;

using namespace buckle;
using buckle::test::TempDir;
using buckle::test::read_text;
using buckle::test::write_file;

namespace {

constexpr const char* API_TOKEN = "tok-7f3a9c-do-not-log";

// Config root with two packages: app needs base
class Fixture {
public:
    Fixture() {
        fs::create_directories(markers());

        write_file(root("config/10-paths.env"), "MARKER_DIR=" + markers() + "\n");
        write_file(root("config/20-net.env"), "# network\nIP_ADDRESS=10.0.0.5\nX=1\n");
        write_file(root("secrets/creds.env"), std::string("API_TOKEN=") + API_TOKEN + "\n");

        write_file(root("packages/base/package.yml"),
                   "description: Base system\n"
                   "files:\n"
                   "  etc: /etc/demo\n");
        write_file(root("packages/base/files/etc/app.conf.tpl"),
                   "ip={{ .IP_ADDRESS }}\ntoken={{ .API_TOKEN }}\n");
        write_file(root("packages/base/files/etc/static.txt"), "copied verbatim {{ .NOT_RENDERED }}\n");
        write_file(root("packages/base/scripts/10-record.sh"),
                   "echo base >> \"$MARKER_DIR/order.log\"\n"
                   "printf '%s' \"$API_TOKEN\" > \"$MARKER_DIR/token.seen\"\n"
                   "echo \"token in stdout: $API_TOKEN\"\n"
                   "echo \"token in stderr: $API_TOKEN\" >&2\n");

        write_file(root("packages/app/package.yml"),
                   "description: The application\n"
                   "needs: [base]\n");
        write_file(root("packages/app/scripts/10-record.sh"),
                   "echo app >> \"$MARKER_DIR/order.log\"\n");
    }

    std::string root(const std::string& rel = "") const { return temp_.path("root/" + rel); }
    std::string stage(const std::string& rel = "") const { return temp_.path("stage/" + rel); }
    std::string markers(const std::string& rel = "") const { return temp_.path("markers/" + rel); }

    OrchestratorOptions options() const {
        OrchestratorOptions opts;
        opts.target_root = stage();
        return opts;
    }

private:
    TempDir temp_{"buckle_it_"};
};

// Capture everything the buckle logger emits, at debug level
class LogCapture {
public:
    LogCapture() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_);
        sink->set_pattern("%l %v");
        log::init_logging_with_sink(sink, spdlog::level::debug);
    }

    // The stream dies with us; detach it from the logger first
    ~LogCapture() {
        log::init_logging_with_sink(std::make_shared<spdlog::sinks::null_sink_mt>(),
                                    spdlog::level::off);
    }

    std::string text() {
        log::logger()->flush();
        return stream_.str();
    }

private:
    std::ostringstream stream_;
};

Result<Outcome> resolve_and_apply(const Fixture& fx) {
    auto plan = resolve(fx.root(), fx.options());
    if (plan.isErr()) return Result<Outcome>::err(plan.error());
    return apply(plan.value());
}

} // namespace

TEST_CASE("apply deploys files and runs scripts in dependency order") {
    Fixture fx;
    LogCapture logs;

    auto plan = resolve(fx.root(), fx.options());
    REQUIRE(plan.isOk());
    CHECK(plan.value().ordered_ids() == std::vector<std::string>{"base", "app"});

    auto outcome = apply(plan.value());
    REQUIRE_MESSAGE(outcome.isOk(), (outcome.isErr() ? outcome.error().toString() : ""));
    CHECK(outcome.value().applied == std::vector<std::string>{"base", "app"});
    CHECK(outcome.value().files_written == 2);
    CHECK(outcome.value().scripts_run == 2);

    CHECK(read_text(fx.stage("etc/demo/app.conf")) ==
          std::string("ip=10.0.0.5\ntoken=") + API_TOKEN + "\n");
    CHECK(read_text(fx.stage("etc/demo/static.txt")) == "copied verbatim {{ .NOT_RENDERED }}\n");
    CHECK_FALSE(fs::exists(fx.stage("etc/demo/app.conf.tpl")));
    CHECK(read_text(fx.markers("order.log")) == "base\napp\n");

    std::string text = logs.text();
    CHECK(text.find(" + package 'base'") != std::string::npos);
    CHECK(text.find("   + template '") != std::string::npos);
    CHECK(text.find("   + task '10-record.sh'") != std::string::npos);
}

TEST_CASE("scripts run after the package's files are deployed") {
    Fixture fx;
    write_file(fx.root("packages/base/scripts/05-check.sh"),
               "conf=\"$BUCKLE_STAGE/etc/demo/app.conf\"\n"
               "test -f \"$conf\" || { echo \"missing $conf\" >&2; exit 1; }\n"
               "cat \"$conf\" > \"$MARKER_DIR/conf.seen\"\n");
    write_file(fx.root("config/30-stage.env"), "BUCKLE_STAGE=" + fx.stage() + "\n");

    auto outcome = resolve_and_apply(fx);
    REQUIRE_MESSAGE(outcome.isOk(), (outcome.isErr() ? outcome.error().toString() : ""));
    CHECK(read_text(fx.markers("conf.seen")) ==
          std::string("ip=10.0.0.5\ntoken=") + API_TOKEN + "\n");
}

TEST_CASE("secrets never reach the log but do reach child processes") {
    Fixture fx;
    LogCapture logs;

    auto outcome = resolve_and_apply(fx);
    REQUIRE(outcome.isOk());

    CHECK(read_text(fx.markers("token.seen")) == API_TOKEN);

    std::string text = logs.text();
    CHECK(text.find(API_TOKEN) == std::string::npos);
    CHECK(text.find("token in stdout: ******") != std::string::npos);
    CHECK(text.find("token in stderr: ******") != std::string::npos);
    CHECK(text.find("secret API_TOKEN=******") != std::string::npos);
}

TEST_CASE("variables follow the four-layer precedence") {
    Fixture fx;
    write_file(fx.root("secrets/x.env"), "X=2\n");
    write_file(fx.root("packages/app/scripts/20-x.sh"), "printf '%s' \"$X\" > \"$MARKER_DIR/x.value\"\n");

    SUBCASE("package secrets win") {
        write_file(fx.root("packages/app/config/x.env"), "X=3\n");
        write_file(fx.root("packages/app/secrets/x.env"), "X=4\n");
        REQUIRE(resolve_and_apply(fx).isOk());
        CHECK(read_text(fx.markers("x.value")) == "4");
    }

    SUBCASE("package config beats global secrets") {
        write_file(fx.root("packages/app/config/x.env"), "X=3\n");
        REQUIRE(resolve_and_apply(fx).isOk());
        CHECK(read_text(fx.markers("x.value")) == "3");
    }

    SUBCASE("global secrets beat global config") {
        REQUIRE(resolve_and_apply(fx).isOk());
        CHECK(read_text(fx.markers("x.value")) == "2");
    }
}

TEST_CASE("package config scripts see the global variables") {
    Fixture fx;
    write_file(fx.root("packages/app/config/derived.sh"), "echo \"LISTEN=$IP_ADDRESS:8080\"\n");
    write_file(fx.root("packages/app/files/conf/listen.tpl"), "{{ .LISTEN }}");
    write_file(fx.root("packages/app/package.yml"),
               "description: The application\nneeds: [base]\nfiles:\n  conf: /etc/app\n");

    REQUIRE(resolve_and_apply(fx).isOk());
    CHECK(read_text(fx.stage("etc/app/listen")) == "10.0.0.5:8080");
}

TEST_CASE("a failing config-discovery script aborts before any package runs") {
    Fixture fx;
    write_file(fx.root("config/30-probe.sh"), "echo 'probe failed' >&2\nexit 2\n");

    auto orchestrator = Orchestrator::create(fx.root(), fx.options());
    auto plan = orchestrator->resolve();
    REQUIRE(plan.isErr());
    CHECK(plan.error().code() == ErrorCode::EXECUTION_ERROR);
    CHECK(plan.error().message().find("probe failed") != std::string::npos);
    CHECK(orchestrator->state() == State::Failed);
    CHECK_FALSE(fs::exists(fx.markers("order.log")));
    CHECK_FALSE(fs::exists(fx.stage()));
}

TEST_CASE("re-applying overwrites files identically and re-runs every script") {
    Fixture fx;

    REQUIRE(resolve_and_apply(fx).isOk());
    std::string first = read_text(fx.stage("etc/demo/app.conf"));

    write_file(fx.stage("etc/demo/static.txt"), "locally modified\n");

    REQUIRE(resolve_and_apply(fx).isOk());
    CHECK(read_text(fx.stage("etc/demo/app.conf")) == first);
    CHECK(read_text(fx.stage("etc/demo/static.txt")) == "copied verbatim {{ .NOT_RENDERED }}\n");
    CHECK(read_text(fx.markers("order.log")) == "base\napp\nbase\napp\n");
}

TEST_CASE("a failing package stops the run and earlier packages stay applied") {
    Fixture fx;
    write_file(fx.root("packages/app/scripts/20-fail.sh"), "echo 'disk full' >&2\nexit 5\n");
    write_file(fx.root("packages/zzz/package.yml"), "description: runs last\n");
    write_file(fx.root("packages/zzz/scripts/run.sh"), "echo zzz >> \"$MARKER_DIR/order.log\"\n");

    auto orchestrator = Orchestrator::create(fx.root(), fx.options());
    auto plan = orchestrator->resolve();
    REQUIRE(plan.isOk());
    CHECK(orchestrator->state() == State::PlanResolved);

    auto outcome = orchestrator->apply(plan.value());
    REQUIRE(outcome.isErr());
    CHECK(outcome.error().code() == ErrorCode::EXECUTION_ERROR);
    CHECK(outcome.error().package_id() == "app");
    CHECK(outcome.error().message().find("disk full") != std::string::npos);
    CHECK(orchestrator->state() == State::Failed);
    CHECK(orchestrator->failure().find("ExecutionError") == 0);

    CHECK(read_text(fx.markers("order.log")) == "base\napp\n");
    CHECK(fs::exists(fx.stage("etc/demo/app.conf")));
}

TEST_CASE("a template error fails the package before its files are written") {
    Fixture fx;
    write_file(fx.root("packages/app/files/conf/bad.tpl"), "ok\n{{ .UNDEFINED_VARIABLE }}\n");
    write_file(fx.root("packages/app/package.yml"),
               "description: The application\nneeds: [base]\nfiles:\n  conf: /etc/app\n");

    auto outcome = resolve_and_apply(fx);
    REQUIRE(outcome.isErr());
    CHECK(outcome.error().code() == ErrorCode::TEMPLATE_ERROR);
    CHECK(outcome.error().package_id() == "app");
    CHECK(outcome.error().line() == 2);
    CHECK_FALSE(fs::exists(fx.stage("etc/app")));
    CHECK(read_text(fx.markers("order.log")) == "base\n");
}

TEST_CASE("circular needs are rejected at resolve time") {
    Fixture fx;
    write_file(fx.root("packages/base/package.yml"), "description: Base system\nneeds: [app]\n");

    auto plan = resolve(fx.root(), fx.options());
    REQUIRE(plan.isErr());
    CHECK(plan.error().code() == ErrorCode::DEPENDENCY_ERROR);
    CHECK(plan.error().message().find("app -> base -> app") != std::string::npos);
}

TEST_CASE("unknown needs are rejected at resolve time") {
    Fixture fx;
    write_file(fx.root("packages/app/package.yml"), "description: x\nneeds: [base, postgres]\n");

    auto plan = resolve(fx.root(), fx.options());
    REQUIRE(plan.isErr());
    CHECK(plan.error().code() == ErrorCode::DEPENDENCY_ERROR);
    CHECK(plan.error().message().find("postgres") != std::string::npos);
}

TEST_CASE("a config root without packages resolves to an empty plan") {
    TempDir temp;
    write_file(temp.path("config/a.env"), "A=1\n");

    auto plan = resolve(temp.path());
    REQUIRE(plan.isOk());
    CHECK(plan.value().order.empty());
    CHECK(plan.value().global_variables.find("A")->value == "1");

    auto outcome = apply(plan.value());
    REQUIRE(outcome.isOk());
    CHECK(outcome.value().applied.empty());
}

TEST_CASE("a missing config root is an IO error") {
    TempDir temp;
    auto plan = resolve(temp.path("does-not-exist"));
    REQUIRE(plan.isErr());
    CHECK(plan.error().code() == ErrorCode::IO_ERROR);
}

TEST_CASE("describe reports the plan without touching the host") {
    Fixture fx;
    write_file(fx.root("packages/app/secrets/db.env"), "DB_PASSWORD=pg-secret-value\n");
    write_file(fx.root("packages/app/config/app.env"), "PORT=8080\n");

    auto plan = resolve(fx.root(), fx.options());
    REQUIRE(plan.isOk());

    auto report = describe(plan.value());
    REQUIRE(report.isOk());

    bool saw_masked_token = false;
    for (const auto& var : report.value().global_variables) {
        if (var.name == "API_TOKEN") {
            saw_masked_token = var.is_secret && var.value == "******";
        }
    }
    CHECK(saw_masked_token);

    REQUIRE(report.value().packages.size() == 2);
    const auto& base = report.value().packages[0];
    CHECK(base.id == "base");
    REQUIRE(base.files.size() == 2);
    CHECK(base.files[0].is_template);
    CHECK(base.files[0].destination_path == to_portable_path(fx.stage()) + "etc/demo/app.conf");
    CHECK(base.scripts == std::vector<std::string>{"10-record.sh"});

    const auto& app = report.value().packages[1];
    CHECK(app.needs == std::vector<std::string>{"base"});
    REQUIRE(app.variables.size() == 2);
    CHECK(app.variables[0].name == "DB_PASSWORD");
    CHECK(app.variables[0].value == "******");
    CHECK(app.variables[1].name == "PORT");
    CHECK(app.variables[1].value == "8080");

    CHECK_FALSE(fs::exists(fx.stage()));
    CHECK_FALSE(fs::exists(fx.markers("order.log")));
}

#endif
