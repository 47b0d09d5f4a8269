/**
 * Mender CLI - Entry Point
 *
 * Validate, run and test logic programs, and build them through the
 * repair loop.
 */

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "common.hpp"

#ifndef MENDER_VERSION
#define MENDER_VERSION "0.1.0"
#endif

// Forward declarations for commands
namespace mender::cli::commands {
    void setup_validate(CLI::App* app, GlobalOptions& opts);
    void setup_run(CLI::App* app, GlobalOptions& opts);
    void setup_test(CLI::App* app, GlobalOptions& opts);
    void setup_build(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace mender::cli;

    // Logs on stderr, results on stdout
    spdlog::set_default_logger(spdlog::stderr_color_mt("mender"));
    spdlog::set_pattern("[%l] %v");

    CLI::App app{"mender - build and repair small logic programs"};
    app.set_version_flag("-V,--version", MENDER_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config_path, "Loop configuration file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* validate_cmd = app.add_subcommand("validate", "Check a program's structure");
    commands::setup_validate(validate_cmd, opts);

    auto* run_cmd = app.add_subcommand("run", "Run a program on one input");
    commands::setup_run(run_cmd, opts);

    auto* test_cmd = app.add_subcommand("test", "Run a program against test cases");
    commands::setup_test(test_cmd, opts);

    auto* build_cmd = app.add_subcommand("build", "Generate, test and repair a program");
    commands::setup_build(build_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
