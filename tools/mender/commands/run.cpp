/**
 * Mender CLI - run command
 *
 * Interpret a program on a single input document.
 */

#include "../common.hpp"
#include <mender/harness.hpp>
#include <mender/interpreter.hpp>
#include <mender/program_json.hpp>
#include <CLI/CLI.hpp>

namespace mender::cli::commands {

namespace {

struct RunOptions {
    std::string program_path;
    std::string input_path;
    std::string schema_path;
    bool full = false;
};

int cmd_run(const GlobalOptions& opts, const RunOptions& run_opts) {
    if (!init_command(opts)) {
        return 1;
    }

    auto program_json = load_json_file(run_opts.program_path, opts.json);
    if (!program_json) {
        return 1;
    }
    auto parsed = mender::program_from_json(*program_json);
    if (!parsed.ok) {
        print_error("invalid program: " + parsed.error, opts.json);
        return 1;
    }
    mender::Program program = std::move(parsed.value);

    if (!run_opts.schema_path.empty()) {
        auto schema = load_json_file(run_opts.schema_path, opts.json);
        if (!schema) {
            return 1;
        }
        program.definition.output_schema = std::move(*schema);
    }

    auto input = load_json_file(run_opts.input_path, opts.json);
    if (!input) {
        return 1;
    }

    auto result = mender::interpret(program, mender::make_runtime_document(std::move(*input)));

    if (result.failed()) {
        if (opts.json) {
            mender::Document out;
            out["ok"] = false;
            out["state"] = mender::run_state_to_string(result.state);
            out["steps_executed"] = result.steps_executed;
            out["error"] = mender::step_error_to_json(*result.error);
            output_json(out);
        } else {
            std::cerr << "Error: " << result.error->toString() << std::endl;
        }
        return 1;
    }

    mender::Document output = run_opts.full
        ? result.document
        : mender::extract_output(result.document, program.definition.output_schema);

    if (opts.json) {
        mender::Document out;
        out["ok"] = true;
        out["state"] = mender::run_state_to_string(result.state);
        out["steps_executed"] = result.steps_executed;
        out["output"] = output;
        output_json(out);
    } else {
        std::cout << output.dump(2) << std::endl;
    }
    return 0;
}

} // namespace

void setup_run(CLI::App* app, GlobalOptions& opts) {
    static RunOptions run_opts;

    app->add_option("program", run_opts.program_path, "Program JSON file")->required();
    app->add_option("input", run_opts.input_path, "Input JSON file")->required();
    app->add_option("--schema", run_opts.schema_path, "Output schema selecting the result keys");
    app->add_flag("--full", run_opts.full, "Print the whole final document");

    app->callback([&opts]() { std::exit(cmd_run(opts, run_opts)); });
}

} // namespace mender::cli::commands
