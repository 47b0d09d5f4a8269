/**
 * Mender CLI - validate command
 *
 * Structural validation of a program file.
 */

#include "../common.hpp"
#include <mender/program_json.hpp>
#include <CLI/CLI.hpp>

namespace mender::cli::commands {

namespace {

struct ValidateOptions {
    std::string program_path;
};

int cmd_validate(const GlobalOptions& opts, const ValidateOptions& validate_opts) {
    if (!init_command(opts)) {
        return 1;
    }

    auto j = load_json_file(validate_opts.program_path, opts.json);
    if (!j) {
        return 1;
    }

    auto parsed = mender::program_from_json(*j);
    if (!parsed.ok) {
        print_error("invalid program: " + parsed.error, opts.json);
        return 1;
    }
    for (const auto& w : parsed.warnings) {
        print_warning(w);
    }

    if (opts.json) {
        mender::Document out;
        out["ok"] = true;
        out["steps"] = parsed.value.steps.size();
        if (!parsed.value.definition.name.empty()) {
            out["name"] = parsed.value.definition.name;
        }
        output_json(out);
    } else {
        std::cout << "Valid program: " << parsed.value.steps.size() << " steps" << std::endl;
        for (const auto& step : parsed.value.steps) {
            std::cout << "  " << step.id << " ("
                      << mender::op_kind_to_string(mender::operation_kind(step.operation))
                      << ") -> " << step.output_path << std::endl;
        }
    }
    return 0;
}

} // namespace

void setup_validate(CLI::App* app, GlobalOptions& opts) {
    static ValidateOptions validate_opts;

    app->add_option("program", validate_opts.program_path, "Program JSON file")->required();

    app->callback([&opts]() { std::exit(cmd_validate(opts, validate_opts)); });
}

} // namespace mender::cli::commands
