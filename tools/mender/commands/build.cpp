/**
 * Mender CLI - build command
 *
 * Run the full pipeline: architecture, drafting, QA, then test and repair
 * until the program is deployed or abandoned.
 */

#include "../common.hpp"
#include <mender/pipeline.hpp>
#include <mender/process_collaborator.hpp>
#include <mender/program_json.hpp>
#include <CLI/CLI.hpp>

namespace mender::cli::commands {

namespace {

struct BuildOptions {
    std::string request;
    std::string architect_cmd;
    std::string developer_cmd;
    std::string qa_cmd;
    std::string fixer_cmd;
    std::string program_path;
    std::string cases_path;
    std::string definition_path;
    std::string out_path;
    int max_attempts = -1;   // -1 keeps the configured value
    long long timeout_ms = -1;
};

void print_history(const mender::RepairResult& result) {
    for (const auto& attempt : result.history) {
        std::cout << "  #" << attempt.number << "  "
                  << mender::attempt_status_to_string(attempt.status) << std::endl;
        for (const auto& failure : attempt.report.failures) {
            std::cout << "      " << (failure.case_name.empty() ? "" : failure.case_name + ": ")
                      << (failure.error ? failure.error->toString() : std::string("failed"))
                      << std::endl;
        }
    }
}

int cmd_build(const GlobalOptions& opts, const BuildOptions& build_opts) {
    auto config = init_command(opts);
    if (!config) {
        return 1;
    }
    if (build_opts.max_attempts >= 0) {
        config->max_attempts = static_cast<size_t>(build_opts.max_attempts);
    }
    if (build_opts.timeout_ms >= 0) {
        config->collaborator_timeout = std::chrono::milliseconds(build_opts.timeout_ms);
    }

    auto statics = mender::load_static_collaborator(
        build_opts.definition_path, build_opts.program_path, build_opts.cases_path);
    if (statics.isErr()) {
        print_error(statics.error().message, opts.json);
        return 1;
    }
    auto fixed = statics.value();

    auto process = [&config](const std::string& command) {
        return std::make_shared<mender::ProcessCollaborator>(command, config->collaborator_timeout);
    };

    // A static file wins over a command for the same role
    std::shared_ptr<mender::Architect> architect;
    if (fixed->has_definition()) {
        architect = fixed;
    } else if (!build_opts.architect_cmd.empty()) {
        architect = process(build_opts.architect_cmd);
    }
    std::shared_ptr<mender::Developer> developer;
    if (fixed->has_program()) {
        developer = fixed;
    } else if (!build_opts.developer_cmd.empty()) {
        developer = process(build_opts.developer_cmd);
    }
    std::shared_ptr<mender::QA> qa;
    if (fixed->has_test_cases()) {
        qa = fixed;
    } else if (!build_opts.qa_cmd.empty()) {
        qa = process(build_opts.qa_cmd);
    }
    std::shared_ptr<mender::Fixer> fixer;
    if (!build_opts.fixer_cmd.empty()) {
        fixer = process(build_opts.fixer_cmd);
    }

    if (!architect) {
        print_error("no architect: pass --architect or --definition", opts.json);
        return 1;
    }
    if (!developer) {
        print_error("no developer: pass --developer or --program", opts.json);
        return 1;
    }
    if (!qa) {
        print_error("no QA: pass --qa or --cases", opts.json);
        return 1;
    }
    if (!fixer) {
        print_error("no fixer: pass --fixer", opts.json);
        return 1;
    }

    mender::Pipeline pipeline(architect, developer, qa, fixer, *config);
    auto result = pipeline.build(build_opts.request);
    auto result_json = mender::repair_result_to_json(result);

    if (!build_opts.out_path.empty()) {
        if (!mender::fs::write_file(build_opts.out_path, result_json.dump(2) + "\n")) {
            print_error("cannot write " + build_opts.out_path, opts.json);
            return 1;
        }
    }

    if (opts.json) {
        mender::Document out = result_json;
        out["ok"] = result.deployed();
        output_json(out);
    } else if (result.deployed()) {
        std::cout << "Deployed after " << result.attempts << " repair attempt(s)" << std::endl;
        std::cout << mender::program_to_json(*result.program).dump(2) << std::endl;
    } else {
        std::cout << "Abandoned: " << result.reason << std::endl;
        print_history(result);
    }
    return result.deployed() ? 0 : 1;
}

} // namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    static BuildOptions build_opts;

    app->add_option("request", build_opts.request, "What the program should do")->required();
    app->add_option("--architect", build_opts.architect_cmd, "Command proposing the app definition");
    app->add_option("--developer", build_opts.developer_cmd, "Command drafting the program");
    app->add_option("--qa", build_opts.qa_cmd, "Command proposing test cases");
    app->add_option("--fixer", build_opts.fixer_cmd, "Command repairing a failing program");
    app->add_option("--definition", build_opts.definition_path, "Use this app definition file");
    app->add_option("--program", build_opts.program_path, "Use this program file as the draft");
    app->add_option("--cases", build_opts.cases_path, "Use this test cases file");
    app->add_option("--max-attempts", build_opts.max_attempts, "Repair attempts after the draft");
    app->add_option("--timeout-ms", build_opts.timeout_ms, "Per-call collaborator timeout");
    app->add_option("-o,--out", build_opts.out_path, "Write the result JSON here");

    app->callback([&opts]() { std::exit(cmd_build(opts, build_opts)); });
}

} // namespace mender::cli::commands
