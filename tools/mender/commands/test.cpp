/**
 * Mender CLI - test command
 *
 * Run a program against a test-case file through the harness.
 */

#include "../common.hpp"
#include <mender/harness.hpp>
#include <mender/program_json.hpp>
#include <CLI/CLI.hpp>

namespace mender::cli::commands {

namespace {

struct TestOptions {
    std::string program_path;
    std::string cases_path;
    size_t jobs = 0;  // 0 keeps the configured parallelism
};

int cmd_test(const GlobalOptions& opts, const TestOptions& test_opts) {
    auto config = init_command(opts);
    if (!config) {
        return 1;
    }

    auto program_json = load_json_file(test_opts.program_path, opts.json);
    if (!program_json) {
        return 1;
    }
    auto program = mender::program_from_json(*program_json);
    if (!program.ok) {
        print_error("invalid program: " + program.error, opts.json);
        return 1;
    }

    auto cases_json = load_json_file(test_opts.cases_path, opts.json);
    if (!cases_json) {
        return 1;
    }
    auto cases = mender::test_cases_from_json(*cases_json);
    if (!cases.ok) {
        print_error("invalid test cases: " + cases.error, opts.json);
        return 1;
    }
    for (const auto& w : cases.warnings) {
        print_warning(w);
    }

    mender::HarnessOptions harness = config->harness;
    if (test_opts.jobs > 0) {
        harness.parallelism = test_opts.jobs;
    }

    auto report = mender::run_tests(program.value, cases.value, harness);

    if (opts.json) {
        mender::Document out;
        out["ok"] = report.all_passed;
        out["passed"] = report.passed_count();
        out["total"] = report.outcomes.size();
        mender::Document outcomes = mender::Document::array();
        for (const auto& outcome : report.outcomes) {
            outcomes.push_back(mender::outcome_to_json(outcome));
        }
        out["outcomes"] = std::move(outcomes);
        output_json(out);
    } else {
        for (const auto& outcome : report.outcomes) {
            if (outcome.passed) {
                std::cout << "PASS  " << outcome.case_name << std::endl;
            } else {
                std::cout << "FAIL  " << outcome.case_name << ": "
                          << outcome.error->toString() << std::endl;
            }
        }
        std::cout << report.passed_count() << "/" << report.outcomes.size()
                  << " cases passed" << std::endl;
    }
    return report.all_passed ? 0 : 1;
}

} // namespace

void setup_test(CLI::App* app, GlobalOptions& opts) {
    static TestOptions test_opts;

    app->add_option("program", test_opts.program_path, "Program JSON file")->required();
    app->add_option("cases", test_opts.cases_path, "Test cases JSON file")->required();
    app->add_option("-j,--jobs", test_opts.jobs, "Cases to run in parallel");

    app->callback([&opts]() { std::exit(cmd_test(opts, test_opts)); });
}

} // namespace mender::cli::commands
