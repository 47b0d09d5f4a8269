#include "mender/harness.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <thread>

#include <spdlog/spdlog.h>

namespace mender {

namespace {

std::string expected_key_path(const std::string& key) {
    if (!key.empty() && key[0] == '/') {
        return key;
    }
    return "/" + escape_segment(key);
}

// The step that last wrote `path`, so a mismatch can be blamed on it
const Step* writer_of(const Program& program, const std::string& path) {
    for (auto it = program.steps.rbegin(); it != program.steps.rend(); ++it) {
        if (it->output_path == path) {
            return &*it;
        }
    }
    return nullptr;
}

StepError check_failure(const Program& program, ErrorKind kind, const std::string& path,
                        std::string message) {
    StepError error;
    error.kind = kind;
    error.path = path;
    error.message = std::move(message);
    const Step* step = writer_of(program, path);
    if (step) {
        error.step_id = step->id;
        error.op = operation_kind(step->operation);
    }
    return error;
}

std::optional<StepError> check_expectations(const Program& program, const TestCase& tc,
                                            const Document& document, double tolerance) {
    if (tc.expected_output) {
        for (auto it = tc.expected_output->begin(); it != tc.expected_output->end(); ++it) {
            // Outputs are read literally; an input echoed under /inputs never counts
            std::string path = expected_key_path(it.key());
            Resolution r = lookup(document, path);
            if (!r.found()) {
                return check_failure(program, ErrorKind::path_not_found, path,
                                     "expected output key '" + it.key() + "' is missing");
            }
            if (!values_match(it.value(), *r.value, tolerance)) {
                return check_failure(program, ErrorKind::output_mismatch, path,
                                     "expected " + truncate_json(it.value()) + ", got " +
                                     truncate_json(*r.value));
            }
        }
    }

    for (const auto& key : tc.expected_output_keys) {
        std::string path = expected_key_path(key);
        if (!lookup(document, path).found()) {
            return check_failure(program, ErrorKind::path_not_found, path,
                                 "expected output key '" + key + "' is missing");
        }
    }

    return std::nullopt;
}

void log_outcome(const TestCase& tc, const Outcome& outcome) {
    if (outcome.passed) {
        spdlog::info("  Test '{}' passed", tc.name);
        spdlog::info("    Input:  {}", truncate_json(tc.input));
        if (outcome.state == RunState::Completed) {
            spdlog::info("    Output: {}", truncate_json(outcome.output));
        }
    } else {
        spdlog::error("  Test '{}' failed: {}", tc.name, outcome.error->toString());
    }
}

} // namespace

// ============================================================================
// Reports
// ============================================================================

size_t HarnessReport::passed_count() const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                             [](const Outcome& o) { return o.passed; }));
}

ErrorReport HarnessReport::error_report() const {
    ErrorReport report;
    report.total_cases = outcomes.size();
    for (const auto& outcome : outcomes) {
        if (!outcome.passed) {
            report.failures.push_back(outcome);
        }
    }
    return report;
}

std::string ErrorReport::summary() const {
    std::string out;
    for (const auto& failure : failures) {
        if (!out.empty()) out += "\n";
        if (failure.case_name.empty()) {
            out += failure.error ? failure.error->toString() : std::string("failed");
        } else {
            out += "Test '" + failure.case_name + "' failed: " +
                   (failure.error ? failure.error->toString() : std::string("unknown error"));
        }
    }
    return out;
}

ErrorReport make_candidate_report(ErrorKind kind, const std::string& message) {
    Outcome outcome;
    outcome.passed = false;
    outcome.state = RunState::Failed;
    StepError error;
    error.kind = kind;
    error.message = message;
    outcome.error = std::move(error);

    ErrorReport report;
    report.failures.push_back(std::move(outcome));
    return report;
}

Document step_error_to_json(const StepError& error) {
    Document j = Document::object();
    j["kind"] = error_kind_to_string(error.kind);
    if (!error.step_id.empty()) j["step_id"] = error.step_id;
    if (error.op) j["op"] = op_kind_to_string(*error.op);
    if (!error.path.empty()) j["path"] = error.path;
    j["message"] = error.message;
    return j;
}

Document outcome_to_json(const Outcome& outcome) {
    Document j = Document::object();
    j["case_index"] = outcome.case_index;
    j["case_name"] = outcome.case_name;
    j["passed"] = outcome.passed;
    j["state"] = run_state_to_string(outcome.state);
    if (outcome.error) {
        j["error"] = step_error_to_json(*outcome.error);
    }
    if (outcome.state == RunState::Completed) {
        j["output"] = outcome.output;
    }
    return j;
}

Document error_report_to_json(const ErrorReport& report) {
    Document j = Document::object();
    j["total_cases"] = report.total_cases;
    Document failures = Document::array();
    for (const auto& f : report.failures) {
        failures.push_back(outcome_to_json(f));
    }
    j["failures"] = std::move(failures);
    return j;
}

std::string truncate_json(const Document& j, size_t limit) {
    std::string s = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (s.size() > limit) {
        return s.substr(0, limit) + "... (len: " + std::to_string(s.size()) + ")";
    }
    return s;
}

// ============================================================================
// Comparison
// ============================================================================

bool values_match(const Document& expected, const Document& actual, double tolerance) {
    if (expected.is_number() && actual.is_number()) {
        double a = expected.get<double>();
        double b = actual.get<double>();
        if (a == b) return true;
        double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
        return std::fabs(a - b) <= tolerance * scale;
    }
    if (expected.is_object() && actual.is_object()) {
        if (expected.size() != actual.size()) return false;
        for (auto it = expected.begin(); it != expected.end(); ++it) {
            auto found = actual.find(it.key());
            if (found == actual.end() || !values_match(it.value(), *found, tolerance)) {
                return false;
            }
        }
        return true;
    }
    if (expected.is_array() && actual.is_array()) {
        if (expected.size() != actual.size()) return false;
        for (size_t i = 0; i < expected.size(); ++i) {
            if (!values_match(expected[i], actual[i], tolerance)) return false;
        }
        return true;
    }
    return expected == actual;
}

// ============================================================================
// Execution
// ============================================================================

Outcome run_case(const Program& program, const TestCase& test_case, size_t index,
                 double tolerance) {
    Outcome outcome;
    outcome.case_index = index;
    outcome.case_name = test_case.name;

    RunResult run = interpret(program, make_runtime_document(test_case.input));
    outcome.state = run.state;

    if (run.completed()) {
        outcome.output = extract_output(run.document, program.definition.output_schema);
        if (test_case.expect_failure) {
            StepError error;
            error.kind = ErrorKind::unexpected_completion;
            error.message = "program completed but the case expects a failure";
            if (test_case.expected_error) {
                error.message += std::string(" (") +
                                 error_kind_to_string(*test_case.expected_error) + ")";
            }
            outcome.error = std::move(error);
            return outcome;
        }
        outcome.error = check_expectations(program, test_case, run.document, tolerance);
        outcome.passed = !outcome.error.has_value();
        return outcome;
    }

    if (test_case.expect_failure &&
        (!test_case.expected_error || *test_case.expected_error == run.error->kind)) {
        outcome.passed = true;
        return outcome;
    }

    outcome.error = std::move(run.error);
    if (test_case.expect_failure) {
        outcome.error->message += std::string(" (expected ") +
                                  error_kind_to_string(*test_case.expected_error) + ")";
    }
    return outcome;
}

HarnessReport run_tests(const Program& program, const std::vector<TestCase>& cases,
                        const HarnessOptions& options) {
    HarnessReport report;
    report.outcomes.resize(cases.size());

    size_t workers = std::min(std::max<size_t>(options.parallelism, 1), cases.size());
    if (workers <= 1) {
        for (size_t i = 0; i < cases.size(); ++i) {
            report.outcomes[i] = run_case(program, cases[i], i, options.tolerance);
        }
    } else {
        std::atomic<size_t> next{0};
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            pool.emplace_back([&]() {
                for (size_t i = next.fetch_add(1); i < cases.size(); i = next.fetch_add(1)) {
                    report.outcomes[i] = run_case(program, cases[i], i, options.tolerance);
                }
            });
        }
        for (auto& t : pool) {
            t.join();
        }
    }

    for (size_t i = 0; i < cases.size(); ++i) {
        log_outcome(cases[i], report.outcomes[i]);
    }

    report.all_passed = report.passed_count() == report.outcomes.size();
    return report;
}

} // namespace mender
