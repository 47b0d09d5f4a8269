#pragma once

#include "mender/document.hpp"
#include "mender/interpreter.hpp"
#include "mender/program.hpp"
#include "mender/program_json.hpp"
#include "mender/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mender {

// ============================================================================
// Test Cases
// ============================================================================

/**
 * @brief One (input, expected outcome) pair
 *
 * Expectations, checked against the final document on completion:
 * - expected_output: every key must resolve to a matching value
 * - expected_output_keys: every key must resolve
 * - expect_failure: the run must fail, with expected_error if set
 */
struct TestCase {
    std::string name;
    Document input = Document::object();
    std::optional<Document> expected_output;
    std::vector<std::string> expected_output_keys;
    bool expect_failure = false;
    std::optional<ErrorKind> expected_error;
};

// Accepts an array of cases or {"tests": [...]} / {"test_cases": [...]}.
// A case input given as a JSON string is parsed when it holds valid JSON.
ParseResult<std::vector<TestCase>> parse_test_cases(const std::string& json_str);
ParseResult<std::vector<TestCase>> test_cases_from_json(const Document& j);

Document test_case_to_json(const TestCase& test_case);
Document test_cases_to_json(const std::vector<TestCase>& cases);

// ============================================================================
// Outcomes
// ============================================================================

struct Outcome {
    size_t case_index = 0;
    std::string case_name;
    bool passed = false;
    RunState state = RunState::Running;
    std::optional<StepError> error;  // Set iff !passed
    Document output;                 // Extracted output on completion
};

/**
 * @brief Every failing outcome of one Testing pass, in case order
 */
struct ErrorReport {
    std::vector<Outcome> failures;
    size_t total_cases = 0;

    bool empty() const { return failures.empty(); }

    // One line per failure, suitable for a fixer prompt
    std::string summary() const;
};

// kind and message always; step_id, op and path only when known
Document step_error_to_json(const StepError& error);
Document outcome_to_json(const Outcome& outcome);
Document error_report_to_json(const ErrorReport& report);

// Build a report that carries a single failure not tied to any test case
// (malformed candidates, collaborator timeouts).
ErrorReport make_candidate_report(ErrorKind kind, const std::string& message);

// ============================================================================
// Test Harness
// ============================================================================

struct HarnessOptions {
    size_t parallelism = 1;   // Worker threads; cases are independent
    double tolerance = 1e-9;  // Relative tolerance for numeric comparison
};

struct HarnessReport {
    std::vector<Outcome> outcomes;
    bool all_passed = false;

    size_t passed_count() const;
    ErrorReport error_report() const;
};

// Structural comparison; numbers use a relative tolerance
bool values_match(const Document& expected, const Document& actual, double tolerance);

// Run one case on a private copy of its input, wrapped in the runtime document
Outcome run_case(const Program& program, const TestCase& test_case, size_t index,
                 double tolerance = 1e-9);

// Run every case. Outcomes are returned in case order regardless of parallelism.
HarnessReport run_tests(const Program& program, const std::vector<TestCase>& cases,
                        const HarnessOptions& options = {});

// Truncate a serialized document for log output
std::string truncate_json(const Document& j, size_t limit = 300);

} // namespace mender
