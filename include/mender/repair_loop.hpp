#pragma once

#include "mender/collaborators.hpp"
#include "mender/config.hpp"
#include "mender/harness.hpp"
#include "mender/program.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mender {

// ============================================================================
// Repair Attempts
// ============================================================================

enum class AttemptStatus {
    Passed,
    TestsFailed,
    MalformedCandidate,
    CollaboratorTimeout,
    CollaboratorFailure,
};

inline const char* attempt_status_to_string(AttemptStatus s) {
    switch (s) {
        case AttemptStatus::Passed: return "passed";
        case AttemptStatus::TestsFailed: return "tests_failed";
        case AttemptStatus::MalformedCandidate: return "malformed_candidate";
        case AttemptStatus::CollaboratorTimeout: return "collaborator_timeout";
        case AttemptStatus::CollaboratorFailure: return "collaborator_failure";
    }
    return "tests_failed";
}

/**
 * @brief One drafting or fixing cycle and what the harness made of it
 *
 * `candidate` is set only for well-formed programs. `raw_candidate` keeps
 * the JSON a malformed candidate arrived as.
 */
struct RepairAttempt {
    size_t number = 0;  // 0 is the draft
    AttemptStatus status = AttemptStatus::TestsFailed;
    std::optional<Program> candidate;
    std::optional<CandidateJson> raw_candidate;
    ErrorReport report;
};

struct RepairResult {
    LoopState state = LoopState::Drafting;
    size_t attempts = 0;                 // Number of the last attempt made
    std::optional<Program> program;      // Set on Deployed
    std::vector<TestCase> test_cases;    // The cases every attempt ran against
    std::vector<RepairAttempt> history;
    std::string reason;                  // Set on Abandoned

    bool deployed() const { return state == LoopState::Deployed; }
};

Document repair_attempt_to_json(const RepairAttempt& attempt);
Document repair_result_to_json(const RepairResult& result);

// ============================================================================
// Repair Loop
// ============================================================================

/**
 * @brief Drives Drafting -> Testing -> {Deployed | Repairing -> Testing | Abandoned}
 *
 * Test cases are requested from QA once and reused for every attempt. A
 * failing attempt sends the harness's error report to the Fixer, which
 * returns a full replacement program. The loop ends Deployed on the first
 * all-pass, or Abandoned once `max_attempts` repairs have been tried.
 *
 * A malformed candidate, a timeout or a failed collaborator call each use up
 * one attempt without running the harness. The Fixer is then handed the last
 * well-formed program with its failing outcomes, followed by the candidate
 * failure. The Developer is asked exactly once: while no candidate has been
 * well-formed, the Fixer receives an empty program carrying the definition.
 *
 * Collaborator calls never overlap. A call that timed out is waited for
 * before the next one starts and before run() returns.
 */
class RepairLoop {
public:
    RepairLoop(std::shared_ptr<Developer> developer,
               std::shared_ptr<QA> qa,
               std::shared_ptr<Fixer> fixer,
               LoopConfig config = get_builtin_config());

    RepairResult run(const AppDefinition& definition);

    const LoopConfig& config() const { return config_; }

private:
    CollabResult<CandidateJson> request_draft(const AppDefinition& definition,
                                              InFlightCalls& in_flight);
    CollabResult<CandidateJson> request_fix(const Program& program, const ErrorReport& report,
                                            const AppDefinition& definition,
                                            InFlightCalls& in_flight);
    CollabResult<std::vector<TestCase>> request_test_cases(const AppDefinition& definition,
                                                           InFlightCalls& in_flight);

    std::shared_ptr<Developer> developer_;
    std::shared_ptr<QA> qa_;
    std::shared_ptr<Fixer> fixer_;
    LoopConfig config_;
};

} // namespace mender
