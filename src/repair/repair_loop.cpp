#include "mender/repair_loop.hpp"
#include "mender/program_json.hpp"

#include <spdlog/spdlog.h>

namespace mender {

namespace {

AttemptStatus status_for(const CollaboratorError& error) {
    switch (error.kind) {
        case CollaboratorErrorKind::timeout: return AttemptStatus::CollaboratorTimeout;
        case CollaboratorErrorKind::malformed: return AttemptStatus::MalformedCandidate;
        case CollaboratorErrorKind::failed: return AttemptStatus::CollaboratorFailure;
    }
    return AttemptStatus::CollaboratorFailure;
}

RepairResult abandon(RepairResult result, std::string reason) {
    result.state = LoopState::Abandoned;
    result.reason = std::move(reason);
    spdlog::error("Abandoned: {}", result.reason);
    return result;
}

} // namespace

RepairLoop::RepairLoop(std::shared_ptr<Developer> developer,
                       std::shared_ptr<QA> qa,
                       std::shared_ptr<Fixer> fixer,
                       LoopConfig config)
    : developer_(std::move(developer)),
      qa_(std::move(qa)),
      fixer_(std::move(fixer)),
      config_(std::move(config)) {}

CollabResult<CandidateJson> RepairLoop::request_draft(const AppDefinition& definition,
                                                      InFlightCalls& in_flight) {
    auto developer = developer_;
    return call_with_timeout<CandidateJson>(
        [developer, definition]() { return developer->propose_program(definition); },
        config_.collaborator_timeout, "developer", in_flight);
}

CollabResult<CandidateJson> RepairLoop::request_fix(const Program& program,
                                                    const ErrorReport& report,
                                                    const AppDefinition& definition,
                                                    InFlightCalls& in_flight) {
    auto fixer = fixer_;
    return call_with_timeout<CandidateJson>(
        [fixer, program, report, definition]() {
            return fixer->propose_fix(program, report, definition);
        },
        config_.collaborator_timeout, "fixer", in_flight);
}

CollabResult<std::vector<TestCase>> RepairLoop::request_test_cases(const AppDefinition& definition,
                                                                   InFlightCalls& in_flight) {
    auto qa = qa_;
    return call_with_timeout<std::vector<TestCase>>(
        [qa, definition]() { return qa->propose_test_cases(definition); },
        config_.collaborator_timeout, "qa", in_flight);
}

RepairResult RepairLoop::run(const AppDefinition& definition) {
    RepairResult result;
    result.state = LoopState::Drafting;
    InFlightCalls in_flight;

    spdlog::info("Phase: Development");
    auto candidate = request_draft(definition, in_flight);

    spdlog::info("Phase: QA & Testing");
    auto cases = request_test_cases(definition, in_flight);
    if (cases.isErr()) {
        return abandon(std::move(result), "QA failed: " + cases.error().toString());
    }
    if (cases.value().empty()) {
        return abandon(std::move(result), "QA returned no test cases");
    }
    result.test_cases = std::move(cases.value());
    spdlog::info("  -> {} test cases", result.test_cases.size());

    std::optional<Program> last_well_formed;
    std::optional<ErrorReport> last_test_report;
    size_t attempt = 0;

    while (true) {
        RepairAttempt record;
        record.number = attempt;

        if (candidate.isErr()) {
            const auto& error = candidate.error();
            spdlog::error("Attempt #{}: {}", attempt, error.toString());
            record.status = status_for(error);
            record.report = make_candidate_report(error.error_kind(), error.message);
        } else {
            auto parsed = program_from_json(candidate.value(), definition);
            if (!parsed.ok) {
                spdlog::error("Attempt #{}: malformed candidate: {}", attempt, parsed.error);
                record.status = AttemptStatus::MalformedCandidate;
                record.raw_candidate = candidate.value();
                record.report = make_candidate_report(ErrorKind::malformed_candidate, parsed.error);
            } else {
                for (const auto& w : parsed.warnings) {
                    spdlog::warn("Attempt #{}: {}", attempt, w);
                }
                result.state = LoopState::Testing;
                spdlog::info("Validation run #{} ({} steps)", attempt, parsed.value.steps.size());

                HarnessReport harness = run_tests(parsed.value, result.test_cases, config_.harness);
                record.candidate = parsed.value;
                if (harness.all_passed) {
                    record.status = AttemptStatus::Passed;
                    record.report.total_cases = harness.outcomes.size();
                    result.history.push_back(std::move(record));
                    result.state = LoopState::Deployed;
                    result.attempts = attempt;
                    result.program = std::move(parsed.value);
                    spdlog::info("Program verified after {} repair attempt(s)", attempt);
                    return result;
                }

                record.status = AttemptStatus::TestsFailed;
                record.report = harness.error_report();
                spdlog::error("Validation run #{}: {}/{} cases failed", attempt,
                              record.report.failures.size(), harness.outcomes.size());
                last_well_formed = std::move(parsed.value);
                last_test_report = record.report;
            }
        }

        // The Fixer always sees the failing outcomes of the program it is
        // asked to repair. A candidate failure is appended to them.
        ErrorReport report = record.report;
        if (record.status != AttemptStatus::TestsFailed && last_test_report) {
            ErrorReport combined = *last_test_report;
            for (auto& failure : report.failures) {
                combined.failures.push_back(std::move(failure));
            }
            report = std::move(combined);
        }
        result.history.push_back(std::move(record));
        result.attempts = attempt;

        if (attempt >= config_.max_attempts) {
            return abandon(std::move(result),
                           "no passing program after " + std::to_string(config_.max_attempts) +
                           " repair attempt(s)");
        }

        ++attempt;
        result.state = LoopState::Repairing;
        spdlog::warn("Invoking Fixer (attempt {}/{})", attempt, config_.max_attempts);
        if (last_well_formed) {
            candidate = request_fix(*last_well_formed, report, definition, in_flight);
        } else {
            Program empty;
            empty.definition = definition;
            candidate = request_fix(empty, report, definition, in_flight);
        }
    }
}

// ============================================================================
// Serialization
// ============================================================================

Document repair_attempt_to_json(const RepairAttempt& attempt) {
    Document j = Document::object();
    j["attempt"] = attempt.number;
    j["status"] = attempt_status_to_string(attempt.status);
    if (attempt.candidate) {
        j["candidate"] = program_to_json(*attempt.candidate);
    } else if (attempt.raw_candidate) {
        j["raw_candidate"] = *attempt.raw_candidate;
    }
    j["report"] = error_report_to_json(attempt.report);
    return j;
}

Document repair_result_to_json(const RepairResult& result) {
    Document j = Document::object();
    j["state"] = loop_state_to_string(result.state);
    j["attempts"] = result.attempts;
    if (!result.reason.empty()) {
        j["reason"] = result.reason;
    }
    if (result.program) {
        j["program"] = program_to_json(*result.program);
    }
    j["test_cases"] = test_cases_to_json(result.test_cases);
    Document history = Document::array();
    for (const auto& attempt : result.history) {
        history.push_back(repair_attempt_to_json(attempt));
    }
    j["history"] = std::move(history);
    return j;
}

} // namespace mender
