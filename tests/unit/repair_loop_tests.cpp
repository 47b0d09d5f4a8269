#include <doctest/doctest.h>
#include <mender/pipeline.hpp>
#include <mender/repair_loop.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace mender;

namespace {

const char* kBuggyAdd = R"([
    {"id": "total", "operation": {"op": "subtract", "a": "/a", "b": "/b"}, "output_path": "/total"}
])";

const char* kCorrectAdd = R"([
    {"id": "total", "operation": {"op": "add", "a": "/a", "b": "/b"}, "output_path": "/total"}
])";

// Unknown op tag: fails structural validation
const char* kMalformed = R"([
    {"id": "total", "operation": {"op": "plus", "a": "/a", "b": "/b"}, "output_path": "/total"}
])";

AppDefinition adder_definition() {
    AppDefinition def;
    def.name = "Adder";
    def.output_schema = Document::parse(R"({"properties": {"total": {}}})");
    return def;
}

CollabResult<CandidateJson> candidate(const char* json) {
    return CollabResult<CandidateJson>::ok(Document::parse(json));
}

CollabResult<CandidateJson> collab_failure(CollaboratorErrorKind kind, const std::string& message) {
    return CollabResult<CandidateJson>::err(CollaboratorError{kind, message});
}

// Answers from a script; the last entry repeats once the script runs out
class ScriptedDeveloper : public Developer {
public:
    explicit ScriptedDeveloper(std::vector<CollabResult<CandidateJson>> script)
        : script_(std::move(script)) {}

    CollabResult<CandidateJson> propose_program(const AppDefinition&) override {
        size_t n = calls++;
        return script_[std::min(n, script_.size() - 1)];
    }

    std::atomic<size_t> calls{0};

private:
    std::vector<CollabResult<CandidateJson>> script_;
};

class ScriptedFixer : public Fixer {
public:
    explicit ScriptedFixer(std::vector<CollabResult<CandidateJson>> script)
        : script_(std::move(script)) {}

    CollabResult<CandidateJson> propose_fix(const Program& program, const ErrorReport& report,
                                            const AppDefinition&) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_programs_.push_back(program);
            seen_reports_.push_back(report);
        }
        size_t n = calls++;
        return script_[std::min(n, script_.size() - 1)];
    }

    std::vector<Program> seen_programs() {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_programs_;
    }

    std::vector<ErrorReport> seen_reports() {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_reports_;
    }

    std::atomic<size_t> calls{0};

private:
    std::vector<CollabResult<CandidateJson>> script_;
    std::mutex mutex_;
    std::vector<Program> seen_programs_;
    std::vector<ErrorReport> seen_reports_;
};

class FixedQA : public QA {
public:
    explicit FixedQA(CollabResult<std::vector<TestCase>> answer) : answer_(std::move(answer)) {}

    CollabResult<std::vector<TestCase>> propose_test_cases(const AppDefinition&) override {
        ++calls;
        return answer_;
    }

    std::atomic<size_t> calls{0};

private:
    CollabResult<std::vector<TestCase>> answer_;
};

std::shared_ptr<FixedQA> adder_qa() {
    auto parsed = parse_test_cases(R"([
        {"name": "small", "input": {"a": 2, "b": 3}, "expected_output": {"total": 5}},
        {"name": "zero_b", "input": {"a": 4, "b": 0}, "expected_output": {"total": 4}}
    ])");
    REQUIRE(parsed.ok);
    return std::make_shared<FixedQA>(CollabResult<std::vector<TestCase>>::ok(parsed.value));
}

LoopConfig test_config(size_t max_attempts) {
    LoopConfig config = get_builtin_config();
    config.max_attempts = max_attempts;
    config.collaborator_timeout = std::chrono::milliseconds(2000);
    return config;
}

} // namespace

// ============================================================================
// Convergence
// ============================================================================

TEST_CASE("a correct draft deploys without repairs") {
    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kCorrectAdd)});
    auto fixer = std::make_shared<ScriptedFixer>(
        std::vector<CollabResult<CandidateJson>>{candidate(kCorrectAdd)});

    RepairLoop loop(developer, adder_qa(), fixer, test_config(3));
    RepairResult result = loop.run(adder_definition());

    CHECK(result.deployed());
    CHECK(result.attempts == 0);
    CHECK(fixer->calls.load() == 0);
    REQUIRE(result.history.size() == 1);
    CHECK(result.history[0].status == AttemptStatus::Passed);
    REQUIRE(result.program.has_value());
    CHECK(result.program->definition.name == "Adder");
}

TEST_CASE("a buggy draft is repaired in one attempt") {
    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kBuggyAdd)});
    auto fixer = std::make_shared<ScriptedFixer>(
        std::vector<CollabResult<CandidateJson>>{candidate(kCorrectAdd)});

    RepairLoop loop(developer, adder_qa(), fixer, test_config(3));
    RepairResult result = loop.run(adder_definition());

    REQUIRE(result.deployed());
    CHECK(result.attempts == 1);
    CHECK(fixer->calls.load() == 1);
    REQUIRE(result.history.size() == 2);
    CHECK(result.history[0].status == AttemptStatus::TestsFailed);
    CHECK(result.history[1].status == AttemptStatus::Passed);
    CHECK(operation_kind(result.program->steps[0].operation) == OpKind::Add);

    // The fixer saw the failing draft and the harness's report on it
    auto reports = fixer->seen_reports();
    REQUIRE(reports.size() == 1);
    CHECK(reports[0].total_cases == 2);
    REQUIRE(reports[0].failures.size() == 1);
    CHECK(reports[0].failures[0].case_name == "small");
    CHECK(reports[0].failures[0].error->kind == ErrorKind::output_mismatch);
    CHECK(reports[0].failures[0].error->step_id == "total");
}

// ============================================================================
// Termination
// ============================================================================

TEST_CASE("a fixer that never fixes is called exactly max_attempts times") {
    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kBuggyAdd)});
    auto fixer = std::make_shared<ScriptedFixer>(
        std::vector<CollabResult<CandidateJson>>{candidate(kBuggyAdd)});

    RepairLoop loop(developer, adder_qa(), fixer, test_config(3));
    RepairResult result = loop.run(adder_definition());

    CHECK(result.state == LoopState::Abandoned);
    CHECK(result.attempts == 3);
    CHECK(fixer->calls.load() == 3);
    CHECK(developer->calls.load() == 1);
    CHECK(result.history.size() == 4);
    CHECK_FALSE(result.program.has_value());
    CHECK(result.reason.find("3 repair attempt") != std::string::npos);
}

TEST_CASE("zero max_attempts abandons after the draft") {
    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kBuggyAdd)});
    auto fixer = std::make_shared<ScriptedFixer>(
        std::vector<CollabResult<CandidateJson>>{candidate(kCorrectAdd)});

    RepairLoop loop(developer, adder_qa(), fixer, test_config(0));
    RepairResult result = loop.run(adder_definition());

    CHECK(result.state == LoopState::Abandoned);
    CHECK(result.attempts == 0);
    CHECK(fixer->calls.load() == 0);
    CHECK(result.history.size() == 1);
}

// ============================================================================
// Malformed Candidates and Collaborator Failures
// ============================================================================

TEST_CASE("a malformed fix uses an attempt and the fixer keeps the last good program") {
    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kBuggyAdd)});
    auto fixer = std::make_shared<ScriptedFixer>(
        std::vector<CollabResult<CandidateJson>>{candidate(kMalformed), candidate(kCorrectAdd)});

    RepairLoop loop(developer, adder_qa(), fixer, test_config(3));
    RepairResult result = loop.run(adder_definition());

    REQUIRE(result.deployed());
    CHECK(result.attempts == 2);
    REQUIRE(result.history.size() == 3);
    CHECK(result.history[1].status == AttemptStatus::MalformedCandidate);
    CHECK_FALSE(result.history[1].candidate.has_value());
    CHECK(result.history[1].raw_candidate.has_value());
    REQUIRE(result.history[1].report.failures.size() == 1);
    CHECK(result.history[1].report.failures[0].error->kind == ErrorKind::malformed_candidate);

    // Both fix requests carried the buggy draft, never the malformed one
    auto programs = fixer->seen_programs();
    REQUIRE(programs.size() == 2);
    for (const auto& program : programs) {
        REQUIRE(program.steps.size() == 1);
        CHECK(operation_kind(program.steps[0].operation) == OpKind::Subtract);
    }

    // ...along with the draft's failing outcomes, then the parse failure
    auto reports = fixer->seen_reports();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[1].failures.size() == 2);
    CHECK(reports[1].total_cases == 2);
    CHECK(reports[1].failures[0].case_name == "small");
    CHECK(reports[1].failures[0].error->kind == ErrorKind::output_mismatch);
    CHECK(reports[1].failures[1].error->kind == ErrorKind::malformed_candidate);
}

TEST_CASE("a malformed draft goes to the fixer with an empty program") {
    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kMalformed), candidate(kCorrectAdd)});
    auto fixer = std::make_shared<ScriptedFixer>(
        std::vector<CollabResult<CandidateJson>>{candidate(kCorrectAdd)});

    RepairLoop loop(developer, adder_qa(), fixer, test_config(3));
    RepairResult result = loop.run(adder_definition());

    REQUIRE(result.deployed());
    CHECK(result.attempts == 1);
    CHECK(developer->calls.load() == 1);
    CHECK(fixer->calls.load() == 1);
    CHECK(result.history[0].status == AttemptStatus::MalformedCandidate);

    auto programs = fixer->seen_programs();
    REQUIRE(programs.size() == 1);
    CHECK(programs[0].steps.empty());
    CHECK(programs[0].definition.name == "Adder");
    auto reports = fixer->seen_reports();
    REQUIRE(reports[0].failures.size() == 1);
    CHECK(reports[0].failures[0].error->kind == ErrorKind::malformed_candidate);
}

TEST_CASE("a failed collaborator call uses an attempt") {
    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kBuggyAdd)});
    auto fixer = std::make_shared<ScriptedFixer>(std::vector<CollabResult<CandidateJson>>{
        collab_failure(CollaboratorErrorKind::failed, "connection refused"),
        candidate(kCorrectAdd)});

    RepairLoop loop(developer, adder_qa(), fixer, test_config(3));
    RepairResult result = loop.run(adder_definition());

    REQUIRE(result.deployed());
    CHECK(result.attempts == 2);
    CHECK(result.history[1].status == AttemptStatus::CollaboratorFailure);
    CHECK(result.history[1].report.failures[0].error->kind == ErrorKind::collaborator_failure);

    // The retry still carries the test failures of the program being fixed
    auto reports = fixer->seen_reports();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[1].failures.size() == 2);
    CHECK(reports[1].failures[0].error->kind == ErrorKind::output_mismatch);
    CHECK(reports[1].failures[0].error->step_id == "total");
    CHECK(reports[1].failures[1].error->kind == ErrorKind::collaborator_failure);
}

TEST_CASE("a slow fixer times out and uses an attempt") {
    class SlowFixer : public Fixer {
    public:
        CollabResult<CandidateJson> propose_fix(const Program&, const ErrorReport& report,
                                                const AppDefinition&) override {
            size_t n = calls++;
            {
                std::lock_guard<std::mutex> lock(mutex);
                reports.push_back(report);
            }
            if (n == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
            }
            return candidate(kCorrectAdd);
        }
        std::atomic<size_t> calls{0};
        std::mutex mutex;
        std::vector<ErrorReport> reports;
    };

    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kBuggyAdd)});
    auto fixer = std::make_shared<SlowFixer>();

    LoopConfig config = test_config(3);
    config.collaborator_timeout = std::chrono::milliseconds(50);

    RepairLoop loop(developer, adder_qa(), fixer, config);
    RepairResult result = loop.run(adder_definition());

    REQUIRE(result.deployed());
    CHECK(result.attempts == 2);
    CHECK(result.history[1].status == AttemptStatus::CollaboratorTimeout);
    CHECK(result.history[1].report.failures[0].error->kind == ErrorKind::collaborator_timeout);

    std::lock_guard<std::mutex> lock(fixer->mutex);
    REQUIRE(fixer->reports.size() == 2);
    CHECK(fixer->reports[1].failures[0].error->kind == ErrorKind::output_mismatch);
    CHECK(fixer->reports[1].failures.back().error->kind == ErrorKind::collaborator_timeout);
}

TEST_CASE("a timed-out call finishes before the next call starts") {
    class CountingFixer : public Fixer {
    public:
        CollabResult<CandidateJson> propose_fix(const Program&, const ErrorReport&,
                                                const AppDefinition&) override {
            size_t now = ++active;
            size_t seen = max_active.load();
            while (now > seen && !max_active.compare_exchange_weak(seen, now)) {
            }
            size_t n = calls++;
            if (n == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(300));
            }
            --active;
            finished++;
            return candidate(kCorrectAdd);
        }
        std::atomic<size_t> active{0};
        std::atomic<size_t> max_active{0};
        std::atomic<size_t> calls{0};
        std::atomic<size_t> finished{0};
    };

    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kBuggyAdd)});
    auto fixer = std::make_shared<CountingFixer>();

    LoopConfig config = test_config(3);
    config.collaborator_timeout = std::chrono::milliseconds(50);

    RepairLoop loop(developer, adder_qa(), fixer, config);
    RepairResult result = loop.run(adder_definition());

    REQUIRE(result.deployed());
    CHECK(result.attempts == 2);
    CHECK(fixer->calls.load() == 2);
    CHECK(fixer->max_active.load() == 1);
    // Nothing is left running once run() has returned
    CHECK(fixer->finished.load() == 2);
    CHECK(fixer->active.load() == 0);
}

TEST_CASE("call_with_timeout reports exceptions as failures") {
    InFlightCalls in_flight;
    auto r = call_with_timeout<int>(
        []() -> CollabResult<int> { throw std::runtime_error("boom"); },
        std::chrono::milliseconds(1000), "thrower", in_flight);
    REQUIRE(r.isErr());
    CHECK(r.error().kind == CollaboratorErrorKind::failed);
    CHECK(r.error().message.find("boom") != std::string::npos);

    auto ok = call_with_timeout<int>([]() { return CollabResult<int>::ok(4); },
                                     std::chrono::milliseconds(0), "answerer", in_flight);
    REQUIRE(ok.isOk());
    CHECK(ok.value() == 4);
    CHECK(in_flight.empty());
}

TEST_CASE("call_with_timeout keeps a timed-out worker until it is waited for") {
    InFlightCalls in_flight;
    std::atomic<bool> done{false};
    auto r = call_with_timeout<int>(
        [&done]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            done = true;
            return CollabResult<int>::ok(1);
        },
        std::chrono::milliseconds(20), "sleeper", in_flight);
    REQUIRE(r.isErr());
    CHECK(r.error().kind == CollaboratorErrorKind::timeout);
    CHECK_FALSE(in_flight.empty());

    in_flight.wait();
    CHECK(done.load());
    CHECK(in_flight.empty());
}

// ============================================================================
// QA
// ============================================================================

TEST_CASE("no usable test cases abandons before any attempt") {
    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kCorrectAdd)});
    auto fixer = std::make_shared<ScriptedFixer>(
        std::vector<CollabResult<CandidateJson>>{candidate(kCorrectAdd)});

    SUBCASE("empty list") {
        auto qa = std::make_shared<FixedQA>(CollabResult<std::vector<TestCase>>::ok({}));
        RepairLoop loop(developer, qa, fixer, test_config(3));
        RepairResult result = loop.run(adder_definition());
        CHECK(result.state == LoopState::Abandoned);
        CHECK(result.history.empty());
        CHECK(result.reason == "QA returned no test cases");
    }
    SUBCASE("QA failure") {
        auto qa = std::make_shared<FixedQA>(CollabResult<std::vector<TestCase>>::err(
            CollaboratorError{CollaboratorErrorKind::malformed, "not a list"}));
        RepairLoop loop(developer, qa, fixer, test_config(3));
        RepairResult result = loop.run(adder_definition());
        CHECK(result.state == LoopState::Abandoned);
        CHECK(result.history.empty());
        CHECK(result.reason.find("not a list") != std::string::npos);
    }
    CHECK(fixer->calls.load() == 0);
}

TEST_CASE("test cases are requested once and reused") {
    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kBuggyAdd)});
    auto fixer = std::make_shared<ScriptedFixer>(std::vector<CollabResult<CandidateJson>>{
        candidate(kBuggyAdd), candidate(kCorrectAdd)});
    auto qa = adder_qa();

    RepairLoop loop(developer, qa, fixer, test_config(3));
    RepairResult result = loop.run(adder_definition());

    CHECK(result.deployed());
    CHECK(qa->calls.load() == 1);
    CHECK(result.test_cases.size() == 2);
}

// ============================================================================
// Pipeline and Serialization
// ============================================================================

TEST_CASE("pipeline abandons when the architect fails") {
    class BrokenArchitect : public Architect {
    public:
        CollabResult<AppDefinition> propose_schemas(const std::string&) override {
            return CollabResult<AppDefinition>::err(
                CollaboratorError{CollaboratorErrorKind::failed, "no model"});
        }
    };

    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kCorrectAdd)});
    auto fixer = std::make_shared<ScriptedFixer>(
        std::vector<CollabResult<CandidateJson>>{candidate(kCorrectAdd)});

    Pipeline pipeline(std::make_shared<BrokenArchitect>(), developer, adder_qa(), fixer,
                      test_config(3));
    RepairResult result = pipeline.build("add two numbers");

    CHECK(result.state == LoopState::Abandoned);
    CHECK(result.reason.find("architect failed") == 0);
    CHECK_FALSE(pipeline.definition().has_value());
    CHECK(developer->calls.load() == 0);
}

TEST_CASE("pipeline runs the loop on the architect's definition") {
    auto statics = std::make_shared<StaticCollaborator>();
    statics->set_definition(adder_definition());

    auto developer = std::make_shared<ScriptedDeveloper>(
        std::vector<CollabResult<CandidateJson>>{candidate(kBuggyAdd)});
    auto fixer = std::make_shared<ScriptedFixer>(
        std::vector<CollabResult<CandidateJson>>{candidate(kCorrectAdd)});

    Pipeline pipeline(statics, developer, adder_qa(), fixer, test_config(3));
    RepairResult result = pipeline.build("add two numbers");

    REQUIRE(result.deployed());
    REQUIRE(pipeline.definition().has_value());
    CHECK(pipeline.definition()->name == "Adder");

    Document j = repair_result_to_json(result);
    CHECK(j["state"] == "deployed");
    CHECK(j["attempts"] == 1);
    CHECK(j["history"].size() == 2);
    CHECK(j["history"][0]["status"] == "tests_failed");
    CHECK(j["program"]["steps"][0]["operation"]["op"] == "add");
}

TEST_CASE("static collaborator fails for roles it has no content for") {
    StaticCollaborator statics;
    CHECK(statics.propose_schemas("x").isErr());
    CHECK(statics.propose_program(adder_definition()).isErr());
    CHECK(statics.propose_test_cases(adder_definition()).error().kind ==
          CollaboratorErrorKind::failed);
}
