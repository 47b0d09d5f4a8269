#pragma once

/**
 * @file collaborators.hpp
 * @brief Contracts for the external actors the repair loop consumes
 *
 * Collaborators produce schemas, programs and test cases. They are reached
 * only through these interfaces, always with a timeout, and may fail in
 * three ways: they time out, they answer with something unusable, or the
 * call itself fails.
 *
 * Developer and Fixer return raw candidate JSON. Structural validation is
 * done by the repair loop so that a malformed candidate is decided in one
 * place.
 */

#include "mender/harness.hpp"
#include "mender/program.hpp"
#include "mender/result.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mender {

// ============================================================================
// Collaborator Errors
// ============================================================================

enum class CollaboratorErrorKind {
    timeout,
    malformed,
    failed,
};

inline const char* collaborator_error_kind_to_string(CollaboratorErrorKind k) {
    switch (k) {
        case CollaboratorErrorKind::timeout: return "timeout";
        case CollaboratorErrorKind::malformed: return "malformed";
        case CollaboratorErrorKind::failed: return "failed";
    }
    return "failed";
}

struct CollaboratorError {
    CollaboratorErrorKind kind = CollaboratorErrorKind::failed;
    std::string message;

    // The error kind recorded in an attempt's report
    ErrorKind error_kind() const {
        switch (kind) {
            case CollaboratorErrorKind::timeout: return ErrorKind::collaborator_timeout;
            case CollaboratorErrorKind::malformed: return ErrorKind::malformed_candidate;
            case CollaboratorErrorKind::failed: return ErrorKind::collaborator_failure;
        }
        return ErrorKind::collaborator_failure;
    }

    std::string toString() const {
        return std::string(collaborator_error_kind_to_string(kind)) + ": " + message;
    }
};

template<typename T>
using CollabResult = Result<T, CollaboratorError>;

// Unvalidated program JSON as returned by a Developer or Fixer
using CandidateJson = Document;

// ============================================================================
// Contracts
// ============================================================================

class Architect {
public:
    virtual ~Architect() = default;
    virtual CollabResult<AppDefinition> propose_schemas(const std::string& request) = 0;
};

class Developer {
public:
    virtual ~Developer() = default;
    virtual CollabResult<CandidateJson> propose_program(const AppDefinition& definition) = 0;
};

class QA {
public:
    virtual ~QA() = default;
    virtual CollabResult<std::vector<TestCase>> propose_test_cases(const AppDefinition& definition) = 0;
};

class Fixer {
public:
    virtual ~Fixer() = default;
    // Returns a full replacement program, never a patch
    virtual CollabResult<CandidateJson> propose_fix(const Program& program,
                                                    const ErrorReport& report,
                                                    const AppDefinition& definition) = 0;
};

// ============================================================================
// Timeout Wrapper
// ============================================================================

/**
 * @brief Worker threads whose calls outlived their timeout
 *
 * A timed-out call keeps running until it returns on its own. Holding its
 * thread here lets the owner wait for it before making the next call and
 * before returning, so at most one call is in flight at a time. The
 * destructor joins whatever is left.
 */
class InFlightCalls {
public:
    InFlightCalls() = default;
    InFlightCalls(const InFlightCalls&) = delete;
    InFlightCalls& operator=(const InFlightCalls&) = delete;
    ~InFlightCalls() { wait(); }

    void add(std::thread worker) { workers_.push_back(std::move(worker)); }

    void wait() {
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    bool empty() const { return workers_.empty(); }

private:
    std::vector<std::thread> workers_;
};

/**
 * @brief Run a collaborator call on a worker thread and wait at most `timeout`
 *
 * Any call still held by `in_flight` is waited for first. On timeout the
 * result is discarded and the worker is handed to `in_flight`. The callable
 * must own everything it touches (capture collaborators by shared_ptr). A
 * non-positive timeout waits indefinitely. An exception thrown by the call is
 * reported as a failed call.
 */
template<typename T>
CollabResult<T> call_with_timeout(std::function<CollabResult<T>()> call,
                                  std::chrono::milliseconds timeout,
                                  const std::string& what,
                                  InFlightCalls& in_flight) {
    in_flight.wait();

    auto task = std::make_shared<std::packaged_task<CollabResult<T>()>>(std::move(call));
    auto future = task->get_future();
    std::thread worker([task]() { (*task)(); });

    if (timeout.count() > 0 && future.wait_for(timeout) == std::future_status::timeout) {
        in_flight.add(std::move(worker));
        return CollabResult<T>::err(CollaboratorError{
            CollaboratorErrorKind::timeout,
            what + " did not answer within " + std::to_string(timeout.count()) + " ms"});
    }
    worker.join();

    try {
        return future.get();
    } catch (const std::exception& e) {
        return CollabResult<T>::err(CollaboratorError{
            CollaboratorErrorKind::failed, what + " threw: " + e.what()});
    }
}

// ============================================================================
// Static Collaborator
// ============================================================================

/**
 * @brief Serves a fixed definition, program and/or test-case list
 *
 * Any role whose content was not supplied fails with `failed`.
 */
class StaticCollaborator : public Architect, public Developer, public QA {
public:
    StaticCollaborator() = default;

    void set_definition(AppDefinition definition) { definition_ = std::move(definition); }
    void set_program(CandidateJson program) { program_ = std::move(program); }
    void set_test_cases(std::vector<TestCase> cases) { cases_ = std::move(cases); }

    bool has_definition() const { return definition_.has_value(); }
    bool has_program() const { return program_.has_value(); }
    bool has_test_cases() const { return cases_.has_value(); }

    CollabResult<AppDefinition> propose_schemas(const std::string& request) override;
    CollabResult<CandidateJson> propose_program(const AppDefinition& definition) override;
    CollabResult<std::vector<TestCase>> propose_test_cases(const AppDefinition& definition) override;

private:
    std::optional<AppDefinition> definition_;
    std::optional<CandidateJson> program_;
    std::optional<std::vector<TestCase>> cases_;
};

/**
 * @brief Load a StaticCollaborator from files; empty paths are skipped
 *
 * The program file is kept as raw JSON so the loop still validates it.
 */
CollabResult<std::shared_ptr<StaticCollaborator>> load_static_collaborator(
    const std::string& definition_path,
    const std::string& program_path,
    const std::string& cases_path);

} // namespace mender
