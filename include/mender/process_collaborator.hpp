#pragma once

/**
 * @file process_collaborator.hpp
 * @brief Collaborators backed by an external command
 *
 * Each call runs `/bin/sh -c <command>`, writes one JSON request to the
 * child's stdin and reads one JSON response from its stdout. The request's
 * "role" field tells the command what is being asked:
 *
 *   {"role": "architect", "request": "..."}
 *   {"role": "developer", "definition": {...}}
 *   {"role": "qa",        "definition": {...}}
 *   {"role": "fixer",     "definition": {...}, "program": {...},
 *                         "error_report": {...}, "error_summary": "..."}
 *
 * Responses may be wrapped in markdown fences or surrounded by prose; the
 * outermost JSON object or array is used.
 */

#include "mender/collaborators.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace mender {

// ============================================================================
// Child Processes
// ============================================================================

constexpr size_t kMaxCollaboratorOutputBytes = 16 * 1024 * 1024;

struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;
    bool timed_out = false;
    bool output_limit_exceeded = false;
    bool spawn_failed = false;
};

/**
 * @brief Run `/bin/sh -c command`, feeding `stdin_data` and collecting output
 *
 * The child is killed with SIGKILL once `timeout` elapses or stdout and
 * stderr together exceed `max_output_bytes`.
 */
ProcessResult run_process(const std::string& command, const std::string& stdin_data,
                          std::chrono::milliseconds timeout,
                          size_t max_output_bytes = kMaxCollaboratorOutputBytes);

// ============================================================================
// Response Extraction
// ============================================================================

/**
 * @brief Pull a JSON payload out of free-form collaborator output
 *
 * Strips ``` fences, turns control characters into spaces and keeps the
 * text from the first '{' or '[' to its last matching closer. Returns
 * nullopt when no bracketed span exists.
 */
std::optional<std::string> extract_json_payload(const std::string& text);

// ============================================================================
// Process Collaborator
// ============================================================================

class ProcessCollaborator : public Architect, public Developer, public QA, public Fixer {
public:
    ProcessCollaborator(std::string command, std::chrono::milliseconds timeout);

    CollabResult<AppDefinition> propose_schemas(const std::string& request) override;
    CollabResult<CandidateJson> propose_program(const AppDefinition& definition) override;
    CollabResult<std::vector<TestCase>> propose_test_cases(const AppDefinition& definition) override;
    CollabResult<CandidateJson> propose_fix(const Program& program,
                                            const ErrorReport& report,
                                            const AppDefinition& definition) override;

    const std::string& command() const { return command_; }

private:
    // Send one request and parse the extracted payload
    CollabResult<Document> exchange(const Document& request);

    std::string command_;
    std::chrono::milliseconds timeout_;
};

} // namespace mender
