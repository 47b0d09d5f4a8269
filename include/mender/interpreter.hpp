#pragma once

#include "mender/document.hpp"
#include "mender/program.hpp"
#include "mender/result.hpp"

#include <optional>

namespace mender {

// ============================================================================
// Program Interpreter
// ============================================================================

/**
 * @brief Terminal state of one program run
 *
 * On Completed, `document` is the result. On Failed, `document` holds the
 * state after the last successful step. It is diagnostic context only and
 * never contains the failing step's output.
 */
struct RunResult {
    RunState state = RunState::Running;
    Document document;
    std::optional<StepError> error;
    size_t steps_executed = 0;

    bool completed() const { return state == RunState::Completed; }
    bool failed() const { return state == RunState::Failed; }
};

/**
 * @brief Execute a program's steps in order against a private copy of `input`
 *
 * Halts at the first failing step. Deterministic: the same program and input
 * always produce the same RunResult.
 */
RunResult interpret(const Program& program, Document input);

/**
 * @brief Collect the program's declared outputs from a final document
 *
 * Each property named in `output_schema["properties"]` is looked up literally
 * at the root; values under /inputs or /temp are never taken. Returns the
 * whole document when the schema has no properties or none of them are
 * present.
 */
Document extract_output(const Document& document, const Document& output_schema);

} // namespace mender
