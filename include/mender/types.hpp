#pragma once

#include <optional>
#include <string>

namespace mender {

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind {
    path_not_found,
    type_mismatch,
    division_by_zero,
    empty_aggregate,
    index_out_of_bounds,
    non_finite_result,
    malformed_candidate,
    output_mismatch,          // Harness only; never produced by the interpreter
    unexpected_completion,    // Harness only; run completed but a failure was expected
    collaborator_timeout,
    collaborator_failure,
};

// Convert error kind to canonical lowercase snake_case string
inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::path_not_found: return "path_not_found";
        case ErrorKind::type_mismatch: return "type_mismatch";
        case ErrorKind::division_by_zero: return "division_by_zero";
        case ErrorKind::empty_aggregate: return "empty_aggregate";
        case ErrorKind::index_out_of_bounds: return "index_out_of_bounds";
        case ErrorKind::non_finite_result: return "non_finite_result";
        case ErrorKind::malformed_candidate: return "malformed_candidate";
        case ErrorKind::output_mismatch: return "output_mismatch";
        case ErrorKind::unexpected_completion: return "unexpected_completion";
        case ErrorKind::collaborator_timeout: return "collaborator_timeout";
        case ErrorKind::collaborator_failure: return "collaborator_failure";
        default: return "unknown";
    }
}

// Parse error kind string to enum (case-insensitive)
std::optional<ErrorKind> parse_error_kind(const std::string& s);

// ============================================================================
// Operation Kinds
// ============================================================================

enum class OpKind {
    Get,
    Constant,
    Pluck,
    Add,
    Subtract,
    Multiply,
    Divide,
    Calculate,
    Sum,
    Count,
    Min,
    Max,
    FilterNumeric,
    Sort,
    FormatString,
};

// The "op" tag used in program JSON
inline const char* op_kind_to_string(OpKind k) {
    switch (k) {
        case OpKind::Get: return "get";
        case OpKind::Constant: return "constant";
        case OpKind::Pluck: return "pluck";
        case OpKind::Add: return "add";
        case OpKind::Subtract: return "subtract";
        case OpKind::Multiply: return "multiply";
        case OpKind::Divide: return "divide";
        case OpKind::Calculate: return "calculate";
        case OpKind::Sum: return "sum";
        case OpKind::Count: return "count";
        case OpKind::Min: return "min";
        case OpKind::Max: return "max";
        case OpKind::FilterNumeric: return "filter_numeric";
        case OpKind::Sort: return "sort";
        case OpKind::FormatString: return "format_string";
        default: return "unknown";
    }
}

std::optional<OpKind> parse_op_kind(const std::string& s);

// ============================================================================
// Arithmetic and Comparison Operators
// ============================================================================

enum class MathOp {
    Add,
    Subtract,
    Multiply,
    Divide
};

inline const char* math_op_to_string(MathOp op) {
    switch (op) {
        case MathOp::Add: return "add";
        case MathOp::Subtract: return "subtract";
        case MathOp::Multiply: return "multiply";
        case MathOp::Divide: return "divide";
        default: return "add";
    }
}

std::optional<MathOp> parse_math_op(const std::string& s);

enum class CmpOp {
    Gt,
    Lt,
    Eq,
    Gte,
    Lte
};

inline const char* cmp_op_to_string(CmpOp op) {
    switch (op) {
        case CmpOp::Gt: return "gt";
        case CmpOp::Lt: return "lt";
        case CmpOp::Eq: return "eq";
        case CmpOp::Gte: return "gte";
        case CmpOp::Lte: return "lte";
        default: return "eq";
    }
}

std::optional<CmpOp> parse_cmp_op(const std::string& s);

// ============================================================================
// Interpreter and Repair Loop States
// ============================================================================

enum class RunState {
    Running,
    Completed,
    Failed
};

inline const char* run_state_to_string(RunState s) {
    switch (s) {
        case RunState::Running: return "running";
        case RunState::Completed: return "completed";
        case RunState::Failed: return "failed";
        default: return "running";
    }
}

enum class LoopState {
    Drafting,
    Testing,
    Repairing,
    Deployed,
    Abandoned
};

inline const char* loop_state_to_string(LoopState s) {
    switch (s) {
        case LoopState::Drafting: return "drafting";
        case LoopState::Testing: return "testing";
        case LoopState::Repairing: return "repairing";
        case LoopState::Deployed: return "deployed";
        case LoopState::Abandoned: return "abandoned";
        default: return "drafting";
    }
}

} // namespace mender
