#pragma once

#include "mender/document.hpp"
#include "mender/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mender {

// ============================================================================
// Operations
// ============================================================================
//
// One struct per supported kind. Every path field is an absolute operand path
// resolved through the Path Resolver at evaluation time.

namespace ops {

struct Get {
    std::string path;
};

struct Constant {
    Document value;  // string, number, bool or null
};

struct Pluck {
    std::string path;
    std::string key;
};

struct Arithmetic {
    MathOp op = MathOp::Add;
    std::string a;
    std::string b;
};

// Per-element arithmetic. A field starting with '/' is a document path,
// anything else names a field of the current element.
struct Calculate {
    std::string list_path;
    std::string output_field;
    MathOp op = MathOp::Add;
    std::string a_field;
    std::string b_field;
};

enum class AggregateFn {
    Sum,
    Min,
    Max
};

struct Aggregate {
    AggregateFn fn = AggregateFn::Sum;
    std::string list_path;
    std::optional<std::string> field;
};

struct Count {
    std::string list_path;
};

struct FilterNumeric {
    std::string list_path;
    std::optional<std::string> field;
    CmpOp op = CmpOp::Eq;
    double value = 0.0;
};

struct Sort {
    std::string list_path;
    std::string field;
    bool descending = false;
};

struct FormatVariable {
    std::string key;   // Placeholder name, without braces
    std::string path;
};

struct FormatString {
    std::string template_text;
    std::vector<FormatVariable> variables;
};

} // namespace ops

using Operation = std::variant<
    ops::Get,
    ops::Constant,
    ops::Pluck,
    ops::Arithmetic,
    ops::Calculate,
    ops::Aggregate,
    ops::Count,
    ops::FilterNumeric,
    ops::Sort,
    ops::FormatString>;

// The tag this operation carries in program JSON
OpKind operation_kind(const Operation& op);

// Every operand path the operation reads, in declaration order
std::vector<std::string> operand_paths(const Operation& op);

// ============================================================================
// Steps and Programs
// ============================================================================

struct Step {
    std::string id;
    std::string description;  // Diagnostic only
    Operation operation;
    std::string output_path;
};

struct AppDefinition {
    std::string name;
    std::string description;
    Document input_schema = Document::object();
    Document output_schema = Document::object();
};

struct Program {
    AppDefinition definition;
    std::vector<Step> steps;
};

} // namespace mender
