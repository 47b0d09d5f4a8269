#include "mender/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace mender {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<ErrorKind> parse_error_kind(const std::string& s) {
    std::string lower = to_lower(s);

    if (lower == "path_not_found") return ErrorKind::path_not_found;
    if (lower == "type_mismatch") return ErrorKind::type_mismatch;
    if (lower == "division_by_zero") return ErrorKind::division_by_zero;
    if (lower == "empty_aggregate") return ErrorKind::empty_aggregate;
    if (lower == "index_out_of_bounds") return ErrorKind::index_out_of_bounds;
    if (lower == "non_finite_result") return ErrorKind::non_finite_result;
    if (lower == "malformed_candidate") return ErrorKind::malformed_candidate;
    if (lower == "output_mismatch") return ErrorKind::output_mismatch;
    if (lower == "unexpected_completion") return ErrorKind::unexpected_completion;
    if (lower == "collaborator_timeout") return ErrorKind::collaborator_timeout;
    if (lower == "collaborator_failure") return ErrorKind::collaborator_failure;

    return std::nullopt;
}

// Tags are matched exactly; the generator is told to emit snake_case
std::optional<OpKind> parse_op_kind(const std::string& s) {
    if (s == "get") return OpKind::Get;
    if (s == "constant") return OpKind::Constant;
    if (s == "pluck") return OpKind::Pluck;
    if (s == "add") return OpKind::Add;
    if (s == "subtract") return OpKind::Subtract;
    if (s == "multiply") return OpKind::Multiply;
    if (s == "divide") return OpKind::Divide;
    if (s == "calculate") return OpKind::Calculate;
    if (s == "sum") return OpKind::Sum;
    if (s == "count") return OpKind::Count;
    if (s == "min") return OpKind::Min;
    if (s == "max") return OpKind::Max;
    if (s == "filter_numeric") return OpKind::FilterNumeric;
    if (s == "sort") return OpKind::Sort;
    if (s == "format_string") return OpKind::FormatString;
    return std::nullopt;
}

std::optional<MathOp> parse_math_op(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "add") return MathOp::Add;
    if (lower == "subtract") return MathOp::Subtract;
    if (lower == "multiply") return MathOp::Multiply;
    if (lower == "divide") return MathOp::Divide;
    return std::nullopt;
}

std::optional<CmpOp> parse_cmp_op(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "gt") return CmpOp::Gt;
    if (lower == "lt") return CmpOp::Lt;
    if (lower == "eq") return CmpOp::Eq;
    if (lower == "gte") return CmpOp::Gte;
    if (lower == "lte") return CmpOp::Lte;
    return std::nullopt;
}

} // namespace mender
