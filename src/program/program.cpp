#include "mender/program.hpp"

#include <type_traits>

namespace mender {

namespace {

OpKind arithmetic_kind(MathOp op) {
    switch (op) {
        case MathOp::Add: return OpKind::Add;
        case MathOp::Subtract: return OpKind::Subtract;
        case MathOp::Multiply: return OpKind::Multiply;
        case MathOp::Divide: return OpKind::Divide;
    }
    return OpKind::Add;
}

OpKind aggregate_kind(ops::AggregateFn fn) {
    switch (fn) {
        case ops::AggregateFn::Sum: return OpKind::Sum;
        case ops::AggregateFn::Min: return OpKind::Min;
        case ops::AggregateFn::Max: return OpKind::Max;
    }
    return OpKind::Sum;
}

bool is_document_path(const std::string& field) {
    return !field.empty() && field[0] == '/';
}

} // namespace

OpKind operation_kind(const Operation& op) {
    return std::visit([](const auto& o) -> OpKind {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, ops::Get>) return OpKind::Get;
        else if constexpr (std::is_same_v<T, ops::Constant>) return OpKind::Constant;
        else if constexpr (std::is_same_v<T, ops::Pluck>) return OpKind::Pluck;
        else if constexpr (std::is_same_v<T, ops::Arithmetic>) return arithmetic_kind(o.op);
        else if constexpr (std::is_same_v<T, ops::Calculate>) return OpKind::Calculate;
        else if constexpr (std::is_same_v<T, ops::Aggregate>) return aggregate_kind(o.fn);
        else if constexpr (std::is_same_v<T, ops::Count>) return OpKind::Count;
        else if constexpr (std::is_same_v<T, ops::FilterNumeric>) return OpKind::FilterNumeric;
        else if constexpr (std::is_same_v<T, ops::Sort>) return OpKind::Sort;
        else return OpKind::FormatString;
    }, op);
}

std::vector<std::string> operand_paths(const Operation& op) {
    return std::visit([](const auto& o) -> std::vector<std::string> {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, ops::Get>) {
            return {o.path};
        } else if constexpr (std::is_same_v<T, ops::Constant>) {
            return {};
        } else if constexpr (std::is_same_v<T, ops::Pluck>) {
            return {o.path};
        } else if constexpr (std::is_same_v<T, ops::Arithmetic>) {
            return {o.a, o.b};
        } else if constexpr (std::is_same_v<T, ops::Calculate>) {
            std::vector<std::string> paths = {o.list_path};
            if (is_document_path(o.a_field)) paths.push_back(o.a_field);
            if (is_document_path(o.b_field)) paths.push_back(o.b_field);
            return paths;
        } else if constexpr (std::is_same_v<T, ops::FormatString>) {
            std::vector<std::string> paths;
            for (const auto& var : o.variables) {
                paths.push_back(var.path);
            }
            return paths;
        } else {
            // Aggregate, Count, FilterNumeric, Sort
            return {o.list_path};
        }
    }, op);
}

} // namespace mender
