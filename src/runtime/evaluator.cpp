#include "mender/evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace mender {

namespace {

using Value = Result<Document, StepError>;
using Ref = Result<const Document*, StepError>;
using Number = Result<double, StepError>;

double apply_math(MathOp op, double a, double b) {
    switch (op) {
        case MathOp::Add: return a + b;
        case MathOp::Subtract: return a - b;
        case MathOp::Multiply: return a * b;
        case MathOp::Divide: return a / b;
    }
    return a + b;
}

bool compare(CmpOp op, double v, double target) {
    switch (op) {
        case CmpOp::Gt: return v > target;
        case CmpOp::Lt: return v < target;
        case CmpOp::Eq: return numbers_equal(v, target);
        case CmpOp::Gte: return v >= target;
        case CmpOp::Lte: return v <= target;
    }
    return false;
}

std::string join_keys(const Document& obj) {
    std::string out = "[";
    bool first = true;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!first) out += ", ";
        out += it.key();
        first = false;
    }
    return out + "]";
}

std::string element_path(const std::string& list_path, size_t index) {
    return list_path + "/" + std::to_string(index);
}

class StepEvaluator {
public:
    StepEvaluator(const Step& step, const Document& document)
        : step_(step), doc_(document), kind_(operation_kind(step.operation)) {}

    Value run() {
        return std::visit([this](const auto& op) { return eval(op); }, step_.operation);
    }

private:
    const Step& step_;
    const Document& doc_;
    OpKind kind_;

    StepError fail(ErrorKind kind, const std::string& path, std::string message) const {
        StepError error;
        error.kind = kind;
        error.step_id = step_.id;
        error.op = kind_;
        error.path = path;
        error.message = std::move(message);
        return error;
    }

    // Lists what does exist so a fixer can correct the path
    std::string missing_hint() const {
        if (!doc_.is_object()) return "document root is not an object";
        std::string hint = "available root keys: " + join_keys(doc_);
        auto inputs = doc_.find("inputs");
        if (inputs != doc_.end() && inputs->is_object()) {
            hint += "; available input keys: " + join_keys(*inputs);
        }
        return hint;
    }

    Ref operand(const std::string& path) const {
        Resolution r = resolve(doc_, path);
        if (r.found()) {
            return Ref::ok(r.value);
        }
        switch (r.status) {
            case LookupStatus::IndexOutOfBounds:
                return Ref::err(fail(ErrorKind::index_out_of_bounds, path,
                                     "array index out of range"));
            case LookupStatus::NotAContainer:
                return Ref::err(fail(ErrorKind::type_mismatch, path,
                                     "path descends into a scalar"));
            default:
                return Ref::err(fail(lookup_error_kind(r.status), path,
                                     "pointer not found; " + missing_hint()));
        }
    }

    Number number(const std::string& path) const {
        auto ref = operand(path);
        if (ref.isErr()) return Number::err(ref.error());
        const Document& v = *ref.value();
        if (!v.is_number()) {
            return Number::err(fail(ErrorKind::type_mismatch, path,
                                    std::string("expected number, got ") + v.type_name()));
        }
        return Number::ok(v.get<double>());
    }

    Ref array(const std::string& path) const {
        auto ref = operand(path);
        if (ref.isErr()) return ref;
        if (!ref.value()->is_array()) {
            return Ref::err(fail(ErrorKind::type_mismatch, path,
                                 std::string("expected array, got ") + ref.value()->type_name()));
        }
        return ref;
    }

    Value finite(double v, const std::string& path) const {
        if (!std::isfinite(v)) {
            return Value::err(fail(ErrorKind::non_finite_result, path,
                                   "result is not a finite number"));
        }
        return Value::ok(Document(v));
    }

    // Numeric value of an array element, or of one of its fields
    Number element_number(const Document& item, const std::optional<std::string>& field,
                          const std::string& item_path) const {
        const Document* v = &item;
        std::string where = item_path;
        if (field) {
            if (!item.is_object()) {
                return Number::err(fail(ErrorKind::type_mismatch, item_path,
                    std::string("expected object with field '") + *field + "', got " +
                    item.type_name()));
            }
            auto it = item.find(*field);
            where = item_path + "/" + escape_segment(*field);
            if (it == item.end()) {
                return Number::err(fail(ErrorKind::path_not_found, where, "field missing"));
            }
            v = &*it;
        }
        if (!v->is_number()) {
            return Number::err(fail(ErrorKind::type_mismatch, where,
                                    std::string("expected number, got ") + v->type_name()));
        }
        return Number::ok(v->get<double>());
    }

    // ------------------------------------------------------------------------

    Value eval(const ops::Get& op) const {
        auto ref = operand(op.path);
        if (ref.isErr()) return Value::err(ref.error());
        return Value::ok(*ref.value());
    }

    Value eval(const ops::Constant& op) const {
        return Value::ok(op.value);
    }

    Value eval(const ops::Pluck& op) const {
        auto list = array(op.path);
        if (list.isErr()) return Value::err(list.error());

        Document out = Document::array();
        for (const auto& item : *list.value()) {
            if (item.is_object()) {
                auto it = item.find(op.key);
                out.push_back(it != item.end() ? *it : Document(nullptr));
            } else {
                out.push_back(nullptr);
            }
        }
        return Value::ok(std::move(out));
    }

    Value eval(const ops::Arithmetic& op) const {
        auto a = number(op.a);
        if (a.isErr()) return Value::err(a.error());
        auto b = number(op.b);
        if (b.isErr()) return Value::err(b.error());

        if (op.op == MathOp::Divide && b.value() == 0.0) {
            return Value::err(fail(ErrorKind::division_by_zero, op.b, "denominator is 0"));
        }
        return finite(apply_math(op.op, a.value(), b.value()), step_.output_path);
    }

    Value eval(const ops::Calculate& op) const {
        auto list = array(op.list_path);
        if (list.isErr()) return Value::err(list.error());

        auto side = [this](const Document& item, const std::string& field,
                           const std::string& item_path) -> Number {
            if (field[0] == '/') {
                return number(field);
            }
            return element_number(item, field, item_path);
        };

        Document out = Document::array();
        const Document& items = *list.value();
        for (size_t i = 0; i < items.size(); ++i) {
            const Document& item = items[i];
            std::string item_path = element_path(op.list_path, i);
            if (!item.is_object()) {
                return Value::err(fail(ErrorKind::type_mismatch, item_path,
                    std::string("expected object, got ") + item.type_name()));
            }

            auto a = side(item, op.a_field, item_path);
            if (a.isErr()) return Value::err(a.error());
            auto b = side(item, op.b_field, item_path);
            if (b.isErr()) return Value::err(b.error());

            if (op.op == MathOp::Divide && b.value() == 0.0) {
                return Value::err(fail(ErrorKind::division_by_zero, item_path,
                                       "denominator '" + op.b_field + "' is 0"));
            }
            double r = apply_math(op.op, a.value(), b.value());
            if (!std::isfinite(r)) {
                return Value::err(fail(ErrorKind::non_finite_result, item_path,
                                       "result is not a finite number"));
            }

            Document row = item;
            row[op.output_field] = r;
            out.push_back(std::move(row));
        }
        return Value::ok(std::move(out));
    }

    Value eval(const ops::Aggregate& op) const {
        auto list = array(op.list_path);
        if (list.isErr()) return Value::err(list.error());

        const Document& items = *list.value();
        std::vector<double> values;
        values.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            auto v = element_number(items[i], op.field, element_path(op.list_path, i));
            if (v.isErr()) return Value::err(v.error());
            values.push_back(v.value());
        }

        if (op.fn == ops::AggregateFn::Sum) {
            return finite(std::accumulate(values.begin(), values.end(), 0.0), step_.output_path);
        }
        if (values.empty()) {
            return Value::err(fail(ErrorKind::empty_aggregate, op.list_path,
                                   "cannot take min/max of an empty array"));
        }
        if (op.fn == ops::AggregateFn::Min) {
            return Value::ok(Document(*std::min_element(values.begin(), values.end())));
        }
        return Value::ok(Document(*std::max_element(values.begin(), values.end())));
    }

    Value eval(const ops::Count& op) const {
        auto list = array(op.list_path);
        if (list.isErr()) return Value::err(list.error());
        return Value::ok(Document(list.value()->size()));
    }

    Value eval(const ops::FilterNumeric& op) const {
        auto list = array(op.list_path);
        if (list.isErr()) return Value::err(list.error());

        Document out = Document::array();
        for (const auto& item : *list.value()) {
            const Document* v = &item;
            if (op.field) {
                if (!item.is_object()) continue;
                auto it = item.find(*op.field);
                if (it == item.end()) continue;
                v = &*it;
            }
            if (!v->is_number()) continue;
            if (compare(op.op, v->get<double>(), op.value)) {
                out.push_back(item);
            }
        }
        return Value::ok(std::move(out));
    }

    Value eval(const ops::Sort& op) const {
        auto list = array(op.list_path);
        if (list.isErr()) return Value::err(list.error());

        const Document& items = *list.value();
        bool numeric = true;
        for (size_t i = 0; i < items.size(); ++i) {
            std::string item_path = element_path(op.list_path, i);
            if (!items[i].is_object()) {
                return Value::err(fail(ErrorKind::type_mismatch, item_path,
                    std::string("expected object, got ") + items[i].type_name()));
            }
            auto it = items[i].find(op.field);
            if (it == items[i].end()) {
                return Value::err(fail(ErrorKind::path_not_found,
                                       item_path + "/" + escape_segment(op.field),
                                       "sort key missing"));
            }
            bool is_num = it->is_number();
            if (!is_num && !it->is_string()) {
                return Value::err(fail(ErrorKind::type_mismatch,
                    item_path + "/" + escape_segment(op.field),
                    std::string("sort key must be a number or string, got ") + it->type_name()));
            }
            if (i == 0) {
                numeric = is_num;
            } else if (numeric != is_num) {
                return Value::err(fail(ErrorKind::type_mismatch,
                    item_path + "/" + escape_segment(op.field),
                    "sort keys mix numbers and strings"));
            }
        }

        std::vector<Document> sorted(items.begin(), items.end());
        const std::string& field = op.field;
        bool descending = op.descending;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [&field, numeric, descending](const Document& x, const Document& y) {
            const Document& kx = x.at(field);
            const Document& ky = y.at(field);
            if (numeric) {
                double a = kx.get<double>();
                double b = ky.get<double>();
                return descending ? a > b : a < b;
            }
            const auto& a = kx.get_ref<const std::string&>();
            const auto& b = ky.get_ref<const std::string&>();
            return descending ? a > b : a < b;
        });

        Document out = Document::array();
        for (auto& item : sorted) {
            out.push_back(std::move(item));
        }
        return Value::ok(std::move(out));
    }

    Value eval(const ops::FormatString& op) const {
        std::string result = op.template_text;
        for (const auto& var : op.variables) {
            auto ref = operand(var.path);
            if (ref.isErr()) return Value::err(ref.error());

            const Document& v = *ref.value();
            std::string text = v.is_string() ? v.get<std::string>() : v.dump();
            std::string placeholder = "{" + var.key + "}";

            size_t pos = 0;
            while ((pos = result.find(placeholder, pos)) != std::string::npos) {
                result.replace(pos, placeholder.size(), text);
                pos += text.size();
            }
        }
        return Value::ok(Document(result));
    }
};

} // namespace

bool numbers_equal(double a, double b) {
    double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    return std::fabs(a - b) <= std::numeric_limits<double>::epsilon() * scale;
}

Result<Document, StepError> evaluate(const Step& step, const Document& document) {
    StepEvaluator evaluator(step, document);
    return evaluator.run();
}

} // namespace mender
