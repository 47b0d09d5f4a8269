#include "mender/program_json.hpp"

#include <type_traits>
#include <unordered_set>

namespace mender {

namespace {

// ============================================================================
// Field helpers: each returns false and fills `error` on a structural problem
// ============================================================================

bool require_string(const Document& j, const char* key, const std::string& where,
                    std::string& out, std::string& error) {
    if (!j.contains(key)) {
        error = where + "." + key + ": missing";
        return false;
    }
    if (!j[key].is_string()) {
        error = where + "." + key + ": expected string, got " + j[key].type_name();
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool require_nonempty(const Document& j, const char* key, const std::string& where,
                      std::string& out, std::string& error) {
    if (!require_string(j, key, where, out, error)) return false;
    if (out.empty()) {
        error = where + "." + key + ": must not be empty";
        return false;
    }
    return true;
}

bool check_path(const std::string& path, const std::string& field, std::string& error) {
    if (path.empty() || path[0] != '/' || !split_path(path)) {
        error = field + ": '" + path + "' is not an absolute path";
        return false;
    }
    return true;
}

bool require_path(const Document& j, const char* key, const std::string& where,
                  std::string& out, std::string& error) {
    if (!require_string(j, key, where, out, error)) return false;
    return check_path(out, where + "." + key, error);
}

// Absent and null both mean "not set"
bool optional_string(const Document& j, const char* key, const std::string& where,
                     std::optional<std::string>& out, std::string& error) {
    if (!j.contains(key) || j[key].is_null()) {
        out.reset();
        return true;
    }
    if (!j[key].is_string()) {
        error = where + "." + key + ": expected string or null, got " + j[key].type_name();
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

// A calculate operand is either a document path or an element field name
bool require_operand_field(const Document& j, const char* key, const std::string& where,
                           std::string& out, std::string& error) {
    if (!require_nonempty(j, key, where, out, error)) return false;
    if (out[0] == '/') {
        return check_path(out, where + "." + key, error);
    }
    return true;
}

std::optional<Operation> parse_operation(const Document& j, const std::string& where,
                                         std::string& error) {
    if (!j.is_object()) {
        error = where + ": expected object, got " + std::string(j.type_name());
        return std::nullopt;
    }

    std::string tag;
    if (!require_string(j, "op", where, tag, error)) return std::nullopt;

    auto kind = parse_op_kind(tag);
    if (!kind) {
        error = where + ".op: unknown operation '" + tag + "'";
        return std::nullopt;
    }

    switch (*kind) {
        case OpKind::Get: {
            ops::Get op;
            if (!require_path(j, "path", where, op.path, error)) return std::nullopt;
            return Operation{op};
        }
        case OpKind::Constant: {
            if (!j.contains("value")) {
                error = where + ".value: missing";
                return std::nullopt;
            }
            const auto& v = j["value"];
            if (!(v.is_string() || v.is_number() || v.is_boolean() || v.is_null())) {
                error = where + ".value: expected string, number, boolean or null, got " +
                        std::string(v.type_name());
                return std::nullopt;
            }
            ops::Constant op;
            op.value = v;
            return Operation{op};
        }
        case OpKind::Pluck: {
            ops::Pluck op;
            if (!require_path(j, "path", where, op.path, error)) return std::nullopt;
            if (!require_nonempty(j, "key", where, op.key, error)) return std::nullopt;
            return Operation{op};
        }
        case OpKind::Add:
        case OpKind::Subtract:
        case OpKind::Multiply:
        case OpKind::Divide: {
            ops::Arithmetic op;
            op.op = *parse_math_op(tag);
            if (!require_path(j, "a", where, op.a, error)) return std::nullopt;
            if (!require_path(j, "b", where, op.b, error)) return std::nullopt;
            return Operation{op};
        }
        case OpKind::Calculate: {
            ops::Calculate op;
            std::string op_name;
            if (!require_path(j, "list_path", where, op.list_path, error)) return std::nullopt;
            if (!require_nonempty(j, "output_field", where, op.output_field, error)) return std::nullopt;
            if (!require_string(j, "operator", where, op_name, error)) return std::nullopt;
            auto math = parse_math_op(op_name);
            if (!math) {
                error = where + ".operator: unknown operator '" + op_name + "'";
                return std::nullopt;
            }
            op.op = *math;
            if (!require_operand_field(j, "a_field", where, op.a_field, error)) return std::nullopt;
            if (!require_operand_field(j, "b_field", where, op.b_field, error)) return std::nullopt;
            return Operation{op};
        }
        case OpKind::Sum:
        case OpKind::Min:
        case OpKind::Max: {
            ops::Aggregate op;
            op.fn = *kind == OpKind::Sum ? ops::AggregateFn::Sum
                  : *kind == OpKind::Min ? ops::AggregateFn::Min
                  : ops::AggregateFn::Max;
            if (!require_path(j, "list_path", where, op.list_path, error)) return std::nullopt;
            if (!optional_string(j, "field", where, op.field, error)) return std::nullopt;
            return Operation{op};
        }
        case OpKind::Count: {
            ops::Count op;
            if (!require_path(j, "list_path", where, op.list_path, error)) return std::nullopt;
            return Operation{op};
        }
        case OpKind::FilterNumeric: {
            ops::FilterNumeric op;
            std::string op_name;
            if (!require_path(j, "list_path", where, op.list_path, error)) return std::nullopt;
            if (!optional_string(j, "field", where, op.field, error)) return std::nullopt;
            if (!require_string(j, "operator", where, op_name, error)) return std::nullopt;
            auto cmp = parse_cmp_op(op_name);
            if (!cmp) {
                error = where + ".operator: unknown comparison '" + op_name + "'";
                return std::nullopt;
            }
            op.op = *cmp;
            if (!j.contains("value") || !j["value"].is_number()) {
                error = where + ".value: expected number";
                return std::nullopt;
            }
            op.value = j["value"].get<double>();
            return Operation{op};
        }
        case OpKind::Sort: {
            ops::Sort op;
            if (!require_path(j, "list_path", where, op.list_path, error)) return std::nullopt;
            if (!require_nonempty(j, "field", where, op.field, error)) return std::nullopt;
            if (j.contains("descending")) {
                if (!j["descending"].is_boolean()) {
                    error = where + ".descending: expected boolean";
                    return std::nullopt;
                }
                op.descending = j["descending"].get<bool>();
            }
            return Operation{op};
        }
        case OpKind::FormatString: {
            ops::FormatString op;
            if (!require_string(j, "template", where, op.template_text, error)) return std::nullopt;
            if (!j.contains("variables") || !j["variables"].is_array()) {
                error = where + ".variables: expected array of {key, path} objects";
                return std::nullopt;
            }
            const auto& vars = j["variables"];
            for (size_t i = 0; i < vars.size(); ++i) {
                std::string var_where = where + ".variables[" + std::to_string(i) + "]";
                if (!vars[i].is_object()) {
                    error = var_where + ": expected {key, path} object, got " +
                            std::string(vars[i].type_name());
                    return std::nullopt;
                }
                ops::FormatVariable var;
                if (!require_nonempty(vars[i], "key", var_where, var.key, error)) return std::nullopt;
                if (!require_path(vars[i], "path", var_where, var.path, error)) return std::nullopt;
                op.variables.push_back(std::move(var));
            }
            return Operation{op};
        }
    }

    error = where + ".op: unsupported operation '" + tag + "'";
    return std::nullopt;
}

std::optional<Step> parse_step(const Document& j, const std::string& where, std::string& error) {
    if (!j.is_object()) {
        error = where + ": expected object, got " + std::string(j.type_name());
        return std::nullopt;
    }

    Step step;
    if (!require_nonempty(j, "id", where, step.id, error)) return std::nullopt;

    if (j.contains("description") && !j["description"].is_null()) {
        if (!require_string(j, "description", where, step.description, error)) return std::nullopt;
    }

    if (!j.contains("operation")) {
        error = where + ".operation: missing";
        return std::nullopt;
    }
    auto op = parse_operation(j["operation"], where + ".operation", error);
    if (!op) return std::nullopt;
    step.operation = std::move(*op);

    if (!require_string(j, "output_path", where, step.output_path, error)) return std::nullopt;
    if (!is_valid_output_path(step.output_path)) {
        error = where + ".output_path: '" + step.output_path +
                "' must be an absolute path below the root";
        return std::nullopt;
    }

    return step;
}

// Schemas may arrive as objects or as JSON text
bool read_schema(const Document& j, const char* key, const char* text_key, Document& out,
                 std::string& error) {
    if (j.contains(key) && !j[key].is_null()) {
        if (!j[key].is_object()) {
            error = std::string("definition.") + key + ": expected object";
            return false;
        }
        out = j[key];
        return true;
    }
    if (j.contains(text_key) && j[text_key].is_string()) {
        try {
            out = Document::parse(j[text_key].get<std::string>());
        } catch (const nlohmann::json::parse_error& e) {
            error = std::string("definition.") + text_key + ": " + e.what();
            return false;
        }
        if (!out.is_object()) {
            error = std::string("definition.") + text_key + ": expected a JSON object";
            return false;
        }
        return true;
    }
    out = Document::object();
    return true;
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

ParseResult<AppDefinition> app_definition_from_json(const Document& j) {
    ParseResult<AppDefinition> result;
    if (!j.is_object()) {
        result.error = "definition: expected object";
        return result;
    }

    if (j.contains("name") && j["name"].is_string()) {
        result.value.name = j["name"].get<std::string>();
    }
    if (j.contains("description") && j["description"].is_string()) {
        result.value.description = j["description"].get<std::string>();
    }
    if (!read_schema(j, "input_schema", "input_schema_json", result.value.input_schema,
                     result.error)) {
        return result;
    }
    if (!read_schema(j, "output_schema", "output_schema_json", result.value.output_schema,
                     result.error)) {
        return result;
    }
    if (result.value.name.empty()) {
        result.warnings.push_back("definition has no name");
    }

    result.ok = true;
    return result;
}

ParseResult<Program> program_from_json(const Document& j, const AppDefinition& fallback_definition) {
    ParseResult<Program> result;
    result.value.definition = fallback_definition;

    const Document* steps = nullptr;
    if (j.is_array()) {
        steps = &j;
    } else if (j.is_object()) {
        if (!j.contains("steps") || !j["steps"].is_array()) {
            result.error = "steps: expected array";
            return result;
        }
        steps = &j["steps"];
        if (j.contains("definition")) {
            auto def = app_definition_from_json(j["definition"]);
            if (!def.ok) {
                result.error = def.error;
                return result;
            }
            result.value.definition = std::move(def.value);
        }
    } else {
        result.error = std::string("program: expected array or object, got ") + j.type_name();
        return result;
    }

    std::unordered_set<std::string> seen_ids;
    for (size_t i = 0; i < steps->size(); ++i) {
        std::string where = "steps[" + std::to_string(i) + "]";
        auto step = parse_step((*steps)[i], where, result.error);
        if (!step) {
            return result;
        }
        if (!seen_ids.insert(step->id).second) {
            result.error = where + ".id: duplicate step id '" + step->id + "'";
            return result;
        }
        result.value.steps.push_back(std::move(*step));
    }

    if (result.value.steps.empty()) {
        result.warnings.push_back("program has no steps");
    }

    result.ok = true;
    return result;
}

ParseResult<Program> program_from_json(const Document& j) {
    return program_from_json(j, AppDefinition{});
}

ParseResult<Program> parse_program(const std::string& json_str) {
    try {
        return program_from_json(Document::parse(json_str));
    } catch (const nlohmann::json::parse_error& e) {
        ParseResult<Program> result;
        result.error = std::string("parse error: ") + e.what();
        return result;
    }
}

// ============================================================================
// Serialization
// ============================================================================

Document operation_to_json(const Operation& op) {
    Document j = Document::object();
    j["op"] = op_kind_to_string(operation_kind(op));

    std::visit([&j](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, ops::Get>) {
            j["path"] = o.path;
        } else if constexpr (std::is_same_v<T, ops::Constant>) {
            j["value"] = o.value;
        } else if constexpr (std::is_same_v<T, ops::Pluck>) {
            j["path"] = o.path;
            j["key"] = o.key;
        } else if constexpr (std::is_same_v<T, ops::Arithmetic>) {
            j["a"] = o.a;
            j["b"] = o.b;
        } else if constexpr (std::is_same_v<T, ops::Calculate>) {
            j["list_path"] = o.list_path;
            j["output_field"] = o.output_field;
            j["operator"] = math_op_to_string(o.op);
            j["a_field"] = o.a_field;
            j["b_field"] = o.b_field;
        } else if constexpr (std::is_same_v<T, ops::Aggregate>) {
            j["list_path"] = o.list_path;
            j["field"] = o.field ? Document(*o.field) : Document(nullptr);
        } else if constexpr (std::is_same_v<T, ops::Count>) {
            j["list_path"] = o.list_path;
        } else if constexpr (std::is_same_v<T, ops::FilterNumeric>) {
            j["list_path"] = o.list_path;
            j["field"] = o.field ? Document(*o.field) : Document(nullptr);
            j["operator"] = cmp_op_to_string(o.op);
            j["value"] = o.value;
        } else if constexpr (std::is_same_v<T, ops::Sort>) {
            j["list_path"] = o.list_path;
            j["field"] = o.field;
            j["descending"] = o.descending;
        } else if constexpr (std::is_same_v<T, ops::FormatString>) {
            j["template"] = o.template_text;
            Document vars = Document::array();
            for (const auto& var : o.variables) {
                vars.push_back(Document{{"key", var.key}, {"path", var.path}});
            }
            j["variables"] = std::move(vars);
        }
    }, op);

    return j;
}

Document step_to_json(const Step& step) {
    Document j = Document::object();
    j["id"] = step.id;
    j["description"] = step.description;
    j["operation"] = operation_to_json(step.operation);
    j["output_path"] = step.output_path;
    return j;
}

Document steps_to_json(const std::vector<Step>& steps) {
    Document j = Document::array();
    for (const auto& step : steps) {
        j.push_back(step_to_json(step));
    }
    return j;
}

Document app_definition_to_json(const AppDefinition& definition) {
    Document j = Document::object();
    j["name"] = definition.name;
    j["description"] = definition.description;
    j["input_schema"] = definition.input_schema;
    j["output_schema"] = definition.output_schema;
    return j;
}

Document program_to_json(const Program& program) {
    Document j = Document::object();
    j["definition"] = app_definition_to_json(program.definition);
    j["steps"] = steps_to_json(program.steps);
    return j;
}

} // namespace mender
