#include "mender/interpreter.hpp"
#include "mender/evaluator.hpp"

#include <spdlog/spdlog.h>

namespace mender {

RunResult interpret(const Program& program, Document input) {
    RunResult result;
    result.state = RunState::Running;
    result.document = std::move(input);

    if (!program.definition.name.empty()) {
        spdlog::debug("Executing program: {}", program.definition.name);
    }

    for (const auto& step : program.steps) {
        spdlog::debug("  Step [{}]: {}", step.id, step.description);

        auto value = evaluate(step, result.document);
        if (value.isErr()) {
            result.state = RunState::Failed;
            result.error = std::move(value.error());
            spdlog::debug("  Step [{}] failed: {}", step.id, result.error->toString());
            return result;
        }

        auto written = set(result.document, step.output_path, std::move(value.value()));
        if (written.isErr()) {
            StepError error;
            error.kind = written.error().kind();
            error.step_id = step.id;
            error.op = operation_kind(step.operation);
            error.path = step.output_path;
            error.message = written.error().message();
            result.state = RunState::Failed;
            result.error = std::move(error);
            spdlog::debug("  Step [{}] failed: {}", step.id, result.error->toString());
            return result;
        }

        ++result.steps_executed;
    }

    result.state = RunState::Completed;
    return result;
}

Document extract_output(const Document& document, const Document& output_schema) {
    if (!output_schema.is_object() || !output_schema.contains("properties") ||
        !output_schema["properties"].is_object()) {
        return document;
    }

    Document structured = Document::object();
    for (auto it = output_schema["properties"].begin(); it != output_schema["properties"].end(); ++it) {
        Resolution r = lookup(document, "/" + escape_segment(it.key()));
        if (r.found()) {
            structured[it.key()] = *r.value;
        }
    }

    if (structured.empty()) {
        return document;
    }
    return structured;
}

} // namespace mender
