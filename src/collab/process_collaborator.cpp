#include "mender/process_collaborator.hpp"
#include "mender/program_json.hpp"

#include <cctype>

#include <spdlog/spdlog.h>

namespace mender {

namespace {

std::string strip_fences(const std::string& text) {
    size_t open = text.find("```");
    if (open == std::string::npos) {
        return text;
    }
    // Skip the fence and its language tag
    size_t start = open + 3;
    while (start < text.size() && std::isalnum(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    size_t close = text.rfind("```");
    if (close == std::string::npos || close < start) {
        close = text.size();
    }
    return text.substr(start, close - start);
}

std::string tail(const std::string& s, size_t limit = 500) {
    if (s.size() <= limit) return s;
    return "..." + s.substr(s.size() - limit);
}

CollaboratorError malformed(std::string message) {
    return CollaboratorError{CollaboratorErrorKind::malformed, std::move(message)};
}

} // namespace

std::optional<std::string> extract_json_payload(const std::string& text) {
    std::string content = strip_fences(text);

    for (auto& c : content) {
        if (std::iscntrl(static_cast<unsigned char>(c))) {
            c = ' ';
        }
    }

    size_t start = content.find_first_of("{[");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    char closer = content[start] == '{' ? '}' : ']';
    size_t end = content.rfind(closer);
    if (end == std::string::npos || end < start) {
        return std::nullopt;
    }
    return content.substr(start, end - start + 1);
}

ProcessCollaborator::ProcessCollaborator(std::string command, std::chrono::milliseconds timeout)
    : command_(std::move(command)), timeout_(timeout) {}

CollabResult<Document> ProcessCollaborator::exchange(const Document& request) {
    using R = CollabResult<Document>;
    std::string role = request.value("role", std::string("collaborator"));

    spdlog::debug("Running {} collaborator: {}", role, command_);
    ProcessResult proc = run_process(
        command_, request.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n",
        timeout_);

    if (proc.spawn_failed) {
        return R::err(CollaboratorError{CollaboratorErrorKind::failed,
                                        role + ": could not start '" + command_ + "'"});
    }
    if (proc.timed_out) {
        return R::err(CollaboratorError{
            CollaboratorErrorKind::timeout,
            role + ": killed after " + std::to_string(timeout_.count()) + " ms"});
    }
    if (proc.output_limit_exceeded) {
        return R::err(CollaboratorError{CollaboratorErrorKind::failed,
                                        role + ": output exceeded " +
                                        std::to_string(kMaxCollaboratorOutputBytes) + " bytes"});
    }
    if (proc.exit_code != 0) {
        std::string message = role + ": exited with status " + std::to_string(proc.exit_code);
        if (!proc.err.empty()) {
            message += ": " + tail(proc.err);
        }
        return R::err(CollaboratorError{CollaboratorErrorKind::failed, message});
    }
    if (!proc.err.empty()) {
        spdlog::debug("{} stderr: {}", role, tail(proc.err));
    }

    auto payload = extract_json_payload(proc.out);
    if (!payload) {
        return R::err(malformed(role + ": no JSON in response: " + tail(proc.out, 300)));
    }
    try {
        return R::ok(Document::parse(*payload));
    } catch (const nlohmann::json::parse_error& e) {
        return R::err(malformed(role + ": " + e.what()));
    }
}

CollabResult<AppDefinition> ProcessCollaborator::propose_schemas(const std::string& request) {
    Document j = Document::object();
    j["role"] = "architect";
    j["request"] = request;

    auto response = exchange(j);
    if (response.isErr()) {
        return CollabResult<AppDefinition>::err(response.error());
    }
    auto def = app_definition_from_json(response.value());
    if (!def.ok) {
        return CollabResult<AppDefinition>::err(malformed("architect: " + def.error));
    }
    return CollabResult<AppDefinition>::ok(std::move(def.value));
}

CollabResult<CandidateJson> ProcessCollaborator::propose_program(const AppDefinition& definition) {
    Document j = Document::object();
    j["role"] = "developer";
    j["definition"] = app_definition_to_json(definition);
    return exchange(j);
}

CollabResult<std::vector<TestCase>> ProcessCollaborator::propose_test_cases(
    const AppDefinition& definition) {
    Document j = Document::object();
    j["role"] = "qa";
    j["definition"] = app_definition_to_json(definition);

    auto response = exchange(j);
    if (response.isErr()) {
        return CollabResult<std::vector<TestCase>>::err(response.error());
    }
    auto cases = test_cases_from_json(response.value());
    if (!cases.ok) {
        return CollabResult<std::vector<TestCase>>::err(malformed("qa: " + cases.error));
    }
    return CollabResult<std::vector<TestCase>>::ok(std::move(cases.value));
}

CollabResult<CandidateJson> ProcessCollaborator::propose_fix(const Program& program,
                                                             const ErrorReport& report,
                                                             const AppDefinition& definition) {
    Document j = Document::object();
    j["role"] = "fixer";
    j["definition"] = app_definition_to_json(definition);
    j["program"] = program_to_json(program);
    j["error_report"] = error_report_to_json(report);
    j["error_summary"] = report.summary();
    return exchange(j);
}

} // namespace mender
