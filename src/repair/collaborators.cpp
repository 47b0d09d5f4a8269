#include "mender/collaborators.hpp"
#include "mender/fs.hpp"

namespace mender {

namespace {

CollaboratorError failed(std::string message) {
    return CollaboratorError{CollaboratorErrorKind::failed, std::move(message)};
}

CollaboratorError malformed(std::string message) {
    return CollaboratorError{CollaboratorErrorKind::malformed, std::move(message)};
}

std::optional<Document> read_json_file(const std::string& path, CollaboratorError& error) {
    auto content = fs::read_file(path);
    if (!content) {
        error = failed("cannot read " + path);
        return std::nullopt;
    }
    try {
        return Document::parse(*content);
    } catch (const nlohmann::json::parse_error& e) {
        error = malformed(path + ": " + e.what());
        return std::nullopt;
    }
}

} // namespace

CollabResult<AppDefinition> StaticCollaborator::propose_schemas(const std::string& /*request*/) {
    if (!definition_) {
        return CollabResult<AppDefinition>::err(failed("no static definition configured"));
    }
    return CollabResult<AppDefinition>::ok(*definition_);
}

CollabResult<CandidateJson> StaticCollaborator::propose_program(const AppDefinition& /*definition*/) {
    if (!program_) {
        return CollabResult<CandidateJson>::err(failed("no static program configured"));
    }
    return CollabResult<CandidateJson>::ok(*program_);
}

CollabResult<std::vector<TestCase>> StaticCollaborator::propose_test_cases(
    const AppDefinition& /*definition*/) {
    if (!cases_) {
        return CollabResult<std::vector<TestCase>>::err(failed("no static test cases configured"));
    }
    return CollabResult<std::vector<TestCase>>::ok(*cases_);
}

CollabResult<std::shared_ptr<StaticCollaborator>> load_static_collaborator(
    const std::string& definition_path,
    const std::string& program_path,
    const std::string& cases_path) {
    using R = CollabResult<std::shared_ptr<StaticCollaborator>>;
    auto collab = std::make_shared<StaticCollaborator>();
    CollaboratorError error;

    if (!definition_path.empty()) {
        auto j = read_json_file(definition_path, error);
        if (!j) return R::err(error);
        auto def = app_definition_from_json(*j);
        if (!def.ok) return R::err(malformed(definition_path + ": " + def.error));
        collab->set_definition(std::move(def.value));
    }

    if (!program_path.empty()) {
        auto j = read_json_file(program_path, error);
        if (!j) return R::err(error);
        collab->set_program(std::move(*j));
    }

    if (!cases_path.empty()) {
        auto j = read_json_file(cases_path, error);
        if (!j) return R::err(error);
        auto cases = test_cases_from_json(*j);
        if (!cases.ok) return R::err(malformed(cases_path + ": " + cases.error));
        collab->set_test_cases(std::move(cases.value));
    }

    return R::ok(std::move(collab));
}

} // namespace mender
