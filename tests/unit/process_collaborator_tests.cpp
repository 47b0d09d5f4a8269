#include <doctest/doctest.h>
#include <mender/process_collaborator.hpp>

using namespace mender;

using std::chrono::milliseconds;

// ============================================================================
// Payload Extraction
// ============================================================================

TEST_CASE("extract_json_payload finds the outermost JSON") {
    CHECK(extract_json_payload(R"({"a": 1})") == std::string(R"({"a": 1})"));
    CHECK(extract_json_payload("Sure! Here it is: [1, [2]] Hope that helps.") ==
          std::string("[1, [2]]"));
    CHECK(extract_json_payload("```json\n{\"steps\": []}\n```") == std::string("{\"steps\": []}"));
    CHECK(extract_json_payload("```\n[\n1,\n2\n]\n```") == std::string("[ 1, 2 ]"));
    CHECK_FALSE(extract_json_payload("I cannot help with that.").has_value());
    CHECK_FALSE(extract_json_payload("only an opener {").has_value());
}

// ============================================================================
// Child Processes
// ============================================================================

TEST_CASE("run_process feeds stdin and collects stdout") {
    auto r = run_process("cat", "hello", milliseconds(5000));
    CHECK(r.exit_code == 0);
    CHECK(r.out == "hello");
    CHECK_FALSE(r.timed_out);
    CHECK_FALSE(r.spawn_failed);
}

TEST_CASE("run_process reports exit status and stderr") {
    auto r = run_process("echo oops >&2; exit 3", "", milliseconds(5000));
    CHECK(r.exit_code == 3);
    CHECK(r.err == "oops\n");
    CHECK(r.out.empty());
}

TEST_CASE("run_process kills a child past its deadline") {
    auto start = std::chrono::steady_clock::now();
    auto r = run_process("sleep 10", "", milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(r.timed_out);
    CHECK(r.exit_code != 0);
    CHECK(elapsed < std::chrono::seconds(5));
}

TEST_CASE("run_process caps output") {
    auto r = run_process("head -c 100000 /dev/zero", "", milliseconds(5000), 1000);
    CHECK(r.output_limit_exceeded);
    CHECK(r.out.size() == 1000);
}

// ============================================================================
// Process Collaborator
// ============================================================================

TEST_CASE("process collaborator speaks each role") {
    AppDefinition def;
    def.name = "Adder";

    SUBCASE("architect") {
        ProcessCollaborator architect(
            R"(grep -q '"role":"architect"' && echo '{"name": "Adder", "output_schema": {"properties": {"total": {}}}}')",
            milliseconds(5000));
        auto r = architect.propose_schemas("add two numbers");
        REQUIRE(r.isOk());
        CHECK(r.value().name == "Adder");
        CHECK(r.value().output_schema["properties"].contains("total"));
    }
    SUBCASE("developer answers in a fence") {
        ProcessCollaborator developer(
            R"(grep -q '"role":"developer"' && printf 'Here:\n```json\n[{"id": "t", "operation": {"op": "constant", "value": 1}, "output_path": "/t"}]\n```\n')",
            milliseconds(5000));
        auto r = developer.propose_program(def);
        REQUIRE(r.isOk());
        REQUIRE(r.value().is_array());
        CHECK(r.value()[0]["id"] == "t");
    }
    SUBCASE("qa") {
        ProcessCollaborator qa(
            R"(grep -q '"role":"qa"' && echo '{"tests": [{"name": "one", "input": {"a": 1}}]}')",
            milliseconds(5000));
        auto r = qa.propose_test_cases(def);
        REQUIRE(r.isOk());
        REQUIRE(r.value().size() == 1);
        CHECK(r.value()[0].name == "one");
    }
    SUBCASE("fixer receives the program and report") {
        ProcessCollaborator fixer(
            R"(grep -q '"error_summary"' && echo '[]')", milliseconds(5000));
        Program program;
        program.definition = def;
        auto r = fixer.propose_fix(program, make_candidate_report(ErrorKind::malformed_candidate, "x"),
                                   def);
        REQUIRE(r.isOk());
        CHECK(r.value().is_array());
    }
}

TEST_CASE("process collaborator maps failures") {
    AppDefinition def;

    SUBCASE("non-zero exit") {
        ProcessCollaborator c("cat >/dev/null; echo 'rate limited' >&2; exit 2", milliseconds(5000));
        auto r = c.propose_program(def);
        REQUIRE(r.isErr());
        CHECK(r.error().kind == CollaboratorErrorKind::failed);
        CHECK(r.error().message.find("rate limited") != std::string::npos);
    }
    SUBCASE("timeout") {
        ProcessCollaborator c("sleep 10", milliseconds(200));
        auto r = c.propose_program(def);
        REQUIRE(r.isErr());
        CHECK(r.error().kind == CollaboratorErrorKind::timeout);
    }
    SUBCASE("no JSON") {
        ProcessCollaborator c("cat >/dev/null; echo 'I would rather not.'", milliseconds(5000));
        auto r = c.propose_program(def);
        REQUIRE(r.isErr());
        CHECK(r.error().kind == CollaboratorErrorKind::malformed);
    }
    SUBCASE("broken JSON") {
        ProcessCollaborator c("cat >/dev/null; echo '{\"steps\": [1,}'", milliseconds(5000));
        auto r = c.propose_program(def);
        REQUIRE(r.isErr());
        CHECK(r.error().kind == CollaboratorErrorKind::malformed);
    }
    SUBCASE("test cases that do not parse") {
        ProcessCollaborator c("cat >/dev/null; echo '[{\"name\": \"no input\"}]'", milliseconds(5000));
        auto r = c.propose_test_cases(def);
        REQUIRE(r.isErr());
        CHECK(r.error().kind == CollaboratorErrorKind::malformed);
    }
}
