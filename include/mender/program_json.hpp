#pragma once

#include "mender/program.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mender {

// ============================================================================
// Parse Results
// ============================================================================

template<typename T>
struct ParseResult {
    bool ok = false;
    std::string error;
    T value;
    std::vector<std::string> warnings;
};

// ============================================================================
// Program Parsing (structural validation)
// ============================================================================
//
// Accepted shapes:
//   [ step, ... ]
//   { "steps": [ step, ... ], "definition": { ... } }
//
// A step is { "id", "description"?, "operation": { "op": <tag>, ... }, "output_path" }.
// Any failure here is a malformed candidate: unknown op tags, missing or
// mistyped fields, duplicate ids, relative paths, or writing the root.

ParseResult<Program> parse_program(const std::string& json_str);
ParseResult<Program> program_from_json(const Document& j);

// A definition embedded in the JSON wins over the fallback
ParseResult<Program> program_from_json(const Document& j, const AppDefinition& fallback_definition);

// Accepts schemas as objects or as JSON text ("input_schema_json")
ParseResult<AppDefinition> app_definition_from_json(const Document& j);

// ============================================================================
// Serialization
// ============================================================================

Document operation_to_json(const Operation& op);
Document step_to_json(const Step& step);
Document steps_to_json(const std::vector<Step>& steps);
Document app_definition_to_json(const AppDefinition& definition);

// { "definition": ..., "steps": [...] }
Document program_to_json(const Program& program);

} // namespace mender
