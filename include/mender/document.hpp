#pragma once

#include "mender/result.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mender {

// ============================================================================
// Document
// ============================================================================

// Objects keep insertion order so serialized documents are stable
using Document = nlohmann::ordered_json;

// Fallback roots tried, in order, when a literal read path misses
constexpr std::array<const char*, 2> kFallbackPrefixes = {"/inputs", "/temp"};

// Build the document a program runs against: {"inputs": <input>, "temp": {}}
Document make_runtime_document(Document input);

// ============================================================================
// Paths
// ============================================================================

// Split an absolute slash-delimited path into unescaped segments.
// "" and "/" address the root and yield no segments.
// Returns nullopt for a non-empty path that does not start with '/'
// or contains an invalid '~' escape.
std::optional<std::vector<std::string>> split_path(const std::string& path);

// Escape a single key for use as a path segment (~ -> ~0, / -> ~1)
std::string escape_segment(const std::string& key);

// True for "/x..." paths that are well-formed; the root is excluded
bool is_valid_output_path(const std::string& path);

// ============================================================================
// Resolution
// ============================================================================

enum class LookupStatus {
    Found,
    Missing,            // An object key along the path is absent
    IndexOutOfBounds,   // An array index along the path is out of range
    NotAContainer,      // A scalar sits where the path needs to descend
    InvalidPath
};

struct Resolution {
    const Document* value = nullptr;
    LookupStatus status = LookupStatus::Missing;
    std::string resolved_path;  // The candidate path that matched

    bool found() const { return value != nullptr; }
};

// Literal lookup only, no fallback
Resolution lookup(const Document& document, const std::string& path);

// Literal lookup, then each kFallbackPrefixes entry + path.
// On total miss the literal attempt's status is reported.
Resolution resolve(const Document& document, const std::string& path);

// Map a failed resolution to the error kind the evaluator reports
ErrorKind lookup_error_kind(LookupStatus status);

// Write value at the literal path, creating intermediate objects.
// Never writes through a fallback prefix. Leaves the document untouched on error.
Result<void> set(Document& document, const std::string& path, Document value);

} // namespace mender
