#include "mender/document.hpp"

#include <cctype>

namespace mender {

namespace {

// Parse a JSON Pointer style array index: digits only, no leading zeros
std::optional<size_t> parse_index(const std::string& seg) {
    if (seg.empty() || seg.size() > 18) return std::nullopt;
    if (seg.size() > 1 && seg[0] == '0') return std::nullopt;
    size_t value = 0;
    for (char c : seg) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    return value;
}

bool has_prefix(const std::string& path, const std::string& prefix) {
    if (path.size() < prefix.size()) return false;
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

} // namespace

Document make_runtime_document(Document input) {
    Document doc = Document::object();
    doc["inputs"] = std::move(input);
    doc["temp"] = Document::object();
    return doc;
}

std::optional<std::vector<std::string>> split_path(const std::string& path) {
    std::vector<std::string> segments;
    if (path.empty() || path == "/") {
        return segments;
    }
    if (path[0] != '/') {
        return std::nullopt;
    }

    std::string current;
    for (size_t i = 1; i < path.size(); ++i) {
        char c = path[i];
        if (c == '/') {
            segments.push_back(std::move(current));
            current.clear();
        } else if (c == '~') {
            if (i + 1 >= path.size()) return std::nullopt;
            char next = path[++i];
            if (next == '0') {
                current += '~';
            } else if (next == '1') {
                current += '/';
            } else {
                return std::nullopt;
            }
        } else {
            current += c;
        }
    }
    segments.push_back(std::move(current));
    return segments;
}

std::string escape_segment(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

bool is_valid_output_path(const std::string& path) {
    auto segments = split_path(path);
    return segments.has_value() && !segments->empty();
}

Resolution lookup(const Document& document, const std::string& path) {
    Resolution result;
    auto segments = split_path(path);
    if (!segments) {
        result.status = LookupStatus::InvalidPath;
        return result;
    }

    const Document* node = &document;
    for (const auto& seg : *segments) {
        if (node->is_object()) {
            auto it = node->find(seg);
            if (it == node->end()) {
                result.status = LookupStatus::Missing;
                return result;
            }
            node = &*it;
        } else if (node->is_array()) {
            auto index = parse_index(seg);
            if (!index) {
                result.status = LookupStatus::NotAContainer;
                return result;
            }
            if (*index >= node->size()) {
                result.status = LookupStatus::IndexOutOfBounds;
                return result;
            }
            node = &(*node)[*index];
        } else {
            result.status = LookupStatus::NotAContainer;
            return result;
        }
    }

    result.value = node;
    result.status = LookupStatus::Found;
    result.resolved_path = path;
    return result;
}

Resolution resolve(const Document& document, const std::string& path) {
    Resolution literal = lookup(document, path);
    if (literal.found() || literal.status == LookupStatus::InvalidPath) {
        return literal;
    }

    for (const char* prefix : kFallbackPrefixes) {
        if (has_prefix(path, prefix)) continue;
        Resolution candidate = lookup(document, std::string(prefix) + path);
        if (candidate.found()) {
            return candidate;
        }
    }

    return literal;
}

ErrorKind lookup_error_kind(LookupStatus status) {
    switch (status) {
        case LookupStatus::IndexOutOfBounds: return ErrorKind::index_out_of_bounds;
        case LookupStatus::NotAContainer: return ErrorKind::type_mismatch;
        case LookupStatus::InvalidPath: return ErrorKind::malformed_candidate;
        case LookupStatus::Missing:
        case LookupStatus::Found:
        default: return ErrorKind::path_not_found;
    }
}

Result<void> set(Document& document, const std::string& path, Document value) {
    auto segments = split_path(path);
    if (!segments) {
        return Result<void>::err(Error(ErrorKind::malformed_candidate, "invalid path: " + path));
    }
    if (segments->empty()) {
        return Result<void>::err(Error(ErrorKind::type_mismatch,
                                       "cannot replace the document root"));
    }

    // Failures can only happen while walking pre-existing containers, before
    // the first insertion, so an error never leaves a partial write behind.
    Document* node = &document;
    for (size_t i = 0; i < segments->size(); ++i) {
        const std::string& seg = (*segments)[i];
        bool last = (i + 1 == segments->size());

        if (node->is_null()) {
            *node = Document::object();
        }

        if (node->is_object()) {
            node = &(*node)[seg];
        } else if (node->is_array()) {
            size_t index = node->size();
            if (seg != "-") {
                auto parsed = parse_index(seg);
                if (!parsed) {
                    return Result<void>::err(Error(ErrorKind::type_mismatch,
                        "segment '" + seg + "' is not an array index in " + path));
                }
                index = *parsed;
            }
            if (index > node->size()) {
                return Result<void>::err(Error(ErrorKind::index_out_of_bounds,
                    "index " + seg + " past end of array (size " +
                    std::to_string(node->size()) + ") in " + path));
            }
            if (index == node->size()) {
                node->push_back(nullptr);
                node = &node->back();
            } else {
                node = &(*node)[index];
            }
        } else {
            return Result<void>::err(Error(ErrorKind::type_mismatch,
                "cannot descend into " + std::string(node->type_name()) + " at segment '" +
                seg + "' of " + path));
        }

        if (last) {
            *node = std::move(value);
        }
    }

    return Result<void>::ok();
}

} // namespace mender
