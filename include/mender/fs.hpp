#pragma once

#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace mender {
namespace fs {

// ============================================================================
// File Operations
// ============================================================================

/**
 * Read entire file contents as string.
 */
inline std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * Write string to file, replacing any previous contents.
 */
inline bool write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }
    file << content;
    return file.good();
}

} // namespace fs
} // namespace mender
