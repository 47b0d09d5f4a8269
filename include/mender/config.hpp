#pragma once

#include "mender/harness.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mender {

// ============================================================================
// Loop Configuration
// ============================================================================

struct LoopConfig {
    std::string schema;       // "mender.config.v1"
    std::string source_path;  // Empty for the built-in defaults

    size_t max_attempts = 3;  // Fixer calls after the draft
    std::chrono::milliseconds collaborator_timeout{60000};
    HarnessOptions harness;
    std::string log_level = "info";
};

// Defaults used when no config file is given
LoopConfig get_builtin_config();

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    LoopConfig config;
    std::vector<std::string> warnings;
};

/**
 * @brief Parse a config file
 *
 * {
 *   "$schema": "mender.config.v1",
 *   "max_attempts": 3,
 *   "collaborator_timeout_ms": 60000,
 *   "harness": { "parallelism": 1, "tolerance": 1e-9 },
 *   "log_level": "info"
 * }
 *
 * $schema is required. Invalid values keep their default and add a warning.
 */
ConfigParseResult parse_config_full(const std::string& json_str,
                                    const std::string& source_path = "");

/**
 * Resolve the config file path.
 * Priority: explicit path > MENDER_CONFIG env > none (built-in defaults)
 */
std::optional<std::string> resolve_config_path(const std::optional<std::string>& override_path);

/**
 * Load the resolved config. A missing or unreadable file is an error only
 * when one was named explicitly or through the environment.
 */
ConfigParseResult load_config(const std::optional<std::string>& override_path);

// Names accepted for log_level: trace, debug, info, warn, error, critical, off
bool is_valid_log_level(const std::string& level);

// Set spdlog's global level from a log_level name
void apply_log_level(const std::string& level);

Document config_to_json(const LoopConfig& config);

} // namespace mender
