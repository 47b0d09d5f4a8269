#include "mender/config.hpp"
#include "mender/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

#include <spdlog/spdlog.h>

namespace mender {

namespace {

constexpr const char* kConfigSchema = "mender.config.v1";

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Non-negative integer, or nullopt with a warning if present but invalid
std::optional<long long> get_count(const nlohmann::json& j, const std::string& key,
                                   const std::string& warning,
                                   std::vector<std::string>& warnings) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    if (!j[key].is_number_integer() || j[key].get<long long>() < 0) {
        warnings.push_back(warning);
        return std::nullopt;
    }
    return j[key].get<long long>();
}

} // namespace

LoopConfig get_builtin_config() {
    LoopConfig config;
    config.schema = kConfigSchema;
    return config;
}

bool is_valid_log_level(const std::string& level) {
    std::string l = to_lower(level);
    return l == "trace" || l == "debug" || l == "info" || l == "warn" ||
           l == "error" || l == "critical" || l == "off";
}

void apply_log_level(const std::string& level) {
    spdlog::set_level(spdlog::level::from_str(to_lower(level)));
}

ConfigParseResult parse_config_full(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config = get_builtin_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != kConfigSchema) {
            result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
            return result;
        }

        if (auto n = get_count(j, "max_attempts", "invalid_configuration:max_attempts",
                               result.warnings)) {
            result.config.max_attempts = static_cast<size_t>(*n);
        }

        if (auto ms = get_count(j, "collaborator_timeout_ms",
                                "invalid_configuration:collaborator_timeout_ms",
                                result.warnings)) {
            result.config.collaborator_timeout = std::chrono::milliseconds(*ms);
        }

        // "harness" section
        if (j.contains("harness") && j["harness"].is_object()) {
            const auto& harness = j["harness"];

            if (auto p = get_count(harness, "parallelism", "invalid_configuration:harness.parallelism",
                                   result.warnings)) {
                if (*p == 0) {
                    result.warnings.push_back("invalid_configuration:harness.parallelism");
                } else {
                    result.config.harness.parallelism = static_cast<size_t>(*p);
                }
            }

            if (harness.contains("tolerance")) {
                const auto& tol = harness["tolerance"];
                if (tol.is_number() && std::isfinite(tol.get<double>()) && tol.get<double>() >= 0.0) {
                    result.config.harness.tolerance = tol.get<double>();
                } else {
                    result.warnings.push_back("invalid_configuration:harness.tolerance");
                }
            }
        }

        if (auto level = get_string(j, "log_level")) {
            if (is_valid_log_level(*level)) {
                result.config.log_level = to_lower(*level);
            } else {
                result.warnings.push_back("invalid_configuration:log_level");
            }
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string& key = it.key();
            if (key != "$schema" && key != "max_attempts" && key != "collaborator_timeout_ms" &&
                key != "harness" && key != "log_level") {
                result.warnings.push_back("unknown_key:" + key);
            }
        }

        result.ok = true;

    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

std::optional<std::string> resolve_config_path(const std::optional<std::string>& override_path) {
    if (override_path && !override_path->empty()) {
        return *override_path;
    }
    const char* env = std::getenv("MENDER_CONFIG");
    if (env && *env) {
        return std::string(env);
    }
    return std::nullopt;
}

ConfigParseResult load_config(const std::optional<std::string>& override_path) {
    auto path = resolve_config_path(override_path);
    if (!path) {
        ConfigParseResult result;
        result.ok = true;
        result.config = get_builtin_config();
        return result;
    }

    auto content = fs::read_file(*path);
    if (!content) {
        ConfigParseResult result;
        result.config = get_builtin_config();
        result.error = "cannot read config file: " + *path;
        return result;
    }
    return parse_config_full(*content, *path);
}

Document config_to_json(const LoopConfig& config) {
    Document j = Document::object();
    j["$schema"] = config.schema;
    j["max_attempts"] = config.max_attempts;
    j["collaborator_timeout_ms"] = config.collaborator_timeout.count();
    j["harness"] = {{"parallelism", config.harness.parallelism},
                    {"tolerance", config.harness.tolerance}};
    j["log_level"] = config.log_level;
    if (!config.source_path.empty()) {
        j["source_path"] = config.source_path;
    }
    return j;
}

} // namespace mender
