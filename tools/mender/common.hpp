/**
 * Mender CLI - Common utilities and types
 */

#pragma once

#include <mender/config.hpp>
#include <mender/fs.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace mender::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config_path;       // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    mender::Document to_json() const {
        return mender::Document(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        mender::Document j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const mender::Document& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && j.is_object() && !j.contains("warnings")) {
        mender::Document output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Load the loop config and set up logging for one command.
 * Priority: --config flag > MENDER_CONFIG env > built-in defaults.
 * -v and -q override the configured log level. Logs go to stderr so that
 * stdout stays machine-readable.
 */
inline std::optional<mender::LoopConfig> init_command(const GlobalOptions& opts) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = opts.json;
    collector.quiet = opts.quiet;

    auto loaded = mender::load_config(
        opts.config_path.empty() ? std::nullopt : std::make_optional(opts.config_path));
    if (!loaded.ok) {
        print_error("config: " + loaded.error, opts.json);
        return std::nullopt;
    }
    for (const auto& w : loaded.warnings) {
        print_warning("config: " + w);
    }

    if (opts.verbose) {
        mender::apply_log_level("debug");
    } else if (opts.quiet || opts.json) {
        mender::apply_log_level(opts.quiet ? "error" : "warn");
    } else {
        mender::apply_log_level(loaded.config.log_level);
    }
    return loaded.config;
}

/**
 * Read and parse a JSON file, reporting failures through print_error.
 */
inline std::optional<mender::Document> load_json_file(const std::string& path, bool json_mode) {
    auto content = mender::fs::read_file(path);
    if (!content) {
        print_error("cannot read " + path, json_mode);
        return std::nullopt;
    }
    try {
        return mender::Document::parse(*content);
    } catch (const nlohmann::json::parse_error& e) {
        print_error(path + ": " + e.what(), json_mode);
        return std::nullopt;
    }
}

} // namespace mender::cli
