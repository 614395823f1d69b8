/**
 * topojar CLI - Common utilities and types
 */

#pragma once

#include <topojar/topojar.hpp>
#include <nlohmann/json.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <string>

namespace topojar::cli {

/**
 * Options that control output rather than the build.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
};

/**
 * Program name used as the error prefix, as invoked.
 */
inline std::string program_name(const char* argv0) {
    if (argv0 == nullptr || *argv0 == '\0') {
        return "topojar";
    }
    return std::filesystem::path(argv0).filename().string();
}

/**
 * Log to stderr so stdout stays clean for --json.
 * --verbose shows the pipeline steps, otherwise only warnings.
 */
inline void init_logging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("topojar");
    logger->set_pattern("%n: %^%l%$: %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

/**
 * Output utilities.
 */
inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline void print_error(const std::string& program, const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["kind"] = error_kind_to_string(error.kind);
        j["error"] = error.message;
        output_json(j);
    } else {
        std::cerr << format_error(program, error) << std::endl;
    }
}

// Unclassified failures (I/O) carry no kind
inline void print_error(const std::string& program, const std::string& message, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["kind"] = nullptr;
        j["error"] = message;
        output_json(j);
    } else {
        std::cerr << format_error(program, message) << std::endl;
    }
}

inline nlohmann::json build_result_to_json(const BuildResult& result) {
    nlohmann::json j;
    j["ok"] = result.ok;
    j["output"] = result.output_jar;
    j["entries"] = result.entry_count;
    j["use_virtualenv"] = result.use_env == UseEnv::Enabled;
    return j;
}

} // namespace topojar::cli
