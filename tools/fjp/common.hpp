/**
 * fjp CLI - Common utilities and types
 */

#pragma once

#include <fjp/location.hpp>
#include <fjp/profile_stream.hpp>
#include <fjp/result.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace fjp::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string user_dir;          // --user-dir
    std::string system_dir;        // --system-dir
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route spdlog to stderr and pick the level from -v / -q.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::stderr_color_mt("fjp");
    logger->set_pattern("%^%l%$: %v");
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Search directories for this invocation.
 * Priority: --user-dir / --system-dir > FJP_USER_DIR / FJP_SYSTEM_DIR > defaults
 */
inline ProfileLocation location_from(const GlobalOptions& opts) {
    auto optional_of = [](const std::string& s) {
        return s.empty() ? std::nullopt : std::make_optional(s);
    };
    return resolve_location(optional_of(opts.user_dir), optional_of(opts.system_dir));
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

// Profile text is not guaranteed to be UTF-8
inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

// Streams are complete on both Result paths
inline ProfileStream parse_stream(const std::string& text) {
    auto parsed = ProfileStream::parse(text);
    return parsed.isOk() ? parsed.value() : parsed.error();
}

inline nlohmann::json line_to_json(const Line& line) {
    nlohmann::json j;
    if (line.lineno) {
        j["line"] = *line.lineno + 1;
    } else {
        j["line"] = nullptr;
    }
    std::string text = line.content ? line.content->to_string() : "";
    if (!text.empty() && text.back() == '\n') text.pop_back();
    j["text"] = text;
    return j;
}

} // namespace fjp::cli
