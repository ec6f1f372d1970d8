/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <cctype>

namespace bottles::logging {

// ============================================================================
// SinkConfig
// ============================================================================

auto SinkConfig::toJson() const -> nlohmann::json {
    return {{"name", name},
            {"type", type},
            {"level", levelToString(level)},
            {"pattern", pattern},
            {"file_path", file_path},
            {"max_file_size", max_file_size},
            {"max_files", max_files}};
}

auto SinkConfig::fromJson(const nlohmann::json& j) -> SinkConfig {
    SinkConfig config;
    config.name = j.value("name", "");
    config.type = j.value("type", "console");
    config.level = levelFromString(j.value("level", "trace"));
    config.pattern = j.value("pattern", "");
    config.file_path = j.value("file_path", "");
    config.max_file_size = j.value("max_file_size", config.max_file_size);
    config.max_files = j.value("max_files", config.max_files);
    return config;
}

// ============================================================================
// LoggingConfig
// ============================================================================

auto LoggingConfig::toJson() const -> nlohmann::json {
    nlohmann::json sinks_json = nlohmann::json::array();
    for (const auto& sink : sinks) {
        sinks_json.push_back(sink.toJson());
    }

    return {{"default_level", levelToString(default_level)},
            {"default_pattern", default_pattern},
            {"sinks", sinks_json},
            {"enable_console", enable_console},
            {"enable_file", enable_file},
            {"log_dir", log_dir},
            {"log_filename", log_filename}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    config.default_level = levelFromString(j.value("default_level", "info"));
    config.default_pattern = j.value("default_pattern", config.default_pattern);
    config.enable_console = j.value("enable_console", config.enable_console);
    config.enable_file = j.value("enable_file", config.enable_file);
    config.log_dir = j.value("log_dir", config.log_dir);
    config.log_filename = j.value("log_filename", config.log_filename);

    if (j.contains("sinks") && j["sinks"].is_array()) {
        for (const auto& sink_json : j["sinks"]) {
            config.sinks.push_back(SinkConfig::fromJson(sink_json));
        }
    }
    return config;
}

auto LoggingConfig::createDefault() -> LoggingConfig {
    LoggingConfig config;
    SinkConfig console;
    console.name = "console";
    console.type = "console";
    console.level = spdlog::level::info;
    config.sinks.push_back(console);
    return config;
}

// ============================================================================
// Level helpers
// ============================================================================

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    std::string lower = level;
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "info";
    }
}

}  // namespace bottles::logging
