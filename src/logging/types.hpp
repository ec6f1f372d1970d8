/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logging system type definitions

**************************************************/

#ifndef BOTTLES_LOGGING_TYPES_HPP
#define BOTTLES_LOGGING_TYPES_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace bottles::logging {

/**
 * @brief Sink configuration structure
 */
struct SinkConfig {
    std::string name;
    std::string type;  // "console", "file", "rotating_file"
    spdlog::level::level_enum level{spdlog::level::trace};
    std::string pattern;

    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{5};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> SinkConfig;
};

/**
 * @brief Logging manager configuration
 */
struct LoggingConfig {
    spdlog::level::level_enum default_level{spdlog::level::info};
    std::string default_pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    std::vector<SinkConfig> sinks;

    bool enable_console{true};
    bool enable_file{false};
    std::string log_dir{"logs"};
    std::string log_filename{"bottles"};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;

    /**
     * @brief Console sink only, info level
     */
    [[nodiscard]] static auto createDefault() -> LoggingConfig;
};

/**
 * @brief Convert level string to spdlog enum
 *
 * Unknown names map to info.
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace bottles::logging

#endif  // BOTTLES_LOGGING_TYPES_HPP
