/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace bottles::logging {

auto SinkFactory::createSink(const SinkConfig& config) -> spdlog::sink_ptr {
    try {
        if (config.type == "console" || config.type == "stdout") {
            return createConsoleSink(config.level, config.pattern);
        }
        if (config.type == "file") {
            return createFileSink(config.file_path, config.level,
                                  config.pattern);
        }
        if (config.type == "rotating_file") {
            return createRotatingFileSink(config.file_path,
                                          config.max_file_size,
                                          config.max_files, config.level,
                                          config.pattern);
        }
        spdlog::warn("Unknown sink type: {}", config.type);
        return nullptr;
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Failed to create sink '{}': {}", config.name, e.what());
        return nullptr;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to create sink '{}': {}", config.name, e.what());
        return nullptr;
    }
}

auto SinkFactory::createConsoleSink(spdlog::level::level_enum level,
                                    const std::string& pattern)
    -> spdlog::sink_ptr {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createFileSink(const std::string& file_path,
                                 spdlog::level::level_enum level,
                                 const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createRotatingFileSink(const std::string& file_path,
                                         size_t max_size, size_t max_files,
                                         spdlog::level::level_enum level,
                                         const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        file_path, max_size, max_files);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

void SinkFactory::ensureDirectoryExists(const std::string& file_path) {
    auto parent = std::filesystem::path(file_path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

}  // namespace bottles::logging
