/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include <filesystem>

#include "sink_factory.hpp"

namespace bottles::logging {

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::~LoggingManager() {
    if (initialized_) {
        shutdown();
    }
}

void LoggingManager::initialize(const LoggingConfig& config) {
    std::unique_lock lock(mutex_);

    if (initialized_) {
        spdlog::warn("LoggingManager already initialized, reinitializing...");
        spdlog::drop_all();
        sinks_.clear();
        loggers_.clear();
    }

    config_ = config;

    for (const auto& sink_config : config.sinks) {
        auto sink = SinkFactory::createSink(sink_config);
        if (sink) {
            sinks_[sink_config.name.empty() ? sink_config.type
                                            : sink_config.name] = sink;
        }
    }

    if (config.enable_console && !sinks_.contains("console")) {
        sinks_["console"] =
            SinkFactory::createConsoleSink(spdlog::level::trace, "");
    }

    if (config.enable_file) {
        SinkConfig file_config;
        file_config.name = "file";
        file_config.type = "rotating_file";
        file_config.file_path =
            (std::filesystem::path(config.log_dir) /
             (config.log_filename + ".log"))
                .string();
        if (auto sink = SinkFactory::createSink(file_config)) {
            sinks_["file"] = sink;
        }
    }

    setupDefaultLogger();

    initialized_ = true;
    spdlog::debug("LoggingManager initialized with {} sinks", sinks_.size());
}

void LoggingManager::shutdown() {
    std::unique_lock lock(mutex_);

    if (!initialized_) {
        return;
    }

    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
    if (auto def = spdlog::default_logger()) {
        def->flush();
    }

    spdlog::drop_all();
    loggers_.clear();
    sinks_.clear();
    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::shared_lock lock(mutex_);
    return initialized_;
}

auto LoggingManager::getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    std::unique_lock lock(mutex_);

    if (auto it = loggers_.find(name); it != loggers_.end()) {
        return it->second;
    }

    auto sinks = sinkList();
    auto logger =
        std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(config_.default_level);
    logger->set_pattern(config_.default_pattern);
    loggers_[name] = logger;
    return logger;
}

void LoggingManager::setGlobalLevel(spdlog::level::level_enum level) {
    std::unique_lock lock(mutex_);

    config_.default_level = level;
    for (const auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
    spdlog::set_level(level);
}

auto LoggingManager::getGlobalLevel() const -> spdlog::level::level_enum {
    std::shared_lock lock(mutex_);
    return config_.default_level;
}

auto LoggingManager::sinkNames() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(sinks_.size());
    for (const auto& [name, sink] : sinks_) {
        names.push_back(name);
    }
    return names;
}

void LoggingManager::flush() {
    std::shared_lock lock(mutex_);
    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
    if (auto def = spdlog::default_logger()) {
        def->flush();
    }
}

void LoggingManager::setupDefaultLogger() {
    auto sinks = sinkList();
    auto default_logger =
        std::make_shared<spdlog::logger>("bottles", sinks.begin(), sinks.end());

    default_logger->set_level(config_.default_level);
    default_logger->set_pattern(config_.default_pattern);

    spdlog::set_default_logger(default_logger);
}

auto LoggingManager::sinkList() const -> std::vector<spdlog::sink_ptr> {
    std::vector<spdlog::sink_ptr> list;
    list.reserve(sinks_.size());
    for (const auto& [name, sink] : sinks_) {
        list.push_back(sink);
    }
    return list;
}

}  // namespace bottles::logging
