/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Central logging manager for the bottles library

**************************************************/

#ifndef BOTTLES_LOGGING_LOGGING_MANAGER_HPP
#define BOTTLES_LOGGING_LOGGING_MANAGER_HPP

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace bottles::logging {

/**
 * @brief Central logging manager with spdlog integration
 *
 * Installs the default spdlog logger used by every module and hands out
 * named loggers that share its sinks. Thread-safe.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    /**
     * @brief Initialize (or reinitialize) logging with configuration
     */
    void initialize(const LoggingConfig& config);

    /**
     * @brief Flush and drop all loggers
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    /**
     * @brief Get or create a named logger sharing the configured sinks
     */
    auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    void setGlobalLevel(spdlog::level::level_enum level);

    [[nodiscard]] auto getGlobalLevel() const -> spdlog::level::level_enum;

    [[nodiscard]] auto sinkNames() const -> std::vector<std::string>;

    void flush();

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

private:
    LoggingManager() = default;
    ~LoggingManager();

    void setupDefaultLogger();
    auto sinkList() const -> std::vector<spdlog::sink_ptr>;

    mutable std::shared_mutex mutex_;
    LoggingConfig config_;
    std::map<std::string, spdlog::sink_ptr> sinks_;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
    bool initialized_{false};
};

}  // namespace bottles::logging

#endif  // BOTTLES_LOGGING_LOGGING_MANAGER_HPP
