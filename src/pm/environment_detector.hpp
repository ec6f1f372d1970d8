/*
 * environment_detector.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file environment_detector.hpp
 * @brief Probe which Python package managers are installed
 * @date 2024
 * @version 1.0.0
 */

#ifndef BOTTLES_PM_ENVIRONMENT_DETECTOR_HPP
#define BOTTLES_PM_ENVIRONMENT_DETECTOR_HPP

#include <chrono>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "config/environment_snapshot.hpp"
#include "shell/command_runner.hpp"

namespace bottles::pm {

/**
 * @brief Availability of one tool
 */
struct ToolInfo {
    bool available{false};
    std::optional<std::string> version;
    std::optional<std::string> error;    ///< Why the tool is unavailable
    std::optional<std::string> path;     ///< Output of `which`
    std::optional<std::string> command;  ///< Command that worked, e.g. pip3
};

struct EnvironmentInfo {
    ToolInfo pip;
    ToolInfo uv;
    bool detected{false};
    std::chrono::system_clock::time_point timestamp;

    /**
     * @brief PIP_COMMAND / UV_COMMAND for the tools that were found
     */
    [[nodiscard]] config::EnvironmentSnapshot::VariableMap
    toSnapshotOverrides() const;
};

class EnvironmentDetector {
public:
    EnvironmentDetector(std::shared_ptr<shell::ICommandRunner> runner,
                        config::EnvironmentSnapshot environment);

    /**
     * @brief Detect pip and uv
     *
     * In CI with PIP_AVAILABLE and UV_AVAILABLE set, the answer is taken
     * from the environment without running anything.
     */
    [[nodiscard]] EnvironmentInfo detect();

private:
    [[nodiscard]] std::optional<EnvironmentInfo> fromEnvironment() const;
    [[nodiscard]] ToolInfo detectPip();
    [[nodiscard]] ToolInfo detectUv();

    /**
     * @brief First candidate `which` finds, with its path
     */
    [[nodiscard]] std::optional<std::pair<std::string, std::string>> locate(
        std::initializer_list<std::string_view> candidates);

    std::shared_ptr<shell::ICommandRunner> runner_;
    config::EnvironmentSnapshot environment_;
};

}  // namespace bottles::pm

#endif  // BOTTLES_PM_ENVIRONMENT_DETECTOR_HPP
