/*
 * environment_detector.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "environment_detector.hpp"

#include "timeouts.hpp"

#include <spdlog/spdlog.h>

#include <format>
#include <regex>

namespace bottles::pm {

namespace {

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

std::string failureText(const shell::CommandResult& result,
                        std::string_view tool,
                        std::chrono::milliseconds timeout) {
    if (result.timedOut) {
        return std::format("{} command timed out after {}ms", tool,
                           timeout.count());
    }
    return result.stderrText.empty() ? "Command failed"
                                     : trim(result.stderrText);
}

}  // namespace

config::EnvironmentSnapshot::VariableMap EnvironmentInfo::toSnapshotOverrides()
    const {
    config::EnvironmentSnapshot::VariableMap overrides;
    if (pip.available && pip.command) {
        overrides["PIP_COMMAND"] = *pip.command;
    }
    if (uv.available && uv.command) {
        overrides["UV_COMMAND"] = *uv.command;
    }
    return overrides;
}

EnvironmentDetector::EnvironmentDetector(
    std::shared_ptr<shell::ICommandRunner> runner,
    config::EnvironmentSnapshot environment)
    : runner_(std::move(runner)), environment_(std::move(environment)) {}

EnvironmentInfo EnvironmentDetector::detect() {
    if (auto cached = fromEnvironment()) {
        spdlog::debug("[detector] Using PIP_AVAILABLE/UV_AVAILABLE from CI");
        return *cached;
    }

    const auto start = std::chrono::steady_clock::now();
    EnvironmentInfo info;
    if (!runner_ || !runner_->isAlive()) {
        spdlog::error("[detector] No live shell to probe package managers");
        info.pip.error = "Detection failed";
        info.uv.error = "Detection failed";
        info.timestamp = std::chrono::system_clock::now();
        return info;
    }

    info.pip = detectPip();
    info.uv = detectUv();
    info.detected = true;
    info.timestamp = std::chrono::system_clock::now();

    spdlog::debug(
        "[detector] Detection completed in {}ms (pip: {}, uv: {})",
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start)
            .count(),
        info.pip.available, info.uv.available);
    return info;
}

std::optional<EnvironmentInfo> EnvironmentDetector::fromEnvironment() const {
    if (!environment_.isCI() || !environment_.has("PIP_AVAILABLE") ||
        !environment_.has("UV_AVAILABLE")) {
        return std::nullopt;
    }
    EnvironmentInfo info;
    info.pip.available = environment_.getOr("PIP_AVAILABLE", "") == "true";
    info.pip.version = environment_.getOr("PIP_VERSION", "unknown");
    info.pip.command = "pip";
    info.uv.available = environment_.getOr("UV_AVAILABLE", "") == "true";
    info.uv.version = environment_.getOr("UV_VERSION", "unknown");
    info.uv.command = "uv";
    info.detected = true;
    info.timestamp = std::chrono::system_clock::now();
    return info;
}

std::optional<std::pair<std::string, std::string>> EnvironmentDetector::locate(
    std::initializer_list<std::string_view> candidates) {
    const auto timeout = timeoutFor(TimeoutTier::Immediate, environment_);
    for (auto candidate : candidates) {
        auto result = runner_->execute(std::format("which {}", candidate),
                                       timeout);
        if (!result) {
            spdlog::warn("[detector] which {} failed: {}", candidate,
                         shell::shellErrorToString(result.error()));
            continue;
        }
        if (result->exitCode == 0 && !result->timedOut) {
            return std::make_pair(std::string(candidate),
                                  trim(result->stdoutText));
        }
    }
    return std::nullopt;
}

ToolInfo EnvironmentDetector::detectPip() {
    ToolInfo info;
    auto found = locate({"pip", "pip3"});
    if (!found) {
        info.error = "pip not found in PATH (tried: pip, pip3)";
        return info;
    }

    const auto timeout = timeoutFor(TimeoutTier::Quick, environment_);
    auto result = runner_->execute(found->first + " --version", timeout);
    if (!result) {
        info.error = std::string(shell::shellErrorToString(result.error()));
        return info;
    }
    if (result->exitCode != 0 || result->timedOut) {
        info.error = failureText(*result, "pip", timeout);
        return info;
    }

    static const std::regex PIP_VERSION(R"(pip\s+(\d+\.\d+\.\d+))");
    std::smatch match;
    info.version = std::regex_search(result->stdoutText, match, PIP_VERSION)
                       ? match[1].str()
                       : trim(result->stdoutText);
    info.available = true;
    info.command = found->first;
    info.path = found->second;
    return info;
}

ToolInfo EnvironmentDetector::detectUv() {
    ToolInfo info;
    auto found = locate({"uv"});
    if (!found) {
        info.error = "uv not found in PATH (tried: uv)";
        return info;
    }

    const auto timeout = timeoutFor(TimeoutTier::Quick, environment_);
    auto result = runner_->execute("uv --version", timeout);
    if (!result) {
        info.error = std::string(shell::shellErrorToString(result.error()));
        return info;
    }
    if (result->exitCode != 0 || result->timedOut) {
        info.error = failureText(*result, "uv", timeout);
        return info;
    }

    auto version = trim(result->stdoutText);
    if (version.starts_with("uv ")) {
        version = trim(std::string_view(version).substr(3));
    }
    info.version = version;
    info.available = true;
    info.command = found->first;
    info.path = found->second;
    return info;
}

}  // namespace bottles::pm
