/*
 * bottles_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "bottles_config.hpp"

#include "exception.hpp"
#include "logging/logging_manager.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>

namespace bottles::config {

namespace {

std::optional<double> parsePositiveDouble(const std::string& text) {
    double value = 0.0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() ||
        value <= 0.0) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

ShellSettings ShellSettings::fromJson(const json& j) {
    ShellSettings cfg;
    cfg.shellPath = j.value("shellPath", cfg.shellPath);
    cfg.defaultTimeoutMs = j.value("defaultTimeoutMs", cfg.defaultTimeoutMs);
    cfg.initTimeoutMs = j.value("initTimeoutMs", cfg.initTimeoutMs);
    cfg.maxCommandDurationMs =
        j.value("maxCommandDurationMs", cfg.maxCommandDurationMs);
    cfg.cleanEnv = j.value("cleanEnv", cfg.cleanEnv);
    if (j.contains("preservePaths") && j["preservePaths"].is_array()) {
        cfg.preservePaths = j["preservePaths"].get<std::vector<std::string>>();
    }
    return cfg;
}

json BottlesConfig::toJson() const {
    json j = {{"bottlesDir", bottlesDir.string()},
              {"cacheRoot", cacheRoot.string()},
              {"shell", shell.toJson()},
              {"pool", pool.toJson()},
              {"logging", logging.toJson()}};
    if (timeoutMultiplier) {
        j["timeoutMultiplier"] = *timeoutMultiplier;
    }
    return j;
}

BottlesConfig BottlesConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION(
            std::string("Configuration root must be an object, got ") +
            j.type_name());
    }

    BottlesConfig cfg;
    try {
        if (j.contains("bottlesDir")) {
            cfg.bottlesDir = j["bottlesDir"].get<std::string>();
        }
        if (j.contains("cacheRoot")) {
            cfg.cacheRoot = j["cacheRoot"].get<std::string>();
        } else if (!cfg.bottlesDir.empty()) {
            cfg.cacheRoot = cfg.bottlesDir / "cache";
        }
        if (j.contains("shell")) {
            cfg.shell = ShellSettings::fromJson(j["shell"]);
        }
        if (j.contains("pool")) {
            cfg.pool = PoolSettings::fromJson(j["pool"]);
        }
        if (j.contains("timeoutMultiplier")) {
            auto multiplier = j["timeoutMultiplier"].get<double>();
            if (multiplier <= 0.0) {
                THROW_INVALID_CONFIG_EXCEPTION(
                    "timeoutMultiplier must be positive");
            }
            cfg.timeoutMultiplier = multiplier;
        }
        if (j.contains("logging")) {
            cfg.logging = logging::LoggingConfig::fromJson(j["logging"]);
        }
    } catch (const json::exception& e) {
        THROW_INVALID_CONFIG_EXCEPTION(std::string("Invalid configuration: ") +
                                       e.what());
    }
    return cfg;
}

BottlesConfig BottlesConfig::loadFromFile(const std::filesystem::path& file) {
    std::ifstream input(file);
    if (!input.is_open()) {
        THROW_CONFIG_IO_EXCEPTION("Cannot open configuration file: " +
                                  file.string());
    }

    json j;
    try {
        j = json::parse(input);
    } catch (const json::parse_error& e) {
        THROW_CONFIG_IO_EXCEPTION("Failed to parse " + file.string() + ": " +
                                  e.what());
    }

    spdlog::debug("Loaded configuration from {}", file.string());
    return fromJson(j);
}

BottlesConfig BottlesConfig::fromEnvironment(const EnvironmentSnapshot& env) {
    BottlesConfig cfg;
    cfg.logging = logging::LoggingConfig::createDefault();
    cfg.applyEnvironment(env);
    return cfg;
}

void BottlesConfig::applyEnvironment(const EnvironmentSnapshot& env) {
    if (bottlesDir.empty() || env.has("BOTTLE_CACHE_ROOT")) {
        bottlesDir = resolveBottlesDir(env);
        cacheRoot = bottlesDir / "cache";
    }
    if (cacheRoot.empty()) {
        cacheRoot = bottlesDir / "cache";
    }

    if (auto raw = env.get("PKG_LOCAL_TIMEOUT_MULTIPLIER")) {
        if (auto value = parsePositiveDouble(*raw)) {
            timeoutMultiplier = value;
        } else {
            spdlog::warn("Ignoring invalid PKG_LOCAL_TIMEOUT_MULTIPLIER '{}'",
                         *raw);
        }
    }

    if (auto level = env.get("BOTTLES_LOG_LEVEL")) {
        logging.default_level = logging::levelFromString(*level);
    }

    if (env.isCI() && shell.initTimeoutMs == ShellSettings{}.initTimeoutMs) {
        shell.initTimeoutMs = 3000;
    }
}

void BottlesConfig::applyLogging() const {
    logging::LoggingManager::getInstance().initialize(logging);
    spdlog::debug("Logging configured at level {}",
                  logging::levelToString(logging.default_level));
}

std::filesystem::path resolveBottlesDir(const EnvironmentSnapshot& env) {
    if (auto root = env.get("BOTTLE_CACHE_ROOT"); root && !root->empty()) {
        return std::filesystem::path(*root) / "bottles";
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        cwd = env.getOr("PWD", ".");
    }
    return cwd / ".pkg-local-cache" / "bottles";
}

std::filesystem::path resolveCacheRoot(const EnvironmentSnapshot& env) {
    return resolveBottlesDir(env) / "cache";
}

}  // namespace bottles::config
