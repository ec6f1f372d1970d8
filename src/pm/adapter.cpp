/*
 * adapter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "adapter.hpp"

#include "exception.hpp"
#include "version_spec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <system_error>

namespace bottles::pm {

namespace {

constexpr std::array<std::string_view, 3> VENV_CANDIDATES = {".venv", "venv",
                                                             "env"};

bool isShellIdentifier(std::string_view name) {
    if (name.empty() ||
        std::isdigit(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    return std::ranges::all_of(name, [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

bool isDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::vector<fs::path> existingFiles(const fs::path& dir,
                                    const std::vector<std::string>& names) {
    std::vector<fs::path> found;
    for (const auto& name : names) {
        std::error_code ec;
        auto candidate = dir / name;
        if (fs::exists(candidate, ec)) {
            found.push_back(std::move(candidate));
        }
    }
    return found;
}

}  // namespace

PackageManagerAdapter::PackageManagerAdapter(AdapterContext context)
    : context_(std::move(context)) {
    if (!context_.runner) {
        THROW_INVALID_ADAPTER("Package manager adapter requires a command runner");
    }
    if (!context_.volumes) {
        THROW_INVALID_ADAPTER(
            "Package manager adapter requires a volume controller");
    }
    if (context_.projectDir.empty()) {
        std::error_code ec;
        context_.projectDir = fs::current_path(ec);
    }
}

PmResult<CachePaths> PackageManagerAdapter::getCachePaths() const {
    auto mount = context_.volumes->getMount(managerId());
    if (!mount) {
        return makeError(ErrorCode::MountNotFound,
                         std::format("No cache mount for {}", name()),
                         "Install a package or mount the cache first");
    }
    CachePaths paths;
    paths.global = mount->cachePath;
    paths.local = mount->cachePath;
    paths.temp = mount->cachePath / "temp";
    return paths;
}

ValidationResult PackageManagerAdapter::validateInstallation(
    const fs::path& dir) {
    ValidationResult validation;

    ExecuteOptions options;
    options.timeout = timeoutFor(TimeoutTier::Quick);
    options.suppressErrors = true;
    auto outcome = executeCommand(executable() + " --version", options);
    if (!outcome) {
        validation.valid = false;
        validation.errors.push_back(outcome.error().message);
    } else if (!outcome->result.success()) {
        validation.valid = false;
        validation.errors.push_back(
            std::format("{} is not available (exit code {}): {}", executable(),
                        outcome->result.exitCode, outcome->result.stderrText));
    }

    if (findManifestFiles(dir).empty()) {
        validation.warnings.push_back(std::format(
            "No {} manifest files found in {}", displayName(), dir.string()));
    }
    return validation;
}

VersionSpec PackageManagerAdapter::parseVersionSpec(
    std::string_view spec) const {
    return parseBasicVersionSpec(spec);
}

std::string PackageManagerAdapter::normalizePackageName(
    std::string_view name) const {
    return pm::normalizePackageName(name);
}

PmResult<CommandOutcome> PackageManagerAdapter::executeCommand(
    const std::string& command, const ExecuteOptions& options) {
    auto env = getEnvironmentVariables(
        options.env, options.cwd.value_or(context_.projectDir));
    if (!env) {
        return std::unexpected(env.error());
    }

    std::string line;
    for (const auto& [key, value] : *env) {
        if (!isShellIdentifier(key)) {
            spdlog::debug("[{}] Not exporting variable {}", name(), key);
            continue;
        }
        line += "export " + key + "=" + shellQuote(value) + "; ";
    }
    line += command;
    if (options.cwd && *options.cwd != context_.projectDir) {
        // Subshell so the directory change does not leak into the engine.
        line = "(cd " + shellQuote(options.cwd->string()) + " && " + line + ")";
    }

    const auto timeout =
        options.timeout.value_or(timeoutFor(TimeoutTier::Standard));
    spdlog::debug("[{}] Executing (timeout {} ms): {}", name(),
                  timeout.count(), command);

    auto result = context_.runner->execute(line, timeout);
    if (!result) {
        spdlog::error("[{}] Failed to execute '{}': {}", name(), command,
                      shell::shellErrorToString(result.error()));
        return makeError(
            ErrorCode::ExecutionError,
            std::format("Failed to execute command: {}", command),
            std::format("Ensure {} is installed and available in PATH",
                        executable()),
            std::string(shell::shellErrorToString(result.error())));
    }

    if (!options.suppressErrors) {
        if (result->timedOut) {
            spdlog::error("[{}] '{}' produced no output for {} ms", name(),
                          command, timeout.count());
            return makeError(
                ErrorCode::CommandTimedOut,
                std::format("Command timed out after {} ms without output: {}",
                            timeout.count(), command),
                "Raise PKG_LOCAL_TIMEOUT_MULTIPLIER or check network access",
                result->stderrText);
        }
        if (result->exitCode != 0) {
            spdlog::error("[{}] '{}' exited with code {}", name(), command,
                          result->exitCode);
            return makeError(
                ErrorCode::CommandFailed,
                std::format("Command failed with exit code {}: {}",
                            result->exitCode, command),
                "Check the error output for details", result->stderrText);
        }
    }

    return CommandOutcome{command, std::move(*result)};
}

PmResult<EnvironmentMap> PackageManagerAdapter::getEnvironmentVariables(
    const EnvironmentMap& overrides, const fs::path& /*dir*/) {
    const auto id = managerId();
    auto mount = context_.volumes->getMount(id);
    if (!mount || !mount->active) {
        auto mounted = context_.volumes->mount(id);
        if (!mounted) {
            return makeError(
                ErrorCode::MountCreationFailed,
                std::format("Failed to mount {} cache", name()),
                "Check that the bottle cache directory is writable",
                mounted.error().message);
        }
        mount = std::move(*mounted);
    }

    EnvironmentMap env;
    std::string prefix(name());
    std::ranges::transform(prefix, prefix.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    env[prefix + "_CACHE_DIR"] = mount->cachePath.string();

    for (const auto& [key, value] : context_.volumes->getMountEnvVars()) {
        env[key] = value;
    }
    for (const auto& [key, value] : overrides) {
        env[key] = value;
    }
    for (const auto& [key, value] : context_.environment.variables()) {
        if (key.starts_with("npm_") || key.find('-') != std::string::npos) {
            continue;
        }
        env.try_emplace(key, value);
    }
    return env;
}

std::vector<fs::path> PackageManagerAdapter::findManifestFiles(
    const fs::path& dir) const {
    return existingFiles(dir, manifestFiles());
}

std::vector<fs::path> PackageManagerAdapter::findLockFiles(
    const fs::path& dir) const {
    return existingFiles(dir, lockFiles());
}

fs::path PackageManagerAdapter::getVenvPath(const fs::path& dir) const {
    for (auto candidate : VENV_CANDIDATES) {
        if (isDirectory(dir / candidate)) {
            return dir / candidate;
        }
    }
    return dir / ".venv";
}

bool PackageManagerAdapter::hasVenv(const fs::path& dir) const {
    return std::ranges::any_of(VENV_CANDIDATES, [&dir](std::string_view c) {
        return isDirectory(dir / c);
    });
}

std::string PackageManagerAdapter::getVenvActivationPrefix(
    const fs::path& dir) const {
    if (!hasVenv(dir)) {
        return {};
    }
    return std::format(". \"{}\" && ",
                       (getVenvPath(dir) / "bin" / "activate").string());
}

std::chrono::milliseconds PackageManagerAdapter::timeoutFor(
    TimeoutTier tier) const {
    return pm::timeoutFor(tier, context_.environment);
}

std::string PackageManagerAdapter::quoteArguments(
    const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined.push_back('"');
        for (char c : arg) {
            if (c == '"' || c == '\\' || c == '$' || c == '`') {
                joined.push_back('\\');
            }
            joined.push_back(c);
        }
        joined.push_back('"');
    }
    return joined;
}

std::string PackageManagerAdapter::shellQuote(std::string_view value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

}  // namespace bottles::pm
