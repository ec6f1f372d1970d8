/*
 * uv_adapter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "uv_adapter.hpp"

#include "json_output.hpp"
#include "pyproject.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <format>
#include <set>
#include <system_error>

namespace bottles::pm {

namespace {

constexpr std::array<std::string_view, 6> DEV_GROUPS = {
    "dev", "development", "test", "testing", "lint", "type-check"};

bool isDevGroup(std::string_view group) {
    return std::ranges::find(DEV_GROUPS, group) != DEV_GROUPS.end();
}

bool pathExists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

}  // namespace

UvAdapter::UvAdapter(AdapterContext context)
    : PackageManagerAdapter(std::move(context)) {}

std::string UvAdapter::executable() const {
    return environment().getOr("UV_COMMAND", "uv");
}

const std::vector<std::string>& UvAdapter::manifestFiles() const {
    static const std::vector<std::string> FILES = {"pyproject.toml"};
    return FILES;
}

const std::vector<std::string>& UvAdapter::lockFiles() const {
    static const std::vector<std::string> FILES = {"uv.lock"};
    return FILES;
}

PmResult<DetectionResult> UvAdapter::detectProject(const fs::path& dir) {
    DetectionResult detection;
    detection.manifestFiles = findManifestFiles(dir);
    if (detection.manifestFiles.empty()) {
        return detection;
    }
    detection.lockFiles = findLockFiles(dir);
    const bool hasLock = !detection.lockFiles.empty();

    double confidence = uv_confidence::BASE;
    auto& metadata = detection.metadata;
    if (hasLock) {
        confidence = uv_confidence::LOCK_FILE;
        metadata["hasLockFile"] = true;
    }

    auto pyproject = parsePyproject(detection.manifestFiles.front());
    if (!pyproject) {
        spdlog::warn("[uv] Could not read {}: {}",
                     detection.manifestFiles.front().string(),
                     pyproject.error().cause);
        confidence = std::max(confidence * uv_confidence::UNREADABLE_FACTOR,
                              uv_confidence::UNREADABLE_FLOOR);
    } else {
        if (pyproject->hasDependencyGroups) {
            confidence =
                std::max(confidence, uv_confidence::DEPENDENCY_GROUPS);
            metadata["hasDependencyGroups"] = true;
        }
        if (pyproject->hasToolUv) {
            confidence = std::max(confidence, uv_confidence::TOOL_UV);
            metadata["hasUVConfig"] = true;
        }
        if (pyproject->hasUvSources) {
            confidence = std::max(confidence, uv_confidence::UV_SOURCES);
            metadata["hasUVSources"] = true;
        }
        if (pyproject->hasUvIndex) {
            confidence = std::max(confidence, uv_confidence::UV_INDEX);
            metadata["hasUVIndex"] = true;
        }
        if (pyproject->hasUvWorkspace) {
            confidence = std::max(confidence, uv_confidence::WORKSPACE);
            if (hasLock) {
                confidence = std::min(
                    confidence + uv_confidence::WORKSPACE_LOCK_BONUS, 1.0);
            }
            metadata["isWorkspace"] = true;
        }
        if (!pyproject->uvDevDependencies.empty()) {
            metadata["hasLegacyDevDeps"] = true;
        }
    }

    detection.confidence = confidence;
    detection.detected = confidence >= uv_confidence::THRESHOLD;
    spdlog::debug("[uv] Detection in {}: confidence {:.2f}", dir.string(),
                  confidence);
    return detection;
}

PmResult<std::optional<Manifest>> UvAdapter::parseManifest(
    const fs::path& dir) {
    const auto pyprojectPath = dir / "pyproject.toml";
    if (!pathExists(pyprojectPath)) {
        return std::optional<Manifest>{};
    }

    auto pyproject = parsePyproject(pyprojectPath);
    if (!pyproject) {
        auto error = pyproject.error();
        error.code = ErrorCode::ManifestParseError;
        error.suggestion =
            "Ensure pyproject.toml is valid TOML with a [project] table";
        return std::unexpected(std::move(error));
    }
    if (!pyproject->hasProject) {
        spdlog::debug("[uv] {} has no [project] table", pyprojectPath.string());
        return std::optional<Manifest>{};
    }

    Manifest manifest;
    manifest.name = pyproject->name;
    manifest.version = pyproject->version;
    manifest.description = pyproject->description;
    manifest.license = pyproject->license;
    manifest.pythonRequires = pyproject->requiresPython;
    if (!pyproject->authors.empty()) {
        manifest.author = pyproject->authors.front().name;
    }

    auto addSpec = [this](DependencyMap& target, const std::string& spec,
                          std::string_view group = {}) {
        auto parsed = parseVersionSpec(spec);
        auto key = group.empty() ? parsed.name
                                 : std::format("{}[{}]", parsed.name, group);
        target[key] = parsed.constraint.value_or(parsed.version);
    };

    for (const auto& spec : pyproject->dependencies) {
        addSpec(manifest.dependencies, spec);
    }
    for (const auto& [group, specs] : pyproject->dependencyGroups) {
        if (!isDevGroup(group)) {
            continue;
        }
        for (const auto& spec : specs) {
            addSpec(manifest.devDependencies, spec);
        }
    }
    for (const auto& spec : pyproject->uvDevDependencies) {
        addSpec(manifest.devDependencies, spec);
    }
    for (const auto& [group, specs] : pyproject->optionalDependencies) {
        for (const auto& spec : specs) {
            addSpec(manifest.optionalDependencies, spec, group);
        }
    }

    std::optional<UvLock> lock;
    if (const auto lockPath = dir / "uv.lock"; pathExists(lockPath)) {
        auto parsed = parseUvLock(lockPath);
        if (parsed) {
            lock = std::move(*parsed);
        } else {
            spdlog::warn("[uv] Failed to parse {}: {}", lockPath.string(),
                         parsed.error().cause);
        }
    }

    json metadata = {{"hasLockFile", pathExists(dir / "uv.lock")},
                     {"lockFileVersion", nullptr},
                     {"uvVersion", nullptr},
                     {"isWorkspace", pyproject->hasUvWorkspace}};
    if (auto uvVersion = environment().get("UV_VERSION")) {
        metadata["uvVersion"] = *uvVersion;
    }
    if (pyproject->hasUvSources) {
        metadata["sources"] = pyproject->uvSources;
    }
    if (pyproject->hasUvIndex) {
        metadata["index"] = pyproject->uvIndex;
    }

    if (lock) {
        for (auto* deps : {&manifest.dependencies, &manifest.devDependencies}) {
            for (auto& [name, version] : *deps) {
                if (const auto* pinned = lock->find(name);
                    pinned != nullptr && !pinned->version.empty()) {
                    version = "==" + pinned->version;
                }
            }
        }
        if (!manifest.pythonRequires) {
            manifest.pythonRequires = lock->requiresPython;
        }
        if (lock->version) {
            metadata["lockFileVersion"] = *lock->version;
        }
        if (lock->revision) {
            metadata["lockFileRevision"] = *lock->revision;
        }
        metadata["lockedPackages"] = lock->packages.size();
    }
    manifest.metadata = std::move(metadata);
    return std::optional<Manifest>{std::move(manifest)};
}

PmResult<CommandOutcome> UvAdapter::installPackages(
    const std::vector<std::string>& packages, const InstallOptions& options) {
    const auto dir = options.cwd.value_or(projectDir());
    const bool project = isUvProject(dir);

    if (!project && !pathExists(dir / ".venv") && !packages.empty()) {
        spdlog::info("[uv] No virtual environment in {}, creating one",
                     dir.string());
        auto created = createEnvironment(dir, std::nullopt);
        if (!created) {
            return created;
        }
    }

    std::string command = executable();
    if (packages.empty()) {
        if (!project) {
            return makeError(
                ErrorCode::NoPackages, "No packages specified for installation",
                "Provide packages to install or add a [project] table to "
                "pyproject.toml");
        }
        command += " sync";
    } else if (project) {
        command += options.dev ? " add --dev" : " add";
    } else {
        command += " pip install";
    }
    for (const auto& arg : buildInstallArgs(options)) {
        command += " " + arg;
    }
    if (!packages.empty()) {
        command += " " + quoteArguments(packages);
    }

    spdlog::info("[uv] {} mode install in {}",
                 project ? "project" : "virtualenv", dir.string());
    ExecuteOptions exec;
    exec.env = options.env;
    exec.cwd = dir;
    exec.timeout = timeoutFor(TimeoutTier::Standard);
    return executeCommand(command, exec);
}

PmResult<CommandOutcome> UvAdapter::uninstallPackages(
    const std::vector<std::string>& packages, const InstallOptions& options) {
    if (packages.empty()) {
        return makeError(ErrorCode::NoPackages,
                         "No packages specified for uninstall");
    }
    const auto dir = options.cwd.value_or(projectDir());
    std::string command = executable() +
                          (isUvProject(dir) ? " remove" : " pip uninstall -y");
    for (const auto& arg : options.extraArgs) {
        command += " " + arg;
    }
    command += " " + quoteArguments(packages);

    ExecuteOptions exec;
    exec.env = options.env;
    exec.cwd = dir;
    exec.timeout = timeoutFor(TimeoutTier::Standard);
    return executeCommand(command, exec);
}

PmResult<std::vector<PackageInfo>> UvAdapter::getInstalledPackages(
    const fs::path& dir) {
    if (!pathExists(dir / ".venv")) {
        return std::vector<PackageInfo>{};
    }

    ExecuteOptions exec;
    exec.cwd = dir;
    exec.suppressErrors = true;
    exec.timeout = timeoutFor(TimeoutTier::Quick);
    auto outcome = executeCommand(executable() + " pip list --format json", exec);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    if (!outcome->result.success()) {
        return makeError(ErrorCode::ListFailed,
                         "Failed to list installed packages",
                         "Ensure uv is installed and a virtual environment "
                         "exists",
                         outcome->result.stderrText);
    }

    auto parsed = parseJsonOutput(outcome->result.stdoutText, "uv pip list");
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    if (!parsed->is_array()) {
        return makeError(ErrorCode::InvalidJsonOutput,
                         "uv pip list did not return a JSON array");
    }

    std::set<std::string> devNames;
    std::vector<std::string> optionalKeys;
    if (auto manifest = parseManifest(dir); !manifest) {
        spdlog::debug("[uv] Listing without manifest information: {}",
                      manifest.error().message);
    } else if (manifest->has_value()) {
        for (const auto& [name, version] : (*manifest)->devDependencies) {
            devNames.insert(normalizePackageName(name));
        }
        for (const auto& [key, version] : (*manifest)->optionalDependencies) {
            optionalKeys.push_back(normalizePackageName(key));
        }
    }

    std::vector<PackageInfo> packages;
    for (const auto& item : *parsed) {
        if (!item.is_object() || !item.contains("name")) {
            continue;
        }
        PackageInfo info;
        info.name = item.value("name", "");
        info.version = item.value("version", "");
        const auto normalized = normalizePackageName(info.name);
        const bool editable = item.contains("editable_project_location");
        info.location = editable ? item.value("editable_project_location", "")
                                 : item.value("location", "site-packages");
        info.isDev = devNames.contains(normalized);
        info.isOptional =
            std::ranges::any_of(optionalKeys, [&normalized](const auto& key) {
                return key.starts_with(normalized + "[");
            });
        info.metadata = {{"editable", editable}, {"manager", "uv"}};
        packages.push_back(std::move(info));
    }
    return packages;
}

PmResult<CommandOutcome> UvAdapter::createEnvironment(
    const fs::path& dir, const std::optional<std::string>& pythonVersion) {
    std::string command = executable() + " venv --clear";
    if (pythonVersion) {
        command += " --python=" + *pythonVersion;
    }
    ExecuteOptions exec;
    exec.cwd = dir;
    exec.timeout = timeoutFor(TimeoutTier::Extended);
    return executeCommand(command, exec);
}

PmResult<EnvironmentMap> UvAdapter::activateEnvironment(const fs::path& dir) {
    const auto venv = dir / ".venv";
    if (!pathExists(venv)) {
        return makeError(ErrorCode::VenvNotFound,
                         "Virtual environment not found",
                         std::format("Run 'uv venv' in {} to create one",
                                     dir.string()));
    }
    const auto bin = venv / "bin";
    EnvironmentMap env{
        {"VIRTUAL_ENV", venv.string()},
        {"PATH", bin.string() + ":" + environment().getOr("PATH", "")},
        {"PYTHON", (bin / "python").string()}};
    if (auto mirror = environment().get("UV_PYTHON_INSTALL_MIRROR")) {
        env["UV_PYTHON_INSTALL_MIRROR"] = *mirror;
    }
    return env;
}

PmResult<CachePaths> UvAdapter::getCachePaths() const {
    auto paths = PackageManagerAdapter::getCachePaths();
    if (paths) {
        paths->additional["builds"] = paths->global / "builds";
        paths->additional["wheels"] = paths->global / "wheels";
        paths->additional["git"] = paths->global / "git";
    }
    return paths;
}

ValidationResult UvAdapter::validateInstallation(const fs::path& dir) {
    auto validation = PackageManagerAdapter::validateInstallation(dir);
    if (pathExists(dir / "pyproject.toml") && !pathExists(dir / "uv.lock")) {
        validation.warnings.emplace_back(
            "No uv.lock found; run 'uv lock' for reproducible installs");
    }
    if (!pathExists(dir / ".venv")) {
        validation.warnings.emplace_back(
            "No .venv found; run 'uv venv' or 'uv sync' to create one");
    }
    return validation;
}

bool UvAdapter::isUvProject(const fs::path& dir) const {
    const auto path = dir / "pyproject.toml";
    if (!pathExists(path)) {
        return false;
    }
    auto pyproject = parsePyproject(path);
    return pyproject && pyproject->hasProject && pyproject->name &&
           !pyproject->name->empty();
}

PmResult<EnvironmentMap> UvAdapter::getEnvironmentVariables(
    const EnvironmentMap& overrides, const fs::path& dir) {
    auto env = PackageManagerAdapter::getEnvironmentVariables(overrides, dir);
    if (!env) {
        return env;
    }
    auto& vars = *env;
    const auto venv = (dir / ".venv").string();
    const auto inheritedPath = vars.contains("PATH") ? vars["PATH"] : "";

    if (!vars.contains("UV_CACHE_DIR")) {
        if (auto paths = getCachePaths()) {
            vars["UV_CACHE_DIR"] = paths->global.string();
        }
    }
    vars["UV_PROJECT_ENVIRONMENT"] = venv;
    vars["VIRTUAL_ENV"] = venv;
    vars["PATH"] = (dir / ".venv" / "bin").string() + ":" + inheritedPath;
    vars["UV_PYTHON_PREFERENCE"] = "only-system";
    vars["UV_NO_PROGRESS"] = "1";
    vars["UV_NO_COLOR"] = "1";
    vars["NO_COLOR"] = "1";
    vars["FORCE_COLOR"] = "0";
    for (const auto& [key, value] : overrides) {
        vars[key] = value;
    }
    return env;
}

std::vector<std::string> UvAdapter::buildInstallArgs(
    const InstallOptions& options) const {
    std::vector<std::string> args;
    if (options.force) {
        args.emplace_back("--reinstall");
    }
    if (options.indexUrl) {
        args.emplace_back("--index-url");
        args.push_back(*options.indexUrl);
    }
    args.insert(args.end(), options.extraArgs.begin(), options.extraArgs.end());
    return args;
}

}  // namespace bottles::pm
