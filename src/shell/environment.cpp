/*
 * environment.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "environment.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

namespace bottles::shell {

namespace {

#ifdef _WIN32
constexpr std::string_view PATH_SEPARATOR = ";";
#else
constexpr std::string_view PATH_SEPARATOR = ":";
#endif

std::vector<std::string> systemPaths() {
#ifdef _WIN32
    return {"C:\\Windows\\System32", "C:\\Windows"};
#else
    return {"/usr/bin", "/bin"};
#endif
}

}  // namespace

const std::vector<std::string>& essentialVariables() {
    static const std::vector<std::string> vars = {
        "HOME",   "USER",     "USERNAME", "LOGNAME",  "SHELL",
        "TERM",   "LANG",     "LC_ALL",   "LC_CTYPE", "TZ",
        "TMPDIR", "TEMP",     "TMP",
#ifdef _WIN32
        "SYSTEMROOT", "WINDIR", "COMSPEC", "PATHEXT", "SYSTEMDRIVE",
        "HOMEDRIVE", "HOMEPATH", "APPDATA", "LOCALAPPDATA", "USERPROFILE",
#else
        "PWD",    "OLDPWD",   "HOSTNAME", "HOSTTYPE", "OSTYPE",
        "MACHTYPE", "SHLVL",
#endif
    };
    return vars;
}

const std::vector<std::string>& commonToolNames() {
    static const std::vector<std::string> tools = {
        "python", "python3", "pip", "pip3", "node", "npm", "uv"};
    return tools;
}

std::string defaultShell() {
#ifdef _WIN32
    return "cmd.exe";
#else
    std::error_code ec;
    if (std::filesystem::exists("/bin/bash", ec)) {
        return "/bin/bash";
    }
    return "/bin/sh";
#endif
}

std::string platformName() {
#if defined(_WIN32)
    return "win32";
#elif defined(__APPLE__)
    return "darwin";
#else
    return "linux";
#endif
}

EnvironmentMap createCleanEnvironment(
    const config::EnvironmentSnapshot& parent, const EnvironmentMap& custom,
    const std::vector<std::string>& preservePaths) {
    EnvironmentMap env;

    for (const auto& key : essentialVariables()) {
        if (auto value = parent.get(key)) {
            env[key] = *value;
        }
    }

    std::vector<std::string> components(preservePaths.begin(),
                                        preservePaths.end());

    for (const auto& tool : commonToolNames()) {
        if (auto location = parent.findExecutable(tool)) {
            components.push_back(location->parent_path().string());
        }
    }

    for (const auto& dir : systemPaths()) {
        std::error_code ec;
        if (std::filesystem::exists(dir, ec)) {
            components.push_back(dir);
        }
    }

    std::set<std::string> seen;
    std::string path;
    for (const auto& component : components) {
        if (component.empty() || !seen.insert(component).second) {
            continue;
        }
        if (!path.empty()) {
            path += PATH_SEPARATOR;
        }
        path += component;
    }
    env["PATH"] = path;

    env["TERM"] = "dumb";
    env["NO_COLOR"] = "1";
    env["CI"] = "true";
    env["NONINTERACTIVE"] = "1";

    for (const auto& [key, value] : custom) {
        if (!key.empty()) {
            env[key] = value;
        }
    }
    return env;
}

EnvironmentMap createStandardEnvironment(
    const config::EnvironmentSnapshot& parent, const EnvironmentMap& custom) {
    EnvironmentMap env(parent.variables().begin(), parent.variables().end());

    for (const auto& [key, value] : custom) {
        if (!key.empty()) {
            env[key] = value;
        }
    }

    env["TERM"] = "dumb";
    env["NO_COLOR"] = "1";
    env["CI"] = "true";

    env.erase("PS1");
    env.erase("PROMPT");
    env.erase("PROMPT_COMMAND");
    return env;
}

std::vector<std::string> toEnvironmentBlock(const EnvironmentMap& env) {
    std::vector<std::string> block;
    block.reserve(env.size());
    for (const auto& [key, value] : env) {
        if (key.empty() || key.find('=') != std::string::npos) {
            continue;
        }
        block.push_back(key + "=" + value);
    }
    return block;
}

}  // namespace bottles::shell
