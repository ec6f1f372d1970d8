/*
 * command_classifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_classifier.hpp"

#include <regex>
#include <string>

namespace bottles::shell {

namespace {

using std::chrono::milliseconds;

struct Patterns {
    static constexpr auto flags = std::regex::ECMAScript | std::regex::icase;

    std::regex pipInstall{R"(^\s*(pip|pip3|python3?\s+-m\s+pip)\s+(install|add))", flags};
    std::regex pipUninstall{R"(^\s*(pip|pip3|python3?\s+-m\s+pip)\s+(uninstall|remove))", flags};
    std::regex pipList{R"(^\s*(pip|pip3|python3?\s+-m\s+pip)\s+(list|freeze|show))", flags};
    std::regex pipCompile{R"(^\s*pip-compile)", flags};

    std::regex uvAdd{R"(^\s*uv\s+(add|pip\s+install))", flags};
    std::regex uvRemove{R"(^\s*uv\s+(remove|pip\s+uninstall))", flags};
    std::regex uvSync{R"(^\s*uv\s+(sync|lock))", flags};
    std::regex uvList{R"(^\s*uv\s+(pip\s+)?list)", flags};
    std::regex uvVenv{R"(^\s*uv\s+venv)", flags};
    std::regex pythonVenv{R"(^\s*python3?\s+-m\s+venv)", flags};

    std::regex poetryAdd{R"(^\s*poetry\s+(add|install))", flags};
    std::regex poetryRemove{R"(^\s*poetry\s+remove)", flags};
    std::regex poetryLock{R"(^\s*poetry\s+lock)", flags};

    std::regex pipenvInstall{R"(^\s*pipenv\s+install)", flags};
    std::regex pipenvUninstall{R"(^\s*pipenv\s+uninstall)", flags};
    std::regex pipenvSync{R"(^\s*pipenv\s+sync)", flags};

    std::regex npmInstall{R"(^\s*npm\s+(install|i|add|ci)\b)", flags};
    std::regex npmUninstall{R"(^\s*npm\s+(uninstall|remove|rm)\b)", flags};
    std::regex npmList{R"(^\s*npm\s+(list|ls)\b)", flags};
    std::regex npmRun{R"(^\s*npm\s+run)", flags};
    std::regex yarnAdd{R"(^\s*yarn\s+(add|install))", flags};
    std::regex yarnRemove{R"(^\s*yarn\s+remove)", flags};
    std::regex pnpmAdd{R"(^\s*pnpm\s+(add|install))", flags};
    std::regex pnpmRemove{R"(^\s*pnpm\s+remove)", flags};

    std::regex maven{R"(^\s*(mvn|maven)\s+)", flags};
    std::regex gradle{R"(^\s*(gradle|gradlew|\./gradlew)\s+)", flags};

    std::regex envSet{R"(^\s*(export|set|source)\s+)", flags};
    std::regex cd{R"(^\s*cd(\s+|$))", flags};

    std::regex version{R"(\s+(--version|-v|version)\s*$)", flags};
    std::regex help{R"(\s+(--help|-h|help)\s*$)", flags};

    std::regex quick{R"(^\s*(echo\s+|ls(\s|$)|pwd\s*$|cat\s+|which\s+|type\s+|mkdir\s+|rm\s+|cp\s+|mv\s+))", flags};
};

const Patterns& patterns() {
    static const Patterns instance;
    return instance;
}

bool matches(const std::regex& re, const std::string& cmd) {
    return std::regex_search(cmd, re);
}

}  // namespace

TimeoutProfile TimeoutProfile::scaled(double multiplier) const {
    if (multiplier <= 0.0) {
        return *this;
    }
    auto scale = [multiplier](milliseconds value) {
        return milliseconds(
            static_cast<milliseconds::rep>(value.count() * multiplier));
    };
    return {scale(idleTimeout), scale(absoluteMaximum)};
}

CommandCategory classifyCommand(std::string_view command) {
    if (command.empty()) {
        return CommandCategory::Unknown;
    }

    const auto& p = patterns();
    std::string cmd(command);

    if (matches(p.pipInstall, cmd) || matches(p.uvAdd, cmd) ||
        matches(p.poetryAdd, cmd) || matches(p.pipenvInstall, cmd) ||
        matches(p.npmInstall, cmd) || matches(p.yarnAdd, cmd) ||
        matches(p.pnpmAdd, cmd)) {
        return CommandCategory::PackageInstall;
    }

    if (matches(p.pipUninstall, cmd) || matches(p.uvRemove, cmd) ||
        matches(p.poetryRemove, cmd) || matches(p.pipenvUninstall, cmd) ||
        matches(p.npmUninstall, cmd) || matches(p.yarnRemove, cmd) ||
        matches(p.pnpmRemove, cmd)) {
        return CommandCategory::PackageUninstall;
    }

    if (matches(p.pipList, cmd) || matches(p.uvList, cmd) ||
        matches(p.npmList, cmd)) {
        return CommandCategory::PackageList;
    }

    if (matches(p.uvSync, cmd) || matches(p.poetryLock, cmd) ||
        matches(p.pipenvSync, cmd) || matches(p.pipCompile, cmd)) {
        return CommandCategory::PackageSync;
    }

    if (matches(p.maven, cmd) || matches(p.gradle, cmd) ||
        matches(p.npmRun, cmd)) {
        return CommandCategory::PackageBuild;
    }

    if (matches(p.uvVenv, cmd) || matches(p.pythonVenv, cmd)) {
        return CommandCategory::EnvCreate;
    }

    if (matches(p.envSet, cmd)) {
        return CommandCategory::EnvSet;
    }

    if (matches(p.cd, cmd)) {
        return CommandCategory::Navigation;
    }

    if (matches(p.version, cmd) || matches(p.help, cmd)) {
        return CommandCategory::VersionCheck;
    }

    if (matches(p.quick, cmd)) {
        return CommandCategory::QuickCommand;
    }

    return CommandCategory::Unknown;
}

TimeoutProfile recommendedTimeout(CommandCategory category,
                                  std::string_view command) {
    const auto& p = patterns();
    std::string cmd(command);

    switch (category) {
        case CommandCategory::PackageInstall:
            if (matches(p.uvAdd, cmd)) {
                return {milliseconds(15000), milliseconds(300000)};
            }
            return {milliseconds(30000), milliseconds(600000)};

        case CommandCategory::PackageUninstall:
            if (matches(p.uvRemove, cmd)) {
                return {milliseconds(10000), milliseconds(300000)};
            }
            return {milliseconds(15000), milliseconds(120000)};

        case CommandCategory::PackageList:
        case CommandCategory::VersionCheck:
            return {milliseconds(5000), milliseconds(15000)};

        case CommandCategory::PackageSync:
            return {milliseconds(45000), milliseconds(600000)};

        case CommandCategory::PackageBuild:
            if (matches(p.maven, cmd)) {
                return {milliseconds(60000), milliseconds(1200000)};
            }
            return {milliseconds(30000), milliseconds(600000)};

        case CommandCategory::EnvCreate:
            return {milliseconds(15000), milliseconds(60000)};

        case CommandCategory::EnvSet:
        case CommandCategory::Navigation:
        case CommandCategory::QuickCommand:
            return {milliseconds(1000), milliseconds(5000)};

        case CommandCategory::Unknown:
            break;
    }
    return {milliseconds(30000), milliseconds(600000)};
}

TimeoutProfile recommendedTimeout(std::string_view command) {
    return recommendedTimeout(classifyCommand(command), command);
}

}  // namespace bottles::shell
