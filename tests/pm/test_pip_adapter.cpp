/*
 * test_pip_adapter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "mock_command_runner.hpp"

#include "pm/pip_adapter.hpp"

using namespace bottles;
using namespace bottles::pm;
using namespace bottles::pm::test;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::AllOf;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Not;
using ::testing::Return;
using ::testing::StartsWith;

namespace {

shell::ShellResult<shell::CommandResult> ok(std::string stdoutText = {}) {
    return commandResult(std::move(stdoutText));
}

}  // namespace

class PipAdapterTest : public AdapterTestBase {};

// ============================================================================
// Detection Tests
// ============================================================================

TEST_F(PipAdapterTest, EmptyDirectoryIsNotDetected) {
    PipAdapter adapter(context());
    auto detection = adapter.detectProject(projectDir_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_FALSE(detection->detected);
    EXPECT_DOUBLE_EQ(detection->confidence, 0.0);
    EXPECT_TRUE(detection->manifestFiles.empty());
}

TEST_F(PipAdapterTest, RequirementsFileIsDetected) {
    writeFile("requirements.txt", "requests\n");
    writeFile("requirements-dev.txt", "pytest\n");
    PipAdapter adapter(context());

    auto detection = adapter.detectProject(projectDir_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_TRUE(detection->detected);
    EXPECT_DOUBLE_EQ(detection->confidence, pip_confidence::REQUIREMENTS);
    EXPECT_EQ(detection->manifestFiles.size(), 2u);
    EXPECT_EQ(detection->metadata["requirementFiles"], 2);
}

TEST_F(PipAdapterTest, PlainPyprojectIsDetected) {
    writeFile("pyproject.toml", "[project]\nname = \"demo\"\n");
    PipAdapter adapter(context());

    auto detection = adapter.detectProject(projectDir_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_TRUE(detection->detected);
    EXPECT_DOUBLE_EQ(detection->confidence, pip_confidence::PLAIN_PYPROJECT);
}

TEST_F(PipAdapterTest, CompetingToolLowersConfidence) {
    writeFile("requirements.txt", "requests\n");
    writeFile("pyproject.toml", "[project]\nname = \"demo\"\n\n[tool.uv]\n");
    PipAdapter adapter(context());

    auto detection = adapter.detectProject(projectDir_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_FALSE(detection->detected);
    EXPECT_DOUBLE_EQ(detection->confidence, pip_confidence::COMPETING_TOOL);
    EXPECT_EQ(detection->metadata["competingTool"], "uv");
}

TEST_F(PipAdapterTest, LockFileRaisesConfidence) {
    writeFile("setup.py", "from setuptools import setup\nsetup(name='x')\n");
    writeFile("requirements.lock", "requests==2.31.0\n");
    makeVenv();
    PipAdapter adapter(context());

    auto detection = adapter.detectProject(projectDir_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_DOUBLE_EQ(detection->confidence, pip_confidence::LOCK_FILE);
    EXPECT_EQ(detection->metadata["hasVenv"], true);
    EXPECT_EQ(detection->lockFiles.size(), 1u);
}

// ============================================================================
// Manifest Tests
// ============================================================================

TEST_F(PipAdapterTest, ManifestMergesSources) {
    writeFile("requirements.txt", "requests>=2.0\n");
    writeFile("requirements-dev.txt", "pytest==8.0\n");
    writeFile("setup.py", R"(
setup(
    name="legacy",
    version="1.0",
    install_requires=["click>=8"],
    extras_require={"docs": ["sphinx"]},
)
)");
    PipAdapter adapter(context());

    auto manifest = adapter.parseManifest(projectDir_);
    ASSERT_TRUE(manifest.has_value());
    ASSERT_TRUE(manifest->has_value());
    const auto& m = **manifest;
    EXPECT_EQ(m.name, "legacy");
    EXPECT_EQ(m.version, "1.0");
    EXPECT_EQ(m.dependencies.at("requests"), ">=2.0");
    EXPECT_EQ(m.dependencies.at("click"), ">=8");
    EXPECT_EQ(m.devDependencies.at("pytest"), "==8.0");
    EXPECT_EQ(m.optionalDependencies.at("sphinx[docs]"), "*");
    EXPECT_EQ(m.metadata["hasSetupFiles"], true);
    EXPECT_EQ(m.metadata["hasPyprojectToml"], false);
}

TEST_F(PipAdapterTest, LockFilePinsOverrideRanges) {
    writeFile("requirements.txt", "requests>=2.0\nFlask\n");
    writeFile("requirements-dev.txt", "pytest>=7\n");
    writeFile("requirements-lock.txt",
              "requests==2.31.0\nflask==3.0.2\npytest==8.1.1\n"
              "idna==3.6\n");
    PipAdapter adapter(context());

    auto manifest = adapter.parseManifest(projectDir_);
    ASSERT_TRUE(manifest.has_value());
    ASSERT_TRUE(manifest->has_value());
    const auto& m = **manifest;
    EXPECT_EQ(m.dependencies.at("requests"), "==2.31.0");
    EXPECT_EQ(m.dependencies.at("Flask"), "==3.0.2");
    EXPECT_EQ(m.devDependencies.at("pytest"), "==8.1.1");
    EXPECT_FALSE(m.dependencies.contains("idna"));
    EXPECT_EQ(m.metadata["hasLockFiles"], true);
}

TEST_F(PipAdapterTest, ManifestWithoutLockKeepsRanges) {
    writeFile("requirements.txt", "requests>=2.0\n");
    PipAdapter adapter(context());

    auto manifest = adapter.parseManifest(projectDir_);
    ASSERT_TRUE(manifest.has_value());
    ASSERT_TRUE(manifest->has_value());
    EXPECT_EQ((*manifest)->dependencies.at("requests"), ">=2.0");
    EXPECT_EQ((*manifest)->metadata["hasLockFiles"], false);
}

TEST_F(PipAdapterTest, NoManifest) {
    PipAdapter adapter(context());
    auto manifest = adapter.parseManifest(projectDir_);
    ASSERT_TRUE(manifest.has_value());
    EXPECT_FALSE(manifest->has_value());
}

// ============================================================================
// Install Tests
// ============================================================================

TEST_F(PipAdapterTest, InstallPackagesInsideVenv) {
    makeVenv();
    PipAdapter adapter(context());

    const auto activate = (projectDir_ / ".venv" / "bin" / "activate").string();
    EXPECT_CALL(*runner_,
                execute(AllOf(HasSubstr("export PIP_DISABLE_PIP_VERSION_CHECK='1'; "),
                              HasSubstr("export PIP_CACHE_DIR="),
                              HasSubstr(". \"" + activate + "\" && pip3 install "
                                        "--force-reinstall --index-url "
                                        "https://mirror.example/simple "
                                        "\"requests\" \"flask>=2\""),
                              Not(StartsWith("(cd "))),
                        30000ms))
        .WillOnce(Return(ok("Successfully installed")));

    InstallOptions options;
    options.force = true;
    options.indexUrl = "https://mirror.example/simple";
    auto outcome = adapter.installPackages({"requests", "flask>=2"}, options);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->result.stdoutText, "Successfully installed");
    EXPECT_THAT(outcome->command, Not(HasSubstr("export ")));
    EXPECT_THAT(outcome->command, StartsWith(". \""));
}

TEST_F(PipAdapterTest, InstallFromRequirementsFiles) {
    writeFile("requirements.txt", "requests\n");
    PipAdapter adapter(context());

    const auto requirements = (projectDir_ / "requirements.txt").string();
    EXPECT_CALL(*runner_,
                execute(HasSubstr("pip3 install -r \"" + requirements + "\""), _))
        .WillOnce(Return(ok()));

    EXPECT_TRUE(adapter.installPackages({}, {}).has_value());
}

TEST_F(PipAdapterTest, InstallWithoutRequirementsFails) {
    PipAdapter adapter(context());
    auto outcome = adapter.installPackages({}, {});
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::NoRequirements);
}

TEST_F(PipAdapterTest, InstallInOtherDirectoryUsesSubshell) {
    const auto other = projectDir_ / "sub";
    fs::create_directories(other);
    PipAdapter adapter(context());

    EXPECT_CALL(*runner_,
                execute(AllOf(StartsWith("(cd '" + other.string() + "' && "),
                              HasSubstr("pip3 install \"six\"")),
                        _))
        .WillOnce(Return(ok()));

    InstallOptions options;
    options.cwd = other;
    EXPECT_TRUE(adapter.installPackages({"six"}, options).has_value());
}

TEST_F(PipAdapterTest, OverridesAreExportedQuoted) {
    environment_ = environment_.with({{"PIP_COMMAND", "pip"}});
    PipAdapter adapter(context());
    EXPECT_EQ(adapter.executable(), "pip");

    EXPECT_CALL(*runner_,
                execute(AllOf(HasSubstr("export MY_VAR='it'\\''s here'; "),
                              Not(HasSubstr("BAD-KEY")),
                              HasSubstr("pip install \"six\"")),
                        _))
        .WillOnce(Return(ok()));

    InstallOptions options;
    options.env = {{"MY_VAR", "it's here"}, {"BAD-KEY", "x"}};
    EXPECT_TRUE(adapter.installPackages({"six"}, options).has_value());
}

TEST_F(PipAdapterTest, NonZeroExitIsCommandFailed) {
    PipAdapter adapter(context());
    EXPECT_CALL(*runner_, execute(_, _))
        .WillOnce(Return(commandResult("", 1, "No matching distribution")));

    auto outcome = adapter.installPackages({"nope"}, {});
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::CommandFailed);
    EXPECT_EQ(outcome.error().cause, "No matching distribution");
    EXPECT_THAT(outcome.error().message, HasSubstr("exit code 1"));
}

TEST_F(PipAdapterTest, SilentCommandIsTimedOut) {
    PipAdapter adapter(context());
    EXPECT_CALL(*runner_, execute(_, _)).WillOnce(Return(timedOutResult()));

    auto outcome = adapter.installPackages({"slow"}, {});
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::CommandTimedOut);
    EXPECT_THAT(outcome.error().suggestion,
                HasSubstr("PKG_LOCAL_TIMEOUT_MULTIPLIER"));
}

TEST_F(PipAdapterTest, RunnerFailureIsExecutionError) {
    PipAdapter adapter(context());
    EXPECT_CALL(*runner_, execute(_, _))
        .WillOnce(Return(shell::ShellResult<shell::CommandResult>(
            std::unexpected(shell::ShellError::ShellNotAlive))));

    auto outcome = adapter.installPackages({"six"}, {});
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::ExecutionError);
    EXPECT_THAT(outcome.error().suggestion, HasSubstr("pip3"));
}

TEST_F(PipAdapterTest, CIStretchesTimeouts) {
    environment_ = environment_.with({{"CI", "true"}});
    PipAdapter adapter(context());
    EXPECT_CALL(*runner_, execute(_, 120000ms)).WillOnce(Return(ok()));
    EXPECT_TRUE(adapter.installPackages({"six"}, {}).has_value());
}

TEST_F(PipAdapterTest, UninstallRequiresPackages) {
    PipAdapter adapter(context());
    auto outcome = adapter.uninstallPackages({}, {});
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::NoPackages);
}

TEST_F(PipAdapterTest, Uninstall) {
    PipAdapter adapter(context());
    EXPECT_CALL(*runner_, execute(HasSubstr("pip3 uninstall -y \"six\""), _))
        .WillOnce(Return(ok()));
    EXPECT_TRUE(adapter.uninstallPackages({"six"}, {}).has_value());
}

// ============================================================================
// Listing Tests
// ============================================================================

TEST_F(PipAdapterTest, ListWithoutVenvIsEmpty) {
    PipAdapter adapter(context());
    auto packages = adapter.getInstalledPackages(projectDir_);
    ASSERT_TRUE(packages.has_value());
    EXPECT_TRUE(packages->empty());
}

TEST_F(PipAdapterTest, ListParsesOutputAfterBanner) {
    makeVenv();
    writeFile("requirements-dev.txt", "Pytest\n");
    PipAdapter adapter(context());

    EXPECT_CALL(*runner_, execute(HasSubstr("pip3 list --format json"), 5000ms))
        .WillOnce(Return(ok(
            "WARNING: You are using an old pip\n"
            R"([{"name": "pytest", "version": "8.0.0"},)"
            R"( {"name": "mylib", "version": "0.1.0",)"
            R"(  "editable_project_location": "/src/mylib"}])")));

    auto packages = adapter.getInstalledPackages(projectDir_);
    ASSERT_TRUE(packages.has_value());
    ASSERT_EQ(packages->size(), 2u);
    EXPECT_EQ((*packages)[0].name, "pytest");
    EXPECT_TRUE((*packages)[0].isDev);
    EXPECT_EQ((*packages)[0].location, "site-packages");
    EXPECT_EQ((*packages)[1].location, "/src/mylib");
    EXPECT_EQ((*packages)[1].metadata["editable"], true);
    EXPECT_EQ((*packages)[1].metadata["manager"], "pip");
}

TEST_F(PipAdapterTest, ListFailure) {
    makeVenv();
    PipAdapter adapter(context());
    EXPECT_CALL(*runner_, execute(_, _))
        .WillOnce(Return(commandResult("", 2, "broken venv")));

    auto packages = adapter.getInstalledPackages(projectDir_);
    ASSERT_FALSE(packages.has_value());
    EXPECT_EQ(packages.error().code, ErrorCode::ListFailed);
    EXPECT_EQ(packages.error().cause, "broken venv");
}

// ============================================================================
// Environment Tests
// ============================================================================

TEST_F(PipAdapterTest, CreateEnvironmentUpgradesPip) {
    PipAdapter adapter(context());
    {
        InSequence sequence;
        EXPECT_CALL(*runner_,
                    execute(HasSubstr("-m venv --clear \"" +
                                      (projectDir_ / ".venv").string() + "\""),
                            60000ms))
            .WillOnce([this](const std::string&, std::chrono::milliseconds) {
                makeVenv();
                return ok();
            });
        EXPECT_CALL(*runner_, execute(HasSubstr("&& pip install --upgrade pip"),
                                      30000ms))
            .WillOnce(Return(commandResult("", 1, "offline")));
    }

    auto outcome = adapter.createEnvironment(projectDir_, std::nullopt);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_THAT(outcome->command, HasSubstr("-m venv"));
}

TEST_F(PipAdapterTest, CreateEnvironmentWithPythonVersion) {
    PipAdapter adapter(context());
    EXPECT_CALL(*runner_, execute(HasSubstr("python3.12 -m venv"), _))
        .WillOnce(Return(ok()));
    EXPECT_TRUE(adapter.createEnvironment(projectDir_, "3.12").has_value());
}

TEST_F(PipAdapterTest, ActivateEnvironment) {
    PipAdapter adapter(context());
    auto missing = adapter.activateEnvironment(projectDir_);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::VenvNotFound);

    makeVenv("venv");
    auto env = adapter.activateEnvironment(projectDir_);
    ASSERT_TRUE(env.has_value());
    const auto bin = projectDir_ / "venv" / "bin";
    EXPECT_EQ(env->at("VIRTUAL_ENV"), (projectDir_ / "venv").string());
    EXPECT_EQ(env->at("PATH"), bin.string() + ":/usr/bin:/bin");
    EXPECT_EQ(env->at("PYTHON"), (bin / "python").string());
    EXPECT_EQ(env->at("PIP_REQUIRE_VIRTUALENV"), "true");
}

TEST_F(PipAdapterTest, CachePathsNeedMount) {
    PipAdapter adapter(context());
    auto before = adapter.getCachePaths();
    ASSERT_FALSE(before.has_value());
    EXPECT_EQ(before.error().code, ErrorCode::MountNotFound);

    EXPECT_CALL(*runner_, execute(_, _)).WillOnce(Return(ok()));
    ASSERT_TRUE(adapter.installPackages({"six"}, {}).has_value());

    auto after = adapter.getCachePaths();
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->additional.at("wheels"), after->global / "wheels");
    EXPECT_EQ(after->temp, after->global / "temp");
    EXPECT_TRUE(volumes_->getMount(volume::PackageManagerId::Pip)->active);
}

TEST_F(PipAdapterTest, ValidateInstallation) {
    PipAdapter adapter(context());
    EXPECT_CALL(*runner_, execute(HasSubstr("pip3 --version"), 5000ms))
        .WillOnce(Return(commandResult("", 127, "pip3: not found")));

    auto validation = adapter.validateInstallation(projectDir_);
    EXPECT_FALSE(validation.valid);
    ASSERT_EQ(validation.errors.size(), 1u);
    EXPECT_THAT(validation.errors[0], HasSubstr("pip3: not found"));
    EXPECT_EQ(validation.warnings.size(), 1u);
}

TEST_F(PipAdapterTest, VersionSpecUnderstandsVcs) {
    PipAdapter adapter(context());
    EXPECT_EQ(adapter.parseVersionSpec("git+https://host/org/tool.git").name,
              "tool");
    EXPECT_EQ(adapter.normalizePackageName("  NumPy "), "numpy");
}
