/*
 * test_volume_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "volume/volume_controller.hpp"

#include <fstream>

#include <unistd.h>

#include <nlohmann/json.hpp>

using namespace bottles::volume;
using bottles::config::EnvironmentSnapshot;

class VolumeControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / "bottles_volume_test";
        fs::remove_all(testDir_);
        fs::create_directories(testDir_ / "home");
        fs::create_directories(testDir_ / "project");

        VolumeConfig config;
        config.baseCacheDir = testDir_ / "cache";
        config.projectDir = testDir_ / "project";
        config.skipAutoDetection = true;
        controller_ = std::make_unique<VolumeController>(
            "test-bottle", config,
            EnvironmentSnapshot({{"HOME", (testDir_ / "home").string()}}));
    }

    void TearDown() override {
        controller_.reset();
        fs::remove_all(testDir_);
    }

    fs::path testDir_;
    std::unique_ptr<VolumeController> controller_;
};

// ============================================================================
// Initialization Tests
// ============================================================================

TEST_F(VolumeControllerTest, InitializeCreatesBaseDirectory) {
    ASSERT_TRUE(controller_->initialize().has_value());
    EXPECT_TRUE(controller_->isInitialized());
    EXPECT_TRUE(fs::is_directory(testDir_ / "cache"));
    EXPECT_TRUE(controller_->getAllMounts().empty());
}

TEST_F(VolumeControllerTest, InitializeRecordsInactiveMounts) {
    VolumeConfig config;
    config.baseCacheDir = testDir_ / "cache";
    config.projectDir = testDir_ / "project";
    config.detectedManagers =
        std::vector{PackageManagerId::Pip, PackageManagerId::Uv};
    VolumeController controller("seeded", config,
                                EnvironmentSnapshot(EnvironmentSnapshot::VariableMap{{"HOME", "/nonexistent"}}));

    ASSERT_TRUE(controller.initialize().has_value());
    EXPECT_EQ(controller.getAllMounts().size(), 2u);
    EXPECT_TRUE(controller.getActiveMounts().empty());
    EXPECT_TRUE(fs::is_directory(testDir_ / "cache" / "uv"));
}

TEST_F(VolumeControllerTest, InitializedMarkerRecordsSystemCache) {
    fs::create_directories(testDir_ / "home" / ".cache" / "pip");
    VolumeConfig config;
    config.baseCacheDir = testDir_ / "cache";
    config.detectedManagers = std::vector{PackageManagerId::Pip};
    VolumeController controller(
        "marker", config,
        EnvironmentSnapshot({{"HOME", (testDir_ / "home").string()}}));
    ASSERT_TRUE(controller.initialize().has_value());

    std::ifstream marker(testDir_ / "cache" / "pip" / ".initialized");
    ASSERT_TRUE(marker.is_open());
    auto content = nlohmann::json::parse(marker);
    EXPECT_EQ(content["manager"], "pip");
    EXPECT_EQ(content["strategy"], "isolated");
}

// ============================================================================
// Mount Tests
// ============================================================================

TEST_F(VolumeControllerTest, MountCreatesCacheTree) {
    auto mount = controller_->mount(PackageManagerId::Pip);
    ASSERT_TRUE(mount.has_value());
    EXPECT_TRUE(mount->active);
    EXPECT_EQ(mount->cachePath, testDir_ / "cache" / "pip");
    EXPECT_EQ(mount->mountPath, "/bottle/pip-cache");
    EXPECT_TRUE(fs::is_directory(mount->cachePath / "wheels"));
    EXPECT_TRUE(fs::is_directory(mount->cachePath / "http"));
}

TEST_F(VolumeControllerTest, MountIsIdempotent) {
    auto first = controller_->mount(PackageManagerId::Pip);
    auto second = controller_->mount(PackageManagerId::Pip);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(first->cachePath, second->cachePath);
    EXPECT_EQ(first->createdAt, second->createdAt);
    EXPECT_EQ(controller_->getAllMounts().size(), 1u);
    EXPECT_EQ(controller_->getActiveMounts().size(), 1u);
}

TEST_F(VolumeControllerTest, MountWithCustomPath) {
    auto custom = testDir_ / "elsewhere";
    auto mount = controller_->mount(PackageManagerId::Uv, custom);
    ASSERT_TRUE(mount.has_value());
    EXPECT_EQ(mount->cachePath, custom);
    EXPECT_TRUE(fs::is_directory(custom / "builds"));
    EXPECT_EQ(controller_->getMount(PackageManagerId::Uv)->cachePath, custom);
}

TEST_F(VolumeControllerTest, UnmountDeactivatesAndWritesMetadata) {
    ASSERT_TRUE(controller_->mount(PackageManagerId::Pip).has_value());
    EXPECT_TRUE(controller_->unmount(PackageManagerId::Pip));

    auto mount = controller_->getMount(PackageManagerId::Pip);
    ASSERT_TRUE(mount.has_value());
    EXPECT_FALSE(mount->active);
    EXPECT_TRUE(
        fs::exists(testDir_ / "cache" / "pip" / ".unmount-metadata.json"));
    EXPECT_FALSE(controller_->unmount(PackageManagerId::Go));
}

TEST_F(VolumeControllerTest, RemountAfterUnmount) {
    ASSERT_TRUE(controller_->mount(PackageManagerId::Pip).has_value());
    controller_->unmount(PackageManagerId::Pip);
    auto again = controller_->mount(PackageManagerId::Pip);
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(again->active);
}

// ============================================================================
// Environment Variable Tests
// ============================================================================

TEST_F(VolumeControllerTest, EnvVarsOnlyForActiveMounts) {
    EXPECT_TRUE(controller_->getMountEnvVars().empty());

    ASSERT_TRUE(controller_->mount(PackageManagerId::Pip).has_value());
    ASSERT_TRUE(controller_->mount(PackageManagerId::Uv).has_value());
    auto vars = controller_->getMountEnvVars();
    EXPECT_EQ(vars["PIP_CACHE_DIR"], (testDir_ / "cache" / "pip").string());
    EXPECT_EQ(vars["UV_CACHE_DIR"], (testDir_ / "cache" / "uv").string());
    EXPECT_EQ(vars["UV_PROJECT_ENVIRONMENT"],
              (testDir_ / "project" / ".venv").string());
    EXPECT_EQ(vars["UV_PYTHON_PREFERENCE"], "only-system");

    controller_->unmount(PackageManagerId::Pip);
    vars = controller_->getMountEnvVars();
    EXPECT_FALSE(vars.contains("PIP_CACHE_DIR"));
    EXPECT_TRUE(vars.contains("UV_CACHE_DIR"));
}

TEST_F(VolumeControllerTest, EnvVarNamesForOtherManagers) {
    ASSERT_TRUE(controller_->mount(PackageManagerId::Npm).has_value());
    ASSERT_TRUE(controller_->mount(PackageManagerId::Maven).has_value());
    auto vars = controller_->getMountEnvVars();
    EXPECT_EQ(vars["npm_config_cache"], (testDir_ / "cache" / "npm").string());
    EXPECT_EQ(vars["MAVEN_OPTS"],
              "-Dmaven.repo.local=" + (testDir_ / "cache" / "maven").string());
}

// ============================================================================
// Stats and Clear Tests
// ============================================================================

TEST_F(VolumeControllerTest, StatsCountFilesAndDirectories) {
    auto mount = controller_->mount(PackageManagerId::Pip);
    ASSERT_TRUE(mount.has_value());
    std::ofstream(mount->cachePath / "wheels" / "a.whl") << "0123456789";

    auto stats = controller_->getCacheStats(PackageManagerId::Pip);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->size, 10u);
    EXPECT_EQ(stats->itemCount, 4u);  // wheels, http, selfcheck, a.whl
    EXPECT_TRUE(stats->lastModified.has_value());

    auto total = controller_->getStats();
    EXPECT_EQ(total.activeMounts, 1u);
    EXPECT_EQ(total.totalSize, 10u);
    EXPECT_EQ(total.managers.size(), 1u);
}

TEST_F(VolumeControllerTest, StatsSkipUnreadableSubdirectories) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root ignores directory permissions";
    }
    auto mount = controller_->mount(PackageManagerId::Pip);
    ASSERT_TRUE(mount.has_value());
    std::ofstream(mount->cachePath / "wheels" / "a.whl") << "0123456789";
    const auto locked = mount->cachePath / "locked";
    fs::create_directories(locked);
    std::ofstream(locked / "hidden.whl") << "abcdef";
    fs::permissions(locked, fs::perms::none);

    auto stats = controller_->getCacheStats(PackageManagerId::Pip);
    auto total = controller_->getStats();
    fs::permissions(locked, fs::perms::owner_all);

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->size, 10u);
    EXPECT_EQ(total.totalSize, 10u);
    EXPECT_EQ(total.managers.size(), 1u);
}

TEST_F(VolumeControllerTest, StatsIgnoreDanglingSymlinks) {
    auto mount = controller_->mount(PackageManagerId::Pip);
    ASSERT_TRUE(mount.has_value());
    std::ofstream(mount->cachePath / "http" / "entry") << "12345";
    fs::create_symlink(testDir_ / "missing-target",
                       mount->cachePath / "http" / "dangling");

    auto total = controller_->getStats();
    EXPECT_EQ(total.totalSize, 5u);
    EXPECT_EQ(total.activeMounts, 1u);
}

TEST_F(VolumeControllerTest, StatsForUnknownMountFail) {
    auto stats = controller_->getCacheStats(PackageManagerId::Cargo);
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, VolumeErrorCode::MountNotFound);
}

TEST_F(VolumeControllerTest, ClearEmptiesOneCache) {
    auto pip = controller_->mount(PackageManagerId::Pip);
    auto uv = controller_->mount(PackageManagerId::Uv);
    ASSERT_TRUE(pip.has_value());
    ASSERT_TRUE(uv.has_value());
    std::ofstream(pip->cachePath / "stale") << "x";
    std::ofstream(uv->cachePath / "keep") << "x";

    ASSERT_TRUE(controller_->clear(PackageManagerId::Pip).has_value());
    EXPECT_TRUE(fs::is_directory(pip->cachePath));
    EXPECT_FALSE(fs::exists(pip->cachePath / "stale"));
    EXPECT_TRUE(fs::exists(uv->cachePath / "keep"));
}

TEST_F(VolumeControllerTest, ClearRecreatesManagerSubdirectories) {
    auto pip = controller_->mount(PackageManagerId::Pip);
    ASSERT_TRUE(pip.has_value());
    std::ofstream(pip->cachePath / "wheels" / "old.whl") << "x";

    ASSERT_TRUE(controller_->clear(PackageManagerId::Pip).has_value());
    EXPECT_TRUE(fs::is_directory(pip->cachePath / "wheels"));
    EXPECT_TRUE(fs::is_directory(pip->cachePath / "http"));
    EXPECT_TRUE(fs::is_directory(pip->cachePath / "selfcheck"));
    EXPECT_TRUE(fs::is_empty(pip->cachePath / "wheels"));

    auto stats = controller_->getCacheStats(PackageManagerId::Pip);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->size, 0u);
    EXPECT_EQ(stats->itemCount, 3u);
}

TEST_F(VolumeControllerTest, ClearAllAndUnknownManager) {
    auto pip = controller_->mount(PackageManagerId::Pip);
    ASSERT_TRUE(pip.has_value());
    std::ofstream(pip->cachePath / "stale") << "x";

    EXPECT_TRUE(controller_->clear(PackageManagerId::Go).has_value());
    ASSERT_TRUE(controller_->clear().has_value());
    EXPECT_FALSE(fs::exists(pip->cachePath / "stale"));
    EXPECT_TRUE(fs::is_directory(pip->cachePath / "wheels"));
}

TEST_F(VolumeControllerTest, CleanupForgetsMounts) {
    ASSERT_TRUE(controller_->mount(PackageManagerId::Pip).has_value());
    controller_->cleanup();
    EXPECT_TRUE(controller_->getAllMounts().empty());
    EXPECT_TRUE(controller_->getMountEnvVars().empty());
}
