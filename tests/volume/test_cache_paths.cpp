/*
 * test_cache_paths.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "volume/cache_paths.hpp"

#include <fstream>

using namespace bottles::volume;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

class CachePathsTest : public ::testing::Test {
protected:
    void SetUp() override {
        projectDir_ = fs::temp_directory_path() / "bottles_cache_paths_test";
        fs::remove_all(projectDir_);
        fs::create_directories(projectDir_);
    }

    void TearDown() override { fs::remove_all(projectDir_); }

    void touch(const std::string& name) {
        std::ofstream(projectDir_ / name) << "";
    }

    fs::path projectDir_;
};

// ============================================================================
// Path Mapping Tests
// ============================================================================

TEST_F(CachePathsTest, SystemCachePaths) {
    const fs::path home = "/home/tester";
    EXPECT_EQ(getSystemCachePath(PackageManagerId::Npm, home),
              home / ".npm");
    EXPECT_EQ(getSystemCachePath(PackageManagerId::Maven, home),
              home / ".m2" / "repository");
#ifndef __APPLE__
    EXPECT_EQ(getSystemCachePath(PackageManagerId::Pip, home),
              home / ".cache" / "pip");
    EXPECT_EQ(getSystemCachePath(PackageManagerId::Uv, home),
              home / ".cache" / "uv");
#endif
}

TEST_F(CachePathsTest, BottleCacheDirIsNamedAfterManager) {
    EXPECT_EQ(getBottleCacheDir(PackageManagerId::Uv, "/base"),
              fs::path("/base/uv"));
    EXPECT_EQ(getBottleCacheDir(PackageManagerId::Go, "/base"),
              fs::path("/base/go"));
}

TEST_F(CachePathsTest, PythonManagersShareMountLabel) {
    EXPECT_EQ(getMountPath(PackageManagerId::Pip), "/bottle/pip-cache");
    EXPECT_EQ(getMountPath(PackageManagerId::Uv), "/bottle/pip-cache");
    EXPECT_EQ(getMountPath(PackageManagerId::Yarn), "/bottle/npm-cache");
}

TEST_F(CachePathsTest, Subdirectories) {
    EXPECT_THAT(getCacheSubdirectories(PackageManagerId::Pip),
                ElementsAre("wheels", "http", "selfcheck"));
    EXPECT_THAT(getCacheSubdirectories(PackageManagerId::Bun),
                ElementsAre("cache", "temp"));
}

TEST_F(CachePathsTest, ManagerNameRoundTrip) {
    for (auto manager : ALL_PACKAGE_MANAGERS) {
        EXPECT_EQ(packageManagerFromString(packageManagerToString(manager)),
                  manager);
    }
    EXPECT_FALSE(packageManagerFromString("conda").has_value());
}

// ============================================================================
// Detection Tests
// ============================================================================

TEST_F(CachePathsTest, DetectsNothingInEmptyProject) {
    EXPECT_TRUE(detectPackageManagers(projectDir_).empty());
}

TEST_F(CachePathsTest, DetectsPythonManagers) {
    touch("requirements.txt");
    touch("pyproject.toml");
    EXPECT_THAT(detectPackageManagers(projectDir_),
                UnorderedElementsAre(PackageManagerId::Pip,
                                     PackageManagerId::Poetry,
                                     PackageManagerId::Uv));
}

TEST_F(CachePathsTest, DetectsNodeLockFilesOnlyWithPackageJson) {
    touch("yarn.lock");
    EXPECT_TRUE(detectPackageManagers(projectDir_).empty());

    touch("package.json");
    EXPECT_THAT(detectPackageManagers(projectDir_),
                ElementsAre(PackageManagerId::Npm, PackageManagerId::Yarn));
}

TEST_F(CachePathsTest, ValidateCacheDir) {
    EXPECT_TRUE(validateCacheDir(projectDir_));
    EXPECT_FALSE(validateCacheDir(projectDir_ / "missing"));
    touch("file");
    EXPECT_FALSE(validateCacheDir(projectDir_ / "file"));
}
