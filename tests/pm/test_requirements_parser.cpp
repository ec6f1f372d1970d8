/*
 * test_requirements_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "pm/requirements_parser.hpp"

#include <algorithm>
#include <fstream>

using namespace bottles::pm;
using ::testing::ElementsAre;

class RequirementsParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / "bottles_requirements_test";
        fs::remove_all(testDir_);
        fs::create_directories(testDir_ / "reqs");
    }

    void TearDown() override { fs::remove_all(testDir_); }

    fs::path writeFile(const std::string& name, const std::string& content) {
        auto path = testDir_ / name;
        std::ofstream(path) << content;
        return path;
    }

    static const RequirementEntry* find(
        const std::vector<RequirementEntry>& entries, std::string_view name) {
        auto it = std::ranges::find(entries, name, &RequirementEntry::name);
        return it == entries.end() ? nullptr : &*it;
    }

    fs::path testDir_;
};

// ============================================================================
// Line Tests
// ============================================================================

TEST_F(RequirementsParserTest, PlainRequirement) {
    auto entry = parseRequirementLine("requests>=2.28  # http");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "requests");
    EXPECT_EQ(entry->version, ">=2.28");
    EXPECT_FALSE(entry->editable);
}

TEST_F(RequirementsParserTest, ExtrasAndMarkers) {
    auto entry =
        parseRequirementLine("httpx[http2]==0.25; sys_platform == 'linux'");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "httpx");
    EXPECT_EQ(entry->version, "==0.25");
    EXPECT_THAT(entry->extras, ElementsAre("http2"));
    EXPECT_EQ(entry->markers, "sys_platform == 'linux'");
}

TEST_F(RequirementsParserTest, EditableVcs) {
    auto entry = parseRequirementLine(
        "-e git+https://github.com/org/Tool.git#egg=Tool");
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->editable);
    EXPECT_EQ(entry->name, "tool");
    EXPECT_EQ(entry->url, "git+https://github.com/org/Tool.git#egg=Tool");
}

TEST_F(RequirementsParserTest, EditableLocalPath) {
    auto entry = parseRequirementLine("--editable ./libs/shared/");
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->editable);
    EXPECT_EQ(entry->name, "shared");
}

TEST_F(RequirementsParserTest, WheelUrl) {
    auto entry = parseRequirementLine(
        "https://example.com/wheels/numpy-1.26.0-cp312-cp312-linux_x86_64.whl");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "numpy");
    EXPECT_TRUE(entry->url.has_value());
}

TEST_F(RequirementsParserTest, UnnamedUrlIsSkipped) {
    EXPECT_FALSE(parseRequirementLine("https://example.com/download"));
    EXPECT_FALSE(parseRequirementLine("# only a comment"));
    EXPECT_FALSE(parseRequirementLine("-e ."));
}

// ============================================================================
// File Tests
// ============================================================================

TEST_F(RequirementsParserTest, SkipsOptionsAndComments) {
    auto entries = parseRequirementsText(
        "# comment\n"
        "--index-url https://pypi.example.com/simple\n"
        "--extra-index-url https://other.example.com\n"
        "-c constraints.txt\n"
        "--trusted-host example.com\n"
        "\n"
        "flask\n",
        testDir_);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "flask");
    EXPECT_EQ(entries[0].version, "*");
}

TEST_F(RequirementsParserTest, FollowsIncludesRelativeToFile) {
    writeFile("reqs/base.txt", "six==1.16\n");
    auto main = writeFile("requirements.txt",
                          "-r reqs/base.txt\nrequests\n--requirement=missing.txt\n");

    auto entries = parseRequirementsFile(main);
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 2u);
    ASSERT_NE(find(*entries, "six"), nullptr);
    EXPECT_EQ(find(*entries, "six")->version, "==1.16");
    EXPECT_NE(find(*entries, "requests"), nullptr);
}

TEST_F(RequirementsParserTest, NestedIncludeResolvesFromIncludedFile) {
    writeFile("reqs/common.txt", "attrs\n");
    writeFile("reqs/base.txt", "-r common.txt\n");
    auto main = writeFile("requirements.txt", "-r reqs/base.txt\n");

    auto entries = parseRequirementsFile(main);
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_EQ((*entries)[0].name, "attrs");
}

TEST_F(RequirementsParserTest, IncludeCycleTerminates) {
    writeFile("a.txt", "-r b.txt\nalpha\n");
    writeFile("b.txt", "-r a.txt\nbeta\n");

    auto entries = parseRequirementsFile(testDir_ / "a.txt");
    ASSERT_TRUE(entries.has_value());
    EXPECT_EQ(entries->size(), 2u);
}

TEST_F(RequirementsParserTest, MissingFileIsReadError) {
    auto entries = parseRequirementsFile(testDir_ / "absent.txt");
    ASSERT_FALSE(entries.has_value());
    EXPECT_EQ(entries.error().code, ErrorCode::FileReadError);
}

// ============================================================================
// setup.py / setup.cfg Tests
// ============================================================================

TEST_F(RequirementsParserTest, SetupPy) {
    auto metadata = parseSetupPyText(R"(
from setuptools import setup

setup(
    name="demo-app",
    version='0.3.1',
    description="Demo",
    long_description="ignored",
    author="Jane Doe",
    license="MIT",
    python_requires=">=3.9",
    install_requires=[
        "requests>=2.0",
        'click',
    ],
    extras_require={
        "dev": ["pytest", "black"],
        "docs": ["sphinx"],
    },
)
)");
    EXPECT_EQ(metadata.name, "demo-app");
    EXPECT_EQ(metadata.version, "0.3.1");
    EXPECT_EQ(metadata.description, "Demo");
    EXPECT_EQ(metadata.author, "Jane Doe");
    EXPECT_EQ(metadata.pythonRequires, ">=3.9");
    EXPECT_THAT(metadata.installRequires, ElementsAre("requests>=2.0", "click"));
    ASSERT_EQ(metadata.extrasRequire.size(), 2u);
    EXPECT_THAT(metadata.extrasRequire["dev"], ElementsAre("pytest", "black"));
}

TEST_F(RequirementsParserTest, SetupCfg) {
    auto metadata = parseSetupCfgText(
        "[metadata]\n"
        "name = cfg-app\n"
        "version = 1.2.0\n"
        "license = BSD\n"
        "\n"
        "[options]\n"
        "python_requires = >=3.8\n"
        "install_requires =\n"
        "    numpy>=1.20\n"
        "    # pinned below\n"
        "    pandas\n"
        "packages = find:\n");
    EXPECT_EQ(metadata.name, "cfg-app");
    EXPECT_EQ(metadata.version, "1.2.0");
    EXPECT_EQ(metadata.license, "BSD");
    EXPECT_EQ(metadata.pythonRequires, ">=3.8");
    EXPECT_THAT(metadata.installRequires, ElementsAre("numpy>=1.20", "pandas"));
}

TEST_F(RequirementsParserTest, SetupCfgInlineRequirement) {
    auto metadata =
        parseSetupCfgText("[options]\ninstall_requires = attrs\n");
    EXPECT_THAT(metadata.installRequires, ElementsAre("attrs"));
}
