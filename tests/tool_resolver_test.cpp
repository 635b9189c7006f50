//! # Tool Resolver Tests
//!
//! Override precedence, PATH probing and fallback substitution. Fake tools
//! are empty files in temporary directories with the execute bit set.

#include "toolchain/tool_resolver.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace tsbuild;
using namespace tsbuild::toolchain;
namespace fs = std::filesystem;

class ToolResolverTest : public ::testing::Test {
protected:
    fs::path root;
    fs::path bin_a;
    fs::path bin_b;

    void SetUp() override {
        root = fs::temp_directory_path() / "tsbuild_tool_resolver_test";
        fs::remove_all(root);
        bin_a = root / "a";
        bin_b = root / "b";
        fs::create_directories(bin_a);
        fs::create_directories(bin_b);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path make_tool(const fs::path& dir, const std::string& name, bool executable = true) {
        fs::path path = dir / name;
        std::ofstream(path) << "#!/bin/sh\nexit 0\n";
        auto perms = fs::perms::owner_read | fs::perms::owner_write;
        if (executable) {
            perms |= fs::perms::owner_exec;
        }
        fs::permissions(path, perms);
        return path;
    }

    std::string path_env() const {
        return bin_a.string() + ":" + bin_b.string();
    }

    ToolResolveOptions unix_options() const {
        ToolResolveOptions options;
        options.path_env = path_env();
        options.platform = Platform::Unix;
        return options;
    }
};

// ============================================================================
// Overrides
// ============================================================================

TEST_F(ToolResolverTest, CommandLineWinsOverEverything) {
    make_tool(bin_a, "lrelease");
    auto options = unix_options();
    options.cli_override = "/opt/qt/bin/lrelease";
    options.env_override = "lrelease-env";
    options.manifest_override = "lrelease-manifest";

    auto tool = resolve_translation_compiler(options);
    EXPECT_EQ(tool.program, "/opt/qt/bin/lrelease");
    EXPECT_EQ(tool.source, ToolSource::CommandLine);
}

TEST_F(ToolResolverTest, EnvironmentWinsOverManifest) {
    auto options = unix_options();
    options.env_override = "lrelease-env";
    options.manifest_override = "lrelease-manifest";

    auto tool = resolve_translation_compiler(options);
    EXPECT_EQ(tool.program, "lrelease-env");
    EXPECT_EQ(tool.source, ToolSource::Environment);
}

TEST_F(ToolResolverTest, ManifestWinsOverProbing) {
    make_tool(bin_a, "lrelease");
    auto options = unix_options();
    options.manifest_override = "lrelease-manifest";

    auto tool = resolve_translation_compiler(options);
    EXPECT_EQ(tool.program, "lrelease-manifest");
    EXPECT_EQ(tool.source, ToolSource::Manifest);
}

// ============================================================================
// PATH Probing
// ============================================================================

TEST_F(ToolResolverTest, DefaultFoundOnPath) {
    make_tool(bin_b, "lrelease");
    make_tool(bin_a, "lrelease-qt5");

    auto tool = resolve_translation_compiler(unix_options());
    EXPECT_EQ(tool.program, "lrelease");
    EXPECT_EQ(tool.source, ToolSource::Path);
}

TEST_F(ToolResolverTest, FallbackSelectedWhenDefaultMissing) {
    make_tool(bin_b, "lrelease-qt5");

    auto tool = resolve_translation_compiler(unix_options());
    EXPECT_EQ(tool.program, "lrelease-qt5");
    EXPECT_EQ(tool.source, ToolSource::Fallback);
}

TEST_F(ToolResolverTest, FirstFallbackFoundWins) {
    make_tool(bin_a, "lrelease-qt5");
    auto options = unix_options();
    options.fallbacks = {"lrelease-qt6", "lrelease-qt5"};

    auto tool = resolve_translation_compiler(options);
    EXPECT_EQ(tool.program, "lrelease-qt5");
    EXPECT_EQ(tool.source, ToolSource::Fallback);
}

TEST_F(ToolResolverTest, FirstFallbackSubstitutedWhenNothingFound) {
    auto options = unix_options();
    options.fallbacks = {"lrelease-qt6", "lrelease-qt5"};

    auto tool = resolve_translation_compiler(options);
    EXPECT_EQ(tool.program, "lrelease-qt6");
    EXPECT_EQ(tool.source, ToolSource::Fallback);
}

TEST_F(ToolResolverTest, NoFallbacksKeepsDefault) {
    auto options = unix_options();
    options.fallbacks.clear();

    auto tool = resolve_translation_compiler(options);
    EXPECT_EQ(tool.program, "lrelease");
    EXPECT_EQ(tool.source, ToolSource::Default);
}

TEST_F(ToolResolverTest, NonExecutableFileIsIgnored) {
    make_tool(bin_a, "lrelease", false);
    make_tool(bin_b, "lrelease-qt5");

    auto tool = resolve_translation_compiler(unix_options());
    EXPECT_EQ(tool.program, "lrelease-qt5");
}

TEST_F(ToolResolverTest, WindowsIsNotProbed) {
    auto options = unix_options();
    options.platform = Platform::Windows;

    auto tool = resolve_translation_compiler(options);
    EXPECT_EQ(tool.program, "lrelease");
    EXPECT_EQ(tool.source, ToolSource::Default);
}

// ============================================================================
// find_in_path
// ============================================================================

TEST_F(ToolResolverTest, FindInPathReturnsFirstMatch) {
    make_tool(bin_a, "lrelease");
    make_tool(bin_b, "lrelease");

    EXPECT_EQ(find_in_path("lrelease", path_env(), Platform::Unix),
              (bin_a / "lrelease").string());
}

TEST_F(ToolResolverTest, FindInPathMissing) {
    EXPECT_EQ(find_in_path("lrelease", path_env(), Platform::Unix), "");
    EXPECT_EQ(find_in_path("", path_env(), Platform::Unix), "");
}

TEST_F(ToolResolverTest, FindInPathChecksNamesWithSeparatorDirectly) {
    auto tool = make_tool(bin_b, "lrelease");

    EXPECT_EQ(find_in_path(tool.string(), "", Platform::Unix), tool.string());
    EXPECT_EQ(find_in_path((bin_a / "lrelease").string(), path_env(), Platform::Unix), "");
}

TEST_F(ToolResolverTest, FindInPathWindowsAddsExe) {
    make_tool(bin_b, "lrelease.exe");

    std::string windows_path = bin_a.string() + ";" + bin_b.string();
    EXPECT_EQ(find_in_path("lrelease", windows_path, Platform::Windows),
              (bin_b / "lrelease.exe").string());
}

TEST(ToolSourceTest, Names) {
    EXPECT_STREQ(tool_source_name(ToolSource::CommandLine), "command line");
    EXPECT_STREQ(tool_source_name(ToolSource::Fallback), "fallback");
}
