//! # Command Options
//!
//! Options shared by every subcommand, and the project setup they drive.
//!
//! ## Options
//!
//! | Option              | Field           | Commands           |
//! |---------------------|-----------------|--------------------|
//! | `--manifest=<file>` | `manifest_path` | all                |
//! | `--lrelease=<tool>` | `lrelease`      | build, list, tool  |
//! | `--out-dir=<dir>`   | `out_dir`       | build, clean, list |
//! | `--jobs=<n>`, `-j<n>` | `jobs`      | build              |
//! | `--force`, `-f`     | `force`         | build              |
//! | `--dry-run`, `-n`   | `dry_run`       | build, clean       |
//! | `-q`, `--quiet`     | `quiet`         | all                |
//!
//! Logging options (`-v`, `--log-level=`, ...) are accepted everywhere and
//! handled by `log::parse_log_options()`.

#pragma once

#include "common.hpp"
#include "manifest/manifest.hpp"
#include "rules/rule_registry.hpp"
#include "toolchain/tool_resolver.hpp"

#include <string>

namespace tsbuild::cli {

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;

struct CommandOptions {
    std::string manifest_path; // Empty = translations.toml in the working directory
    std::string lrelease;
    std::string out_dir; // Relative to the working directory
    int jobs = -1;       // -1 = take [build] jobs from the manifest
    bool force = false;
    bool dry_run = false;
    bool quiet = false;
};

/// Parse `argv[first..argc)`.
/// @return Options, or an error naming the offending argument
[[nodiscard]] Result<CommandOptions> parse_command_options(int argc, char* argv[], int first);

/// Everything a command needs: the manifest, the chosen tool and the
/// registered translation rule.
struct Project {
    manifest::Manifest manifest;
    toolchain::ResolvedTool tool;
    rules::RuleRegistry registry;
};

/// Tool for `manifest` after applying CLI and environment overrides.
toolchain::ResolvedTool resolve_tool(const manifest::Manifest& manifest,
                                     const CommandOptions& options);

/// Load the manifest named by `options`, resolve the tool and register
/// the translation rule.
[[nodiscard]] Result<Project> load_project(const CommandOptions& options);

} // namespace tsbuild::cli
