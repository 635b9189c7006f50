//! # Translation Compiler Discovery
//!
//! Decides which executable compiles `.ts` sources into `.qm` catalogs.
//!
//! ## Resolution Order
//!
//! | Step | Source                       | Example                          |
//! |------|------------------------------|----------------------------------|
//! | 1    | `--lrelease=<tool>`          | `--lrelease=/opt/qt5/bin/lrelease` |
//! | 2    | `TSBUILD_LRELEASE`           | `TSBUILD_LRELEASE=lrelease-qt6`  |
//! | 3    | `[tool] lrelease`            | `lrelease = "lrelease"`          |
//! | 4    | Default name                 | `lrelease`                       |
//!
//! On unix-like hosts the default name is probed on `PATH`. When it is
//! missing, the first fallback found on `PATH` replaces it; when none is
//! found the first fallback replaces it anyway. Nothing here fails: a tool
//! that does not exist surfaces later as a failing build step.

#pragma once

#include "common.hpp"

#include <string>
#include <vector>

namespace tsbuild::toolchain {

/// Default translation compiler name.
constexpr const char* DEFAULT_LRELEASE = "lrelease";

/// Environment variable overriding the translation compiler.
constexpr const char* LRELEASE_ENV = "TSBUILD_LRELEASE";

/// Where a resolved tool came from.
enum class ToolSource {
    CommandLine,
    Environment,
    Manifest,
    Path,     // Default name found on PATH
    Fallback, // Alternate name substituted for a missing default
    Default   // Default name, not probed
};

const char* tool_source_name(ToolSource source);

struct ResolvedTool {
    std::string program;
    ToolSource source = ToolSource::Default;
};

/// Inputs of the resolver. Tests fill `path_env` and `platform` directly.
struct ToolResolveOptions {
    std::string cli_override;
    std::string env_override;
    std::string manifest_override;
    std::string default_name = DEFAULT_LRELEASE;
    std::vector<std::string> fallbacks = {"lrelease-qt5"};
    std::string path_env;
    Platform platform = host_platform();

    /// Fills `env_override` and `path_env` from the process environment.
    static ToolResolveOptions from_environment();
};

/// Pick the translation compiler.
ResolvedTool resolve_translation_compiler(const ToolResolveOptions& options);

/// Search `path_env` (PATH syntax of `platform`) for an executable named `name`.
/// A name containing a directory separator is checked as-is.
/// Returns the full path, or an empty string if not found.
std::string find_in_path(const std::string& name, const std::string& path_env,
                         Platform platform = host_platform());

/// Returns the value of an environment variable, or "" if unset.
std::string get_env(const char* name);

} // namespace tsbuild::toolchain
