//! # Translation Manifest
//!
//! This header defines `translations.toml` loading and the project
//! configuration it carries.
//!
//! ## Manifest Sections
//!
//! | Section          | Type                  | Description                       |
//! |------------------|-----------------------|-----------------------------------|
//! | `[project]`      | `ProjectInfo`         | Project name                      |
//! | `[translations]` | `TranslationSettings` | Source list, output dir, encoding |
//! | `[tool]`         | `ToolSettings`        | lrelease override and fallbacks   |
//! | `[build]`        | `BuildSettings`       | Jobs, silent mode, command        |
//!
//! ## Example
//!
//! ```toml
//! [project]
//! name = "svgcleaner"
//!
//! [translations]
//! sources = [
//!     "translations/svgcleaner_cs.ts",
//!     "translations/svgcleaner_de.ts",
//! ]
//! output_dir = "bin/translations"
//! ```

#ifndef TSBUILD_MANIFEST_MANIFEST_HPP
#define TSBUILD_MANIFEST_MANIFEST_HPP

#include "common.hpp"
#include "manifest/toml_parser.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace tsbuild::manifest {

/// Default manifest file name looked up in the working directory.
constexpr const char* MANIFEST_FILENAME = "translations.toml";

/**
 * Project metadata from [project]
 */
struct ProjectInfo {
    std::string name;
};

/**
 * Translation sources from [translations]
 */
struct TranslationSettings {
    std::vector<std::string> sources; // Ordered, one per locale
    std::string output_dir = "translations";
    std::string extension = ".qm";
    std::string source_encoding = "UTF-8";
};

/**
 * Translation compiler selection from [tool]
 */
struct ToolSettings {
    std::string lrelease; // Explicit tool, empty = probe
    std::vector<std::string> fallbacks = {"lrelease-qt5"};
};

/**
 * Execution settings from [build]
 */
struct BuildSettings {
    int jobs = 0; // 0 = hardware concurrency
    bool silent = true;
    std::string command; // Command template override, empty = default
};

/**
 * Complete manifest structure
 */
struct Manifest {
    ProjectInfo project;
    TranslationSettings translations;
    ToolSettings tool;
    BuildSettings build;

    /// Directory relative paths are resolved against.
    fs::path base_dir;

    /**
     * Load a manifest from disk.
     * @return Manifest, or "<file>:<line>: message" on error
     */
    [[nodiscard]] static Result<Manifest> load(const fs::path& path);

    /**
     * Load `translations.toml` from the current directory.
     */
    [[nodiscard]] static Result<Manifest> load_from_current_dir();

    /**
     * Parse manifest text. Errors are "line N: message".
     */
    [[nodiscard]] static Result<Manifest> parse(const std::string& content,
                                                const fs::path& base_dir = {});

    /**
     * Check semantic constraints (non-empty source list, no duplicates, ...).
     * @return Error message, or std::nullopt when valid
     */
    std::optional<std::string> validate() const;

    /// Source paths resolved against base_dir, in manifest order.
    std::vector<fs::path> source_paths() const;

    /// Output directory resolved against base_dir.
    fs::path output_path() const;
};

} // namespace tsbuild::manifest

#endif // TSBUILD_MANIFEST_MANIFEST_HPP
