//! # Translation Compiler Discovery
//!
//! Implements the resolution order documented in tool_resolver.hpp. The PATH
//! probe is the moral equivalent of `which lrelease`: split the variable,
//! look for a regular file with an execute bit, take the first hit.

#include "toolchain/tool_resolver.hpp"

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace tsbuild::toolchain {

const char* tool_source_name(ToolSource source) {
    switch (source) {
    case ToolSource::CommandLine:
        return "command line";
    case ToolSource::Environment:
        return "environment";
    case ToolSource::Manifest:
        return "manifest";
    case ToolSource::Path:
        return "PATH";
    case ToolSource::Fallback:
        return "fallback";
    case ToolSource::Default:
        return "default";
    }
    return "unknown";
}

std::string get_env(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    std::string value;
    if (_dupenv_s(&buf, &len, name) == 0 && buf) {
        value = buf;
        free(buf);
    }
    return value;
#else
    const char* value = std::getenv(name);
    return value ? value : "";
#endif
}

ToolResolveOptions ToolResolveOptions::from_environment() {
    ToolResolveOptions options;
    options.env_override = get_env(LRELEASE_ENV);
    options.path_env = get_env("PATH");
    return options;
}

static bool is_executable_file(const fs::path& path, Platform platform) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status))
        return false;

    // Windows has no execute bit, the extension decides
    if (platform == Platform::Windows)
        return true;

    auto exec_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (status.permissions() & exec_bits) != fs::perms::none;
}

std::string find_in_path(const std::string& name, const std::string& path_env,
                         Platform platform) {
    if (name.empty())
        return "";

    std::vector<std::string> candidates = {name};
    if (platform == Platform::Windows && fs::path(name).extension().empty()) {
        candidates.push_back(name + ".exe");
    }

    bool has_separator = name.find('/') != std::string::npos ||
                         (platform == Platform::Windows && name.find('\\') != std::string::npos);
    if (has_separator) {
        for (const auto& candidate : candidates) {
            if (is_executable_file(candidate, platform)) {
                return candidate;
            }
        }
        return "";
    }

    char separator = platform == Platform::Windows ? ';' : ':';
    size_t pos = 0;
    while (pos <= path_env.size()) {
        size_t end = path_env.find(separator, pos);
        if (end == std::string::npos) {
            end = path_env.size();
        }

        std::string dir = path_env.substr(pos, end - pos);
        // An empty PATH entry means the current directory
        if (dir.empty()) {
            dir = ".";
        }

        for (const auto& candidate : candidates) {
            fs::path full = fs::path(dir) / candidate;
            if (is_executable_file(full, platform)) {
                return full.string();
            }
        }

        pos = end + 1;
    }

    return "";
}

ResolvedTool resolve_translation_compiler(const ToolResolveOptions& options) {
    if (!options.cli_override.empty())
        return {options.cli_override, ToolSource::CommandLine};
    if (!options.env_override.empty())
        return {options.env_override, ToolSource::Environment};
    if (!options.manifest_override.empty())
        return {options.manifest_override, ToolSource::Manifest};

    // Only unix hosts are probed, Windows relies on the default name
    if (options.platform != Platform::Unix)
        return {options.default_name, ToolSource::Default};

    if (!find_in_path(options.default_name, options.path_env, options.platform).empty()) {
        TSBUILD_LOG_DEBUG("toolchain", "Found '" << options.default_name << "' on PATH");
        return {options.default_name, ToolSource::Path};
    }

    if (options.fallbacks.empty()) {
        TSBUILD_LOG_DEBUG("toolchain", "'" << options.default_name
                                           << "' not on PATH and no fallback configured");
        return {options.default_name, ToolSource::Default};
    }

    for (const auto& fallback : options.fallbacks) {
        if (!find_in_path(fallback, options.path_env, options.platform).empty()) {
            TSBUILD_LOG_DEBUG("toolchain", "'" << options.default_name << "' not on PATH, using '"
                                               << fallback << "'");
            return {fallback, ToolSource::Fallback};
        }
    }

    TSBUILD_LOG_DEBUG("toolchain", "Neither '" << options.default_name
                                               << "' nor any fallback is on PATH, assuming '"
                                               << options.fallbacks.front() << "'");
    return {options.fallbacks.front(), ToolSource::Fallback};
}

} // namespace tsbuild::toolchain
