#include "cmd_options.hpp"

#include "log/log.hpp"
#include "rules/build_rule.hpp"

#include <charconv>
#include <string_view>

namespace tsbuild::cli {

static bool parse_jobs(std::string_view text, int& jobs) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 0 || value > 1024)
        return false;
    jobs = value;
    return true;
}

Result<CommandOptions> parse_command_options(int argc, char* argv[], int first) {
    CommandOptions options;

    for (int i = first; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (arg.starts_with("--manifest=")) {
            options.manifest_path = std::string(arg.substr(11));
            if (options.manifest_path.empty())
                return std::string("--manifest requires a file");
        } else if (arg.starts_with("--lrelease=")) {
            options.lrelease = std::string(arg.substr(11));
            if (options.lrelease.empty())
                return std::string("--lrelease requires a program");
        } else if (arg.starts_with("--out-dir=")) {
            options.out_dir = std::string(arg.substr(10));
            if (options.out_dir.empty())
                return std::string("--out-dir requires a directory");
        } else if (arg.starts_with("--jobs=") || (arg.starts_with("-j") && arg.size() > 2)) {
            auto value = arg.substr(arg[1] == 'j' ? 2 : 7);
            if (!parse_jobs(value, options.jobs))
                return "invalid job count '" + std::string(value) + "'";
        } else if (arg == "--force" || arg == "-f") {
            options.force = true;
        } else if (arg == "--dry-run" || arg == "-n") {
            options.dry_run = true;
        } else {
            return "unknown option '" + std::string(arg) + "'";
        }
    }

    return options;
}

toolchain::ResolvedTool resolve_tool(const manifest::Manifest& manifest,
                                     const CommandOptions& options) {
    auto resolve = toolchain::ToolResolveOptions::from_environment();
    resolve.cli_override = options.lrelease;
    resolve.manifest_override = manifest.tool.lrelease;
    resolve.fallbacks = manifest.tool.fallbacks;
    return toolchain::resolve_translation_compiler(resolve);
}

Result<Project> load_project(const CommandOptions& options) {
    auto loaded = options.manifest_path.empty()
                      ? manifest::Manifest::load_from_current_dir()
                      : manifest::Manifest::load(options.manifest_path);
    if (is_err(loaded))
        return unwrap_err(loaded);

    Project project;
    project.manifest = std::move(unwrap(loaded));
    project.tool = resolve_tool(project.manifest, options);

    auto rule = rules::make_translation_rule(project.manifest, project.tool.program);
    if (!options.out_dir.empty()) {
        rule.output_dir = options.out_dir;
    }

    if (auto error = project.registry.add(std::move(rule)))
        return *error;

    TSBUILD_LOG_DEBUG("cli", "Project '" << project.manifest.project.name << "': "
                                         << project.manifest.translations.sources.size()
                                         << " source(s), tool " << project.tool.program);
    return project;
}

} // namespace tsbuild::cli
