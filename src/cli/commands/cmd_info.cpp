#include "cmd_info.hpp"

#include "engine/step_runner.hpp"

#include <iostream>

namespace tsbuild::cli {

int run_list(const CommandOptions& options) {
    auto loaded = load_project(options);
    if (is_err(loaded)) {
        std::cerr << "error: " << unwrap_err(loaded) << "\n";
        return EXIT_ERROR;
    }
    const Project& project = unwrap(loaded);

    for (const rules::BuildRule* rule : project.registry.ordered()) {
        std::cout << rule->name << ":";
        if (rule->flags.target_predeps)
            std::cout << " target_predeps";
        if (rule->flags.no_link)
            std::cout << " no_link";
        std::cout << "\n";

        for (const auto& input : rule->inputs) {
            fs::path output = rules::output_for(*rule, input);
            std::cout << "  " << input.string() << " -> " << output.string();
            if (!fs::exists(input)) {
                std::cout << " (missing)";
            } else if (engine::is_up_to_date(input, output)) {
                std::cout << " (up to date)";
            }
            std::cout << "\n";
        }
    }

    auto link_inputs = project.registry.link_inputs();
    std::cout << "link inputs: " << (link_inputs.empty() ? "none" : "") << "\n";
    for (const auto& path : link_inputs) {
        std::cout << "  " << path.string() << "\n";
    }

    return EXIT_OK;
}

int run_tool(const CommandOptions& options) {
    auto loaded = options.manifest_path.empty()
                      ? manifest::Manifest::load_from_current_dir()
                      : manifest::Manifest::load(options.manifest_path);

    // Without a manifest the tool is still resolved from CLI, environment and defaults.
    manifest::Manifest defaults;
    bool has_manifest =
        !options.manifest_path.empty() || fs::exists(manifest::MANIFEST_FILENAME);
    if (is_err(loaded) && has_manifest) {
        std::cerr << "error: " << unwrap_err(loaded) << "\n";
        return EXIT_ERROR;
    }
    const manifest::Manifest& manifest = is_ok(loaded) ? unwrap(loaded) : defaults;

    auto tool = resolve_tool(manifest, options);
    std::cout << tool.program << " (" << toolchain::tool_source_name(tool.source) << ")\n";

    auto found = toolchain::find_in_path(tool.program, toolchain::get_env("PATH"));
    if (found.empty()) {
        std::cerr << "warning: '" << tool.program << "' was not found on PATH\n";
    } else if (found != tool.program) {
        std::cout << "  " << found << "\n";
    }

    return EXIT_OK;
}

} // namespace tsbuild::cli
