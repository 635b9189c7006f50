//! # Build Command
//!
//! `tsbuild build` compiles every out-of-date `.ts` source into its `.qm`
//! catalog; `tsbuild clean` removes the catalogs again.
//!
//! ## Output
//!
//! ```text
//! [1/4] Compiling translations/svgcleaner_cs.ts -> bin/translations/svgcleaner_cs.qm
//! ...
//! error: translations/svgcleaner_ru.ts: input not found
//! Build finished: 3 compiled, 0 up to date, 1 failed (12 ms)
//! ```

#include "cmd_build.hpp"

#include "engine/step_runner.hpp"
#include "log/log.hpp"

#include <iostream>

namespace tsbuild::cli {

int run_build(const CommandOptions& options) {
    auto loaded = load_project(options);
    if (is_err(loaded)) {
        std::cerr << "error: " << unwrap_err(loaded) << "\n";
        return EXIT_ERROR;
    }
    const Project& project = unwrap(loaded);

    engine::StepRunnerOptions runner_options;
    runner_options.jobs = options.jobs >= 0 ? options.jobs : project.manifest.build.jobs;
    runner_options.force = options.force;
    runner_options.dry_run = options.dry_run;
    runner_options.quiet = options.quiet;

    TSBUILD_LOG_INFO("cli", "Using " << project.tool.program << " ("
                                     << toolchain::tool_source_name(project.tool.source)
                                     << ")");

    engine::StepRunner runner(runner_options);
    bool success = runner.run(project.registry);

    for (const auto& job : runner.jobs()) {
        if (job->state == engine::StepState::Failed) {
            std::cerr << "error: " << job->step.input.string() << ": " << job->error_message
                      << "\n";
        }
    }

    const auto& stats = runner.stats();
    if (!options.quiet) {
        if (options.dry_run) {
            std::cout << "Dry run: " << stats.planned.load() << " to compile, "
                      << stats.up_to_date.load() << " up to date, " << stats.failed.load()
                      << " failed\n";
        } else {
            std::cout << "Build finished: " << stats.compiled.load() << " compiled, "
                      << stats.up_to_date.load() << " up to date, " << stats.failed.load()
                      << " failed (" << stats.elapsed_ms() << " ms)\n";
        }
    }

    return success ? EXIT_OK : EXIT_ERROR;
}

int run_clean(const CommandOptions& options) {
    auto loaded = load_project(options);
    if (is_err(loaded)) {
        std::cerr << "error: " << unwrap_err(loaded) << "\n";
        return EXIT_ERROR;
    }

    auto result = engine::clean_outputs(unwrap(loaded).registry, options.dry_run);

    if (!options.quiet) {
        std::cout << "Removed " << result.removed << " file(s)";
        if (result.failed > 0) {
            std::cout << ", " << result.failed << " could not be removed";
        }
        std::cout << "\n";
    }

    return result.failed == 0 ? EXIT_OK : EXIT_ERROR;
}

} // namespace tsbuild::cli
