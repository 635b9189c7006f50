//! # CLI Command Dispatcher
//!
//! Entry point of the tsbuild CLI. Initializes logging, parses the shared
//! options and routes to the command handler.
//!
//! ## Architecture
//!
//! ```text
//! tsbuild_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ build          → run_build()
//!   ├─ clean          → run_clean()
//!   ├─ list           → run_list()
//!   └─ tool           → run_tool()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                        |
//! |------|------------------------------------------------|
//! | 0    | Success                                        |
//! | 1    | Bad usage, invalid manifest or a failed step   |

#include "cli/commands/cmd_build.hpp"
#include "cli/commands/cmd_info.hpp"
#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <exception>
#include <iostream>
#include <string>

int tsbuild_main(int argc, char* argv[]) {
    using namespace tsbuild;
    using namespace tsbuild::cli;

    if (argc < 2) {
        print_usage();
        return EXIT_OK;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return EXIT_OK;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return EXIT_OK;
    }

    log::Logger::init(log::parse_log_options(argc, argv));

    auto parsed = parse_command_options(argc, argv, 2);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n";
        std::cerr << "Run 'tsbuild --help' for usage.\n";
        return EXIT_ERROR;
    }
    const CommandOptions& options = unwrap(parsed);

    int result = EXIT_ERROR;
    try {
        if (command == "build") {
            result = run_build(options);
        } else if (command == "clean") {
            result = run_clean(options);
        } else if (command == "list") {
            result = run_list(options);
        } else if (command == "tool") {
            result = run_tool(options);
        } else {
            std::cerr << "error: unknown command '" << command << "'\n";
            std::cerr << "Run 'tsbuild --help' for usage.\n";
        }
    } catch (const std::exception& e) {
        TSBUILD_LOG_FATAL("cli", "Unhandled exception: " << e.what());
        std::cerr << "error: " << e.what() << "\n";
        result = EXIT_ERROR;
    }

    log::Logger::instance().flush();
    return result;
}
