#include "utils.hpp"

#include "common.hpp"

#include <iostream>

namespace tsbuild::cli {

void print_usage() {
    std::cout << "tsbuild " << VERSION << " - Qt translation catalog builder\n\n";
    std::cout << "Usage: tsbuild <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  build     Compile out-of-date .ts sources into .qm catalogs\n";
    std::cout << "  clean     Remove compiled catalogs\n";
    std::cout << "  list      Show each source and the catalog it produces\n";
    std::cout << "  tool      Show which lrelease would be invoked\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --manifest=<file>   Manifest to read (default: translations.toml)\n";
    std::cout << "  --lrelease=<tool>   Translation compiler to invoke\n";
    std::cout << "  --out-dir=<dir>     Output directory for catalogs\n";
    std::cout << "  --jobs=<n>, -j<n>   Parallel steps (0 = one per CPU)\n";
    std::cout << "  --force, -f         Rebuild catalogs even when up to date\n";
    std::cout << "  --dry-run, -n       Print commands without running them\n";
    std::cout << "  --quiet, -q         Only report errors\n";
    std::cout << "  --help, -h          Show this help\n";
    std::cout << "  --version, -V       Show version\n";
    std::cout << "\nLogging:\n";
    std::cout << "  -v, -vv, -vvv       Info, debug, trace output\n";
    std::cout << "  --log-level=<lvl>   trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --log-filter=<spec> Per-module levels, e.g. \"engine=debug,*=warn\"\n";
    std::cout << "  --log-file=<path>   Also write log records to a file\n";
    std::cout << "  --log-format=<fmt>  text or json\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  TSBUILD_LRELEASE    Translation compiler override\n";
    std::cout << "  TSBUILD_LOG         Log level or filter spec\n";
}

void print_version() {
    std::cout << "tsbuild " << VERSION << "\n";
}

} // namespace tsbuild::cli
