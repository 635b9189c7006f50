//! # tsbuild Entry Point
//!
//! ```bash
//! tsbuild build                  # Compile catalogs listed in translations.toml
//! tsbuild build --force -j4      # Rebuild everything on four threads
//! tsbuild list                   # Show source -> catalog pairs
//! tsbuild tool                   # Show which lrelease is used
//! ```
//!
//! All work happens in the CLI driver (`cli/dispatcher.cpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return tsbuild_main(argc, argv);
}
