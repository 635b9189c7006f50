//! # Build Command Interface
//!
//! | Function      | Description                                  |
//! |---------------|----------------------------------------------|
//! | `run_build()` | Compile out-of-date translation catalogs     |
//! | `run_clean()` | Remove compiled catalogs                     |

#pragma once

#include "cmd_options.hpp"

namespace tsbuild::cli {

int run_build(const CommandOptions& options);
int run_clean(const CommandOptions& options);

} // namespace tsbuild::cli
