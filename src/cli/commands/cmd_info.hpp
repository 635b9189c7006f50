//! # Inspection Commands
//!
//! | Function     | Description                                     |
//! |--------------|-------------------------------------------------|
//! | `run_list()` | Print each source with the catalog it produces  |
//! | `run_tool()` | Print the translation compiler and its origin   |

#pragma once

#include "cmd_options.hpp"

namespace tsbuild::cli {

int run_list(const CommandOptions& options);
int run_tool(const CommandOptions& options);

} // namespace tsbuild::cli
