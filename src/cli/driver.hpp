//! # CLI Driver Interface
//!
//! `tsbuild_main()` dispatches to the command handler named by argv[1].

#pragma once

int tsbuild_main(int argc, char* argv[]);
