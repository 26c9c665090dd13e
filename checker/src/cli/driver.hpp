//! # Checker Driver Interface
//!
//! `sbc_main()` dispatches to the appropriate command handler based on argv[1].

#pragma once

// Main driver entry point
// Dispatches to appropriate command handlers
int sbc_main(int argc, char* argv[]);
