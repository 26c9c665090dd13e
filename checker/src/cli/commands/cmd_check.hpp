//! # Check Command Interface
//!
//! `sbcheck check <file.trace>...` parses, verifies and runs each trace and
//! prints its verdict.
//!
//! ## Exit Codes
//!
//! | Code | Meaning                                                  |
//! |------|----------------------------------------------------------|
//! | 0    | Every trace is sound, or matches its `expect` directive  |
//! | 1    | A violation, or an `expect` directive that did not match |
//! | 2    | A file could not be read, parsed or verified             |
//!
//! With several files the worst result wins.

#pragma once

#include "borrow/interpreter.hpp"
#include "cli/diagnostic.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace sbc::cli {

enum CheckExitCode : int {
    CHECK_OK = 0,
    CHECK_VIOLATION = 1,
    CHECK_ERROR = 2,
};

/// Checks one trace file. Diagnostics go to `emitter`, the summary line to
/// `out`.
int check_file(const std::string& path, const borrow::CheckOptions& options,
               DiagnosticEmitter& emitter, std::ostream& out);

/// Checks every file and returns the worst exit code.
int run_check(const std::vector<std::string>& files, const borrow::CheckOptions& options,
              std::ostream& out, std::ostream& diag_out);

} // namespace sbc::cli
