//! # Explain Internal Interface
//!
//! Shared declarations for the explain command subsystem.
//! Each category module returns explanations for its error codes.
//!
//! ## Categories
//!
//! | Module               | Code Range  | Description                       |
//! |----------------------|-------------|-----------------------------------|
//! | `rule_errors.cpp`    | SB001-SB004 | Aliasing rule violations          |
//! | `verify_errors.cpp`  | V001-V003   | Malformed programs                |
//! | `parser_errors.cpp`  | P001-P005   | Trace syntax errors               |
//! | `general_errors.cpp` | E001-E002   | File and expectation errors       |

#pragma once

#include <string>
#include <unordered_map>

namespace sbc::cli::explain {

/// Get explanations for aliasing rule violations (SB001-SB004)
const std::unordered_map<std::string, std::string>& get_rule_explanations();

/// Get explanations for verification errors (V001-V003)
const std::unordered_map<std::string, std::string>& get_verify_explanations();

/// Get explanations for trace syntax errors (P001-P005)
const std::unordered_map<std::string, std::string>& get_parser_explanations();

/// Get explanations for general errors (E001-E002)
const std::unordered_map<std::string, std::string>& get_general_explanations();

} // namespace sbc::cli::explain
