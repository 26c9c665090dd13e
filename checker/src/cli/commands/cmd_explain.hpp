//! # Explain Command Interface
//!
//! Show detailed explanation for a diagnostic code.
//!
//! | Command                  | Output                            |
//! |--------------------------|-----------------------------------|
//! | `sbcheck explain SB004`  | Read-only violation explanation   |
//! | `sbcheck explain v1`     | Same as `V001` (case-insensitive) |

#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace sbc::cli {

/// Returns the explanation text for a code, accepting lower case and
/// unpadded numbers (`sb4` is `SB004`).
std::optional<std::string> find_explanation(const std::string& code);

/// Normalizes a code: strips whitespace, upper-cases, pads the number to
/// three digits.
std::string normalize_code(const std::string& code);

/// Show detailed explanation for an error code.
/// Returns 0 on success, 1 if the code is not found.
int run_explain(const std::string& code, std::ostream& out, std::ostream& err);

} // namespace sbc::cli
