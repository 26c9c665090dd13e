//! # CLI Utilities
//!
//! Usage and version banners shared by the dispatcher.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sbc::cli {

void print_usage();
void print_check_usage();
void print_version();

/// Parses a decimal integer flag value such as the `5` of `--call-value=5`.
std::optional<int64_t> parse_int_flag(const std::string& text);

} // namespace sbc::cli
