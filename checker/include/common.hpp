//! # Common Definitions
//!
//! Types and utilities shared by every sbcheck component.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version constants
//! - **Tool Options**: Process-wide presentation settings set by the CLI
//! - **Source Locations**: Line/column positions inside trace files
//! - **Result Type**: Error handling without exceptions
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Errors are values**: every error carries a stable code that the CLI
//!   prints and that `sbcheck explain` documents

#ifndef SBC_COMMON_HPP
#define SBC_COMMON_HPP

#include <cstdint>
#include <string>
#include <variant>

namespace sbc {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Tool Configuration
// ============================================================================

/// Output format for diagnostics.
enum class DiagnosticFormat {
    Text, ///< Human-readable text output (default)
    JSON  ///< One JSON object per line, for editors and scripts
};

/// Process-wide presentation options.
///
/// These only affect how results are printed by the CLI. Nothing that
/// influences the outcome of a check lives here; per-run settings are passed
/// explicitly through `borrow::CheckOptions`.
///
/// # Example
///
/// ```cpp
/// ToolOptions::diagnostic_format = DiagnosticFormat::JSON;
/// ToolOptions::dump_stack = true;
/// ```
struct ToolOptions {
    /// Enable verbose output to stderr.
    static inline bool verbose = false;

    /// Output format for diagnostics.
    static inline DiagnosticFormat diagnostic_format = DiagnosticFormat::Text;

    /// Print the full borrow stack of the faulting allocation.
    static inline bool dump_stack = false;

    /// Allow ANSI colors when the terminal supports them.
    static inline bool color = true;
};

// ============================================================================
// Source Locations
// ============================================================================

/// A position inside a trace file.
///
/// Programs built in memory have no location; `line == 0` marks that case.
struct SourceLocation {
    /// Line number (1-based, 0 = unknown).
    uint32_t line = 0;

    /// Column number (1-based).
    uint32_t column = 0;

    [[nodiscard]] auto is_known() const -> bool {
        return line != 0;
    }

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<int64_t, std::string> parse_value(std::string_view s) {
///     if (s.empty()) return std::string("empty literal");
///     return int64_t{42};
/// }
///
/// auto result = parse_value("42");
/// if (is_ok(result)) {
///     int64_t value = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace sbc

#endif // SBC_COMMON_HPP
