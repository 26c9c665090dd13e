//! # Diagnostic System Interface
//!
//! Formats checker results for people and for tools.
//!
//! ## Error Code Categories
//!
//! | Prefix | Category      | Example                          |
//! |--------|---------------|----------------------------------|
//! | SB     | Aliasing rule | SB004 - Write through read-only  |
//! | V      | Verification  | V001 - Unknown allocation        |
//! | P      | Parser        | P001 - Unexpected token          |
//! | E      | General       | E001 - File not readable         |
//!
//! Every code has a long-form explanation in `sbcheck explain <code>`.
//!
//! ## Text format
//!
//! ```text
//! error[SB004]: attempting a write access using <3> at `x`, but that tag only grants ...
//!   --> shared_write.trace:4:1
//!      |
//!    4 | call q
//!      | ^^^^^^ write rejected here
//!      |
//!   = note: <3> was created by `q = reborrow unique p` (instruction 2) with SharedReadOnly ...
//! ```
//!
//! With `DiagnosticFormat::JSON` every diagnostic is one JSON object on one
//! line instead.

#pragma once

#include "borrow/report.hpp"
#include "common.hpp"
#include "trace/parser.hpp"

#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace sbc::cli {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightBlue = "\033[94m";
    static constexpr const char* BrightCyan = "\033[96m";
};

// ============================================================================
// Diagnostic Message
// ============================================================================

/// Every diagnostic is an error; explanations live in `notes` and `help`.
struct Diagnostic {
    std::string code;    // "SB004", "V002", "P001", or empty
    std::string message; // Main message
    std::string file;
    SourceLocation location;
    std::string label;              // Shown under the ^^^ marker
    std::vector<std::string> notes; // "= note: ..."
    std::vector<std::string> help;  // "= help: ..."
    std::vector<std::string> stack; // Borrow stack dump, bottom first
};

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter {
public:
    /// Colors are on when `ToolOptions::color` is set and `out` is a
    /// terminal.
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }
    void set_source_content(const std::string& path, const std::string& content);

    void emit(const Diagnostic& diag);

    void error(const std::string& code, const std::string& message, const std::string& file,
               SourceLocation location, const std::vector<std::string>& notes = {});

    static std::string escape_json_string(const std::string& s);

private:
    std::ostream& out_;
    bool use_colors_ = true;
    std::unordered_map<std::string, std::string> source_files_; // path -> content

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    void emit_header(const Diagnostic& diag);
    void emit_source_snippet(const Diagnostic& diag);
    void emit_notes(const std::vector<std::string>& notes);
    void emit_help(const std::vector<std::string>& help);
    void emit_stack(const std::vector<std::string>& stack);

    void emit_json(const Diagnostic& diag);

    std::string get_source_line(const std::string& path, uint32_t line) const;
};

// Check if `out` is std::cout or std::cerr attached to a color terminal
bool terminal_supports_colors(const std::ostream& out);

// ============================================================================
// Conversions
// ============================================================================

/// Builds the diagnostic for an aliasing violation found in `file`.
///
/// The borrow stack is attached when `ToolOptions::dump_stack` is set.
Diagnostic make_diagnostic(const borrow::Violation& violation, const std::string& file);

Diagnostic make_diagnostic(const borrow::TraceError& error, const std::string& file);

Diagnostic make_diagnostic(const trace::ParseError& error);

/// One line per frame, e.g. `<2> Unique (from <1>, instruction 1)`.
std::vector<std::string> format_stack(const std::vector<borrow::Frame>& stack);

// ============================================================================
// "Did You Mean?" Suggestions
// ============================================================================

/// Case-insensitive edit distance.
size_t levenshtein_distance(const std::string& s1, const std::string& s2);

/// Candidates within `max_distance` of `input`, closest first, ties in
/// alphabetical order.
std::vector<std::string> find_similar_candidates(const std::string& input,
                                                 const std::vector<std::string>& candidates,
                                                 size_t max_results = 3, size_t max_distance = 3);

} // namespace sbc::cli
