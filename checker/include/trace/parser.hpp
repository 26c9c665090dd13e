//! # Trace Parser
//!
//! Parses the line-oriented `.trace` format into a `borrow::Program`.
//!
//! ## Grammar
//!
//! ```text
//! line        = [ statement ] [ "#" comment ]
//! statement   = "declare" [ "mut" | "cell" ] NAME "=" INT
//!             | NAME "=" "borrow" kind NAME
//!             | NAME "=" "reborrow" kind NAME
//!             | NAME "=" "cast_int" NAME
//!             | "read" NAME
//!             | "write" NAME INT
//!             | "call" NAME [ INT ]
//!             | "expect" "sound"
//!             | "expect" "violation" [ RULE ] [ "at" INT ]
//! kind        = "shared" | "unique"
//! RULE        = rule name (`Disabled`) or code (`SB003`)
//! ```
//!
//! `expect` lines are directives, not instructions: `at N` counts
//! instructions from zero, skipping blank lines, comments and the directive.
//!
//! The parser keeps going after a bad line so that one run reports every
//! syntax error in a file.

#ifndef SBC_TRACE_PARSER_HPP
#define SBC_TRACE_PARSER_HPP

#include "borrow/program.hpp"
#include "common.hpp"
#include "trace/source.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sbc::trace {

enum class ParseErrorCode {
    UnexpectedToken,    ///< P001
    MissingOperand,     ///< P002
    InvalidInteger,     ///< P003
    UnknownInstruction, ///< P004
    DuplicateExpect,    ///< P005
    IoError,            ///< E001: the trace file could not be read
};

/// Returns the diagnostic code of a parse error, e.g. "P001".
[[nodiscard]] auto parse_error_code(ParseErrorCode code) -> const char*;

struct ParseError {
    ParseErrorCode code = ParseErrorCode::UnexpectedToken;
    std::string message;
    std::string file;
    SourceLocation location;
};

class TraceParser {
public:
    explicit TraceParser(const Source& source);

    /// Parses the whole source. The program is named after the source file.
    [[nodiscard]] auto parse() -> Result<borrow::Program, std::vector<ParseError>>;

private:
    struct Token {
        std::string_view text;
        SourceLocation location;
    };

    const Source& source_;
    borrow::Program program_;
    std::vector<ParseError> errors_;

    std::vector<Token> tokens_;
    size_t pos_ = 0;

    void tokenize_line(uint32_t line_num);
    void parse_line();

    void parse_declare(const Token& keyword);
    void parse_assignment(const Token& dest);
    void parse_read(const Token& keyword);
    void parse_write(const Token& keyword);
    void parse_call(const Token& keyword);
    void parse_expect(const Token& keyword);

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= tokens_.size();
    }
    auto peek() const -> const Token*;
    auto advance() -> const Token*;

    /// Consumes a name, or reports `MissingOperand` naming `what`.
    auto expect_name(const Token& after, std::string_view what) -> std::optional<std::string>;
    auto expect_integer(const Token& after, std::string_view what) -> std::optional<int64_t>;
    auto expect_keyword(const Token& after, std::string_view keyword) -> bool;
    auto parse_integer(const Token& token) -> std::optional<int64_t>;

    /// Reports trailing tokens after a complete statement.
    auto expect_end() -> bool;

    /// Location just past `token`, for errors about a missing operand.
    auto location_after(const Token& token) const -> SourceLocation;

    void error(ParseErrorCode code, std::string message, SourceLocation location);
    void push(borrow::Operation op, SourceLocation location);
};

/// Parses trace text held in memory.
[[nodiscard]] auto parse_trace(std::string_view text, std::string name = "<input>")
    -> Result<borrow::Program, std::vector<ParseError>>;

/// Reads and parses a trace file. An unreadable file is reported as a single
/// `IoError`.
[[nodiscard]] auto load_trace(const std::string& path)
    -> Result<borrow::Program, std::vector<ParseError>>;

/// True if `text` is a valid pointer or allocation name.
[[nodiscard]] auto is_identifier(std::string_view text) -> bool;

} // namespace sbc::trace

#endif // SBC_TRACE_PARSER_HPP
