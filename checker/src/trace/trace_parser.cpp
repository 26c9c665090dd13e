//! # Trace Parser Implementation
//!
//! Each line is tokenized on its own (whitespace separated, `=` always a
//! token of its own, `#` ends the line) and then parsed by recursive descent
//! over that token list. A bad line records an error and the parser moves on
//! to the next one.

#include "trace/parser.hpp"

#include "log/log.hpp"

#include <array>
#include <cctype>
#include <charconv>

namespace sbc::trace {

using borrow::BorrowKind;
using borrow::Expectation;
using borrow::Mutability;

namespace {

constexpr std::array<std::string_view, 15> KEYWORDS = {
    "declare", "mut",    "cell",   "borrow", "reborrow",  "cast_int", "read", "write",
    "call",    "expect", "shared", "unique", "violation", "sound",    "at",
};

} // namespace

auto parse_error_code(ParseErrorCode code) -> const char* {
    switch (code) {
    case ParseErrorCode::UnexpectedToken:
        return "P001";
    case ParseErrorCode::MissingOperand:
        return "P002";
    case ParseErrorCode::InvalidInteger:
        return "P003";
    case ParseErrorCode::UnknownInstruction:
        return "P004";
    case ParseErrorCode::DuplicateExpect:
        return "P005";
    case ParseErrorCode::IoError:
        return "E001";
    }
    return "P000";
}

auto is_identifier(std::string_view text) -> bool {
    if (text.empty()) {
        return false;
    }
    auto first = static_cast<unsigned char>(text.front());
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_') {
            return false;
        }
    }
    for (auto keyword : KEYWORDS) {
        if (text == keyword) {
            return false;
        }
    }
    return true;
}

TraceParser::TraceParser(const Source& source) : source_(source) {
    program_.name = std::string(source.filename());
}

auto TraceParser::parse() -> Result<borrow::Program, std::vector<ParseError>> {
    for (uint32_t line = 1; line <= source_.line_count(); ++line) {
        tokenize_line(line);
        if (!tokens_.empty()) {
            parse_line();
        }
    }

    if (!errors_.empty()) {
        SBC_LOG_DEBUG("trace", source_.filename() << ": " << errors_.size() << " parse error(s)");
        return errors_;
    }
    SBC_LOG_DEBUG("trace", source_.filename() << ": parsed " << program_.instructions.size()
                                              << " instruction(s)");
    return program_;
}

// ============================================================================
// Tokenizer
// ============================================================================

void TraceParser::tokenize_line(uint32_t line_num) {
    tokens_.clear();
    pos_ = 0;

    std::string_view text = source_.line(line_num);
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        if (c == '#') {
            break;
        }
        auto column = static_cast<uint32_t>(i + 1);
        if (c == '=') {
            tokens_.push_back(Token{text.substr(i, 1), SourceLocation{line_num, column}});
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i])) &&
               text[i] != '=' && text[i] != '#') {
            ++i;
        }
        tokens_.push_back(Token{text.substr(start, i - start), SourceLocation{line_num, column}});
    }
}

auto TraceParser::peek() const -> const Token* {
    return at_end() ? nullptr : &tokens_[pos_];
}

auto TraceParser::advance() -> const Token* {
    return at_end() ? nullptr : &tokens_[pos_++];
}

auto TraceParser::location_after(const Token& token) const -> SourceLocation {
    return SourceLocation{token.location.line,
                          token.location.column + static_cast<uint32_t>(token.text.size())};
}

// ============================================================================
// Statements
// ============================================================================

void TraceParser::parse_line() {
    const Token& first = *advance();

    if (first.text == "declare") {
        parse_declare(first);
    } else if (first.text == "read") {
        parse_read(first);
    } else if (first.text == "write") {
        parse_write(first);
    } else if (first.text == "call") {
        parse_call(first);
    } else if (first.text == "expect") {
        parse_expect(first);
    } else if (const Token* next = peek(); next && next->text == "=") {
        parse_assignment(first);
    } else if (is_identifier(first.text)) {
        error(ParseErrorCode::UnknownInstruction,
              "unknown instruction `" + std::string(first.text) + "`", first.location);
    } else {
        error(ParseErrorCode::UnexpectedToken,
              "expected an instruction, found `" + std::string(first.text) + "`", first.location);
    }
}

void TraceParser::parse_declare(const Token& keyword) {
    auto mutability = Mutability::Immutable;
    const Token* last = &keyword;
    if (const Token* modifier = peek()) {
        if (modifier->text == "mut") {
            mutability = Mutability::Mutable;
            last = advance();
        } else if (modifier->text == "cell") {
            mutability = Mutability::InteriorMutable;
            last = advance();
        }
    }

    auto name = expect_name(*last, "an allocation name");
    if (!name) {
        return;
    }
    if (!expect_keyword(tokens_[pos_ - 1], "=")) {
        return;
    }
    auto value = expect_integer(tokens_[pos_ - 1], "an initial value");
    if (!value || !expect_end()) {
        return;
    }
    push(borrow::DeclareOp{std::move(*name), *value, mutability}, keyword.location);
}

void TraceParser::parse_assignment(const Token& dest) {
    if (!is_identifier(dest.text)) {
        error(ParseErrorCode::UnexpectedToken,
              "`" + std::string(dest.text) + "` is not a valid pointer name", dest.location);
        return;
    }
    const Token& equals = *advance();

    const Token* op = advance();
    if (!op) {
        error(ParseErrorCode::MissingOperand, "expected `borrow`, `reborrow` or `cast_int` after `=`",
              location_after(equals));
        return;
    }

    if (op->text == "borrow" || op->text == "reborrow") {
        const Token* kind_token = advance();
        if (!kind_token) {
            error(ParseErrorCode::MissingOperand,
                  "expected `shared` or `unique` after `" + std::string(op->text) + "`",
                  location_after(*op));
            return;
        }
        BorrowKind kind = BorrowKind::Shared;
        if (kind_token->text == "shared") {
            kind = BorrowKind::Shared;
        } else if (kind_token->text == "unique") {
            kind = BorrowKind::Unique;
        } else {
            error(ParseErrorCode::UnexpectedToken,
                  "expected `shared` or `unique`, found `" + std::string(kind_token->text) + "`",
                  kind_token->location);
            return;
        }

        bool is_borrow = op->text == "borrow";
        auto source = expect_name(*kind_token, is_borrow ? "an allocation name" : "a pointer name");
        if (!source || !expect_end()) {
            return;
        }
        if (is_borrow) {
            push(borrow::BorrowOp{std::string(dest.text), std::move(*source), kind}, dest.location);
        } else {
            push(borrow::ReborrowOp{std::string(dest.text), std::move(*source), kind},
                 dest.location);
        }
        return;
    }

    if (op->text == "cast_int") {
        auto source = expect_name(*op, "a pointer name");
        if (!source || !expect_end()) {
            return;
        }
        push(borrow::CastToIntegerOp{std::string(dest.text), std::move(*source)}, dest.location);
        return;
    }

    error(ParseErrorCode::UnknownInstruction, "unknown instruction `" + std::string(op->text) + "`",
          op->location);
}

void TraceParser::parse_read(const Token& keyword) {
    auto source = expect_name(keyword, "a pointer name");
    if (!source || !expect_end()) {
        return;
    }
    push(borrow::ReadOp{std::move(*source)}, keyword.location);
}

void TraceParser::parse_write(const Token& keyword) {
    auto target = expect_name(keyword, "a pointer name");
    if (!target) {
        return;
    }
    auto value = expect_integer(tokens_[pos_ - 1], "a value to write");
    if (!value || !expect_end()) {
        return;
    }
    push(borrow::WriteOp{std::move(*target), *value}, keyword.location);
}

void TraceParser::parse_call(const Token& keyword) {
    auto target = expect_name(keyword, "a pointer name");
    if (!target) {
        return;
    }
    std::optional<int64_t> value;
    if (const Token* token = advance()) {
        value = parse_integer(*token);
        if (!value) {
            return;
        }
    }
    if (!expect_end()) {
        return;
    }
    push(borrow::ExternalCallOp{std::move(*target), value}, keyword.location);
}

void TraceParser::parse_expect(const Token& keyword) {
    const Token* kind = advance();
    if (!kind) {
        error(ParseErrorCode::MissingOperand, "expected `sound` or `violation` after `expect`",
              location_after(keyword));
        return;
    }

    Expectation expectation;
    expectation.location = keyword.location;

    if (kind->text == "sound") {
        expectation.kind = Expectation::Kind::Sound;
    } else if (kind->text == "violation") {
        expectation.kind = Expectation::Kind::Violation;

        const Token* next = peek();
        if (next && next->text != "at") {
            advance();
            expectation.rule = borrow::parse_rule(next->text);
            if (!expectation.rule) {
                error(ParseErrorCode::UnexpectedToken,
                      "unknown rule `" + std::string(next->text) + "`", next->location);
                return;
            }
            next = peek();
        }
        if (next && next->text == "at") {
            advance();
            auto index = expect_integer(*next, "an instruction index");
            if (!index) {
                return;
            }
            if (*index < 0) {
                error(ParseErrorCode::InvalidInteger, "instruction index cannot be negative",
                      tokens_[pos_ - 1].location);
                return;
            }
            expectation.instruction_index = static_cast<size_t>(*index);
        }
    } else {
        error(ParseErrorCode::UnexpectedToken,
              "expected `sound` or `violation`, found `" + std::string(kind->text) + "`",
              kind->location);
        return;
    }

    if (!expect_end()) {
        return;
    }
    if (program_.expectation) {
        error(ParseErrorCode::DuplicateExpect,
              "duplicate `expect` directive, the first one is on line " +
                  std::to_string(program_.expectation->location.line),
              keyword.location);
        return;
    }
    program_.expectation = expectation;
}

// ============================================================================
// Operands
// ============================================================================

auto TraceParser::expect_name(const Token& after, std::string_view what)
    -> std::optional<std::string> {
    const Token* token = advance();
    if (!token) {
        error(ParseErrorCode::MissingOperand,
              "expected " + std::string(what) + " after `" + std::string(after.text) + "`",
              location_after(after));
        return std::nullopt;
    }
    if (!is_identifier(token->text)) {
        error(ParseErrorCode::UnexpectedToken,
              "expected " + std::string(what) + ", found `" + std::string(token->text) + "`",
              token->location);
        return std::nullopt;
    }
    return std::string(token->text);
}

auto TraceParser::expect_integer(const Token& after, std::string_view what)
    -> std::optional<int64_t> {
    const Token* token = advance();
    if (!token) {
        error(ParseErrorCode::MissingOperand,
              "expected " + std::string(what) + " after `" + std::string(after.text) + "`",
              location_after(after));
        return std::nullopt;
    }
    return parse_integer(*token);
}

auto TraceParser::expect_keyword(const Token& after, std::string_view keyword) -> bool {
    const Token* token = advance();
    if (!token) {
        error(ParseErrorCode::MissingOperand,
              "expected `" + std::string(keyword) + "` after `" + std::string(after.text) + "`",
              location_after(after));
        return false;
    }
    if (token->text != keyword) {
        error(ParseErrorCode::UnexpectedToken,
              "expected `" + std::string(keyword) + "`, found `" + std::string(token->text) + "`",
              token->location);
        return false;
    }
    return true;
}

auto TraceParser::parse_integer(const Token& token) -> std::optional<int64_t> {
    int64_t value = 0;
    const char* begin = token.text.data();
    const char* end = begin + token.text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        error(ParseErrorCode::InvalidInteger,
              "invalid integer literal `" + std::string(token.text) + "`", token.location);
        return std::nullopt;
    }
    return value;
}

auto TraceParser::expect_end() -> bool {
    if (const Token* extra = peek()) {
        error(ParseErrorCode::UnexpectedToken, "unexpected `" + std::string(extra->text) + "`",
              extra->location);
        return false;
    }
    return true;
}

void TraceParser::error(ParseErrorCode code, std::string message, SourceLocation location) {
    errors_.push_back(
        ParseError{code, std::move(message), std::string(source_.filename()), location});
}

void TraceParser::push(borrow::Operation op, SourceLocation location) {
    program_.instructions.push_back(borrow::Instruction{std::move(op), location});
}

// ============================================================================
// Convenience Entry Points
// ============================================================================

auto parse_trace(std::string_view text, std::string name)
    -> Result<borrow::Program, std::vector<ParseError>> {
    Source source = Source::from_string(std::string(text), std::move(name));
    return TraceParser(source).parse();
}

auto load_trace(const std::string& path) -> Result<borrow::Program, std::vector<ParseError>> {
    auto source = Source::from_file(path);
    if (is_err(source)) {
        SBC_LOG_WARN("trace", unwrap_err(source));
        return std::vector<ParseError>{
            ParseError{ParseErrorCode::IoError, unwrap_err(source), path, {}}};
    }
    return TraceParser(unwrap(source)).parse();
}

} // namespace sbc::trace
