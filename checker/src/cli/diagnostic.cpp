#include "cli/diagnostic.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace sbc::cli {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors(const std::ostream& out) {
    FILE* stream = nullptr;
    if (&out == &std::cerr || &out == &std::clog)
        stream = stderr;
    else if (&out == &std::cout)
        stream = stdout;
    if (!stream || !isatty(fileno(stream)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = ToolOptions::color && terminal_supports_colors(out);
}

void DiagnosticEmitter::set_source_content(const std::string& path, const std::string& content) {
    source_files_[path] = content;
}

std::string DiagnosticEmitter::get_source_line(const std::string& path, uint32_t line) const {
    auto it = source_files_.find(path);
    if (it == source_files_.end() || line == 0)
        return "";

    const std::string& content = it->second;
    uint32_t current_line = 1;
    size_t line_start = 0;

    while (current_line < line) {
        size_t newline = content.find('\n', line_start);
        if (newline == std::string::npos)
            return "";
        line_start = newline + 1;
        current_line++;
    }

    size_t line_end = content.find('\n', line_start);
    if (line_end == std::string::npos)
        line_end = content.size();
    if (line_end > line_start && content[line_end - 1] == '\r')
        line_end--;
    return content.substr(line_start, line_end - line_start);
}

void DiagnosticEmitter::emit_header(const Diagnostic& diag) {
    // Format: error[SB004]: message
    out_ << color(Colors::Bold) << color(Colors::BrightRed) << "error";

    if (!diag.code.empty()) {
        out_ << "[" << diag.code << "]";
    }

    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << diag.message
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_source_snippet(const Diagnostic& diag) {
    if (diag.file.empty()) {
        return;
    }

    // Location line: --> file:line:column
    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << diag.file;
    if (diag.location.is_known()) {
        out_ << ":" << diag.location.line << ":" << diag.location.column;
    }
    out_ << "\n";

    std::string source_line = get_source_line(diag.file, diag.location.line);
    if (source_line.empty()) {
        return;
    }

    int line_width = static_cast<int>(std::to_string(diag.location.line).length());
    line_width = std::max(line_width, 4);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
    out_ << color(Colors::BrightBlue) << std::setw(line_width) << diag.location.line << " | "
         << color(Colors::Reset) << source_line << "\n";

    // Underline from the reported column to the end of the statement,
    // leaving out a trailing comment.
    size_t start_col = diag.location.column > 0 ? diag.location.column - 1 : 0;
    size_t end_col = std::min(source_line.find('#'), source_line.size());
    while (end_col > start_col && (source_line[end_col - 1] == ' ' ||
                                   source_line[end_col - 1] == '\t')) {
        end_col--;
    }
    end_col = std::max(end_col, start_col + 1);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
         << color(Colors::Reset) << std::string(start_col, ' ') << color(Colors::BrightRed)
         << std::string(end_col - start_col, '^');
    if (!diag.label.empty()) {
        out_ << " " << diag.label;
    }
    out_ << color(Colors::Reset) << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
}

void DiagnosticEmitter::emit_notes(const std::vector<std::string>& notes) {
    for (const auto& note : notes) {
        out_ << color(Colors::BrightCyan) << "  = note" << color(Colors::Reset) << ": " << note
             << "\n";
    }
}

void DiagnosticEmitter::emit_help(const std::vector<std::string>& help) {
    for (const auto& h : help) {
        out_ << color(Colors::BrightGreen) << "  = help" << color(Colors::Reset) << ": " << h
             << "\n";
    }
}

void DiagnosticEmitter::emit_stack(const std::vector<std::string>& stack) {
    if (stack.empty()) {
        return;
    }
    out_ << color(Colors::BrightCyan) << "  = stack" << color(Colors::Reset)
         << " (top first):\n";
    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        out_ << "      " << *it << "\n";
    }
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    if (ToolOptions::diagnostic_format == DiagnosticFormat::JSON) {
        emit_json(diag);
        return;
    }

    emit_header(diag);
    emit_source_snippet(diag);
    emit_notes(diag.notes);
    emit_help(diag.help);
    emit_stack(diag.stack);
}

void DiagnosticEmitter::error(const std::string& code, const std::string& message,
                              const std::string& file, SourceLocation location,
                              const std::vector<std::string>& notes) {
    Diagnostic diag;
    diag.code = code;
    diag.message = message;
    diag.file = file;
    diag.location = location;
    diag.notes = notes;
    emit(diag);
}

std::string DiagnosticEmitter::escape_json_string(const std::string& s) {
    std::ostringstream result;
    for (char c : s) {
        switch (c) {
        case '"':
            result << "\\\"";
            break;
        case '\\':
            result << "\\\\";
            break;
        case '\b':
            result << "\\b";
            break;
        case '\f':
            result << "\\f";
            break;
        case '\n':
            result << "\\n";
            break;
        case '\r':
            result << "\\r";
            break;
        case '\t':
            result << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                // Control character - emit as \uXXXX
                result << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                result << c;
            }
            break;
        }
    }
    return result.str();
}

static void emit_json_array(std::ostream& out, const char* key,
                            const std::vector<std::string>& items) {
    out << "\"" << key << "\":[";
    bool first = true;
    for (const auto& item : items) {
        if (!first)
            out << ",";
        first = false;
        out << "\"" << DiagnosticEmitter::escape_json_string(item) << "\"";
    }
    out << "]";
}

void DiagnosticEmitter::emit_json(const Diagnostic& diag) {
    out_ << "{";
    out_ << "\"severity\":\"error\",";
    out_ << "\"code\":\"" << escape_json_string(diag.code) << "\",";
    out_ << "\"message\":\"" << escape_json_string(diag.message) << "\",";

    out_ << "\"span\":{";
    out_ << "\"file\":\"" << escape_json_string(diag.file) << "\",";
    out_ << "\"line\":" << diag.location.line << ",\"column\":" << diag.location.column;
    out_ << "},";

    out_ << "\"label\":\"" << escape_json_string(diag.label) << "\",";
    emit_json_array(out_, "notes", diag.notes);
    out_ << ",";
    emit_json_array(out_, "help", diag.help);
    out_ << ",";
    emit_json_array(out_, "stack", diag.stack);
    out_ << "}\n";
}

// ============================================================================
// Conversions
// ============================================================================

std::vector<std::string> format_stack(const std::vector<borrow::Frame>& stack) {
    std::vector<std::string> lines;
    for (const auto& frame : stack) {
        std::ostringstream line;
        line << frame.tag << " " << borrow::permission_name(frame.permission);
        if (frame.parent) {
            line << " (from " << *frame.parent << ", instruction " << frame.created_at << ")";
        } else {
            line << " (root, instruction " << frame.created_at << ")";
        }
        lines.push_back(line.str());
    }
    return lines;
}

Diagnostic make_diagnostic(const borrow::Violation& violation, const std::string& file) {
    Diagnostic diag;
    diag.code = borrow::rule_code(violation.rule);
    diag.message = violation.message;
    diag.file = file;
    diag.location = violation.location;
    diag.label = std::string(borrow::rule_name(violation.rule)) + " at instruction " +
                 std::to_string(violation.instruction_index);
    diag.notes = violation.notes;
    if (!violation.location.is_known() && !violation.instruction.empty()) {
        diag.notes.insert(diag.notes.begin(), "in `" + violation.instruction + "` (instruction " +
                                                  std::to_string(violation.instruction_index) +
                                                  ")");
    }
    diag.help.push_back(std::string("run `sbcheck explain ") + borrow::rule_code(violation.rule) +
                        "` for more information");
    if (ToolOptions::dump_stack) {
        diag.stack = format_stack(violation.stack);
    }
    return diag;
}

Diagnostic make_diagnostic(const borrow::TraceError& error, const std::string& file) {
    Diagnostic diag;
    diag.code = borrow::trace_error_code(error.code);
    diag.message = error.message;
    diag.file = file;
    diag.location = error.location;
    diag.label = "instruction " + std::to_string(error.instruction_index);
    return diag;
}

Diagnostic make_diagnostic(const trace::ParseError& error) {
    Diagnostic diag;
    diag.code = trace::parse_error_code(error.code);
    diag.message = error.message;
    diag.file = error.file;
    diag.location = error.location;
    return diag;
}

// ============================================================================
// "Did You Mean?" Suggestions
// ============================================================================

size_t levenshtein_distance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);
    for (size_t j = 0; j <= n; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr_row[0] = i;
        for (size_t j = 1; j <= n; ++j) {
            char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(s1[i - 1])));
            char c2 = static_cast<char>(std::tolower(static_cast<unsigned char>(s2[j - 1])));
            size_t cost = (c1 == c2) ? 0 : 1;

            curr_row[j] = std::min({prev_row[j] + 1,          // deletion
                                    curr_row[j - 1] + 1,      // insertion
                                    prev_row[j - 1] + cost}); // substitution
        }
        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

std::vector<std::string> find_similar_candidates(const std::string& input,
                                                 const std::vector<std::string>& candidates,
                                                 size_t max_results, size_t max_distance) {
    if (input.empty() || candidates.empty()) {
        return {};
    }

    std::vector<std::pair<std::string, size_t>> scored;
    for (const auto& candidate : candidates) {
        size_t len_diff = input.length() > candidate.length() ? input.length() - candidate.length()
                                                              : candidate.length() - input.length();
        if (len_diff > max_distance) {
            continue;
        }

        size_t dist = levenshtein_distance(input, candidate);
        if (dist <= max_distance) {
            scored.emplace_back(candidate, dist);
        }
    }

    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        return a.second != b.second ? a.second < b.second : a.first < b.first;
    });

    std::vector<std::string> result;
    for (size_t i = 0; i < max_results && i < scored.size(); ++i) {
        result.push_back(scored[i].first);
    }
    return result;
}

} // namespace sbc::cli
