//! # Check Command
//!
//! ```text
//! check_file(path)
//!   ├─ Source::from_file     ── fails ──► E001            exit 2
//!   ├─ TraceParser::parse    ── fails ──► P001..P005      exit 2
//!   ├─ check_program         ── fails ──► V001..V003      exit 2
//!   └─ verdict
//!        ├─ has `expect`     ── match ──► summary         exit 0
//!        │                   └─ no ─────► E002 (+ SBxxx)  exit 1
//!        ├─ Sound            ───────────► summary         exit 0
//!        └─ Violation        ───────────► SBxxx           exit 1
//! ```

#include "cli/commands/cmd_check.hpp"

#include "borrow/report.hpp"
#include "log/log.hpp"
#include "trace/parser.hpp"
#include "trace/source.hpp"

#include <algorithm>
#include <ostream>

namespace sbc::cli {

namespace {

struct FileSummary {
    std::string file;
    const borrow::Outcome* outcome = nullptr;
    const borrow::Expectation* expectation = nullptr;
    bool matched = false;
};

void print_summary_json(std::ostream& out, const FileSummary& summary) {
    const auto& verdict = summary.outcome->verdict;
    const auto* violation = std::get_if<borrow::Violation>(&verdict);

    out << "{\"file\":\"" << DiagnosticEmitter::escape_json_string(summary.file) << "\",";
    out << "\"verdict\":\"" << (violation ? "violation" : "sound") << "\",";
    if (violation) {
        out << "\"rule\":\"" << borrow::rule_name(violation->rule) << "\",";
        out << "\"code\":\"" << borrow::rule_code(violation->rule) << "\",";
        out << "\"instruction\":" << violation->instruction_index << ",";
        out << "\"allocation\":\""
            << DiagnosticEmitter::escape_json_string(violation->allocation_name) << "\",";
    }
    if (summary.expectation) {
        out << "\"expected\":\"" << borrow::describe(*summary.expectation) << "\",";
        out << "\"matched\":" << (summary.matched ? "true" : "false") << ",";
    }
    out << "\"executed\":" << summary.outcome->executed << ",";

    out << "\"reads\":[";
    bool first = true;
    for (const auto& read : summary.outcome->reads) {
        if (!first)
            out << ",";
        first = false;
        out << "{\"instruction\":" << read.instruction_index << ",\"pointer\":\""
            << DiagnosticEmitter::escape_json_string(read.pointer) << "\",\"value\":" << read.value
            << "}";
    }
    out << "],";

    out << "\"final_values\":{";
    first = true;
    for (const auto& [name, value] : summary.outcome->final_values) {
        if (!first)
            out << ",";
        first = false;
        out << "\"" << DiagnosticEmitter::escape_json_string(name) << "\":" << value;
    }
    out << "}}\n";
}

void print_summary_text(std::ostream& out, const FileSummary& summary) {
    out << summary.file << ": ";
    if (summary.expectation) {
        out << (summary.matched ? "ok" : "FAILED") << " (expected "
            << borrow::describe(*summary.expectation) << ", found "
            << borrow::describe(summary.outcome->verdict) << ")";
    } else {
        out << borrow::describe(summary.outcome->verdict);
    }
    out << ", " << summary.outcome->executed << " instruction(s) executed\n";

    if (!ToolOptions::verbose) {
        return;
    }
    for (const auto& read : summary.outcome->reads) {
        out << "    read " << read.pointer << " = " << read.value << " (instruction "
            << read.instruction_index << ")\n";
    }
    for (const auto& [name, value] : summary.outcome->final_values) {
        out << "    final " << name << " = " << value << "\n";
    }
}

void print_summary(std::ostream& out, const FileSummary& summary) {
    if (ToolOptions::diagnostic_format == DiagnosticFormat::JSON) {
        print_summary_json(out, summary);
    } else {
        print_summary_text(out, summary);
    }
}

} // namespace

int check_file(const std::string& path, const borrow::CheckOptions& options,
               DiagnosticEmitter& emitter, std::ostream& out) {
    SBC_LOG_INFO("cli", "checking " << path);

    auto loaded = trace::Source::from_file(path);
    if (is_err(loaded)) {
        emitter.error(trace::parse_error_code(trace::ParseErrorCode::IoError),
                      unwrap_err(loaded), path, {});
        return CHECK_ERROR;
    }
    const trace::Source& source = unwrap(loaded);
    emitter.set_source_content(path, std::string(source.content()));

    auto parsed = trace::TraceParser(source).parse();
    if (is_err(parsed)) {
        for (const auto& error : unwrap_err(parsed)) {
            emitter.emit(make_diagnostic(error));
        }
        return CHECK_ERROR;
    }
    const borrow::Program& program = unwrap(parsed);

    auto checked = borrow::check_program(program, options);
    if (is_err(checked)) {
        for (const auto& error : unwrap_err(checked)) {
            emitter.emit(make_diagnostic(error, path));
        }
        return CHECK_ERROR;
    }
    const borrow::Outcome& outcome = unwrap(checked);
    const auto* violation = std::get_if<borrow::Violation>(&outcome.verdict);

    FileSummary summary{path, &outcome, nullptr, false};
    int result = violation ? CHECK_VIOLATION : CHECK_OK;

    if (program.expectation) {
        summary.expectation = &*program.expectation;
        summary.matched = borrow::matches_expectation(*program.expectation, outcome.verdict);
        if (summary.matched) {
            result = CHECK_OK;
        } else {
            if (violation) {
                emitter.emit(make_diagnostic(*violation, path));
            }
            emitter.error("E002",
                          "expected " + borrow::describe(*program.expectation) + ", found " +
                              borrow::describe(outcome.verdict),
                          path, program.expectation->location);
            result = CHECK_VIOLATION;
        }
    } else if (violation) {
        emitter.emit(make_diagnostic(*violation, path));
    }

    print_summary(out, summary);
    return result;
}

int run_check(const std::vector<std::string>& files, const borrow::CheckOptions& options,
              std::ostream& out, std::ostream& diag_out) {
    DiagnosticEmitter emitter(diag_out);

    int worst = CHECK_OK;
    size_t counts[3] = {0, 0, 0};
    for (const auto& file : files) {
        int result = check_file(file, options, emitter, out);
        counts[result]++;
        worst = std::max(worst, result);
    }

    if (files.size() > 1 && ToolOptions::diagnostic_format == DiagnosticFormat::Text) {
        out << "\nchecked " << files.size() << " trace(s): " << counts[CHECK_OK] << " ok, "
            << counts[CHECK_VIOLATION] << " violation(s), " << counts[CHECK_ERROR]
            << " error(s)\n";
    }
    return worst;
}

} // namespace sbc::cli
