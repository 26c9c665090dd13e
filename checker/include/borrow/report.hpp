//! # Diagnostic Reporter
//!
//! Turns the final state of an interpreter into a verdict.
//!
//! ```text
//! Interpreter ──► report() ──► Sound
//!                          └─► Violation { instruction_index, allocation_name, rule,
//!                                          message, notes, stack }
//! ```
//!
//! The reporter is pure: it reads the interpreter and never changes it, so
//! calling it twice yields the same verdict.
//!
//! `check_program` bundles the usual pipeline (verify, run, report) for
//! embedders and the CLI.

#ifndef SBC_BORROW_REPORT_HPP
#define SBC_BORROW_REPORT_HPP

#include "borrow/interpreter.hpp"
#include "borrow/memory.hpp"
#include "borrow/permission.hpp"
#include "borrow/program.hpp"
#include "common.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sbc::borrow {

/// No violation was observed.
struct Sound {};

/// The first aliasing violation of a run.
struct Violation {
    size_t instruction_index = 0;
    std::string allocation_name;
    Rule rule = Rule::TagNotFound;

    /// Primary message from the permission engine.
    std::string message;

    /// The faulting instruction in trace syntax.
    std::string instruction;

    SourceLocation location;

    /// Where the offending tag came from and what ended it.
    std::vector<std::string> notes;

    /// Borrow stack of the allocation at the moment of the fault, bottom first.
    std::vector<Frame> stack;
};

using Verdict = std::variant<Sound, Violation>;

[[nodiscard]] inline auto is_sound(const Verdict& verdict) -> bool {
    return std::holds_alternative<Sound>(verdict);
}

/// Builds the verdict for the interpreter's current state.
///
/// An interpreter that has not faulted (halted or not) is `Sound` so far.
[[nodiscard]] auto report(const Interpreter& interp) -> Verdict;

/// Everything a caller learns from a checked program.
struct Outcome {
    Verdict verdict;
    std::vector<ReadEvent> reads;

    /// Value of every allocation when the run stopped, in declaration order.
    std::vector<std::pair<std::string, Scalar>> final_values;

    /// Instructions that completed. Excludes the faulting one.
    size_t executed = 0;

    uint64_t tags_issued = 0;
};

/// Verifies, runs and reports a program in one call.
///
/// Returns the verification errors if the program is malformed; aliasing
/// violations are part of a successful `Outcome`.
[[nodiscard]] auto check_program(const Program& program, const CheckOptions& options = {})
    -> Result<Outcome, std::vector<TraceError>>;

/// True if the verdict satisfies an `expect` line.
///
/// A violation expectation without a rule accepts any rule; without an
/// instruction index it accepts any index.
[[nodiscard]] auto matches_expectation(const Expectation& expectation, const Verdict& verdict)
    -> bool;

/// Renders an expectation in trace syntax, e.g. `violation Disabled at 4`.
[[nodiscard]] auto describe(const Expectation& expectation) -> std::string;

/// Renders a verdict in the same syntax as `describe(Expectation)`.
[[nodiscard]] auto describe(const Verdict& verdict) -> std::string;

} // namespace sbc::borrow

#endif // SBC_BORROW_REPORT_HPP
