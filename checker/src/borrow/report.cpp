//! # Diagnostic Reporter Implementation
//!
//! Notes are built from the interpreter's tag history. When history
//! recording is off the verdict carries no notes but is otherwise identical.

#include "borrow/report.hpp"

#include "log/log.hpp"

#include <sstream>

namespace sbc::borrow {

namespace {

/// "`q = reborrow unique p` (instruction 2)"
auto at_instruction(const Program& program, size_t index) -> std::string {
    std::ostringstream out;
    if (index < program.instructions.size()) {
        out << "`" << describe(program.instructions[index].op) << "` ";
    }
    out << "(instruction " << index << ")";
    return out.str();
}

void note_created(const Interpreter& interp, const Allocation& alloc, BorrowTag tag,
                  std::vector<std::string>& notes) {
    const TagHistory* hist = interp.history(tag);
    if (!hist) {
        return;
    }
    std::string text = tag.to_string() + " was created by " +
                       at_instruction(interp.program(), hist->created_at);
    if (auto depth = alloc.find_frame(tag)) {
        text += std::string(" with ") + permission_name(alloc.stack[*depth].permission) +
                " permission";
    }
    notes.push_back(std::move(text));
}

void note_invalidated(const Interpreter& interp, BorrowTag tag, std::vector<std::string>& notes) {
    const TagHistory* hist = interp.history(tag);
    if (!hist) {
        return;
    }
    if (hist->popped_at) {
        notes.push_back(tag.to_string() + " was popped from the borrow stack by " +
                        at_instruction(interp.program(), *hist->popped_at));
    }
    if (hist->disabled_at) {
        notes.push_back(tag.to_string() + " was disabled by " +
                        at_instruction(interp.program(), *hist->disabled_at));
    }
}

/// Follows reborrows of an untagged pointer back to the cast that erased
/// its tag.
void note_untagged_origin(const Interpreter& interp, std::string name,
                          std::vector<std::string>& notes) {
    const Program& program = interp.program();
    for (size_t hops = 0; hops <= program.instructions.size(); ++hops) {
        auto index = interp.bound_at(name);
        if (!index || *index >= program.instructions.size()) {
            return;
        }
        const Operation& op = program.instructions[*index].op;
        if (std::holds_alternative<CastToIntegerOp>(op)) {
            notes.push_back("`" + name + "` was rebuilt from an integer by " +
                            at_instruction(program, *index) + " and carries no tag");
            return;
        }
        if (const auto* reborrow = std::get_if<ReborrowOp>(&op)) {
            name = reborrow->source;
            continue;
        }
        return;
    }
}

auto build_notes(const Interpreter& interp, const Fault& fault, const Allocation& alloc)
    -> std::vector<std::string> {
    std::vector<std::string> notes;
    const AccessError& error = fault.error;

    switch (error.rule) {
    case Rule::UntaggedAccess: {
        const Program& program = interp.program();
        if (fault.instruction_index < program.instructions.size()) {
            std::string_view operand = operand_of(program.instructions[fault.instruction_index].op);
            note_untagged_origin(interp, std::string(operand), notes);
        }
        break;
    }
    case Rule::TagNotFound:
    case Rule::Disabled:
        if (error.tag) {
            note_created(interp, alloc, *error.tag, notes);
            note_invalidated(interp, *error.tag, notes);
        }
        if (error.conflicting) {
            note_created(interp, alloc, *error.conflicting, notes);
            if (error.tag) {
                notes.push_back(error.conflicting->to_string() + " is not derived from " +
                                error.tag->to_string() +
                                ", so both claimed unique access at the same time");
            }
        }
        break;
    case Rule::ReadOnlyViolation:
        if (error.tag) {
            note_created(interp, alloc, *error.tag, notes);
        }
        if (alloc.mutability != Mutability::InteriorMutable) {
            notes.push_back("`" + alloc.name +
                            "` is not interior-mutable, so shared borrows of it never write");
        }
        break;
    }
    return notes;
}

auto rule_text(const std::optional<Rule>& rule) -> std::string {
    return rule ? std::string(" ") + rule_name(*rule) : std::string();
}

} // namespace

// ============================================================================
// Report
// ============================================================================

auto report(const Interpreter& interp) -> Verdict {
    const auto& fault = interp.fault();
    if (!fault) {
        return Sound{};
    }

    Violation violation;
    violation.instruction_index = fault->instruction_index;
    violation.rule = fault->error.rule;
    violation.message = fault->error.message;

    const Program& program = interp.program();
    if (fault->instruction_index < program.instructions.size()) {
        const Instruction& instr = program.instructions[fault->instruction_index];
        violation.instruction = describe(instr.op);
        violation.location = instr.location;
    }

    auto alloc = interp.store().get(fault->allocation);
    if (is_ok(alloc)) {
        const Allocation& a = *unwrap(alloc);
        violation.allocation_name = a.name;
        violation.stack = a.stack;
        violation.notes = build_notes(interp, *fault, a);
    }
    return violation;
}

auto check_program(const Program& program, const CheckOptions& options)
    -> Result<Outcome, std::vector<TraceError>> {
    auto verified = verify_program(program);
    if (is_err(verified)) {
        return std::move(unwrap_err(verified));
    }

    Interpreter interp(program, options);
    auto status = interp.run();
    if (is_err(status)) {
        return std::vector<TraceError>{unwrap_err(status)};
    }

    Outcome outcome;
    outcome.verdict = report(interp);
    outcome.reads = interp.reads();
    outcome.executed = interp.program_counter();
    outcome.tags_issued = interp.tags_issued();
    for (const auto& alloc : interp.store().allocations()) {
        outcome.final_values.emplace_back(alloc.name, alloc.value);
    }

    SBC_LOG_INFO("borrow", "`" << program.name << "`: " << describe(outcome.verdict) << " after "
                               << outcome.executed << " instruction(s)");
    return outcome;
}

// ============================================================================
// Expectations
// ============================================================================

auto matches_expectation(const Expectation& expectation, const Verdict& verdict) -> bool {
    const auto* violation = std::get_if<Violation>(&verdict);
    if (expectation.kind == Expectation::Kind::Sound) {
        return violation == nullptr;
    }
    if (!violation) {
        return false;
    }
    if (expectation.rule && *expectation.rule != violation->rule) {
        return false;
    }
    if (expectation.instruction_index &&
        *expectation.instruction_index != violation->instruction_index) {
        return false;
    }
    return true;
}

auto describe(const Expectation& expectation) -> std::string {
    if (expectation.kind == Expectation::Kind::Sound) {
        return "sound";
    }
    std::string text = "violation" + rule_text(expectation.rule);
    if (expectation.instruction_index) {
        text += " at " + std::to_string(*expectation.instruction_index);
    }
    return text;
}

auto describe(const Verdict& verdict) -> std::string {
    const auto* violation = std::get_if<Violation>(&verdict);
    if (!violation) {
        return "sound";
    }
    return "violation " + std::string(rule_name(violation->rule)) + " at " +
           std::to_string(violation->instruction_index);
}

} // namespace sbc::borrow
