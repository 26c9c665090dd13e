//! # Interpreter Property Tests
//!
//! Properties that hold for every trace rather than for one scenario:
//! the first fault wins, tags are never shared between frames, cells never
//! report read-only writes, and fresh runs agree on the whole verdict.

#include "borrow/report.hpp"
#include "trace/parser.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <map>
#include <random>
#include <set>

using namespace sbc;
using namespace sbc::borrow;
using namespace sbc::trace;
namespace fs = std::filesystem;

namespace {

auto example_programs() -> std::vector<Program> {
    std::vector<Program> programs;
    for (const auto& entry : fs::directory_iterator(SBC_EXAMPLES_DIR)) {
        if (entry.path().extension() != ".trace") {
            continue;
        }
        auto program = load_trace(entry.path().string());
        EXPECT_TRUE(is_ok(program)) << entry.path();
        if (is_ok(program)) {
            programs.push_back(unwrap(program));
        }
    }
    return programs;
}

auto checked(const Program& program) -> Outcome {
    auto outcome = check_program(program);
    EXPECT_TRUE(is_ok(outcome)) << program.name;
    return is_ok(outcome) ? unwrap(outcome) : Outcome{};
}

/// Random program over one cell, built only from names bound earlier.
auto random_cell_program(uint32_t seed, size_t length) -> Program {
    std::mt19937 rng(seed);
    ProgramBuilder builder("cell-" + std::to_string(seed));
    builder.declare("c", 0, Mutability::InteriorMutable);

    std::vector<std::string> names = {"c"};
    auto pick = [&]() -> const std::string& { return names[rng() % names.size()]; };

    for (size_t i = 0; i < length; ++i) {
        std::string fresh = "p" + std::to_string(i);
        switch (rng() % 6) {
        case 0:
            builder.borrow(fresh, "c", rng() % 2 ? BorrowKind::Shared : BorrowKind::Unique);
            names.push_back(fresh);
            break;
        case 1:
            builder.reborrow(fresh, pick(), rng() % 2 ? BorrowKind::Shared : BorrowKind::Unique);
            names.push_back(fresh);
            break;
        case 2:
            builder.read(pick());
            break;
        case 3:
            builder.external_call(pick());
            break;
        default:
            builder.write(pick(), static_cast<Scalar>(i));
            break;
        }
    }
    return builder.build();
}

/// Steps `interp` to the end and checks that no tag is ever carried by two
/// different frames, live at once or one after the other.
void expect_unique_tags(Interpreter& interp) {
    struct Seen {
        AllocationId allocation = 0;
        size_t created_at = 0;
    };
    std::map<uint64_t, Seen> seen;

    while (!interp.is_halted()) {
        auto status = interp.step();
        ASSERT_TRUE(is_ok(status));

        std::set<uint64_t> live;
        const auto& allocations = interp.store().allocations();
        for (AllocationId id = 0; id < allocations.size(); ++id) {
            for (const auto& frame : allocations[id].stack) {
                EXPECT_TRUE(live.insert(frame.tag.value).second) << frame.tag;
                EXPECT_LE(frame.tag.value, interp.tags_issued());

                auto [it, inserted] = seen.emplace(frame.tag.value, Seen{id, frame.created_at});
                if (!inserted) {
                    EXPECT_EQ(it->second.allocation, id) << frame.tag;
                    EXPECT_EQ(it->second.created_at, frame.created_at) << frame.tag;
                }
            }
        }
    }
}

} // namespace

// ============================================================================
// First Fault
// ============================================================================

TEST(InterpreterPropertyTest, LaterFaultIsNeverReached) {
    auto untagged_write = [](bool with_call) {
        ProgramBuilder builder;
        builder.declare("x", 2)
            .borrow("r", "x", BorrowKind::Shared)
            .reborrow("p", "r", BorrowKind::Unique);
        if (with_call) {
            builder.external_call("p");
        }
        return builder.cast_to_integer("i", "r").write("i", 5).build();
    };

    // On its own, the tail faults with a different rule.
    auto tail_only = checked(untagged_write(false));
    const auto* tail = std::get_if<Violation>(&tail_only.verdict);
    ASSERT_NE(tail, nullptr);
    EXPECT_EQ(tail->rule, Rule::UntaggedAccess);
    EXPECT_EQ(tail->instruction_index, 4u);

    Interpreter interp(untagged_write(true));
    ASSERT_TRUE(is_ok(interp.run()));
    ASSERT_EQ(interp.status(), RunStatus::HaltedUB);
    ASSERT_TRUE(interp.fault().has_value());
    EXPECT_EQ(interp.fault()->instruction_index, 3u);
    EXPECT_EQ(interp.fault()->error.rule, Rule::ReadOnlyViolation);
    EXPECT_EQ(interp.program_counter(), 3u);
    EXPECT_FALSE(interp.lookup("i").has_value());

    // Stepping a halted run evaluates nothing.
    ASSERT_TRUE(is_ok(interp.step()));
    EXPECT_EQ(interp.program_counter(), 3u);
    EXPECT_FALSE(interp.lookup("i").has_value());

    auto verdict = report(interp);
    const auto* violation = std::get_if<Violation>(&verdict);
    ASSERT_NE(violation, nullptr);
    EXPECT_EQ(violation->rule, Rule::ReadOnlyViolation);
    EXPECT_EQ(violation->instruction_index, 3u);
    EXPECT_EQ(violation->allocation_name, "x");
}

TEST(InterpreterPropertyTest, NothingAfterTheFaultIsObserved) {
    auto outcome = checked(ProgramBuilder()
                               .declare("x", 2)
                               .borrow("p", "x", BorrowKind::Unique)
                               .write("x", 3)
                               .read("p")
                               .write("x", 9)
                               .read("x")
                               .build());
    const auto* violation = std::get_if<Violation>(&outcome.verdict);
    ASSERT_NE(violation, nullptr);
    EXPECT_EQ(violation->instruction_index, 3u);
    EXPECT_EQ(outcome.executed, 3u);
    EXPECT_TRUE(outcome.reads.empty());
    EXPECT_EQ(outcome.final_values[0].second, 3);
}

// ============================================================================
// Tag Uniqueness
// ============================================================================

TEST(InterpreterPropertyTest, NoTwoFramesShareATag) {
    auto program = ProgramBuilder()
                       .declare("a", 1)
                       .declare("b", 2)
                       .declare("c", 3, Mutability::InteriorMutable)
                       .borrow("pa", "a", BorrowKind::Unique)
                       .borrow("sb", "b", BorrowKind::Shared)
                       .borrow("sc", "c", BorrowKind::Shared)
                       .reborrow("qa", "pa", BorrowKind::Shared)
                       .reborrow("uc", "sc", BorrowKind::Unique)
                       .write("a", 4)
                       .borrow("pa2", "a", BorrowKind::Unique)
                       .read("sb")
                       .write("c", 5)
                       .reborrow("ub", "b", BorrowKind::Unique)
                       .write("ub", 6)
                       .read("c")
                       .build();
    Interpreter interp(program);
    expect_unique_tags(interp);
    EXPECT_EQ(interp.status(), RunStatus::HaltedOk);
}

TEST(InterpreterPropertyTest, ExampleTracesNeverShareATag) {
    for (const auto& program : example_programs()) {
        SCOPED_TRACE(program.name);
        Interpreter interp(program);
        expect_unique_tags(interp);
    }
}

TEST(InterpreterPropertyTest, RandomCellTracesNeverShareATag) {
    for (uint32_t seed = 1; seed <= 50; ++seed) {
        SCOPED_TRACE(seed);
        Interpreter interp(random_cell_program(seed, 40));
        expect_unique_tags(interp);
    }
}

// ============================================================================
// Interior Mutability
// ============================================================================

TEST(InterpreterPropertyTest, CellWritesThroughSharedFramesStaySound) {
    ProgramBuilder builder;
    builder.declare("c", 0, Mutability::InteriorMutable)
        .borrow("s", "c", BorrowKind::Shared)
        .reborrow("t", "s", BorrowKind::Shared)
        .reborrow("u", "t", BorrowKind::Shared)
        .borrow("v", "c", BorrowKind::Shared);
    const std::vector<std::string> writers = {"c", "s", "t", "u", "v"};
    for (Scalar i = 0; i < 40; ++i) {
        const auto& target = writers[static_cast<size_t>(i) % writers.size()];
        if (i % 3 == 0) {
            builder.external_call(target, i);
        } else {
            builder.write(target, i);
        }
        builder.read(writers[static_cast<size_t>(i + 2) % writers.size()]);
    }

    auto outcome = checked(builder.build());
    EXPECT_TRUE(is_sound(outcome.verdict)) << describe(outcome.verdict);
    EXPECT_EQ(outcome.final_values[0].second, 39);
}

TEST(InterpreterPropertyTest, CellNeverReportsReadOnlyViolation) {
    for (uint32_t seed = 1; seed <= 200; ++seed) {
        SCOPED_TRACE(seed);
        Interpreter interp(random_cell_program(seed, 30));
        while (!interp.is_halted()) {
            ASSERT_TRUE(is_ok(interp.step()));
            for (const auto& frame : unwrap(interp.store().get(0))->stack) {
                EXPECT_NE(frame.permission, Permission::SharedReadOnly) << frame.tag;
            }
        }
        if (interp.fault()) {
            EXPECT_NE(interp.fault()->error.rule, Rule::ReadOnlyViolation);
        }
    }
}

// ============================================================================
// Determinism
// ============================================================================

TEST(InterpreterPropertyTest, FreshRunsAgreeOnEveryExample) {
    auto programs = example_programs();
    EXPECT_GE(programs.size(), 7u);

    for (const auto& program : programs) {
        SCOPED_TRACE(program.name);
        auto first = checked(program);
        for (int run = 0; run < 3; ++run) {
            auto again = checked(program);
            EXPECT_EQ(describe(again.verdict), describe(first.verdict));
            EXPECT_EQ(again.executed, first.executed);
            EXPECT_EQ(again.tags_issued, first.tags_issued);
            EXPECT_EQ(again.final_values, first.final_values);
            ASSERT_EQ(again.reads.size(), first.reads.size());
            for (size_t i = 0; i < first.reads.size(); ++i) {
                EXPECT_EQ(again.reads[i].instruction_index, first.reads[i].instruction_index);
                EXPECT_EQ(again.reads[i].value, first.reads[i].value);
            }

            const auto* expected = std::get_if<Violation>(&first.verdict);
            const auto* actual = std::get_if<Violation>(&again.verdict);
            ASSERT_EQ(actual == nullptr, expected == nullptr);
            if (!expected) {
                continue;
            }
            EXPECT_EQ(actual->rule, expected->rule);
            EXPECT_EQ(actual->instruction_index, expected->instruction_index);
            EXPECT_EQ(actual->allocation_name, expected->allocation_name);
            EXPECT_EQ(actual->message, expected->message);
            EXPECT_EQ(actual->notes, expected->notes);
            ASSERT_EQ(actual->stack.size(), expected->stack.size());
            for (size_t i = 0; i < expected->stack.size(); ++i) {
                EXPECT_EQ(actual->stack[i].tag, expected->stack[i].tag);
                EXPECT_EQ(actual->stack[i].permission, expected->stack[i].permission);
            }
        }
    }
}
