//! # Trace Interpreter Tests
//!
//! Runs programs step by step and inspects the store, bindings and fault.

#include "borrow/interpreter.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace sbc;
using namespace sbc::borrow;

namespace {

auto stack_of(const Interpreter& interp, AllocationId id) -> std::vector<Frame> {
    auto alloc = interp.store().get(id);
    return is_ok(alloc) ? unwrap(alloc)->stack : std::vector<Frame>{};
}

auto permissions_of(const Interpreter& interp, AllocationId id) -> std::vector<Permission> {
    std::vector<Permission> out;
    for (const auto& frame : stack_of(interp, id)) {
        out.push_back(frame.permission);
    }
    return out;
}

auto run_to_end(Interpreter& interp) -> RunStatus {
    auto status = interp.run();
    EXPECT_TRUE(is_ok(status));
    return is_ok(status) ? unwrap(status) : RunStatus::Running;
}

} // namespace

// ============================================================================
// Stepping
// ============================================================================

TEST(InterpreterTest, EmptyProgramHaltsOk) {
    Interpreter interp(ProgramBuilder().build());
    EXPECT_EQ(interp.status(), RunStatus::Running);

    auto status = interp.step();
    ASSERT_TRUE(is_ok(status));
    EXPECT_EQ(unwrap(status), RunStatus::HaltedOk);
    EXPECT_EQ(interp.program_counter(), 0u);
}

TEST(InterpreterTest, StepAdvancesOneInstruction) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 2)
                           .borrow("p", "x", BorrowKind::Unique)
                           .build());

    ASSERT_EQ(unwrap(interp.step()), RunStatus::Running);
    EXPECT_EQ(interp.program_counter(), 1u);
    EXPECT_EQ(interp.store().size(), 1u);

    ASSERT_EQ(unwrap(interp.step()), RunStatus::HaltedOk);
    EXPECT_EQ(interp.program_counter(), 2u);
    EXPECT_EQ(interp.tags_issued(), 2u);
}

TEST(InterpreterTest, HaltedInterpreterStaysHalted) {
    Interpreter interp(ProgramBuilder().declare("x", 2).build());
    ASSERT_EQ(run_to_end(interp), RunStatus::HaltedOk);

    auto again = interp.step();
    ASSERT_TRUE(is_ok(again));
    EXPECT_EQ(unwrap(again), RunStatus::HaltedOk);
    EXPECT_EQ(interp.program_counter(), 1u);
}

TEST(InterpreterTest, UnknownNameIsATraceError) {
    Interpreter interp(ProgramBuilder().declare("x", 2).push(ReadOp{"q"}, {3, 1}).build());

    auto status = interp.run();
    ASSERT_TRUE(is_err(status));
    EXPECT_EQ(unwrap_err(status).code, TraceErrorCode::UnknownPointer);
    EXPECT_EQ(unwrap_err(status).instruction_index, 1u);
    EXPECT_EQ(unwrap_err(status).location, (SourceLocation{3, 1}));
    EXPECT_FALSE(interp.fault().has_value());
}

// ============================================================================
// Memory effects
// ============================================================================

TEST(InterpreterTest, DeclarePushesRootFrame) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 2, Mutability::Immutable)
                           .declare("c", 0, Mutability::InteriorMutable)
                           .build());
    run_to_end(interp);

    EXPECT_EQ(permissions_of(interp, 0), std::vector<Permission>{Permission::Unique});
    EXPECT_EQ(permissions_of(interp, 1), std::vector<Permission>{Permission::SharedReadWrite});

    auto x = interp.lookup("x");
    ASSERT_TRUE(x.has_value());
    EXPECT_EQ(x->tag, std::optional<BorrowTag>(BorrowTag{1}));
}

TEST(InterpreterTest, ReadsRecordObservedValues) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 2)
                           .borrow("p", "x", BorrowKind::Unique)
                           .write("p", 7)
                           .read("x")
                           .build());
    ASSERT_EQ(run_to_end(interp), RunStatus::HaltedOk);

    ASSERT_EQ(interp.reads().size(), 1u);
    EXPECT_EQ(interp.reads()[0].instruction_index, 3u);
    EXPECT_EQ(interp.reads()[0].pointer, "x");
    EXPECT_EQ(interp.reads()[0].value, 7);
}

TEST(InterpreterTest, ExternalCallWritesConfiguredValue) {
    CheckOptions options;
    options.external_call_value = 42;
    Interpreter interp(ProgramBuilder()
                           .declare("x", 2)
                           .borrow("p", "x", BorrowKind::Unique)
                           .external_call("p")
                           .build(),
                       options);
    run_to_end(interp);
    EXPECT_EQ(unwrap(interp.store().value_read(0)), 42);
}

TEST(InterpreterTest, ExternalCallWithExplicitValue) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 2)
                           .borrow("p", "x", BorrowKind::Unique)
                           .external_call("p", -3)
                           .build());
    run_to_end(interp);
    EXPECT_EQ(unwrap(interp.store().value_read(0)), -3);
}

TEST(InterpreterTest, CastToIntegerDropsTag) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 2)
                           .borrow("p", "x", BorrowKind::Unique)
                           .cast_to_integer("i", "p")
                           .reborrow("j", "i", BorrowKind::Unique)
                           .build());
    ASSERT_EQ(run_to_end(interp), RunStatus::HaltedOk);

    EXPECT_TRUE(interp.lookup("i")->is_untagged());
    EXPECT_TRUE(interp.lookup("j")->is_untagged());
    EXPECT_EQ(stack_of(interp, 0).size(), 2u);
    EXPECT_EQ(interp.bound_at("i"), std::optional<size_t>(2));
}

// ============================================================================
// Scenarios
// ============================================================================

TEST(InterpreterScenarioTest, SharedCastWriteOfImmutable) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 2, Mutability::Immutable)
                           .borrow("r", "x", BorrowKind::Shared)
                           .reborrow("p", "r", BorrowKind::Unique)
                           .external_call("p")
                           .build());
    ASSERT_EQ(run_to_end(interp), RunStatus::HaltedUB);

    ASSERT_TRUE(interp.fault().has_value());
    EXPECT_EQ(interp.fault()->instruction_index, 3u);
    EXPECT_EQ(interp.fault()->error.rule, Rule::ReadOnlyViolation);
    EXPECT_EQ(interp.program_counter(), 3u);

    // The callee never ran.
    EXPECT_EQ(unwrap(interp.store().value_read(0)), 2);
}

TEST(InterpreterScenarioTest, SharedCastWriteOfMutable) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 2, Mutability::Mutable)
                           .borrow("r", "x", BorrowKind::Shared)
                           .reborrow("p", "r", BorrowKind::Unique)
                           .external_call("p")
                           .build());
    ASSERT_EQ(run_to_end(interp), RunStatus::HaltedUB);
    EXPECT_EQ(interp.fault()->error.rule, Rule::ReadOnlyViolation);
    EXPECT_EQ(interp.fault()->instruction_index, 3u);
}

TEST(InterpreterScenarioTest, IntegerRoundTrip) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 2, Mutability::Mutable)
                           .borrow("p", "x", BorrowKind::Unique)
                           .reborrow("r", "p", BorrowKind::Shared)
                           .cast_to_integer("i", "r")
                           .external_call("i")
                           .build());
    ASSERT_EQ(run_to_end(interp), RunStatus::HaltedUB);
    EXPECT_EQ(interp.fault()->error.rule, Rule::UntaggedAccess);
    EXPECT_EQ(interp.fault()->instruction_index, 4u);
}

TEST(InterpreterScenarioTest, UniqueCastWriteIsSound) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 2, Mutability::Mutable)
                           .borrow("p", "x", BorrowKind::Unique)
                           .reborrow("q", "p", BorrowKind::Unique)
                           .external_call("q")
                           .read("x")
                           .build());
    ASSERT_EQ(run_to_end(interp), RunStatus::HaltedOk);
    EXPECT_EQ(interp.reads().back().value, 1);
    EXPECT_EQ(permissions_of(interp, 0),
              (std::vector<Permission>{Permission::Unique, Permission::Disabled,
                                       Permission::Disabled}));
}

TEST(InterpreterScenarioTest, CellSharedWriteIsSound) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 2, Mutability::InteriorMutable)
                           .borrow("r", "x", BorrowKind::Shared)
                           .reborrow("p", "r", BorrowKind::Unique)
                           .external_call("p")
                           .read("x")
                           .build());
    ASSERT_EQ(run_to_end(interp), RunStatus::HaltedOk);
    EXPECT_EQ(interp.reads().back().value, 1);
    EXPECT_EQ(permissions_of(interp, 0),
              (std::vector<Permission>{Permission::SharedReadWrite, Permission::SharedReadWrite,
                                       Permission::Disabled}));
}

TEST(InterpreterScenarioTest, SiblingUniqueBorrowsOfCell) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 0, Mutability::InteriorMutable)
                           .borrow("s", "x", BorrowKind::Shared)
                           .reborrow("a", "s", BorrowKind::Unique)
                           .reborrow("b", "s", BorrowKind::Unique)
                           .write("b", 5)
                           .read("a")
                           .build());
    ASSERT_EQ(run_to_end(interp), RunStatus::HaltedUB);

    const Fault& fault = *interp.fault();
    EXPECT_EQ(fault.instruction_index, 5u);
    EXPECT_EQ(fault.error.rule, Rule::Disabled);
    EXPECT_EQ(fault.error.tag, std::optional<BorrowTag>(BorrowTag{3}));
    EXPECT_EQ(fault.error.conflicting, std::optional<BorrowTag>(BorrowTag{4}));
}

TEST(InterpreterScenarioTest, WriteThroughParentPopsSharedChild) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 0)
                           .borrow("p", "x", BorrowKind::Unique)
                           .reborrow("q", "p", BorrowKind::Shared)
                           .write("p", 1)
                           .read("q")
                           .build());
    ASSERT_EQ(run_to_end(interp), RunStatus::HaltedUB);
    EXPECT_EQ(interp.fault()->error.rule, Rule::TagNotFound);
    EXPECT_EQ(interp.fault()->instruction_index, 4u);
}

TEST(InterpreterScenarioTest, ReborrowOfDisabledTagFaults) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 0)
                           .borrow("p", "x", BorrowKind::Unique)
                           .read("x")
                           .reborrow("q", "p", BorrowKind::Shared)
                           .build());
    ASSERT_EQ(run_to_end(interp), RunStatus::HaltedUB);
    EXPECT_EQ(interp.fault()->error.rule, Rule::Disabled);
    EXPECT_EQ(interp.fault()->instruction_index, 3u);
}

// ============================================================================
// History
// ============================================================================

TEST(InterpreterHistoryTest, RecordsCreationAndInvalidation) {
    Interpreter interp(ProgramBuilder()
                           .declare("x", 0)
                           .borrow("p", "x", BorrowKind::Unique)
                           .reborrow("q", "p", BorrowKind::Shared)
                           .write("p", 1)
                           .read("x")
                           .build());
    ASSERT_EQ(run_to_end(interp), RunStatus::HaltedOk);

    const TagHistory* q = interp.history(BorrowTag{3});
    ASSERT_NE(q, nullptr);
    EXPECT_EQ(q->created_at, 2u);
    EXPECT_EQ(q->popped_at, std::optional<size_t>(3));

    const TagHistory* p = interp.history(BorrowTag{2});
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->disabled_at, std::optional<size_t>(4));
    EXPECT_FALSE(p->popped_at.has_value());
}

TEST(InterpreterHistoryTest, HistoryCanBeTurnedOff) {
    CheckOptions options;
    options.record_history = false;
    Interpreter interp(ProgramBuilder().declare("x", 0).build(), options);
    run_to_end(interp);
    EXPECT_EQ(interp.history(BorrowTag{1}), nullptr);
}

TEST(InterpreterHistoryTest, IndependentInterpretersOnThreads) {
    auto program = ProgramBuilder()
                       .declare("x", 0, Mutability::InteriorMutable)
                       .borrow("s", "x", BorrowKind::Shared)
                       .reborrow("a", "s", BorrowKind::Unique)
                       .reborrow("b", "s", BorrowKind::Unique)
                       .write("b", 5)
                       .read("a")
                       .build();

    std::vector<size_t> faults(4, 0);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < faults.size(); ++t) {
        threads.emplace_back([&program, &faults, t]() {
            Interpreter interp(program);
            auto status = interp.run();
            if (is_ok(status) && interp.fault()) {
                faults[t] = interp.fault()->instruction_index;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(faults, (std::vector<size_t>{5, 5, 5, 5}));
}

TEST(RunStatusTest, Names) {
    EXPECT_STREQ(run_status_name(RunStatus::Running), "running");
    EXPECT_STREQ(run_status_name(RunStatus::HaltedUB), "halted (undefined behavior)");
}
