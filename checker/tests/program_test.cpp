//! # Program and Verifier Tests

#include "borrow/program.hpp"

#include <gtest/gtest.h>

using namespace sbc;
using namespace sbc::borrow;

// ============================================================================
// Rendering
// ============================================================================

TEST(ProgramDescribeTest, RendersTraceSyntax) {
    EXPECT_EQ(describe(DeclareOp{"x", 2, Mutability::Immutable}), "declare x = 2");
    EXPECT_EQ(describe(DeclareOp{"x", -1, Mutability::Mutable}), "declare mut x = -1");
    EXPECT_EQ(describe(DeclareOp{"c", 0, Mutability::InteriorMutable}), "declare cell c = 0");
    EXPECT_EQ(describe(BorrowOp{"p", "x", BorrowKind::Unique}), "p = borrow unique x");
    EXPECT_EQ(describe(ReborrowOp{"q", "p", BorrowKind::Shared}), "q = reborrow shared p");
    EXPECT_EQ(describe(CastToIntegerOp{"i", "q"}), "i = cast_int q");
    EXPECT_EQ(describe(ReadOp{"q"}), "read q");
    EXPECT_EQ(describe(WriteOp{"p", 5}), "write p 5");
    EXPECT_EQ(describe(ExternalCallOp{"p", std::nullopt}), "call p");
    EXPECT_EQ(describe(ExternalCallOp{"p", 7}), "call p 7");
}

TEST(ProgramDescribeTest, OperandsAndBindings) {
    EXPECT_EQ(operand_of(DeclareOp{"x", 2, Mutability::Mutable}), "");
    EXPECT_EQ(operand_of(BorrowOp{"p", "x", BorrowKind::Shared}), "x");
    EXPECT_EQ(operand_of(ReborrowOp{"q", "p", BorrowKind::Shared}), "p");
    EXPECT_EQ(operand_of(WriteOp{"q", 1}), "q");

    EXPECT_EQ(binding_of(DeclareOp{"x", 2, Mutability::Mutable}),
              std::optional<std::string_view>("x"));
    EXPECT_EQ(binding_of(CastToIntegerOp{"i", "p"}), std::optional<std::string_view>("i"));
    EXPECT_FALSE(binding_of(ReadOp{"p"}).has_value());
}

TEST(ProgramBuilderTest, BuildsInstructionsInOrder) {
    auto program = ProgramBuilder("scenario")
                       .declare("x", 2)
                       .borrow("p", "x", BorrowKind::Unique)
                       .external_call("p")
                       .external_call("p", 9)
                       .build();

    EXPECT_EQ(program.name, "scenario");
    ASSERT_EQ(program.instructions.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<DeclareOp>(program.instructions[0].op));
    EXPECT_EQ(std::get<DeclareOp>(program.instructions[0].op).mutability, Mutability::Mutable);
    EXPECT_FALSE(std::get<ExternalCallOp>(program.instructions[2].op).value.has_value());
    EXPECT_EQ(std::get<ExternalCallOp>(program.instructions[3].op).value,
              std::optional<Scalar>(9));
    EXPECT_FALSE(program.expectation.has_value());
}

// ============================================================================
// Verification
// ============================================================================

class VerifyTest : public ::testing::Test {
protected:
    static auto errors_of(const Program& program) -> std::vector<TraceError> {
        auto result = verify_program(program);
        if (is_ok(result)) {
            return {};
        }
        return unwrap_err(result);
    }
};

TEST_F(VerifyTest, WellFormedProgramPasses) {
    auto program = ProgramBuilder()
                       .declare("x", 2, Mutability::Immutable)
                       .borrow("r", "x", BorrowKind::Shared)
                       .reborrow("p", "r", BorrowKind::Unique)
                       .cast_to_integer("i", "p")
                       .external_call("p")
                       .read("i")
                       .build();
    EXPECT_TRUE(is_ok(verify_program(program)));
}

TEST_F(VerifyTest, BorrowOfUndeclaredAllocation) {
    auto errors = errors_of(ProgramBuilder().borrow("p", "y", BorrowKind::Shared).build());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, TraceErrorCode::InvalidAllocation);
    EXPECT_STREQ(trace_error_code(errors[0].code), "V001");
    EXPECT_EQ(errors[0].instruction_index, 0u);
}

TEST_F(VerifyTest, BorrowOfAPointerIsNotAnAllocation) {
    auto errors = errors_of(ProgramBuilder()
                                .declare("x", 0)
                                .borrow("p", "x", BorrowKind::Shared)
                                .borrow("q", "p", BorrowKind::Shared)
                                .build());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, TraceErrorCode::InvalidAllocation);
    EXPECT_EQ(errors[0].instruction_index, 2u);
}

TEST_F(VerifyTest, UnknownPointer) {
    auto errors = errors_of(ProgramBuilder().declare("x", 0).read("q").write("r", 1).build());
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].code, TraceErrorCode::UnknownPointer);
    EXPECT_EQ(errors[0].message, "no pointer named `q` is bound");
    EXPECT_EQ(errors[1].instruction_index, 2u);
}

TEST_F(VerifyTest, DuplicateName) {
    auto errors = errors_of(ProgramBuilder()
                                .declare("x", 0)
                                .borrow("p", "x", BorrowKind::Shared)
                                .borrow("p", "x", BorrowKind::Shared)
                                .build());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, TraceErrorCode::DuplicateName);
    EXPECT_STREQ(trace_error_code(errors[0].code), "V003");
}

TEST_F(VerifyTest, ImmutableDeclarationMayBeBorrowedUniquely) {
    auto errors = errors_of(ProgramBuilder()
                                .declare("x", 0, Mutability::Immutable)
                                .borrow("p", "x", BorrowKind::Unique)
                                .reborrow("q", "x", BorrowKind::Unique)
                                .build());
    EXPECT_TRUE(errors.empty());
}

TEST_F(VerifyTest, CastOfSharedBorrowIsNotAMutBorrow) {
    // The cast is legal; its write is what the checker catches at run time.
    auto errors = errors_of(ProgramBuilder()
                                .declare("x", 0, Mutability::Immutable)
                                .borrow("r", "x", BorrowKind::Shared)
                                .reborrow("p", "r", BorrowKind::Unique)
                                .write("p", 1)
                                .build());
    EXPECT_TRUE(errors.empty());
}

TEST_F(VerifyTest, ImmutableDeclarationMayBeWritten) {
    auto errors = errors_of(
        ProgramBuilder().declare("x", 0, Mutability::Immutable).write("x", 1).external_call("x").build());
    EXPECT_TRUE(errors.empty());
}

TEST_F(VerifyTest, CellDeclarationMayBeWritten) {
    auto errors = errors_of(
        ProgramBuilder().declare("c", 0, Mutability::InteriorMutable).write("c", 1).build());
    EXPECT_TRUE(errors.empty());
}

TEST_F(VerifyTest, ErrorsCarryLocations) {
    auto program = ProgramBuilder().push(ReadOp{"q"}, SourceLocation{4, 1}).build();
    auto errors = errors_of(program);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].location, (SourceLocation{4, 1}));
}
