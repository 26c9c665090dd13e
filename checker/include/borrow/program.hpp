//! # Trace Programs
//!
//! A `Program` is the checker's input: an ordered list of abstract memory
//! operations over named allocations and named pointers.
//!
//! ## Operations
//!
//! | Operation       | Trace syntax               | Effect                                |
//! |-----------------|----------------------------|---------------------------------------|
//! | `DeclareOp`     | `declare [mut|cell] x = 2` | new allocation, binds `x` to its root |
//! | `BorrowOp`      | `p = borrow unique x`      | new frame derived from `x`'s root     |
//! | `ReborrowOp`    | `q = reborrow shared p`    | new frame derived from `p`            |
//! | `CastToIntegerOp` | `i = cast_int p`         | untagged copy of `p`                  |
//! | `ReadOp`        | `read p`                   | read access                           |
//! | `WriteOp`       | `write p 5`                | write access                          |
//! | `ExternalCallOp`| `call p [v]`               | opaque callee writes through `p`      |
//!
//! Names are resolved in program order. `verify_program` reports references
//! to unknown names and other malformed programs before anything runs; those
//! are `TraceError`s, never aliasing violations.

#ifndef SBC_BORROW_PROGRAM_HPP
#define SBC_BORROW_PROGRAM_HPP

#include "borrow/memory.hpp"
#include "borrow/permission.hpp"
#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sbc::borrow {

// ============================================================================
// Operations
// ============================================================================

struct DeclareOp {
    std::string name;
    Scalar value = 0;
    Mutability mutability = Mutability::Mutable;
};

struct BorrowOp {
    std::string dest;
    std::string allocation;
    BorrowKind kind = BorrowKind::Shared;
};

struct ReborrowOp {
    std::string dest;
    std::string source;
    BorrowKind kind = BorrowKind::Shared;
};

/// Casts a pointer to an integer and back. The result has no tag.
struct CastToIntegerOp {
    std::string dest;
    std::string source;
};

struct ReadOp {
    std::string source;
};

struct WriteOp {
    std::string target;
    Scalar value = 0;
};

/// A call into code the checker cannot see, which writes through `target`.
struct ExternalCallOp {
    std::string target;

    /// Value the callee stores; empty uses `CheckOptions::external_call_value`.
    std::optional<Scalar> value;
};

using Operation = std::variant<DeclareOp, BorrowOp, ReborrowOp, CastToIntegerOp, ReadOp, WriteOp,
                               ExternalCallOp>;

/// Renders an operation in trace syntax, e.g. `q = reborrow unique p`.
[[nodiscard]] auto describe(const Operation& op) -> std::string;

/// The pointer (or, for `BorrowOp`, the allocation) an operation reads from.
/// Empty for `DeclareOp`.
[[nodiscard]] auto operand_of(const Operation& op) -> std::string_view;

/// The name an operation binds, if any.
[[nodiscard]] auto binding_of(const Operation& op) -> std::optional<std::string_view>;

struct Instruction {
    Operation op;

    /// Where the instruction came from in a trace file.
    SourceLocation location;
};

/// The verdict a trace file asks for with an `expect` line.
struct Expectation {
    enum class Kind { Sound, Violation };

    Kind kind = Kind::Sound;

    /// Only for `Violation`: the expected rule, if given.
    std::optional<Rule> rule;

    /// Only for `Violation`: the expected faulting instruction, if given.
    std::optional<size_t> instruction_index;

    SourceLocation location;
};

struct Program {
    /// File name or scenario name, used in diagnostics.
    std::string name = "<program>";

    std::vector<Instruction> instructions;

    std::optional<Expectation> expectation;
};

// ============================================================================
// Program Builder
// ============================================================================

/// Fluent construction of programs for tests and embedders.
///
/// ```cpp
/// auto program = ProgramBuilder("shared-write")
///                    .declare("x", 2, Mutability::Immutable)
///                    .borrow("r", "x", BorrowKind::Shared)
///                    .reborrow("p", "r", BorrowKind::Unique)
///                    .external_call("p")
///                    .build();
/// ```
class ProgramBuilder {
public:
    explicit ProgramBuilder(std::string name = "<program>");

    auto declare(std::string name, Scalar value, Mutability mutability = Mutability::Mutable)
        -> ProgramBuilder&;
    auto borrow(std::string dest, std::string allocation, BorrowKind kind) -> ProgramBuilder&;
    auto reborrow(std::string dest, std::string source, BorrowKind kind) -> ProgramBuilder&;
    auto cast_to_integer(std::string dest, std::string source) -> ProgramBuilder&;
    auto read(std::string source) -> ProgramBuilder&;
    auto write(std::string target, Scalar value) -> ProgramBuilder&;
    auto external_call(std::string target) -> ProgramBuilder&;
    auto external_call(std::string target, Scalar value) -> ProgramBuilder&;

    /// Appends an already-built operation.
    auto push(Operation op, SourceLocation location = {}) -> ProgramBuilder&;

    auto expect(Expectation expectation) -> ProgramBuilder&;

    [[nodiscard]] auto build() const -> Program {
        return program_;
    }

private:
    Program program_;
};

// ============================================================================
// Construction-time Errors
// ============================================================================

/// Malformed-program errors. These are input bugs, not aliasing violations.
enum class TraceErrorCode {
    InvalidAllocation, ///< V001: borrow of an allocation that was never declared
    UnknownPointer,    ///< V002: use of a pointer name that was never bound
    DuplicateName,     ///< V003: a name is bound twice
};

/// Returns the diagnostic code of a trace error, e.g. "V001".
[[nodiscard]] auto trace_error_code(TraceErrorCode code) -> const char*;

struct TraceError {
    TraceErrorCode code = TraceErrorCode::InvalidAllocation;
    size_t instruction_index = 0;
    SourceLocation location;
    std::string message;

    static auto invalid_allocation(std::string_view name, size_t index, SourceLocation loc)
        -> TraceError;
    static auto unknown_pointer(std::string_view name, size_t index, SourceLocation loc)
        -> TraceError;
};

/// Checks that every name resolves and is bound exactly once.
///
/// Returns `true` or every error found (checking continues past the first).
[[nodiscard]] auto verify_program(const Program& program)
    -> Result<bool, std::vector<TraceError>>;

} // namespace sbc::borrow

#endif // SBC_BORROW_PROGRAM_HPP
