#include "borrow/program.hpp"

#include <sstream>
#include <type_traits>

namespace sbc::borrow {

auto describe(const Operation& op) -> std::string {
    std::ostringstream out;
    std::visit(
        [&out](const auto& o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, DeclareOp>) {
                out << "declare ";
                if (o.mutability == Mutability::Mutable) {
                    out << "mut ";
                } else if (o.mutability == Mutability::InteriorMutable) {
                    out << "cell ";
                }
                out << o.name << " = " << o.value;
            } else if constexpr (std::is_same_v<T, BorrowOp>) {
                out << o.dest << " = borrow " << borrow_kind_name(o.kind) << " " << o.allocation;
            } else if constexpr (std::is_same_v<T, ReborrowOp>) {
                out << o.dest << " = reborrow " << borrow_kind_name(o.kind) << " " << o.source;
            } else if constexpr (std::is_same_v<T, CastToIntegerOp>) {
                out << o.dest << " = cast_int " << o.source;
            } else if constexpr (std::is_same_v<T, ReadOp>) {
                out << "read " << o.source;
            } else if constexpr (std::is_same_v<T, WriteOp>) {
                out << "write " << o.target << " " << o.value;
            } else if constexpr (std::is_same_v<T, ExternalCallOp>) {
                out << "call " << o.target;
                if (o.value) {
                    out << " " << *o.value;
                }
            }
        },
        op);
    return out.str();
}

auto operand_of(const Operation& op) -> std::string_view {
    return std::visit(
        [](const auto& o) -> std::string_view {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, DeclareOp>) {
                return {};
            } else if constexpr (std::is_same_v<T, BorrowOp>) {
                return o.allocation;
            } else if constexpr (std::is_same_v<T, ReborrowOp> ||
                                 std::is_same_v<T, CastToIntegerOp> ||
                                 std::is_same_v<T, ReadOp>) {
                return o.source;
            } else {
                return o.target;
            }
        },
        op);
}

auto binding_of(const Operation& op) -> std::optional<std::string_view> {
    return std::visit(
        [](const auto& o) -> std::optional<std::string_view> {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, DeclareOp>) {
                return std::string_view(o.name);
            } else if constexpr (std::is_same_v<T, BorrowOp> || std::is_same_v<T, ReborrowOp> ||
                                 std::is_same_v<T, CastToIntegerOp>) {
                return std::string_view(o.dest);
            } else {
                return std::nullopt;
            }
        },
        op);
}

// ============================================================================
// ProgramBuilder
// ============================================================================

ProgramBuilder::ProgramBuilder(std::string name) {
    program_.name = std::move(name);
}

auto ProgramBuilder::declare(std::string name, Scalar value, Mutability mutability)
    -> ProgramBuilder& {
    return push(DeclareOp{std::move(name), value, mutability});
}

auto ProgramBuilder::borrow(std::string dest, std::string allocation, BorrowKind kind)
    -> ProgramBuilder& {
    return push(BorrowOp{std::move(dest), std::move(allocation), kind});
}

auto ProgramBuilder::reborrow(std::string dest, std::string source, BorrowKind kind)
    -> ProgramBuilder& {
    return push(ReborrowOp{std::move(dest), std::move(source), kind});
}

auto ProgramBuilder::cast_to_integer(std::string dest, std::string source) -> ProgramBuilder& {
    return push(CastToIntegerOp{std::move(dest), std::move(source)});
}

auto ProgramBuilder::read(std::string source) -> ProgramBuilder& {
    return push(ReadOp{std::move(source)});
}

auto ProgramBuilder::write(std::string target, Scalar value) -> ProgramBuilder& {
    return push(WriteOp{std::move(target), value});
}

auto ProgramBuilder::external_call(std::string target) -> ProgramBuilder& {
    return push(ExternalCallOp{std::move(target), std::nullopt});
}

auto ProgramBuilder::external_call(std::string target, Scalar value) -> ProgramBuilder& {
    return push(ExternalCallOp{std::move(target), value});
}

auto ProgramBuilder::push(Operation op, SourceLocation location) -> ProgramBuilder& {
    program_.instructions.push_back(Instruction{std::move(op), location});
    return *this;
}

auto ProgramBuilder::expect(Expectation expectation) -> ProgramBuilder& {
    program_.expectation = expectation;
    return *this;
}

// ============================================================================
// TraceError
// ============================================================================

auto trace_error_code(TraceErrorCode code) -> const char* {
    switch (code) {
    case TraceErrorCode::InvalidAllocation:
        return "V001";
    case TraceErrorCode::UnknownPointer:
        return "V002";
    case TraceErrorCode::DuplicateName:
        return "V003";
    }
    return "V000";
}

auto TraceError::invalid_allocation(std::string_view name, size_t index, SourceLocation loc)
    -> TraceError {
    return TraceError{TraceErrorCode::InvalidAllocation, index, loc,
                      "no allocation named `" + std::string(name) + "` has been declared"};
}

auto TraceError::unknown_pointer(std::string_view name, size_t index, SourceLocation loc)
    -> TraceError {
    return TraceError{TraceErrorCode::UnknownPointer, index, loc,
                      "no pointer named `" + std::string(name) + "` is bound"};
}

} // namespace sbc::borrow
