//! # Trace Interpreter
//!
//! Executes a `Program` one instruction at a time against its own memory
//! store, using the permission engine to authorise every access.
//!
//! ## States
//!
//! ```text
//!            step() ok, more left
//!           ┌───────────────┐
//!           ▼               │
//!   ──► Running ────────────┘
//!           │ last instruction ok          ──► HaltedOk
//!           │ permission engine says no    ──► HaltedUB
//! ```
//!
//! The first violation halts the run: no later instruction is evaluated.
//! Violations are states, not errors. `step()` and `run()` only return an
//! error for a malformed program (a name that does not resolve), which
//! `verify_program` normally catches beforehand.
//!
//! Each interpreter owns its store and tag allocator, so separate
//! interpreters can run on separate threads.

#ifndef SBC_BORROW_INTERPRETER_HPP
#define SBC_BORROW_INTERPRETER_HPP

#include "borrow/memory.hpp"
#include "borrow/permission.hpp"
#include "borrow/program.hpp"
#include "borrow/tag.hpp"
#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sbc::borrow {

enum class RunStatus {
    Running,
    HaltedOk,
    HaltedUB,
};

[[nodiscard]] auto run_status_name(RunStatus status) -> const char*;

/// Settings for one run.
struct CheckOptions {
    /// Value written by an `ExternalCallOp` that does not name one.
    Scalar external_call_value = 1;

    /// Keep per-tag creation/invalidation history for diagnostic notes.
    bool record_history = true;
};

/// The violation that halted a run.
struct Fault {
    size_t instruction_index = 0;
    AllocationId allocation = 0;
    AccessError error;
};

/// A successful read and the value it observed.
struct ReadEvent {
    size_t instruction_index = 0;
    std::string pointer;
    Scalar value = 0;
};

/// Lifecycle of one tag, used to explain violations.
struct TagHistory {
    BorrowTag tag;
    AllocationId allocation = 0;
    size_t created_at = 0;
    std::optional<size_t> popped_at;
    std::optional<size_t> disabled_at;
};

class Interpreter {
public:
    explicit Interpreter(const Program& program, CheckOptions options = {});

    /// Executes the instruction at the program counter.
    ///
    /// A halted interpreter stays halted; calling `step()` again returns the
    /// same status without doing anything.
    auto step() -> Result<RunStatus, TraceError>;

    /// Steps until halted.
    auto run() -> Result<RunStatus, TraceError>;

    [[nodiscard]] auto status() const -> RunStatus {
        return status_;
    }

    [[nodiscard]] auto is_halted() const -> bool {
        return status_ != RunStatus::Running;
    }

    /// Index of the next instruction to execute. After a violation, the
    /// index of the faulting instruction.
    [[nodiscard]] auto program_counter() const -> size_t {
        return pc_;
    }

    [[nodiscard]] auto program() const -> const Program& {
        return program_;
    }

    [[nodiscard]] auto store() const -> const MemoryStore& {
        return store_;
    }

    [[nodiscard]] auto tags_issued() const -> uint64_t {
        return tags_.issued();
    }

    /// Set once the run reaches `HaltedUB`.
    [[nodiscard]] auto fault() const -> const std::optional<Fault>& {
        return fault_;
    }

    [[nodiscard]] auto reads() const -> const std::vector<ReadEvent>& {
        return reads_;
    }

    /// The pointer currently bound to `name`.
    [[nodiscard]] auto lookup(std::string_view name) const -> std::optional<Pointer>;

    /// Index of the instruction that bound `name`.
    [[nodiscard]] auto bound_at(std::string_view name) const -> std::optional<size_t>;

    /// History of a tag; null when history is off or the tag is unknown.
    [[nodiscard]] auto history(BorrowTag tag) const -> const TagHistory*;

private:
    /// Why an instruction did not complete.
    using StepError = std::variant<Fault, TraceError>;
    using StepResult = Result<bool, StepError>;

    struct BoundPointer {
        Pointer pointer;
        size_t bound_at = 0;
    };

    Program program_;
    CheckOptions options_;

    RunStatus status_ = RunStatus::Running;
    size_t pc_ = 0;

    MemoryStore store_;
    TagAllocator tags_;
    std::unordered_map<std::string, BoundPointer> bindings_;
    std::unordered_map<uint64_t, TagHistory> history_;
    std::vector<ReadEvent> reads_;
    std::optional<Fault> fault_;

    auto exec(const DeclareOp& op) -> StepResult;
    auto exec(const BorrowOp& op) -> StepResult;
    auto exec(const ReborrowOp& op) -> StepResult;
    auto exec(const CastToIntegerOp& op) -> StepResult;
    auto exec(const ReadOp& op) -> StepResult;
    auto exec(const WriteOp& op) -> StepResult;
    auto exec(const ExternalCallOp& op) -> StepResult;

    /// Shared by borrow and reborrow: derive a frame from `parent`, push it
    /// and bind `dest`.
    auto derive_into(const std::string& dest, const Pointer& parent, BorrowKind kind)
        -> StepResult;

    /// Shared by write and external call.
    auto write_through(const std::string& target, Scalar value) -> StepResult;

    auto resolve(const std::string& name) const -> Result<Pointer, TraceError>;
    auto allocation_of(const Pointer& ptr) -> Result<Allocation*, TraceError>;
    void bind(const std::string& name, Pointer pointer);

    void record_created(const Frame& frame, AllocationId allocation);
    void record_effect(const AccessEffect& effect);
};

} // namespace sbc::borrow

#endif // SBC_BORROW_INTERPRETER_HPP
