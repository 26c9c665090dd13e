//! # Trace Interpreter Implementation
//!
//! `step()` dispatches the current instruction to one `exec` overload per
//! operation. Each overload returns early on the first failure:
//!
//! ```text
//! step()
//!   └─ exec(op)
//!        ├─ resolve names        ── TraceError ──► returned to the caller
//!        ├─ retag / validate     ── AccessError ─► Fault, status = HaltedUB
//!        └─ mutate store         ── ok ──────────► pc + 1
//! ```

#include "borrow/interpreter.hpp"

#include "log/log.hpp"


namespace sbc::borrow {

auto run_status_name(RunStatus status) -> const char* {
    switch (status) {
    case RunStatus::Running:
        return "running";
    case RunStatus::HaltedOk:
        return "halted (ok)";
    case RunStatus::HaltedUB:
        return "halted (undefined behavior)";
    }
    return "?";
}

Interpreter::Interpreter(const Program& program, CheckOptions options)
    : program_(program), options_(options) {}

// ============================================================================
// Stepping
// ============================================================================

auto Interpreter::step() -> Result<RunStatus, TraceError> {
    if (is_halted()) {
        return status_;
    }
    if (pc_ >= program_.instructions.size()) {
        status_ = RunStatus::HaltedOk;
        SBC_LOG_DEBUG("interp", "`" << program_.name << "` finished after " << pc_
                                    << " instruction(s)");
        return status_;
    }

    const Instruction& instr = program_.instructions[pc_];
    SBC_LOG_DEBUG("interp", "[" << pc_ << "] " << describe(instr.op));

    auto result = std::visit([this](const auto& op) { return exec(op); }, instr.op);

    if (is_err(result)) {
        auto& error = unwrap_err(result);
        if (auto* trace_error = std::get_if<TraceError>(&error)) {
            trace_error->location = instr.location;
            return *trace_error;
        }
        fault_ = std::get<Fault>(std::move(error));
        status_ = RunStatus::HaltedUB;
        SBC_LOG_DEBUG("interp", "[" << pc_ << "] halted: " << fault_->error.message);
        return status_;
    }

    ++pc_;
    if (pc_ == program_.instructions.size()) {
        status_ = RunStatus::HaltedOk;
        SBC_LOG_DEBUG("interp", "`" << program_.name << "` finished after " << pc_
                                    << " instruction(s)");
    }
    return status_;
}

auto Interpreter::run() -> Result<RunStatus, TraceError> {
    while (!is_halted()) {
        auto result = step();
        if (is_err(result)) {
            return result;
        }
    }
    return status_;
}

// ============================================================================
// Operations
// ============================================================================

auto Interpreter::exec(const DeclareOp& op) -> StepResult {
    bool interior_mutable = op.mutability == Mutability::InteriorMutable;
    Frame root{tags_.next(), root_permission(interior_mutable), std::nullopt, pc_};

    AllocationId id = store_.declare(op.name, op.value, op.mutability, root);
    record_created(root, id);
    bind(op.name, Pointer{id, root.tag});
    return true;
}

auto Interpreter::exec(const BorrowOp& op) -> StepResult {
    auto id = store_.find(op.allocation);
    if (!id) {
        return StepError{TraceError::invalid_allocation(op.allocation, pc_, {})};
    }
    auto alloc = store_.get(*id);
    if (is_err(alloc)) {
        return StepError{TraceError::invalid_allocation(op.allocation, pc_, {})};
    }
    return derive_into(op.dest, Pointer{*id, unwrap(alloc)->root}, op.kind);
}

auto Interpreter::exec(const ReborrowOp& op) -> StepResult {
    auto parent = resolve(op.source);
    if (is_err(parent)) {
        return StepError{unwrap_err(parent)};
    }
    return derive_into(op.dest, unwrap(parent), op.kind);
}

auto Interpreter::exec(const CastToIntegerOp& op) -> StepResult {
    auto source = resolve(op.source);
    if (is_err(source)) {
        return StepError{unwrap_err(source)};
    }
    // The integer carries the address but not the tag; rebuilding a pointer
    // from it yields an untagged pointer to the same allocation.
    bind(op.dest, Pointer{unwrap(source).target, std::nullopt});
    return true;
}

auto Interpreter::exec(const ReadOp& op) -> StepResult {
    auto ptr = resolve(op.source);
    if (is_err(ptr)) {
        return StepError{unwrap_err(ptr)};
    }
    auto alloc = allocation_of(unwrap(ptr));
    if (is_err(alloc)) {
        return StepError{unwrap_err(alloc)};
    }

    auto access = validate(*unwrap(alloc), unwrap(ptr), AccessKind::Read);
    if (is_err(access)) {
        return StepError{Fault{pc_, unwrap(ptr).target, std::move(unwrap_err(access))}};
    }
    record_effect(unwrap(access));

    auto value = store_.value_read(unwrap(ptr).target);
    if (is_err(value)) {
        return StepError{TraceError::invalid_allocation(op.source, pc_, {})};
    }
    reads_.push_back(ReadEvent{pc_, op.source, unwrap(value)});
    SBC_LOG_TRACE("interp", "read " << op.source << " -> " << unwrap(value));
    return true;
}

auto Interpreter::exec(const WriteOp& op) -> StepResult {
    return write_through(op.target, op.value);
}

auto Interpreter::exec(const ExternalCallOp& op) -> StepResult {
    // The callee is opaque; all the checker may assume is that it writes.
    return write_through(op.target, op.value.value_or(options_.external_call_value));
}

auto Interpreter::derive_into(const std::string& dest, const Pointer& parent, BorrowKind kind)
    -> StepResult {
    auto alloc = allocation_of(parent);
    if (is_err(alloc)) {
        return StepError{unwrap_err(alloc)};
    }

    auto frame = retag(*unwrap(alloc), parent, kind, tags_.next(), pc_);
    if (is_err(frame)) {
        return StepError{Fault{pc_, parent.target, std::move(unwrap_err(frame))}};
    }

    const auto& new_frame = unwrap(frame);
    if (!new_frame) {
        bind(dest, Pointer{parent.target, std::nullopt});
        return true;
    }

    auto pushed = store_.push_frame(parent.target, *new_frame);
    if (is_err(pushed)) {
        return StepError{TraceError::invalid_allocation(dest, pc_, {})};
    }
    record_created(*new_frame, parent.target);
    bind(dest, Pointer{parent.target, new_frame->tag});
    return true;
}

auto Interpreter::write_through(const std::string& target, Scalar value) -> StepResult {
    auto ptr = resolve(target);
    if (is_err(ptr)) {
        return StepError{unwrap_err(ptr)};
    }
    auto alloc = allocation_of(unwrap(ptr));
    if (is_err(alloc)) {
        return StepError{unwrap_err(alloc)};
    }

    auto access = validate(*unwrap(alloc), unwrap(ptr), AccessKind::Write);
    if (is_err(access)) {
        return StepError{Fault{pc_, unwrap(ptr).target, std::move(unwrap_err(access))}};
    }
    record_effect(unwrap(access));

    auto written = store_.value_write(unwrap(ptr).target, value);
    if (is_err(written)) {
        return StepError{TraceError::invalid_allocation(target, pc_, {})};
    }
    SBC_LOG_TRACE("interp", "write " << target << " <- " << value);
    return true;
}

// ============================================================================
// Bindings
// ============================================================================

auto Interpreter::resolve(const std::string& name) const -> Result<Pointer, TraceError> {
    auto it = bindings_.find(name);
    if (it == bindings_.end()) {
        return TraceError::unknown_pointer(name, pc_, {});
    }
    return it->second.pointer;
}

auto Interpreter::allocation_of(const Pointer& ptr) -> Result<Allocation*, TraceError> {
    auto alloc = store_.get_mut(ptr.target);
    if (is_err(alloc)) {
        return TraceError{TraceErrorCode::InvalidAllocation, pc_, {}, unwrap_err(alloc).message};
    }
    return unwrap(alloc);
}

void Interpreter::bind(const std::string& name, Pointer pointer) {
    bindings_.insert_or_assign(name, BoundPointer{pointer, pc_});
}

auto Interpreter::lookup(std::string_view name) const -> std::optional<Pointer> {
    auto it = bindings_.find(std::string(name));
    if (it == bindings_.end()) {
        return std::nullopt;
    }
    return it->second.pointer;
}

auto Interpreter::bound_at(std::string_view name) const -> std::optional<size_t> {
    auto it = bindings_.find(std::string(name));
    if (it == bindings_.end()) {
        return std::nullopt;
    }
    return it->second.bound_at;
}

// ============================================================================
// History
// ============================================================================

void Interpreter::record_created(const Frame& frame, AllocationId allocation) {
    if (!options_.record_history) {
        return;
    }
    history_[frame.tag.value] = TagHistory{frame.tag, allocation, frame.created_at, {}, {}};
}

void Interpreter::record_effect(const AccessEffect& effect) {
    if (!options_.record_history) {
        return;
    }
    for (const auto& tag : effect.popped) {
        auto it = history_.find(tag.value);
        if (it != history_.end()) {
            it->second.popped_at = pc_;
        }
    }
    for (const auto& tag : effect.disabled) {
        auto it = history_.find(tag.value);
        if (it != history_.end() && !it->second.disabled_at) {
            it->second.disabled_at = pc_;
        }
    }
}

auto Interpreter::history(BorrowTag tag) const -> const TagHistory* {
    auto it = history_.find(tag.value);
    return it == history_.end() ? nullptr : &it->second;
}

} // namespace sbc::borrow
