//! # Program Verification
//!
//! A single forward pass over the instructions that tracks which names are
//! bound and what they point to. It rejects programs whose names do not
//! resolve, so that the interpreter only ever reports aliasing violations:
//!
//! ```text
//! V001  p = borrow shared y      // `y` never declared
//! V002  read q                   // `q` never bound
//! V003  declare x = 1; declare x = 2
//! ```
//!
//! Mutability is not checked here. The root frame of every declaration is
//! `Unique`, so writing through an immutable declaration is a question for
//! the permission engine, not a malformed program.

#include "borrow/program.hpp"

#include "log/log.hpp"

#include <type_traits>
#include <unordered_map>

namespace sbc::borrow {

namespace {

/// What the verifier knows about a bound name.
struct Binding {
    std::string allocation;

    /// True for the name bound by `declare` itself.
    bool is_root = false;
};

class Verifier {
public:
    explicit Verifier(const Program& program) : program_(program) {}

    auto run() -> std::vector<TraceError> {
        for (size_t i = 0; i < program_.instructions.size(); ++i) {
            index_ = i;
            location_ = program_.instructions[i].location;
            std::visit([this](const auto& op) { check(op); }, program_.instructions[i].op);
        }
        return std::move(errors_);
    }

private:
    const Program& program_;
    std::unordered_map<std::string, Binding> bindings_;
    std::vector<TraceError> errors_;
    size_t index_ = 0;
    SourceLocation location_;

    void error(TraceErrorCode code, std::string message) {
        errors_.push_back(TraceError{code, index_, location_, std::move(message)});
    }

    auto lookup(const std::string& name) -> const Binding* {
        auto it = bindings_.find(name);
        if (it == bindings_.end()) {
            errors_.push_back(TraceError::unknown_pointer(name, index_, location_));
            return nullptr;
        }
        return &it->second;
    }

    void bind(const std::string& name, Binding binding) {
        if (bindings_.contains(name)) {
            error(TraceErrorCode::DuplicateName, "`" + name + "` is already bound");
            return;
        }
        bindings_.emplace(name, std::move(binding));
    }

    void check(const DeclareOp& op) {
        bind(op.name, Binding{op.name, true});
    }

    void check(const BorrowOp& op) {
        auto it = bindings_.find(op.allocation);
        if (it == bindings_.end() || !it->second.is_root) {
            errors_.push_back(TraceError::invalid_allocation(op.allocation, index_, location_));
            return;
        }
        bind(op.dest, Binding{it->second.allocation, false});
    }

    void check(const ReborrowOp& op) {
        const Binding* source = lookup(op.source);
        if (!source) {
            return;
        }
        bind(op.dest, Binding{source->allocation, false});
    }

    void check(const CastToIntegerOp& op) {
        const Binding* source = lookup(op.source);
        if (!source) {
            return;
        }
        bind(op.dest, Binding{source->allocation, false});
    }

    void check(const ReadOp& op) {
        (void)lookup(op.source);
    }

    void check(const WriteOp& op) {
        (void)lookup(op.target);
    }

    void check(const ExternalCallOp& op) {
        (void)lookup(op.target);
    }
};

} // namespace

auto verify_program(const Program& program) -> Result<bool, std::vector<TraceError>> {
    auto errors = Verifier(program).run();
    if (!errors.empty()) {
        SBC_LOG_DEBUG("borrow", "`" << program.name << "` failed verification with "
                                    << errors.size() << " error(s)");
        return errors;
    }
    return true;
}

} // namespace sbc::borrow
