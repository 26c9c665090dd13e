//! # Memory Store
//!
//! The memory store is an arena of allocations. Each allocation owns a scalar
//! value and a **borrow stack**: the ordered list of frames (tag + permission)
//! that are currently allowed to access it, most recent on top.
//!
//! ```text
//! Allocation `x` (mutable, value 2)
//!   top    <3> SharedReadOnly   parent <2>
//!          <2> Unique           parent <1>
//!   bottom <1> Unique           (root, created by declare)
//! ```
//!
//! The store is a plain container. It never decides whether an access is
//! allowed; that is the permission engine's job (`borrow/permission.hpp`).
//! Its only failure mode is an unknown allocation id.

#ifndef SBC_BORROW_MEMORY_HPP
#define SBC_BORROW_MEMORY_HPP

#include "borrow/tag.hpp"
#include "common.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sbc::borrow {

/// Index of an allocation inside its store.
using AllocationId = uint32_t;

/// The value held by an allocation.
using Scalar = int64_t;

/// What a frame on the borrow stack is allowed to do.
enum class Permission {
    Unique,          ///< Exclusive read/write (mutable references, `*mut` casts of them)
    SharedReadWrite, ///< Shared, but writes allowed (interior mutability)
    SharedReadOnly,  ///< Shared, reads only
    Disabled,        ///< Still on the stack but no longer grants anything
};

/// Returns the name of a permission, e.g. "SharedReadOnly".
[[nodiscard]] auto permission_name(Permission permission) -> const char*;

/// How a variable was declared.
enum class Mutability {
    Immutable,       ///< `let x`
    Mutable,         ///< `let mut x`
    InteriorMutable, ///< `let x = Cell::new(..)`
};

[[nodiscard]] auto mutability_name(Mutability mutability) -> const char*;

/// One entry on a borrow stack.
struct Frame {
    BorrowTag tag;
    Permission permission;

    /// The tag this frame was derived from; empty for the root frame.
    std::optional<BorrowTag> parent;

    /// Index of the instruction that pushed the frame.
    size_t created_at = 0;
};

/// A named memory location with its borrow stack.
struct Allocation {
    std::string name;
    Scalar value = 0;
    Mutability mutability = Mutability::Mutable;

    /// Fixed at declaration; enables writes through shared borrows.
    bool interior_mutable = false;

    /// Tag of the frame pushed by `declare`.
    BorrowTag root;

    /// Borrow stack, `stack.back()` is the top.
    std::vector<Frame> stack;

    /// Parent of every tag ever pushed on this allocation, including popped
    /// ones. Lets descendants be recognised after an intermediate frame is
    /// gone.
    std::unordered_map<uint64_t, BorrowTag> lineage;

    /// Finds the topmost frame carrying `tag`.
    [[nodiscard]] auto find_frame(BorrowTag tag) const -> std::optional<size_t>;

    /// True if `tag` was derived from `ancestor`, directly or transitively.
    /// A tag is not its own descendant.
    [[nodiscard]] auto is_derived_from(BorrowTag tag, BorrowTag ancestor) const -> bool;
};

/// Error codes reported by the store.
enum class StoreErrorCode {
    InvalidAllocation, ///< The id does not name an allocation in this store
};

struct StoreError {
    StoreErrorCode code = StoreErrorCode::InvalidAllocation;
    AllocationId id = 0;
    std::string message;

    static auto invalid_allocation(AllocationId id) -> StoreError;
};

/// Arena of allocations. Ids are dense indices in declaration order.
class MemoryStore {
public:
    MemoryStore() = default;

    /// Creates an allocation whose stack holds only `root`.
    auto declare(std::string name, Scalar value, Mutability mutability, Frame root)
        -> AllocationId;

    /// Looks up the most recent allocation with this name.
    [[nodiscard]] auto find(std::string_view name) const -> std::optional<AllocationId>;

    [[nodiscard]] auto get(AllocationId id) const -> Result<const Allocation*, StoreError>;

    [[nodiscard]] auto get_mut(AllocationId id) -> Result<Allocation*, StoreError>;

    /// Pushes a frame on top of the allocation's stack and records its parent.
    auto push_frame(AllocationId id, Frame frame) -> Result<bool, StoreError>;

    [[nodiscard]] auto value_read(AllocationId id) const -> Result<Scalar, StoreError>;

    auto value_write(AllocationId id, Scalar value) -> Result<bool, StoreError>;

    [[nodiscard]] auto size() const -> size_t {
        return allocations_.size();
    }

    [[nodiscard]] auto allocations() const -> const std::vector<Allocation>& {
        return allocations_;
    }

private:
    std::vector<Allocation> allocations_;
    std::unordered_map<std::string, AllocationId> by_name_;
};

} // namespace sbc::borrow

#endif // SBC_BORROW_MEMORY_HPP
