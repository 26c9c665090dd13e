//! # Memory Store Implementation
//!
//! Allocations live in a vector indexed by `AllocationId`; names map to the
//! most recently declared id. Nothing here checks permissions.

#include "borrow/memory.hpp"

#include "log/log.hpp"

namespace sbc::borrow {

auto permission_name(Permission permission) -> const char* {
    switch (permission) {
    case Permission::Unique:
        return "Unique";
    case Permission::SharedReadWrite:
        return "SharedReadWrite";
    case Permission::SharedReadOnly:
        return "SharedReadOnly";
    case Permission::Disabled:
        return "Disabled";
    }
    return "?";
}

auto mutability_name(Mutability mutability) -> const char* {
    switch (mutability) {
    case Mutability::Immutable:
        return "immutable";
    case Mutability::Mutable:
        return "mutable";
    case Mutability::InteriorMutable:
        return "interior-mutable";
    }
    return "?";
}

// ============================================================================
// Allocation
// ============================================================================

auto Allocation::find_frame(BorrowTag tag) const -> std::optional<size_t> {
    for (size_t i = stack.size(); i > 0; --i) {
        if (stack[i - 1].tag == tag) {
            return i - 1;
        }
    }
    return std::nullopt;
}

auto Allocation::is_derived_from(BorrowTag tag, BorrowTag ancestor) const -> bool {
    auto it = lineage.find(tag.value);
    while (it != lineage.end()) {
        if (it->second == ancestor) {
            return true;
        }
        it = lineage.find(it->second.value);
    }
    return false;
}

auto StoreError::invalid_allocation(AllocationId id) -> StoreError {
    return StoreError{StoreErrorCode::InvalidAllocation, id,
                      "no allocation with id " + std::to_string(id)};
}

// ============================================================================
// MemoryStore
// ============================================================================

auto MemoryStore::declare(std::string name, Scalar value, Mutability mutability, Frame root)
    -> AllocationId {
    auto id = static_cast<AllocationId>(allocations_.size());

    Allocation alloc;
    alloc.name = std::move(name);
    alloc.value = value;
    alloc.mutability = mutability;
    alloc.interior_mutable = mutability == Mutability::InteriorMutable;
    alloc.root = root.tag;
    alloc.stack.push_back(root);

    SBC_LOG_TRACE("borrow", "declare `" << alloc.name << "` as #" << id << " ("
                                        << mutability_name(mutability) << ", value " << value
                                        << ", root " << root.tag << " "
                                        << permission_name(root.permission) << ")");

    by_name_[alloc.name] = id;
    allocations_.push_back(std::move(alloc));
    return id;
}

auto MemoryStore::find(std::string_view name) const -> std::optional<AllocationId> {
    auto it = by_name_.find(std::string(name));
    if (it == by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto MemoryStore::get(AllocationId id) const -> Result<const Allocation*, StoreError> {
    if (id >= allocations_.size()) {
        return StoreError::invalid_allocation(id);
    }
    return &allocations_[id];
}

auto MemoryStore::get_mut(AllocationId id) -> Result<Allocation*, StoreError> {
    if (id >= allocations_.size()) {
        return StoreError::invalid_allocation(id);
    }
    return &allocations_[id];
}

auto MemoryStore::push_frame(AllocationId id, Frame frame) -> Result<bool, StoreError> {
    if (id >= allocations_.size()) {
        return StoreError::invalid_allocation(id);
    }
    auto& alloc = allocations_[id];
    if (frame.parent) {
        alloc.lineage[frame.tag.value] = *frame.parent;
    }
    SBC_LOG_TRACE("borrow", "push " << frame.tag << " " << permission_name(frame.permission)
                                    << " on `" << alloc.name << "` (depth "
                                    << alloc.stack.size() << ")");
    alloc.stack.push_back(frame);
    return true;
}

auto MemoryStore::value_read(AllocationId id) const -> Result<Scalar, StoreError> {
    if (id >= allocations_.size()) {
        return StoreError::invalid_allocation(id);
    }
    return allocations_[id].value;
}

auto MemoryStore::value_write(AllocationId id, Scalar value) -> Result<bool, StoreError> {
    if (id >= allocations_.size()) {
        return StoreError::invalid_allocation(id);
    }
    allocations_[id].value = value;
    return true;
}

} // namespace sbc::borrow
