//! # Permission Engine
//!
//! The rule core of the checker: how a new borrow's permission is derived
//! from its parent, and whether an access through a pointer is allowed by the
//! current borrow stack.
//!
//! ## Deriving a borrow
//!
//! | Parent permission          | Kind   | Interior-mutable | New permission  |
//! |----------------------------|--------|------------------|-----------------|
//! | SharedReadOnly             | any    | any              | SharedReadOnly  |
//! | Unique / SharedReadWrite   | Unique | any              | Unique          |
//! | Unique / SharedReadWrite   | Shared | no               | SharedReadOnly  |
//! | Unique / SharedReadWrite   | Shared | yes              | SharedReadWrite |
//!
//! A cast can never gain permission: a shared reference cast to a `*mut`
//! pointer still only reads.
//!
//! ## Validating an access
//!
//! ```text
//! validate(ptr, Read | Write)
//!   1. untagged pointer                          -> UntaggedAccess
//!   2. tag not on the stack                      -> TagNotFound
//!      a Unique frame above it that was not
//!      derived from it                           -> Disabled
//!   3. matched frame is Disabled                 -> Disabled
//!   4. Write through SharedReadOnly (no cell)    -> ReadOnlyViolation
//!   5. ok: Write pops every non-SharedReadWrite frame above the match,
//!          Read disables the Unique descendants above it
//! ```
//!
//! The stack is only modified when the access succeeds.

#ifndef SBC_BORROW_PERMISSION_HPP
#define SBC_BORROW_PERMISSION_HPP

#include "borrow/memory.hpp"
#include "borrow/tag.hpp"
#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sbc::borrow {

/// The flavor of a new borrow.
enum class BorrowKind {
    Unique, ///< `&mut x`, or a cast of a mutable reference to `*mut`
    Shared, ///< `&x`, or a cast to a `*const` pointer
};

enum class AccessKind {
    Read,
    Write,
};

/// The aliasing rule an operation broke.
enum class Rule {
    UntaggedAccess,    ///< SB001: access through a pointer whose provenance was erased
    TagNotFound,       ///< SB002: the tag was popped by an earlier access
    Disabled,          ///< SB003: the tag is disabled, or a foreign Unique frame sits above it
    ReadOnlyViolation, ///< SB004: write through a SharedReadOnly frame
};

[[nodiscard]] auto borrow_kind_name(BorrowKind kind) -> const char*;
[[nodiscard]] auto access_kind_name(AccessKind kind) -> const char*;

/// Returns the rule's name, e.g. "TagNotFound".
[[nodiscard]] auto rule_name(Rule rule) -> const char*;

/// Returns the rule's diagnostic code, e.g. "SB002".
[[nodiscard]] auto rule_code(Rule rule) -> const char*;

/// Parses a rule from its name or its code. Case-sensitive.
[[nodiscard]] auto parse_rule(std::string_view text) -> std::optional<Rule>;

/// A reference or raw pointer value.
struct Pointer {
    AllocationId target = 0;

    /// Empty for pointers rebuilt from an integer.
    std::optional<BorrowTag> tag;

    [[nodiscard]] auto is_untagged() const -> bool {
        return !tag.has_value();
    }
};

/// A rejected access or retag.
struct AccessError {
    Rule rule = Rule::TagNotFound;

    /// The tag the operation used, if any.
    std::optional<BorrowTag> tag;

    /// For conflicts: the foreign Unique frame that blocked the access.
    std::optional<BorrowTag> conflicting;

    std::string message;
};

/// What a successful access did to the stack.
struct AccessEffect {
    std::vector<BorrowTag> popped;
    std::vector<BorrowTag> disabled;
};

/// Permission of the frame `declare` pushes.
[[nodiscard]] auto root_permission(bool interior_mutable) -> Permission;

/// Permission of a borrow of `kind` derived from a frame with `parent`.
[[nodiscard]] auto derive(Permission parent, BorrowKind kind, bool interior_mutable) -> Permission;

/// Builds the frame for a new borrow derived from `parent`.
///
/// Retagging is not an access: the parent must still be live (on the stack
/// and not Disabled) but nothing is popped or disabled. An untagged parent
/// yields `nullopt`: the new pointer stays untagged and owns no frame.
/// The caller pushes the returned frame.
[[nodiscard]] auto retag(const Allocation& alloc, const Pointer& parent, BorrowKind kind,
                         BorrowTag new_tag, size_t at) -> Result<std::optional<Frame>, AccessError>;

/// Checks an access through `ptr` and, when allowed, applies its effect on
/// the borrow stack.
[[nodiscard]] auto validate(Allocation& alloc, const Pointer& ptr, AccessKind access)
    -> Result<AccessEffect, AccessError>;

} // namespace sbc::borrow

#endif // SBC_BORROW_PERMISSION_HPP
