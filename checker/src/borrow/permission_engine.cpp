//! # Permission Engine Implementation
//!
//! Every decision here is a `switch` over the closed `Permission` and
//! `BorrowKind` enums, so adding a permission forces every rule to be
//! revisited.
//!
//! ## What an access does to frames above the match
//!
//! | Frame above     | Read                    | Write |
//! |-----------------|-------------------------|-------|
//! | Unique (own)    | demoted to Disabled     | popped |
//! | Unique (other)  | error: Disabled         | error: Disabled |
//! | SharedReadWrite | kept                    | kept  |
//! | SharedReadOnly  | kept                    | popped |
//! | Disabled        | kept                    | popped |
//!
//! "Own" means derived from the accessing tag, directly or through any chain
//! of reborrows. An access through a parent legitimately ends the children it
//! handed out; an access that finds an unrelated Unique frame above itself
//! means two mutable borrows were live at once.

#include "borrow/permission.hpp"

#include "log/log.hpp"

#include <sstream>

namespace sbc::borrow {

auto borrow_kind_name(BorrowKind kind) -> const char* {
    switch (kind) {
    case BorrowKind::Unique:
        return "unique";
    case BorrowKind::Shared:
        return "shared";
    }
    return "?";
}

auto access_kind_name(AccessKind kind) -> const char* {
    switch (kind) {
    case AccessKind::Read:
        return "read";
    case AccessKind::Write:
        return "write";
    }
    return "?";
}

auto rule_name(Rule rule) -> const char* {
    switch (rule) {
    case Rule::UntaggedAccess:
        return "UntaggedAccess";
    case Rule::TagNotFound:
        return "TagNotFound";
    case Rule::Disabled:
        return "Disabled";
    case Rule::ReadOnlyViolation:
        return "ReadOnlyViolation";
    }
    return "?";
}

auto rule_code(Rule rule) -> const char* {
    switch (rule) {
    case Rule::UntaggedAccess:
        return "SB001";
    case Rule::TagNotFound:
        return "SB002";
    case Rule::Disabled:
        return "SB003";
    case Rule::ReadOnlyViolation:
        return "SB004";
    }
    return "SB000";
}

auto parse_rule(std::string_view text) -> std::optional<Rule> {
    for (auto rule : {Rule::UntaggedAccess, Rule::TagNotFound, Rule::Disabled,
                      Rule::ReadOnlyViolation}) {
        if (text == rule_name(rule) || text == rule_code(rule)) {
            return rule;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Derivation
// ============================================================================

auto root_permission(bool interior_mutable) -> Permission {
    return interior_mutable ? Permission::SharedReadWrite : Permission::Unique;
}

auto derive(Permission parent, BorrowKind kind, bool interior_mutable) -> Permission {
    switch (parent) {
    case Permission::SharedReadOnly:
        return Permission::SharedReadOnly;
    case Permission::Disabled:
        return Permission::Disabled;
    case Permission::Unique:
    case Permission::SharedReadWrite:
        break;
    }

    switch (kind) {
    case BorrowKind::Unique:
        return Permission::Unique;
    case BorrowKind::Shared:
        return interior_mutable ? Permission::SharedReadWrite : Permission::SharedReadOnly;
    }
    return Permission::Disabled;
}

// ============================================================================
// Error Construction
// ============================================================================

static auto tag_text(const std::optional<BorrowTag>& tag) -> std::string {
    return tag ? tag->to_string() : std::string("<untagged>");
}

static auto make_error(Rule rule, const Allocation& alloc, std::string_view action,
                       const std::optional<BorrowTag>& tag, const std::string& reason,
                       std::optional<BorrowTag> conflicting = std::nullopt) -> AccessError {
    std::ostringstream msg;
    msg << "attempting a " << action << " using " << tag_text(tag) << " at `" << alloc.name
        << "`, but " << reason;

    SBC_LOG_DEBUG("borrow", rule_name(rule) << ": " << msg.str());
    return AccessError{rule, tag, conflicting, msg.str()};
}

// ============================================================================
// Retag
// ============================================================================

auto retag(const Allocation& alloc, const Pointer& parent, BorrowKind kind, BorrowTag new_tag,
           size_t at) -> Result<std::optional<Frame>, AccessError> {
    std::string action = std::string(borrow_kind_name(kind)) + " reborrow";

    if (parent.is_untagged()) {
        // Nothing to derive from; the result is as untagged as its parent.
        return std::optional<Frame>{};
    }

    auto found = alloc.find_frame(*parent.tag);
    if (!found) {
        return make_error(Rule::TagNotFound, alloc, action, parent.tag,
                          "that tag does not exist in the borrow stack");
    }

    const Frame& source = alloc.stack[*found];
    if (source.permission == Permission::Disabled) {
        return make_error(Rule::Disabled, alloc, action, parent.tag,
                          "that tag has been disabled");
    }

    Frame frame{new_tag, derive(source.permission, kind, alloc.interior_mutable), parent.tag, at};
    SBC_LOG_TRACE("borrow", "retag " << *parent.tag << " -> " << new_tag << " ("
                                     << borrow_kind_name(kind) << ", "
                                     << permission_name(frame.permission) << ")");
    return std::optional<Frame>{frame};
}

// ============================================================================
// Access Validation
// ============================================================================

namespace {

enum class Fate { Keep, Pop, Disable };

/// What a successful read does to a frame sitting above the matched one.
auto fate_on_read(Permission above) -> Fate {
    switch (above) {
    case Permission::Unique:
        return Fate::Disable;
    case Permission::SharedReadWrite:
    case Permission::SharedReadOnly:
    case Permission::Disabled:
        return Fate::Keep;
    }
    return Fate::Keep;
}

/// What a successful write does to a frame sitting above the matched one.
auto fate_on_write(Permission above) -> Fate {
    switch (above) {
    case Permission::SharedReadWrite:
        return Fate::Keep;
    case Permission::Unique:
    case Permission::SharedReadOnly:
    case Permission::Disabled:
        return Fate::Pop;
    }
    return Fate::Pop;
}

} // namespace

auto validate(Allocation& alloc, const Pointer& ptr, AccessKind access)
    -> Result<AccessEffect, AccessError> {
    std::string action = std::string(access_kind_name(access)) + " access";

    // 1. Provenance erased by an integer round-trip.
    if (ptr.is_untagged()) {
        return make_error(Rule::UntaggedAccess, alloc, action, ptr.tag,
                          "no item grants this access to an untagged pointer");
    }
    BorrowTag tag = *ptr.tag;

    // 2. Locate the tag and look at everything stacked on top of it.
    auto found = alloc.find_frame(tag);
    if (!found) {
        return make_error(Rule::TagNotFound, alloc, action, ptr.tag,
                          "that tag does not exist in the borrow stack");
    }
    size_t depth = *found;

    for (size_t i = depth + 1; i < alloc.stack.size(); ++i) {
        const Frame& above = alloc.stack[i];
        if (above.permission == Permission::Unique && !alloc.is_derived_from(above.tag, tag)) {
            return make_error(Rule::Disabled, alloc, action, ptr.tag,
                              above.tag.to_string() +
                                  " above it holds Unique access that was not derived from it",
                              above.tag);
        }
    }

    const Frame& matched = alloc.stack[depth];

    // 3. The frame itself may have been disabled by an earlier read of a parent.
    if (matched.permission == Permission::Disabled) {
        return make_error(Rule::Disabled, alloc, action, ptr.tag, "that tag has been disabled");
    }

    // 4. Read-only frames never write, unless the location is a cell.
    if (access == AccessKind::Write && matched.permission == Permission::SharedReadOnly &&
        !alloc.interior_mutable) {
        return make_error(Rule::ReadOnlyViolation, alloc, action, ptr.tag,
                          "that tag only grants SharedReadOnly permission");
    }

    // 5. Allowed: commit the effect on the frames above the match.
    AccessEffect effect;
    std::vector<Frame> kept(alloc.stack.begin(), alloc.stack.begin() + depth + 1);

    for (size_t i = depth + 1; i < alloc.stack.size(); ++i) {
        Frame frame = alloc.stack[i];
        Fate fate = access == AccessKind::Read ? fate_on_read(frame.permission)
                                               : fate_on_write(frame.permission);
        switch (fate) {
        case Fate::Keep:
            kept.push_back(frame);
            break;
        case Fate::Disable:
            frame.permission = Permission::Disabled;
            effect.disabled.push_back(frame.tag);
            kept.push_back(frame);
            SBC_LOG_TRACE("borrow", "disable " << frame.tag << " on `" << alloc.name << "`");
            break;
        case Fate::Pop:
            effect.popped.push_back(frame.tag);
            SBC_LOG_TRACE("borrow", "pop " << frame.tag << " from `" << alloc.name << "`");
            break;
        }
    }

    alloc.stack = std::move(kept);
    return effect;
}

} // namespace sbc::borrow
