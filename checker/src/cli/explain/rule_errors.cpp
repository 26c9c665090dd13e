//! # Aliasing Rule Explanations
//!
//! Error codes SB001-SB004, one per rule the permission engine enforces.

#include "cli/explain/explain_internal.hpp"

namespace sbc::cli::explain {

const std::unordered_map<std::string, std::string>& get_rule_explanations() {
    static const std::unordered_map<std::string, std::string> db = {

        {"SB001", R"EX(
Untagged access [SB001]

A pointer was used after its provenance was erased by a round-trip through
an integer. Such a pointer carries no tag, so no frame on the borrow stack
can authorise the access.

Example of erroneous trace:

    declare mut x = 2
    p = borrow unique x
    r = reborrow shared p
    i = cast_int r              # the address survives, the tag does not
    call i                      # error: untagged access

How to fix:

1. Keep the original pointer instead of rebuilding one from an integer:
       call p

2. If the integer round-trip is essential, derive the pointer again from
   a live borrow after converting back.

Related: SB004 (the same trace without the cast is a read-only violation)
)EX"},

        {"SB002", R"EX(
Tag not found [SB002]

The pointer's tag is no longer on the allocation's borrow stack. Tags are
popped when a write goes through a pointer further down the stack: the
write ends every borrow that was created on top of it.

Example of erroneous trace:

    declare mut x = 0
    p = borrow unique x
    q = reborrow shared p
    write p 1                   # pops q's tag
    read q                      # error: tag not found

How to fix:

1. Finish using `q` before writing through `p`:
       read q
       write p 1

2. Re-derive `q` after the write:
       write p 1
       q2 = reborrow shared p
       read q2
)EX"},

        {"SB003", R"EX(
Disabled tag [SB003]

Either the pointer's own frame was disabled, or a Unique frame that was
not derived from the pointer sits above it on the stack.

A frame is disabled when its parent is read: the parent reclaims the
location and the unique child may not be used again. A foreign Unique
frame above the pointer means two unique borrows of the same location
were live at the same time.

Example of erroneous trace:

    declare cell x = 0
    s = borrow shared x
    a = reborrow unique s
    b = reborrow unique s       # a second unique pointer next to `a`
    write b 5
    read a                      # error: `b` is unique and not derived from `a`

How to fix:

1. Derive the second pointer from the first:
       b = reborrow unique a

2. Stop using `a` once `b` exists.
)EX"},

        {"SB004", R"EX(
Read-only violation [SB004]

A write (or an external call, which is assumed to write) went through a
pointer whose frame only grants SharedReadOnly permission. Shared borrows
of a location without interior mutability never write, and a cast never
gains permission: a shared reference cast to a mutable raw pointer is
still read-only.

Example of erroneous trace:

    declare x = 2
    r = borrow shared x
    p = reborrow unique r       # still SharedReadOnly
    call p                      # error: read-only violation

How to fix:

1. Borrow uniquely from a mutable declaration:
       declare mut x = 2
       p = borrow unique x
       call p

2. Declare the location interior-mutable, so shared borrows may write:
       declare cell x = 2
       r = borrow shared x
       call r
)EX"},
    };
    return db;
}

} // namespace sbc::cli::explain
