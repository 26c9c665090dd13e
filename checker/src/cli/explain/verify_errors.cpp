//! # Verification Error Explanations
//!
//! Error codes V001-V003. These are reported before anything runs and mean
//! the trace itself is malformed; they are never aliasing violations.

#include "cli/explain/explain_internal.hpp"

namespace sbc::cli::explain {

const std::unordered_map<std::string, std::string>& get_verify_explanations() {
    static const std::unordered_map<std::string, std::string> db = {

        {"V001", R"EX(
Invalid allocation [V001]

A `borrow` names something that is not a declared allocation. Only names
bound by `declare` can be borrowed; pointers are reborrowed instead.

Example of erroneous trace:

    declare mut x = 1
    p = borrow unique y         # error: `y` was never declared
    q = borrow shared p         # error: `p` is a pointer, use `reborrow`
)EX"},

        {"V002", R"EX(
Unknown pointer [V002]

An instruction uses a name that no earlier instruction bound.

Example of erroneous trace:

    declare mut x = 1
    read p                      # error: `p` is not bound yet
    p = borrow shared x
)EX"},

        {"V003", R"EX(
Duplicate name [V003]

A name is bound twice. Every `declare`, `borrow`, `reborrow` and
`cast_int` must introduce a fresh name.

Example of erroneous trace:

    declare mut x = 1
    p = borrow shared x
    p = borrow unique x         # error: `p` is already bound
)EX"},
    };
    return db;
}

} // namespace sbc::cli::explain
