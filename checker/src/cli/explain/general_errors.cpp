//! # General Error Explanations
//!
//! Error codes E001-E002.

#include "cli/explain/explain_internal.hpp"

namespace sbc::cli::explain {

const std::unordered_map<std::string, std::string>& get_general_explanations() {
    static const std::unordered_map<std::string, std::string> db = {

        {"E001", R"EX(
File not readable [E001]

The trace file does not exist or cannot be read.

How to fix:

1. Check the file path for typos
2. Paths are relative to the current directory
3. Check file permissions
)EX"},

        {"E002", R"EX(
Expectation not met [E002]

The trace carries an `expect` directive and the checker reached a
different verdict.

Example:

    declare mut x = 1
    p = borrow unique x
    read p
    expect violation            # error: the trace is sound

`expect violation` may name a rule (`Disabled` or `SB003`) and the index
of the faulting instruction (`at 4`, counting instructions from zero).
Parts left out match anything.
)EX"},
    };
    return db;
}

} // namespace sbc::cli::explain
