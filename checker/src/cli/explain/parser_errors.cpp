//! # Parser Error Explanations
//!
//! Error codes P001-P005 for `.trace` syntax errors.

#include "cli/explain/explain_internal.hpp"

namespace sbc::cli::explain {

const std::unordered_map<std::string, std::string>& get_parser_explanations() {
    static const std::unordered_map<std::string, std::string> db = {

        {"P001", R"EX(
Unexpected token [P001]

A token appeared where the grammar expects something else, for example a
keyword used as a name or extra words at the end of a line.

Example of erroneous trace:

    declare mut read = 1        # `read` is a keyword
    read x extra                # trailing token
)EX"},

        {"P002", R"EX(
Missing operand [P002]

An instruction ended before all of its operands were given.

Example of erroneous trace:

    write p                     # missing value
    q = reborrow unique         # missing source pointer
)EX"},

        {"P003", R"EX(
Invalid integer [P003]

A value is not a decimal 64-bit signed integer.

Example of erroneous trace:

    declare mut x = 0x10        # hex is not accepted
    write p 99999999999999999999
)EX"},

        {"P004", R"EX(
Unknown instruction [P004]

The line does not start with a known instruction. Valid instructions are
`declare`, `borrow`, `reborrow`, `cast_int`, `read`, `write`, `call` and
the `expect` directive.

Example of erroneous trace:

    free p                      # not an instruction
    q = copy p                  # not an instruction
)EX"},

        {"P005", R"EX(
Duplicate expect [P005]

A trace may contain at most one `expect` directive.

Example of erroneous trace:

    expect sound
    expect violation Disabled
)EX"},
    };
    return db;
}

} // namespace sbc::cli::explain
