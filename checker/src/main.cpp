//! # sbcheck Entry Point
//!
//! Delegates to the CLI driver, which handles argument parsing and command
//! dispatch.
//!
//! ```bash
//! sbcheck check examples/traces/*.trace   # Check trace files
//! sbcheck check bad.trace --dump-stack    # Show the borrow stack at the fault
//! sbcheck explain SB004                   # Explain a diagnostic code
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return sbc_main(argc, argv);
}
