//! # CLI Command Dispatcher
//!
//! Parses command-line arguments and routes to the command handlers.
//!
//! ```text
//! sbc_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ check          → run_check()
//!   └─ explain        → run_explain()
//! ```
//!
//! Logging flags (`-v`, `--log-*`, `SBC_LOG`) are read from the whole
//! argument list before dispatch, so they may appear anywhere.

#include "cli/commands/cmd_check.hpp"
#include "cli/commands/cmd_explain.hpp"
#include "cli/diagnostic.hpp"
#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

/// True for flags already consumed by `log::parse_log_options`.
bool is_log_flag(const std::string& arg) {
    if (arg.starts_with("--log-") || arg == "-q" || arg == "--quiet") {
        return true;
    }
    return arg == "-vv" || arg == "-vvv";
}

int dispatch_check(int argc, char* argv[]) {
    sbc::borrow::CheckOptions options;
    std::vector<std::string> files;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--format=json" || arg == "--error-format=json") {
            sbc::ToolOptions::diagnostic_format = sbc::DiagnosticFormat::JSON;
        } else if (arg == "--format=text") {
            sbc::ToolOptions::diagnostic_format = sbc::DiagnosticFormat::Text;
        } else if (arg == "--no-color") {
            sbc::ToolOptions::color = false;
        } else if (arg == "--dump-stack") {
            sbc::ToolOptions::dump_stack = true;
        } else if (arg == "--verbose" || arg == "-v") {
            sbc::ToolOptions::verbose = true;
        } else if (arg.starts_with("--call-value=")) {
            auto value = sbc::cli::parse_int_flag(arg.substr(13));
            if (!value) {
                std::cerr << "error: invalid value in `" << arg << "`\n";
                return sbc::cli::CHECK_ERROR;
            }
            options.external_call_value = *value;
        } else if (is_log_flag(arg)) {
            continue;
        } else if (arg.starts_with("-")) {
            std::cerr << "error: unknown option `" << arg << "`\n";
            sbc::cli::print_check_usage();
            return sbc::cli::CHECK_ERROR;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty()) {
        sbc::cli::print_check_usage();
        return sbc::cli::CHECK_ERROR;
    }

    // JSON consumers read a single stream.
    std::ostream& diag_out =
        sbc::ToolOptions::diagnostic_format == sbc::DiagnosticFormat::JSON ? std::cout : std::cerr;
    return sbc::cli::run_check(files, options, std::cout, diag_out);
}

} // namespace

/// Main entry point for the sbcheck CLI.
///
/// | Code | Meaning                                   |
/// |------|-------------------------------------------|
/// | 0    | Success                                   |
/// | 1    | Violation found, or unknown explain code  |
/// | 2    | Bad input: usage, I/O, parse, verification |
int sbc_main(int argc, char* argv[]) {
    if (argc < 2) {
        sbc::cli::print_usage();
        return 0;
    }

    auto log_config = sbc::log::parse_log_options(argc, argv);
    sbc::log::Logger::init(log_config);
    if (!log_config.colors) {
        sbc::ToolOptions::color = false;
    }

    std::string command = argv[1];
    SBC_LOG_DEBUG("cli", "command `" << command << "` with " << argc - 2 << " argument(s)");

    if (command == "--help" || command == "-h") {
        sbc::cli::print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        sbc::cli::print_version();
        return 0;
    }

    if (command == "check") {
        int result = dispatch_check(argc, argv);
        sbc::log::Logger::instance().flush();
        return result;
    }

    if (command == "explain") {
        if (argc < 3) {
            std::cerr << "Usage: sbcheck explain <code>\n";
            return 1;
        }
        return sbc::cli::run_explain(argv[2], std::cout, std::cerr);
    }

    std::cerr << "error: unknown command `" << command << "`\n";
    auto suggestions = sbc::cli::find_similar_candidates(command, {"check", "explain"}, 1, 3);
    if (!suggestions.empty()) {
        std::cerr << "  did you mean `" << suggestions.front() << "`?\n";
    }
    std::cerr << "Run `sbcheck --help` for usage.\n";
    return 2;
}
