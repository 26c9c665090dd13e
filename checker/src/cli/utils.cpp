#include "cli/utils.hpp"

#include "common.hpp"

#include <charconv>
#include <iostream>

namespace sbc::cli {

void print_usage() {
    std::cout << "sbcheck " << VERSION << ": borrow-stack aliasing checker\n\n";
    std::cout << "Usage: sbcheck <command> [options] [files]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  check     Run trace files and report aliasing violations\n";
    std::cout << "  explain   Show the long explanation of a diagnostic code\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h        Show this help\n";
    std::cout << "  --version, -V     Show version\n";
    std::cout << "  -v, -vv, -vvv     Log info, debug or trace messages to stderr\n";
    std::cout << "  -q, --quiet       Only log errors\n";
    std::cout << "  --log-level=<l>   trace, debug, info, warn, error, fatal or off\n";
    std::cout << "  --log-filter=<f>  Per-module levels, e.g. borrow=trace,*=warn\n";
    std::cout << "  --log-file=<p>    Also write log records to a file\n";
    std::cout << "  --log-format=<f>  text or json\n";
    std::cout << "\nThe SBC_LOG environment variable is read when no log flag is given.\n";
}

void print_check_usage() {
    std::cerr << "Usage: sbcheck check <file.trace>... [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --format=<f>        Diagnostic format: text (default) or json\n";
    std::cerr << "  --no-color          Disable ANSI colors\n";
    std::cerr << "  --dump-stack        Show the borrow stack of the faulting allocation\n";
    std::cerr << "  --call-value=<n>    Value written by `call p` without a value (default 1)\n";
    std::cerr << "  --verbose, -v       Show reads and final values\n";
}

void print_version() {
    std::cout << "sbcheck " << VERSION << "\n";
}

std::optional<int64_t> parse_int_flag(const std::string& text) {
    int64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace sbc::cli
