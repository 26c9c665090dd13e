//! # Explain Command Entry Point
//!
//! Implements `sbcheck explain <code>`.
//!
//! The explanation database is split across category files:
//! - `rule_errors.cpp`    SB001-SB004
//! - `verify_errors.cpp`  V001-V003
//! - `parser_errors.cpp`  P001-P005
//! - `general_errors.cpp` E001-E002

#include "cli/commands/cmd_explain.hpp"
#include "cli/diagnostic.hpp"
#include "cli/explain/explain_internal.hpp"

#include <cctype>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace sbc::cli {

// ============================================================================
// Merged explanation database
// ============================================================================

static const std::unordered_map<std::string, std::string>& get_all_explanations() {
    static const std::unordered_map<std::string, std::string> merged = [] {
        std::unordered_map<std::string, std::string> all;
        for (const auto* db :
             {&explain::get_rule_explanations(), &explain::get_verify_explanations(),
              &explain::get_parser_explanations(), &explain::get_general_explanations()}) {
            all.insert(db->begin(), db->end());
        }
        return all;
    }();
    return merged;
}

std::string normalize_code(const std::string& code) {
    std::string upper;
    for (char c : code) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isspace(uc)) {
            upper += static_cast<char>(std::toupper(uc));
        }
    }

    // Pad "SB4" to "SB004"; anything not shaped like letters+digits is left as is.
    size_t digits_at = upper.find_first_of("0123456789");
    if (digits_at == std::string::npos || digits_at == 0 ||
        upper.find_first_not_of("0123456789", digits_at) != std::string::npos) {
        return upper;
    }
    size_t digit_count = upper.size() - digits_at;
    if (digit_count < 3) {
        upper.insert(digits_at, 3 - digit_count, '0');
    }
    return upper;
}

std::optional<std::string> find_explanation(const std::string& code) {
    const auto& explanations = get_all_explanations();
    auto it = explanations.find(normalize_code(code));
    if (it == explanations.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// run_explain implementation
// ============================================================================

int run_explain(const std::string& code, std::ostream& out, std::ostream& err) {
    std::string normalized = normalize_code(code);

    if (normalized.empty()) {
        err << "Usage: sbcheck explain <code>\n";
        err << "Example: sbcheck explain SB004\n";
        return 1;
    }

    if (auto text = find_explanation(normalized)) {
        bool colors = ToolOptions::color && terminal_supports_colors(out);
        if (colors) {
            out << Colors::Bold << Colors::BrightCyan;
        }
        out << "Explanation for " << normalized;
        if (colors) {
            out << Colors::Reset;
        }
        out << "\n" << *text;
        if (!text->empty() && text->back() != '\n') {
            out << "\n";
        }
        return 0;
    }

    err << "No explanation available for code `" << normalized << "`.\n\n";

    std::vector<std::string> known_codes;
    for (const auto& [key, _] : get_all_explanations()) {
        known_codes.push_back(key);
    }

    auto suggestions = find_similar_candidates(normalized, known_codes, 3, 2);
    if (!suggestions.empty()) {
        err << "Did you mean:\n";
        for (const auto& suggestion : suggestions) {
            err << "  sbcheck explain " << suggestion << "\n";
        }
        err << "\n";
    }

    err << "Available code categories:\n";
    err << "  SB001-SB004  Aliasing rule violations\n";
    err << "  V001-V003    Malformed programs\n";
    err << "  P001-P005    Trace syntax errors\n";
    err << "  E001-E002    File and expectation errors\n";

    return 1;
}

} // namespace sbc::cli
