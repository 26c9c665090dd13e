//! # Trace Sources
//!
//! Owns the text of a trace file and indexes its lines for the parser and
//! for source snippets in diagnostics.
//!
//! ```cpp
//! auto result = Source::from_file("aliasing.trace");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result) << "\n";
//!     return;
//! }
//! const Source& source = unwrap(result);
//! std::string_view first = source.line(1);
//! ```

#ifndef SBC_TRACE_SOURCE_HPP
#define SBC_TRACE_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sbc::trace {

/// A trace file held in memory with a line index.
///
/// Views returned by `content()` and `line()` stay valid as long as the
/// Source exists.
class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    /// Returns line `line_num` (1-based) without its line terminator, or an
    /// empty view when out of range.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Reads a file from disk. Returns an error message on failure.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace sbc::trace

#endif // SBC_TRACE_SOURCE_HPP
