//! # Borrow Tags
//!
//! Every reference or raw pointer created during a trace carries a *tag*, an
//! opaque identifier that names the frame it owns on an allocation's borrow
//! stack. Accesses authenticate by finding their tag on the stack.
//!
//! Tags are issued by a `TagAllocator`. Each interpreter owns its own
//! allocator, so independent traces never share state and a trace always
//! sees the same tag numbers no matter what ran before it.
//!
//! ```text
//! TagAllocator alloc;
//! alloc.next()  // <1>
//! alloc.next()  // <2>
//! ```

#ifndef SBC_BORROW_TAG_HPP
#define SBC_BORROW_TAG_HPP

#include <compare>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace sbc::borrow {

/// Opaque, totally ordered borrow identifier. Zero is never issued.
struct BorrowTag {
    uint64_t value = 0;

    auto operator<=>(const BorrowTag& other) const = default;

    /// Renders the tag as `<n>`.
    [[nodiscard]] auto to_string() const -> std::string;
};

auto operator<<(std::ostream& out, const BorrowTag& tag) -> std::ostream&;

/// Issues strictly increasing tags, starting at `<1>`.
class TagAllocator {
public:
    TagAllocator() = default;

    /// Returns a tag never returned before by this allocator.
    [[nodiscard]] auto next() -> BorrowTag;

    /// Number of tags handed out so far.
    [[nodiscard]] auto issued() const -> uint64_t {
        return next_value_ - 1;
    }

private:
    uint64_t next_value_ = 1;
};

} // namespace sbc::borrow

#endif // SBC_BORROW_TAG_HPP
