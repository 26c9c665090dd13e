#include "borrow/tag.hpp"

#include <ostream>

namespace sbc::borrow {

auto BorrowTag::to_string() const -> std::string {
    return "<" + std::to_string(value) + ">";
}

auto operator<<(std::ostream& out, const BorrowTag& tag) -> std::ostream& {
    return out << '<' << tag.value << '>';
}

auto TagAllocator::next() -> BorrowTag {
    return BorrowTag{next_value_++};
}

} // namespace sbc::borrow
