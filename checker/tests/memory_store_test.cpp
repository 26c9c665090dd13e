//! # Memory Store Tests

#include "borrow/memory.hpp"

#include <gtest/gtest.h>

using namespace sbc;
using namespace sbc::borrow;

class MemoryStoreTest : public ::testing::Test {
protected:
    MemoryStore store;

    static auto root(uint64_t tag, Permission permission = Permission::Unique) -> Frame {
        return Frame{BorrowTag{tag}, permission, std::nullopt, 0};
    }
};

TEST_F(MemoryStoreTest, DeclareCreatesSingleFrameStack) {
    AllocationId id = store.declare("x", 2, Mutability::Mutable, root(1));

    auto alloc = store.get(id);
    ASSERT_TRUE(is_ok(alloc));
    const Allocation& a = *unwrap(alloc);
    EXPECT_EQ(a.name, "x");
    EXPECT_EQ(a.value, 2);
    EXPECT_EQ(a.root, BorrowTag{1});
    EXPECT_FALSE(a.interior_mutable);
    ASSERT_EQ(a.stack.size(), 1u);
    EXPECT_EQ(a.stack[0].permission, Permission::Unique);
}

TEST_F(MemoryStoreTest, IdsAreDenseInDeclarationOrder) {
    EXPECT_EQ(store.declare("x", 0, Mutability::Mutable, root(1)), 0u);
    EXPECT_EQ(store.declare("y", 0, Mutability::Immutable, root(2)), 1u);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.find("y"), std::optional<AllocationId>(1));
    EXPECT_FALSE(store.find("z").has_value());
}

TEST_F(MemoryStoreTest, CellIsInteriorMutable) {
    AllocationId id =
        store.declare("c", 0, Mutability::InteriorMutable, root(1, Permission::SharedReadWrite));
    EXPECT_TRUE(unwrap(store.get(id))->interior_mutable);
}

TEST_F(MemoryStoreTest, ValueReadWrite) {
    AllocationId id = store.declare("x", 2, Mutability::Mutable, root(1));
    ASSERT_TRUE(is_ok(store.value_write(id, 9)));

    auto value = store.value_read(id);
    ASSERT_TRUE(is_ok(value));
    EXPECT_EQ(unwrap(value), 9);
}

TEST_F(MemoryStoreTest, InvalidIdIsAnError) {
    store.declare("x", 2, Mutability::Mutable, root(1));

    auto alloc = store.get(5);
    ASSERT_TRUE(is_err(alloc));
    EXPECT_EQ(unwrap_err(alloc).code, StoreErrorCode::InvalidAllocation);
    EXPECT_EQ(unwrap_err(alloc).id, 5u);

    EXPECT_TRUE(is_err(store.get_mut(5)));
    EXPECT_TRUE(is_err(store.value_read(5)));
    EXPECT_TRUE(is_err(store.value_write(5, 1)));
    EXPECT_TRUE(is_err(store.push_frame(5, root(2))));
}

TEST_F(MemoryStoreTest, PushFrameRecordsLineage) {
    AllocationId id = store.declare("x", 0, Mutability::Mutable, root(1));
    ASSERT_TRUE(is_ok(store.push_frame(id, Frame{BorrowTag{2}, Permission::Unique, BorrowTag{1}, 1})));
    ASSERT_TRUE(
        is_ok(store.push_frame(id, Frame{BorrowTag{3}, Permission::SharedReadOnly, BorrowTag{2}, 2})));

    const Allocation& a = *unwrap(store.get(id));
    ASSERT_EQ(a.stack.size(), 3u);
    EXPECT_EQ(a.stack.back().tag, BorrowTag{3});

    EXPECT_TRUE(a.is_derived_from(BorrowTag{3}, BorrowTag{1}));
    EXPECT_TRUE(a.is_derived_from(BorrowTag{2}, BorrowTag{1}));
    EXPECT_FALSE(a.is_derived_from(BorrowTag{1}, BorrowTag{2}));
    EXPECT_FALSE(a.is_derived_from(BorrowTag{2}, BorrowTag{2}));
}

TEST_F(MemoryStoreTest, FindFrameReturnsTopmostMatch) {
    AllocationId id = store.declare("x", 0, Mutability::Mutable, root(1));
    ASSERT_TRUE(is_ok(store.push_frame(id, Frame{BorrowTag{2}, Permission::Unique, BorrowTag{1}, 1})));

    const Allocation& a = *unwrap(store.get(id));
    EXPECT_EQ(a.find_frame(BorrowTag{2}), std::optional<size_t>(1));
    EXPECT_EQ(a.find_frame(BorrowTag{1}), std::optional<size_t>(0));
    EXPECT_FALSE(a.find_frame(BorrowTag{9}).has_value());
}

TEST(PermissionNameTest, Names) {
    EXPECT_STREQ(permission_name(Permission::SharedReadWrite), "SharedReadWrite");
    EXPECT_STREQ(permission_name(Permission::Disabled), "Disabled");
    EXPECT_STREQ(mutability_name(Mutability::InteriorMutable), "interior-mutable");
}
