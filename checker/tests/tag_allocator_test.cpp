//! # Tag Allocator Tests

#include "borrow/tag.hpp"

#include <gtest/gtest.h>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

using namespace sbc::borrow;

TEST(TagAllocatorTest, StartsAtOne) {
    TagAllocator tags;
    EXPECT_EQ(tags.issued(), 0u);
    EXPECT_EQ(tags.next().value, 1u);
    EXPECT_EQ(tags.next().value, 2u);
    EXPECT_EQ(tags.issued(), 2u);
}

TEST(TagAllocatorTest, TagsStrictlyIncrease) {
    TagAllocator tags;
    BorrowTag previous = tags.next();
    for (int i = 0; i < 1000; ++i) {
        BorrowTag tag = tags.next();
        EXPECT_LT(previous, tag);
        previous = tag;
    }
}

TEST(TagAllocatorTest, AllocatorsAreIndependent) {
    TagAllocator a;
    TagAllocator b;
    (void)a.next();
    (void)a.next();
    EXPECT_EQ(b.next().value, 1u);
}

TEST(TagAllocatorTest, SeparateThreadsSeeTheSameSequence) {
    std::vector<std::vector<uint64_t>> seen(4);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < seen.size(); ++t) {
        threads.emplace_back([&seen, t]() {
            TagAllocator tags;
            for (int i = 0; i < 50; ++i) {
                seen[t].push_back(tags.next().value);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& sequence : seen) {
        EXPECT_EQ(sequence, seen[0]);
        EXPECT_EQ(std::set<uint64_t>(sequence.begin(), sequence.end()).size(), sequence.size());
    }
}

TEST(BorrowTagTest, Formatting) {
    BorrowTag tag{7};
    EXPECT_EQ(tag.to_string(), "<7>");

    std::ostringstream out;
    out << tag;
    EXPECT_EQ(out.str(), "<7>");
}
