/// @file test_tt.cpp
/// Tests for the transposition table.

#include <othello/tt.hpp>

#include <cstdint>
#include <gtest/gtest.h>

namespace othello {
namespace {

// ── Construction & Sizing ───────────────────────────────────────────────────

TEST(TTTest, DefaultConstruction) {
    TranspositionTable tt(1);  // 1 MB
    // 1 MB / 16 bytes per entry = 65536 entries (already power of 2)
    EXPECT_EQ(tt.entry_count(), 65536U);
    EXPECT_EQ(tt.hashfull(), 0);
}

TEST(TTTest, DefaultSizeIsFourMegabytes) {
    TranspositionTable tt;
    EXPECT_EQ(tt.entry_count(), 4U * 65536U);
}

TEST(TTTest, EntryCountIsPowerOfTwo) {
    TranspositionTable tt(3);  // 3 MB = 196608 entries raw, rounded to 131072
    auto count = tt.entry_count();
    EXPECT_EQ(count, 131072U);
    EXPECT_EQ(count & (count - 1), 0U);
}

TEST(TTTest, ZeroMegabytesStillUsable) {
    TranspositionTable tt(0);
    EXPECT_GE(tt.entry_count(), 1024U);
}

TEST(TTTest, ResizeClearsTable) {
    TranspositionTable tt(1);
    tt.store(0x1234567890ABCDEF, 5, 100, Bound::Exact);

    TTEntry entry{};
    EXPECT_TRUE(tt.lookup(0x1234567890ABCDEF, entry));

    tt.resize(2);
    EXPECT_FALSE(tt.lookup(0x1234567890ABCDEF, entry));
}

// ── Store & Lookup ──────────────────────────────────────────────────────────

TEST(TTTest, StoreAndLookupHit) {
    TranspositionTable tt(1);
    const std::uint64_t key = 0xDEADBEEFCAFEBABE;

    tt.store(key, 5, -150, Bound::Lower);

    TTEntry entry{};
    ASSERT_TRUE(tt.lookup(key, entry));
    EXPECT_EQ(entry.key, key);
    EXPECT_EQ(entry.score, -150);
    EXPECT_EQ(entry.depth, 5);
    EXPECT_EQ(entry.bound, Bound::Lower);
}

TEST(TTTest, LookupMiss) {
    TranspositionTable tt(1);
    TTEntry entry{};
    EXPECT_FALSE(tt.lookup(0x42, entry));
}

TEST(TTTest, KeyMismatchInSameSlotMisses) {
    TranspositionTable tt(1);
    const std::uint64_t key = 0x0000000100000007ULL;
    const std::uint64_t other = key + (tt.entry_count() << 4);  // same index, different key
    tt.store(key, 3, 10, Bound::Exact);

    TTEntry entry{};
    EXPECT_FALSE(tt.lookup(other, entry));
}

// ── Replacement ─────────────────────────────────────────────────────────────

TEST(TTTest, SameKeyOverwrites) {
    TranspositionTable tt(1);
    const std::uint64_t key = 0xABCDEF;
    tt.store(key, 8, 10, Bound::Exact);
    tt.store(key, 2, 20, Bound::Upper);

    TTEntry entry{};
    ASSERT_TRUE(tt.lookup(key, entry));
    EXPECT_EQ(entry.score, 20);
    EXPECT_EQ(entry.bound, Bound::Upper);
}

TEST(TTTest, ShallowBoundDoesNotEvictDeepEntry) {
    TranspositionTable tt(1);
    const std::uint64_t key = 0x10;
    const std::uint64_t other = key + tt.entry_count();  // collides on the index
    tt.store(key, 8, 10, Bound::Exact);
    tt.store(other, 2, 20, Bound::Lower);

    TTEntry entry{};
    EXPECT_TRUE(tt.lookup(key, entry));
    EXPECT_FALSE(tt.lookup(other, entry));
}

TEST(TTTest, DeeperEntryEvicts) {
    TranspositionTable tt(1);
    const std::uint64_t key = 0x10;
    const std::uint64_t other = key + tt.entry_count();
    tt.store(key, 2, 10, Bound::Upper);
    tt.store(other, 6, 20, Bound::Lower);

    TTEntry entry{};
    EXPECT_FALSE(tt.lookup(key, entry));
    ASSERT_TRUE(tt.lookup(other, entry));
    EXPECT_EQ(entry.score, 20);
}

TEST(TTTest, ExactEvictsShallowerBound) {
    TranspositionTable tt(1);
    const std::uint64_t key = 0x10;
    const std::uint64_t other = key + tt.entry_count();
    tt.store(key, 6, 10, Bound::Lower);
    tt.store(other, 1, 20, Bound::Exact);

    TTEntry entry{};
    ASSERT_TRUE(tt.lookup(other, entry));
    EXPECT_EQ(entry.bound, Bound::Exact);
}

// ── Clear & hashfull ────────────────────────────────────────────────────────

TEST(TTTest, ClearEmptiesEverything) {
    TranspositionTable tt(1);
    for (std::uint64_t k = 0; k < 500; ++k) {
        tt.store(k, 1, static_cast<int>(k), Bound::Exact);
    }
    EXPECT_EQ(tt.hashfull(), 500);

    tt.clear();
    EXPECT_EQ(tt.hashfull(), 0);
    TTEntry entry{};
    EXPECT_FALSE(tt.lookup(7, entry));
}

}  // namespace
}  // namespace othello
