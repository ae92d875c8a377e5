/// @file test_bitboard.cpp
/// Tests for bitboard helpers, masks and directional shifts.

#include <othello/bitboard.hpp>

#include <gtest/gtest.h>

using namespace othello;

// ── Bit manipulation ────────────────────────────────────────────────────────

TEST(Bitboard, PopcountAndLsb) {
    EXPECT_EQ(popcount(kEmptyBB), 0);
    EXPECT_EQ(popcount(~kEmptyBB), 64);
    EXPECT_EQ(popcount(square_bb(A1) | square_bb(H8)), 2);
    EXPECT_EQ(lsb(square_bb(D3) | square_bb(H8)), D3);
}

TEST(Bitboard, PopLsbWalksInScanOrder) {
    Bitboard b = square_bb(H8) | square_bb(A1) | square_bb(E3);
    EXPECT_EQ(pop_lsb(b), A1);
    EXPECT_EQ(pop_lsb(b), E3);
    EXPECT_EQ(pop_lsb(b), H8);
    EXPECT_EQ(b, kEmptyBB);
}

TEST(Bitboard, SetTestClear) {
    Bitboard b = kEmptyBB;
    set_bit(b, B2);
    EXPECT_TRUE(test_bit(b, B2));
    EXPECT_FALSE(test_bit(b, B1));
    clear_bit(b, B2);
    EXPECT_EQ(b, kEmptyBB);
}

// ── Masks ───────────────────────────────────────────────────────────────────

TEST(Bitboard, RowAndColumnMasks) {
    EXPECT_EQ(row_bb(0), kRow1);
    EXPECT_EQ(row_bb(7), kRow8);
    EXPECT_EQ(column_bb(0), kColumnA);
    EXPECT_EQ(column_bb(7), kColumnH);
    EXPECT_EQ(popcount(row_bb(3)), 8);
    EXPECT_EQ(popcount(column_bb(5)), 8);
}

TEST(Bitboard, SquareClasses) {
    EXPECT_EQ(popcount(kCornersBB), 4);
    EXPECT_EQ(popcount(kEdgesBB), 24);
    EXPECT_EQ(popcount(kUnsafeBB), 12);

    EXPECT_EQ(kCornersBB & kEdgesBB, kEmptyBB);
    EXPECT_EQ(kCornersBB & kUnsafeBB, kEmptyBB);

    // Eight of the unsafe squares sit on the border, the four X-squares do not.
    EXPECT_EQ(popcount(kUnsafeBB & kEdgesBB), 8);
    EXPECT_FALSE(test_bit(kEdgesBB, B2));
    EXPECT_FALSE(test_bit(kEdgesBB, G7));
    EXPECT_TRUE(test_bit(kEdgesBB, B1));
}

// ── Shifts ──────────────────────────────────────────────────────────────────

TEST(Bitboard, ShiftsMoveOneStep) {
    const Bitboard d4 = square_bb(make_square(3, 3));
    EXPECT_EQ(shift(d4, Direction::North), square_bb(make_square(2, 3)));
    EXPECT_EQ(shift(d4, Direction::South), square_bb(make_square(4, 3)));
    EXPECT_EQ(shift(d4, Direction::East), square_bb(make_square(3, 4)));
    EXPECT_EQ(shift(d4, Direction::West), square_bb(make_square(3, 2)));
    EXPECT_EQ(shift(d4, Direction::NorthEast), square_bb(make_square(2, 4)));
    EXPECT_EQ(shift(d4, Direction::NorthWest), square_bb(make_square(2, 2)));
    EXPECT_EQ(shift(d4, Direction::SouthEast), square_bb(make_square(4, 4)));
    EXPECT_EQ(shift(d4, Direction::SouthWest), square_bb(make_square(4, 2)));
}

TEST(Bitboard, ShiftsDoNotWrap) {
    EXPECT_EQ(shift_east(kColumnH), kEmptyBB);
    EXPECT_EQ(shift_west(kColumnA), kEmptyBB);
    EXPECT_EQ(shift_north(kRow1), kEmptyBB);
    EXPECT_EQ(shift_south(kRow8), kEmptyBB);
    EXPECT_EQ(shift_ne(square_bb(make_square(4, 7))), kEmptyBB);
    EXPECT_EQ(shift_sw(square_bb(make_square(4, 0))), kEmptyBB);
    EXPECT_EQ(shift_nw(square_bb(A1)), kEmptyBB);
    EXPECT_EQ(shift_se(square_bb(H8)), kEmptyBB);
}

TEST(Bitboard, StepsMatchShifts) {
    const Square origin = make_square(3, 4);
    for (Direction d : kDirections) {
        Square expected = make_square(3 + row_step(d), 4 + col_step(d));
        EXPECT_EQ(shift(square_bb(origin), d), square_bb(expected));
    }
}
