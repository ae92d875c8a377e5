/// @file test_board.cpp
/// Tests for the Board class.

#include <othello/board.hpp>

#include <gtest/gtest.h>

using namespace othello;

// ── Board::initial() ────────────────────────────────────────────────────────

TEST(Board, InitialCentreDiscs) {
    Board b = Board::initial();

    EXPECT_EQ(b.cell_at(make_square(3, 3)), Cell::White);
    EXPECT_EQ(b.cell_at(make_square(4, 4)), Cell::White);
    EXPECT_EQ(b.cell_at(make_square(3, 4)), Cell::Black);
    EXPECT_EQ(b.cell_at(make_square(4, 3)), Cell::Black);
}

TEST(Board, InitialCounts) {
    Board b = Board::initial();
    EXPECT_EQ(b.count(Color::Black), 2);
    EXPECT_EQ(b.count(Color::White), 2);
    EXPECT_EQ(b.disc_count(), 4);
    EXPECT_EQ(b.empty_count(), 60);
}

TEST(Board, InitialEverythingElseEmpty) {
    Board b = Board::initial();
    int empties = 0;
    for (int sq = 0; sq < kNumSquares; ++sq) {
        if (b.is_empty(static_cast<Square>(sq)))
            ++empties;
    }
    EXPECT_EQ(empties, 60);
    EXPECT_EQ(popcount(b.empty_squares()), 60);
}

// ── Mutation ────────────────────────────────────────────────────────────────

TEST(Board, PutAndRemoveDisc) {
    Board b;
    b.put_disc(A1, Color::Black);
    EXPECT_EQ(b.cell_at(A1), Cell::Black);
    EXPECT_FALSE(b.is_empty(A1));
    EXPECT_TRUE(test_bit(b.discs(Color::Black), A1));

    b.remove_disc(A1);
    EXPECT_EQ(b.cell_at(A1), Cell::Empty);
    EXPECT_EQ(b.occupied(), kEmptyBB);
}

TEST(Board, FlipSwapsOwnership) {
    Board b;
    b.put_disc(A1, Color::Black);
    b.put_disc(B1, Color::White);
    b.put_disc(H8, Color::White);

    b.flip(square_bb(A1) | square_bb(B1));
    EXPECT_EQ(b.cell_at(A1), Cell::White);
    EXPECT_EQ(b.cell_at(B1), Cell::Black);
    EXPECT_EQ(b.cell_at(H8), Cell::White);
    EXPECT_EQ(b.discs(Color::Black) & b.discs(Color::White), kEmptyBB);
}

TEST(Board, ClearAndEquality) {
    Board a = Board::initial();
    Board b = Board::initial();
    EXPECT_EQ(a, b);

    b.put_disc(A1, Color::White);
    EXPECT_FALSE(a == b);

    a.clear();
    EXPECT_EQ(a.disc_count(), 0);
    EXPECT_EQ(a, Board{});
}
