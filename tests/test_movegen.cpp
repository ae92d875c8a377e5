/// @file test_movegen.cpp
/// Unit tests for move generation and capture resolution.

#include <othello/movegen.hpp>
#include <othello/position.hpp>

#include <gtest/gtest.h>

#include <random>
#include <vector>

using namespace othello;

// Helper: legal moves as squares.
static std::vector<Square> squares_of(const MoveList& ml) {
    std::vector<Square> out;
    for (const Move& m : ml) {
        out.push_back(m.sq);
    }
    return out;
}

// ── Starting position ───────────────────────────────────────────────────────

TEST(MoveGen, StartingMovesForBlack) {
    auto pos = Position::initial();
    std::vector<Square> expected = {make_square(2, 3), make_square(3, 2), make_square(4, 5),
                                    make_square(5, 4)};
    EXPECT_EQ(squares_of(movegen::legal(pos, Color::Black)), expected);
}

TEST(MoveGen, StartingMovesForWhite) {
    auto pos = Position::initial();
    std::vector<Square> expected = {make_square(2, 4), make_square(3, 5), make_square(4, 2),
                                    make_square(5, 3)};
    EXPECT_EQ(squares_of(movegen::legal(pos, Color::White)), expected);
}

TEST(MoveGen, NoMovesForNone) {
    auto pos = Position::initial();
    EXPECT_TRUE(movegen::legal(pos, Color::None).empty());
    EXPECT_EQ(movegen::legal_mask(pos.board(), Color::None), kEmptyBB);
}

TEST(MoveGen, EmptyBoardHasNoMoves) {
    Board b;
    EXPECT_FALSE(movegen::has_legal_move(b, Color::Black));
    EXPECT_FALSE(movegen::has_legal_move(b, Color::White));
}

// ── Captures ────────────────────────────────────────────────────────────────

TEST(MoveGen, CapturesInRayOrder) {
    // Black plays (2,2) and brackets three rays; the east ray stays open.
    Board b;
    b.put_disc(make_square(2, 1), Color::White);  // west
    b.put_disc(make_square(2, 0), Color::Black);
    b.put_disc(make_square(1, 2), Color::White);  // north
    b.put_disc(make_square(0, 2), Color::Black);
    b.put_disc(make_square(3, 3), Color::White);  // south-east
    b.put_disc(make_square(4, 4), Color::White);
    b.put_disc(make_square(5, 5), Color::Black);
    b.put_disc(make_square(2, 3), Color::White);  // east, not closed
    b.put_disc(make_square(2, 4), Color::White);

    const Square origin = make_square(2, 2);
    CaptureSet cs = movegen::captures(b, origin, Color::Black);
    ASSERT_EQ(cs.size(), 4);
    EXPECT_EQ(cs[0], make_square(2, 1));
    EXPECT_EQ(cs[1], make_square(1, 2));
    EXPECT_EQ(cs[2], make_square(3, 3));
    EXPECT_EQ(cs[3], make_square(4, 4));

    Bitboard expected = square_bb(make_square(2, 1)) | square_bb(make_square(1, 2)) |
                        square_bb(make_square(3, 3)) | square_bb(make_square(4, 4));
    EXPECT_EQ(movegen::flips(b, origin, Color::Black), expected);
    EXPECT_TRUE(test_bit(movegen::legal_mask(b, Color::Black), origin));
}

TEST(MoveGen, CapturesOnOccupiedOrOffBoardSquareIsEmpty) {
    auto pos = Position::initial();
    EXPECT_TRUE(movegen::captures(pos, make_square(3, 3), Color::Black).empty());
    EXPECT_TRUE(movegen::captures(pos, kNoSquare, Color::Black).empty());
    EXPECT_EQ(movegen::flips(pos.board(), kNoSquare, Color::Black), kEmptyBB);
}

TEST(MoveGen, RaysDoNotWrapAroundTheBoard) {
    // A white disc on the east edge, black behind it: the run must not
    // continue onto column 0 of the next row.
    Board b;
    b.put_disc(make_square(3, 6), Color::Black);
    b.put_disc(make_square(3, 7), Color::White);
    EXPECT_TRUE(movegen::legal(b, Color::Black).empty());
    EXPECT_EQ(movegen::flips(b, make_square(4, 0), Color::Black), kEmptyBB);
}

TEST(MoveGen, LongestRunIsCaptured) {
    Board b;
    b.put_disc(A1, Color::Black);
    for (int c = 1; c < 7; ++c) {
        b.put_disc(make_square(0, c), Color::White);
    }
    EXPECT_EQ(popcount(movegen::flips(b, H1, Color::Black)), 6);
    EXPECT_EQ(movegen::captures(b, H1, Color::Black).size(), 6);
}

// ── Consistency over random games ───────────────────────────────────────────

TEST(MoveGen, MaskListAndCapturesAgreeOverRandomGames) {
    std::mt19937 rng(20240611);

    for (int game = 0; game < 20; ++game) {
        auto pos = Position::initial();
        while (!pos.is_game_over()) {
            const Color side = pos.side_to_move();
            const Board& b = pos.board();
            const Bitboard mask = movegen::legal_mask(b, side);

            for (int sq = 0; sq < kNumSquares; ++sq) {
                auto s = static_cast<Square>(sq);
                const Bitboard f = movegen::flips(b, s, side);
                CaptureSet cs = movegen::captures(b, s, side);

                EXPECT_EQ(f != kEmptyBB, test_bit(mask, s));
                EXPECT_EQ(popcount(f), cs.size());
                for (Square c : cs) {
                    EXPECT_TRUE(test_bit(f, c));
                }
            }

            MoveList ml = movegen::legal(pos, side);
            ASSERT_FALSE(ml.empty());
            EXPECT_EQ(ml.size(), movegen::mobility(b, side));

            std::uniform_int_distribution<int> pick(0, ml.size() - 1);
            ASSERT_TRUE(pos.apply_move(ml[pick(rng)].sq, side));
        }
        EXPECT_FALSE(movegen::has_legal_move(pos.board(), Color::Black));
        EXPECT_FALSE(movegen::has_legal_move(pos.board(), Color::White));
    }
}
