/// @file evaluation.cpp
/// Heuristic and positional evaluation.

#include <othello/evaluation.hpp>

#include <othello/movegen.hpp>

#include <array>

namespace othello::eval {

namespace {

// ── Phase table ─────────────────────────────────────────────────────────────

constexpr int kOpeningMaxDiscs = 20;
constexpr int kMidgameMaxDiscs = 52;

constexpr PhaseWeights kOpeningWeights{10, 80, 800, 40, 60};
constexpr PhaseWeights kMidgameWeights{30, 60, 800, 60, 40};
constexpr PhaseWeights kEndgameWeights{100, 20, 800, 20, 0};

// ── Positional table ────────────────────────────────────────────────────────

// clang-format off
constexpr std::array<int, 64> kSquareWeights = {
    100, -20,  10,   5,   5,  10, -20, 100,
    -20, -50,  -2,  -2,  -2,  -2, -50, -20,
     10,  -2,  -1,  -1,  -1,  -1,  -2,  10,
      5,  -2,  -1,  -1,  -1,  -1,  -2,   5,
      5,  -2,  -1,  -1,  -1,  -1,  -2,   5,
     10,  -2,  -1,  -1,  -1,  -1,  -2,  10,
    -20, -50,  -2,  -2,  -2,  -2, -50, -20,
    100, -20,  10,   5,   5,  10, -20, 100,
};
// clang-format on

int weight_sum(Bitboard b) noexcept {
    int sum = 0;
    while (b) {
        sum += square_weight(pop_lsb(b));
    }
    return sum;
}

}  // namespace

PhaseWeights phase_weights(int discs) noexcept {
    if (discs <= kOpeningMaxDiscs)
        return kOpeningWeights;
    if (discs <= kMidgameMaxDiscs)
        return kMidgameWeights;
    return kEndgameWeights;
}

int evaluate(const Board& board, Color perspective) noexcept {
    const Color them = opposite(perspective);
    const Bitboard own = board.discs(perspective);
    const Bitboard opp = board.discs(them);

    const int own_count = popcount(own);
    const int opp_count = popcount(opp);
    const PhaseWeights w = phase_weights(own_count + opp_count);

    // Unsafe squares on the border are counted as edges too.
    const int disc_diff = own_count - opp_count;
    const int mobility_diff = movegen::mobility(board, perspective) - movegen::mobility(board, them);
    const int corner_diff = popcount(own & kCornersBB) - popcount(opp & kCornersBB);
    const int edge_diff = popcount(own & kEdgesBB) - popcount(opp & kEdgesBB);
    const int unsafe_diff = popcount(own & kUnsafeBB) - popcount(opp & kUnsafeBB);

    int score = 0;
    score += w.disc * disc_diff;
    score += w.mobility * mobility_diff;
    score += w.corner * corner_diff;
    score += w.edge * edge_diff;
    score -= w.unsafe * unsafe_diff;
    return score;
}

int positional(const Board& board, Color perspective) noexcept {
    return weight_sum(board.discs(perspective)) - weight_sum(board.discs(opposite(perspective)));
}

int square_weight(Square sq) noexcept {
    return kSquareWeights[sq];
}

}  // namespace othello::eval
