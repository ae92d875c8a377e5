#pragma once

/// @file evaluation.hpp
/// Static evaluation: phase-weighted heuristic for the alpha-beta engine and
/// the positional weight table used by the fixed-depth minimax bot.
///
/// Both scores are taken from a fixed perspective side, not from the side to
/// move, so a search keeps one sign convention across the whole tree.

#include <othello/board.hpp>

namespace othello::eval {

/// Term weights for one game phase.
struct PhaseWeights {
    int disc;
    int mobility;
    int corner;
    int edge;
    int unsafe;
};

/// Weights in effect with `discs` discs on the board (≤20, 21–52, ≥53).
[[nodiscard]] PhaseWeights phase_weights(int discs) noexcept;

/// Heuristic score of `board` for `perspective`. Positive = good for `perspective`.
[[nodiscard]] int evaluate(const Board& board, Color perspective) noexcept;

/// Sum of the static square weights, + for `perspective`'s discs, − for the opponent's.
[[nodiscard]] int positional(const Board& board, Color perspective) noexcept;

/// Static weight of a single square.
[[nodiscard]] int square_weight(Square sq) noexcept;

}  // namespace othello::eval
