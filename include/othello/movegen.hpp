#pragma once

/// @file movegen.hpp
/// Legal move generation, capture resolution and perft.

#include <othello/position.hpp>

#include <cstdint>

namespace othello::movegen {

/// Bitboard of every empty square where `side` captures at least one disc.
/// Empty for Color::None.
[[nodiscard]] Bitboard legal_mask(const Board& board, Color side) noexcept;

/// Discs flipped by `side` playing `sq`. Empty if the move is illegal.
[[nodiscard]] Bitboard flips(const Board& board, Square sq, Color side) noexcept;

/// Legal moves for `side` in board-scan order (row by row, left to right).
[[nodiscard]] MoveList legal(const Board& board, Color side);
[[nodiscard]] MoveList legal(const Position& pos, Color side);

/// Opponent discs flipped by `side` playing `sq`, in ray order.
[[nodiscard]] CaptureSet captures(const Board& board, Square sq, Color side);
[[nodiscard]] CaptureSet captures(const Position& pos, Square sq, Color side);

[[nodiscard]] inline bool has_legal_move(const Board& board, Color side) noexcept {
    return legal_mask(board, side) != kEmptyBB;
}

/// Number of legal moves available to `side`.
[[nodiscard]] inline int mobility(const Board& board, Color side) noexcept {
    return popcount(legal_mask(board, side));
}

/// Count leaf nodes at `depth` plies (perft for validation). A forced pass
/// is folded into the move that caused it; a finished game counts as a leaf.
[[nodiscard]] std::uint64_t perft(Position& pos, int depth);

}  // namespace othello::movegen
