#pragma once

/// @file ordering.hpp
/// Move ordering for alpha-beta: corners first, corner-adjacent squares last,
/// edges before interior, and more flips before fewer within a class.

#include <othello/board.hpp>
#include <othello/move.hpp>

namespace othello::ordering {

// Priority classes, lower sorts first.
inline constexpr int kCornerPriority = 0;
inline constexpr int kEdgePriority = 1;
inline constexpr int kInteriorPriority = 2;
inline constexpr int kUnsafePriority = 3;

/// Priority class of a square.
[[nodiscard]] int priority(Square sq) noexcept;

/// Stable-sort `ml` in place for `side` to move. Ties keep their incoming order.
void order_moves(const Board& board, MoveList& ml, Color side);

}  // namespace othello::ordering
