#pragma once

/// @file strategy.hpp
/// Bot strategies behind one contract: given a position and a side, pick a
/// move or report that there is none.

#include <othello/engine.hpp>
#include <othello/position.hpp>

#include <cstddef>
#include <optional>

namespace othello {

/// Default horizon of the fixed-depth minimax bot.
inline constexpr int kMinimaxDepth = 3;

class Strategy {
   public:
    virtual ~Strategy() = default;

    /// Move for `side`, or std::nullopt when `side` has no legal move.
    /// `pos` is never modified; strategies work on private copies.
    [[nodiscard]] virtual std::optional<Move> choose(const Position& pos, Color side) = 0;
};

/// Flip the most discs. Ties go to the first move in board-scan order.
class GreedyStrategy final : public Strategy {
   public:
    [[nodiscard]] std::optional<Move> choose(const Position& pos, Color side) override;
};

/// Leave the opponent the fewest replies. Ties go to the first move in scan order.
class LookaheadStrategy final : public Strategy {
   public:
    [[nodiscard]] std::optional<Move> choose(const Position& pos, Color side) override;
};

/// Plain minimax over the static square weights: no pruning, no cache, no ordering.
class MinimaxStrategy final : public Strategy {
   public:
    explicit MinimaxStrategy(int depth = kMinimaxDepth) : depth_(depth) {}

    [[nodiscard]] std::optional<Move> choose(const Position& pos, Color side) override;

    [[nodiscard]] int depth() const noexcept { return depth_; }

   private:
    int minimax(Position& pos, Color turn, int depth, Color root) const;

    int depth_;
};

/// The full engine: iterative deepening alpha-beta with book and endgame solver.
class AlphaBetaStrategy final : public Strategy {
   public:
    explicit AlphaBetaStrategy(int max_depth,
                               std::size_t tt_mb = TranspositionTable::kDefaultSizeMB);

    [[nodiscard]] std::optional<Move> choose(const Position& pos, Color side) override;

    [[nodiscard]] const SearchLimits& limits() const noexcept { return limits_; }
    [[nodiscard]] SearchLimits& limits() noexcept { return limits_; }

    /// Statistics of the most recent choose() call.
    [[nodiscard]] const SearchResult& last_result() const noexcept { return last_result_; }

    [[nodiscard]] Engine& engine() noexcept { return engine_; }

   private:
    Engine engine_;
    SearchLimits limits_;
    SearchResult last_result_;
};

}  // namespace othello
