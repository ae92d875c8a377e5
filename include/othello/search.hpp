#pragma once

/// @file search.hpp
/// Alpha-beta search with iterative deepening, transposition table, move
/// ordering, a one-move opening book and an exhaustive endgame solver.

#include <othello/evaluation.hpp>
#include <othello/movegen.hpp>
#include <othello/tt.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

namespace othello {

// ── Constants ───────────────────────────────────────────────────────────────

inline constexpr int kInfScore = 1'000'000;
inline constexpr int kDefaultMaxDepth = 6;

/// At or below this many empty squares the search runs to the end of the game.
inline constexpr int kEndgameEmpties = 12;

// ── Search limits ───────────────────────────────────────────────────────────

struct SearchLimits {
    int max_depth = kDefaultMaxDepth;
    int endgame_empties = kEndgameEmpties;  ///< -1 = never extend to the end.
    bool use_book = true;
    std::int64_t time_limit_ms = -1;  ///< -1 = no time limit.
};

// ── Search result ───────────────────────────────────────────────────────────

struct SearchResult {
    Move best_move{};
    int score = 0;  ///< From the searching side's perspective.
    int depth = 0;  ///< Deepest completed iteration; 0 for book or no move.
    std::uint64_t nodes = 0;
    bool from_book = false;
};

/// Called after every completed iteration with the result so far.
using IterationCallback = std::function<void(const SearchResult&)>;

/// Book reply for the untouched 4-disc start: White (2,4), Black (2,3).
/// Returns kNullMove on any other board or if the reply is illegal there.
[[nodiscard]] Move book_move(const Board& board, Color side);

// ── Search class ────────────────────────────────────────────────────────────

class Search {
   public:
    explicit Search(std::size_t tt_mb = TranspositionTable::kDefaultSizeMB);

    /// Run iterative-deepening search for `side`. The position is restored
    /// before returning. best_move is null when `side` has no legal move.
    SearchResult search(Position& pos, Color side, const SearchLimits& limits);

    /// Cancel the search from another thread. The running iteration is discarded.
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    void set_iteration_callback(IterationCallback cb) { on_iteration_ = std::move(cb); }

    /// Access the TT for resizing, etc.
    TranspositionTable& tt() noexcept { return tt_; }
    const TranspositionTable& tt() const noexcept { return tt_; }

   private:
    // ── Core search routine ─────────────────────────────────────────────
    int alphabeta(Position& pos, int depth, int alpha, int beta, Color turn);

    // ── Helpers ─────────────────────────────────────────────────────────
    [[nodiscard]] bool should_stop();

    // ── Data members ────────────────────────────────────────────────────
    TranspositionTable tt_;
    Color root_ = Color::Black;
    IterationCallback on_iteration_;

    // Cancellation
    std::atomic<bool> cancelled_{false};
    bool stopped_ = false;

    // Time management
    std::chrono::steady_clock::time_point deadline_{};
    bool has_deadline_ = false;

    // Stats
    std::uint64_t nodes_ = 0;
};

}  // namespace othello
