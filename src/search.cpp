/// @file search.cpp
/// Alpha-beta search with iterative deepening.

#include <othello/search.hpp>

#include <othello/ordering.hpp>

#include <algorithm>

namespace othello {

namespace {

// Check for time every N nodes
constexpr std::uint64_t kTimeCheckInterval = 4096;

// Opening book: exactly the four centre discs on the board.
constexpr int kBookDiscCount = 4;

}  // namespace

// ── Opening book ────────────────────────────────────────────────────────────

Move book_move(const Board& board, Color side) {
    if (board.disc_count() != kBookDiscCount)
        return kNullMove;

    Move reply = (side == Color::White) ? Move{E3} : Move{D3};
    if (movegen::flips(board, reply.sq, side) == kEmptyBB)
        return kNullMove;
    return reply;
}

// ── Search construction ─────────────────────────────────────────────────────

Search::Search(std::size_t tt_mb) : tt_(tt_mb) {}

// ── Main search entry point ─────────────────────────────────────────────────

SearchResult Search::search(Position& pos, Color side, const SearchLimits& limits) {
    cancelled_.store(false, std::memory_order_relaxed);
    stopped_ = false;
    nodes_ = 0;
    root_ = side;

    // A fresh table per call: cached scores belong to this root and side only.
    tt_.clear();

    // Set deadline
    has_deadline_ = (limits.time_limit_ms > 0);
    if (has_deadline_) {
        deadline_ =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(limits.time_limit_ms);
    }

    SearchResult result;
    if (side == Color::None)
        return result;

    if (limits.use_book) {
        Move book = book_move(pos.board(), side);
        if (!book.is_null()) {
            result.best_move = book;
            result.from_book = true;
            return result;
        }
    }

    // Generate root legal moves
    MoveList root_moves = movegen::legal(pos, side);
    if (root_moves.empty()) {
        result.score = eval::evaluate(pos.board(), side);
        return result;
    }

    // Endgame: search every remaining empty square
    int max_depth = std::max(1, limits.max_depth);
    const int empties = pos.board().empty_count();
    if (limits.endgame_empties >= 0 && empties <= limits.endgame_empties) {
        max_depth = empties;
    }

    // Fallback if not even depth 1 completes: first move in scan order.
    result.best_move = root_moves[0];

    ordering::order_moves(pos.board(), root_moves, side);
    const Color them = opposite(side);

    // Iterative deepening
    for (int depth = 1; depth <= max_depth; ++depth) {
        int best_score = -kInfScore;
        Move iter_best = kNullMove;
        int alpha = -kInfScore;
        const int beta = kInfScore;

        for (const Move& m : root_moves) {
            pos.make_move(m, side);
            int s = alphabeta(pos, depth - 1, alpha, beta, them);
            pos.unmake_move();

            if (stopped_)
                break;

            // Strictly greater: the first move reaching the best score keeps it.
            if (s > best_score) {
                best_score = s;
                iter_best = m;
            }
            if (s > alpha) {
                alpha = s;
            }
        }

        if (stopped_ || iter_best.is_null())
            break;

        result.best_move = iter_best;
        result.score = best_score;
        result.depth = depth;
        result.nodes = nodes_;

        if (on_iteration_)
            on_iteration_(result);
    }

    result.nodes = nodes_;
    return result;
}

// ── Minimax with alpha-beta ─────────────────────────────────────────────────
// Scores are always from root_'s point of view: root_ maximises, the
// opponent minimises.

int Search::alphabeta(Position& pos, int depth, int alpha, int beta, Color turn) {
    if (should_stop())
        return 0;

    ++nodes_;

    const Board& board = pos.board();
    const std::uint64_t key = pos.key() ^ zobrist::turn_key(turn) ^ zobrist::depth_key(depth);

    // ── Transposition table lookup ──────────────────────────────────────
    TTEntry tt_entry{};
    if (tt_.lookup(key, tt_entry) && tt_entry.depth == depth) {
        if (tt_entry.bound == Bound::Exact)
            return tt_entry.score;
        if (tt_entry.bound == Bound::Lower && tt_entry.score >= beta)
            return tt_entry.score;
        if (tt_entry.bound == Bound::Upper && tt_entry.score <= alpha)
            return tt_entry.score;
    }

    const int alpha_orig = alpha;
    const int beta_orig = beta;
    const Color them = opposite(turn);
    const bool can_move = movegen::has_legal_move(board, turn);

    // ── Leaf: horizon or game over ──────────────────────────────────────
    if (depth <= 0 || (!can_move && !movegen::has_legal_move(board, them))) {
        int score = eval::evaluate(board, root_);
        tt_.store(key, depth, score, Bound::Exact);
        return score;
    }

    int value = 0;
    if (!can_move) {
        // ── Pass: the opponent moves, one ply is spent ──────────────────
        value = alphabeta(pos, depth - 1, alpha, beta, them);
    } else {
        MoveList moves = movegen::legal(board, turn);
        ordering::order_moves(board, moves, turn);

        if (turn == root_) {
            value = -kInfScore;
            for (const Move& m : moves) {
                pos.make_move(m, turn);
                value = std::max(value, alphabeta(pos, depth - 1, alpha, beta, them));
                pos.unmake_move();
                alpha = std::max(alpha, value);
                if (alpha >= beta)
                    break;
            }
        } else {
            value = kInfScore;
            for (const Move& m : moves) {
                pos.make_move(m, turn);
                value = std::min(value, alphabeta(pos, depth - 1, alpha, beta, them));
                pos.unmake_move();
                beta = std::min(beta, value);
                if (alpha >= beta)
                    break;
            }
        }
    }

    // Interrupted subtrees are incomplete; keep them out of the table.
    if (stopped_)
        return value;

    // ── Store in TT ─────────────────────────────────────────────────────
    Bound bound = Bound::Exact;
    if (value <= alpha_orig) {
        bound = Bound::Upper;
    } else if (value >= beta_orig) {
        bound = Bound::Lower;
    }
    tt_.store(key, depth, value, bound);

    return value;
}

// ── Time / cancellation check ───────────────────────────────────────────────

bool Search::should_stop() {
    if (stopped_)
        return true;

    if (cancelled_.load(std::memory_order_relaxed)) {
        stopped_ = true;
    } else if (has_deadline_ && (nodes_ & (kTimeCheckInterval - 1)) == 0) {
        stopped_ = std::chrono::steady_clock::now() >= deadline_;
    }
    return stopped_;
}

}  // namespace othello
