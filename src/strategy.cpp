/// @file strategy.cpp
/// Greedy, lookahead, minimax and alpha-beta strategies.

#include <othello/strategy.hpp>

#include <othello/evaluation.hpp>
#include <othello/movegen.hpp>

#include <algorithm>

namespace othello {

// ── Greedy ──────────────────────────────────────────────────────────────────

std::optional<Move> GreedyStrategy::choose(const Position& pos, Color side) {
    MoveList moves = movegen::legal(pos, side);
    if (moves.empty())
        return std::nullopt;

    Move best = moves[0];
    int most_flips = -1;
    for (const Move& m : moves) {
        int n = popcount(movegen::flips(pos.board(), m.sq, side));
        if (n > most_flips) {
            most_flips = n;
            best = m;
        }
    }
    return best;
}

// ── Lookahead ───────────────────────────────────────────────────────────────

std::optional<Move> LookaheadStrategy::choose(const Position& pos, Color side) {
    MoveList moves = movegen::legal(pos, side);
    if (moves.empty())
        return std::nullopt;

    Position sim = pos;
    const Color them = opposite(side);

    Move best = moves[0];
    int fewest_replies = kInfScore;
    for (const Move& m : moves) {
        sim.make_move(m, side);
        int replies = movegen::mobility(sim.board(), them);
        sim.unmake_move();

        if (replies < fewest_replies) {
            fewest_replies = replies;
            best = m;
        }
    }
    return best;
}

// ── Minimax ─────────────────────────────────────────────────────────────────

std::optional<Move> MinimaxStrategy::choose(const Position& pos, Color side) {
    MoveList moves = movegen::legal(pos, side);
    if (moves.empty())
        return std::nullopt;

    Position sim = pos;
    const Color them = opposite(side);

    Move best = moves[0];
    int best_value = -kInfScore;
    for (const Move& m : moves) {
        sim.make_move(m, side);
        int value = minimax(sim, them, depth_ - 1, side);
        sim.unmake_move();

        if (value > best_value) {
            best_value = value;
            best = m;
        }
    }
    return best;
}

int MinimaxStrategy::minimax(Position& pos, Color turn, int depth, Color root) const {
    if (depth <= 0)
        return eval::positional(pos.board(), root);

    MoveList moves = movegen::legal(pos, turn);
    const Color them = opposite(turn);
    if (moves.empty()) {
        if (movegen::has_legal_move(pos.board(), them))
            return minimax(pos, them, depth - 1, root);
        return eval::positional(pos.board(), root);
    }

    const bool maximizing = (turn == root);
    int best = maximizing ? -kInfScore : kInfScore;
    for (const Move& m : moves) {
        pos.make_move(m, turn);
        int value = minimax(pos, them, depth - 1, root);
        pos.unmake_move();
        best = maximizing ? std::max(best, value) : std::min(best, value);
    }
    return best;
}

// ── Alpha-beta ──────────────────────────────────────────────────────────────

AlphaBetaStrategy::AlphaBetaStrategy(int max_depth, std::size_t tt_mb) : engine_(tt_mb) {
    limits_.max_depth = max_depth;
}

std::optional<Move> AlphaBetaStrategy::choose(const Position& pos, Color side) {
    Position sim = pos;
    last_result_ = engine_.search(sim, side, limits_);
    if (last_result_.best_move.is_null())
        return std::nullopt;
    return last_result_.best_move;
}

}  // namespace othello
