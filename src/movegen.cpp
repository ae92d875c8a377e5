/// @file movegen.cpp
/// Move generation implementation using directional bitboard fills.

#include <othello/movegen.hpp>

namespace othello::movegen {

namespace {

// ── Helpers ─────────────────────────────────────────────────────────────────

/// Opponent discs bracketed along one ray from `origin`, or empty if the
/// run is not closed by one of our discs.
Bitboard ray_flips(Bitboard origin, Bitboard own, Bitboard opp, Direction d) noexcept {
    Bitboard run = kEmptyBB;
    Bitboard cursor = shift(origin, d);
    while (cursor & opp) {
        run |= cursor;
        cursor = shift(cursor, d);
    }
    return (cursor & own) ? run : kEmptyBB;
}

}  // namespace

// ── Legal mask ──────────────────────────────────────────────────────────────

Bitboard legal_mask(const Board& board, Color side) noexcept {
    if (side == Color::None)
        return kEmptyBB;

    const Bitboard own = board.discs(side);
    const Bitboard opp = board.discs(opposite(side));
    const Bitboard empty = board.empty_squares();
    Bitboard moves = kEmptyBB;

    // Grow runs of opponent discs away from our discs; a run can hold at most 6.
    for (Direction d : kDirections) {
        Bitboard run = shift(own, d) & opp;
        for (int i = 0; i < 5; ++i) {
            run |= shift(run, d) & opp;
        }
        moves |= shift(run, d) & empty;
    }
    return moves;
}

// ── Flips ───────────────────────────────────────────────────────────────────

Bitboard flips(const Board& board, Square sq, Color side) noexcept {
    if (side == Color::None || !is_valid_square(sq) || !board.is_empty(sq))
        return kEmptyBB;

    const Bitboard origin = square_bb(sq);
    const Bitboard own = board.discs(side);
    const Bitboard opp = board.discs(opposite(side));

    Bitboard result = kEmptyBB;
    for (Direction d : kDirections) {
        result |= ray_flips(origin, own, opp, d);
    }
    return result;
}

// ── Move lists ──────────────────────────────────────────────────────────────

MoveList legal(const Board& board, Color side) {
    MoveList ml;
    Bitboard mask = legal_mask(board, side);
    while (mask) {
        ml.push(Move{pop_lsb(mask)});
    }
    return ml;
}

MoveList legal(const Position& pos, Color side) {
    return legal(pos.board(), side);
}

// ── Capture sets ────────────────────────────────────────────────────────────

CaptureSet captures(const Board& board, Square sq, Color side) {
    CaptureSet cs;
    if (side == Color::None || !is_valid_square(sq) || !board.is_empty(sq))
        return cs;

    const Color them = opposite(side);
    const Cell own_cell = cell_of(side);
    const Cell opp_cell = cell_of(them);

    for (Direction d : kDirections) {
        const int dr = row_step(d);
        const int dc = col_step(d);
        int r = row_of(sq) + dr;
        int c = col_of(sq) + dc;
        int first = cs.size();

        while (is_on_board(r, c) && board.cell_at(make_square(r, c)) == opp_cell) {
            cs.push(make_square(r, c));
            r += dr;
            c += dc;
        }
        // Unclosed run: drop what this ray pushed.
        if (!is_on_board(r, c) || board.cell_at(make_square(r, c)) != own_cell) {
            cs.truncate(first);
        }
    }
    return cs;
}

CaptureSet captures(const Position& pos, Square sq, Color side) {
    return captures(pos.board(), sq, side);
}

// ── Perft ───────────────────────────────────────────────────────────────────

std::uint64_t perft(Position& pos, int depth) {
    if (depth == 0 || pos.is_game_over())
        return 1;

    const Color side = pos.side_to_move();
    MoveList moves = legal(pos, side);

    // Bulk counting optimisation: at depth 1, just return number of legal moves.
    if (depth == 1)
        return static_cast<std::uint64_t>(moves.size());

    std::uint64_t nodes = 0;
    for (const Move& m : moves) {
        pos.make_move(m, side);
        nodes += perft(pos, depth - 1);
        pos.unmake_move();
    }
    return nodes;
}

}  // namespace othello::movegen
