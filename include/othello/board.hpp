#pragma once

/// @file board.hpp
/// Bitboard-based 8×8 Othello board.

#include <othello/bitboard.hpp>
#include <othello/types.hpp>

namespace othello {

/// Two occupancy bitboards, one per color. A square set in neither is empty;
/// the two boards never overlap.
class Board {
public:
    Board() noexcept = default;

    // ── Disc placement ──────────────────────────────────────────────────

    /// Place a disc on the board. Square must be empty.
    void put_disc(Square sq, Color c) noexcept { set_bit(discs_[color_index(c)], sq); }

    /// Remove a disc from the board. Square must be occupied.
    void remove_disc(Square sq) noexcept {
        clear_bit(discs_[0], sq);
        clear_bit(discs_[1], sq);
    }

    /// Flip the color of every disc in `mask`. All squares in `mask` must be occupied.
    void flip(Bitboard mask) noexcept {
        discs_[0] ^= mask;
        discs_[1] ^= mask;
    }

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] Cell cell_at(Square sq) const noexcept {
        if (test_bit(discs_[0], sq))
            return Cell::Black;
        if (test_bit(discs_[1], sq))
            return Cell::White;
        return Cell::Empty;
    }

    [[nodiscard]] bool is_empty(Square sq) const noexcept { return !test_bit(occupied(), sq); }

    /// Bitboard of all discs of a given color.
    [[nodiscard]] Bitboard discs(Color c) const noexcept { return discs_[color_index(c)]; }

    [[nodiscard]] Bitboard occupied() const noexcept { return discs_[0] | discs_[1]; }
    [[nodiscard]] Bitboard empty_squares() const noexcept { return ~occupied(); }

    [[nodiscard]] int count(Color c) const noexcept { return popcount(discs(c)); }
    [[nodiscard]] int disc_count() const noexcept { return popcount(occupied()); }
    [[nodiscard]] int empty_count() const noexcept { return kNumSquares - disc_count(); }

    void clear() noexcept {
        discs_[0] = kEmptyBB;
        discs_[1] = kEmptyBB;
    }

    [[nodiscard]] bool operator==(const Board& other) const noexcept {
        return discs_[0] == other.discs_[0] && discs_[1] == other.discs_[1];
    }

    // ── Factory ─────────────────────────────────────────────────────────

    /// Four centre discs: White on (3,3) and (4,4), Black on (3,4) and (4,3).
    [[nodiscard]] static Board initial() noexcept;

private:
    Bitboard discs_[2]{};  // [color_index]
};

}  // namespace othello
