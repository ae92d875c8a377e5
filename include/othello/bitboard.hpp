#pragma once

/// @file bitboard.hpp
/// Bitboard type, directional shifts and the square classes used by the heuristics.

#include <othello/types.hpp>

#include <bit>
#include <cstdint>

namespace othello {

using Bitboard = std::uint64_t;

inline constexpr Bitboard kEmptyBB = 0ULL;

// ── Bit manipulation ────────────────────────────────────────────────────────

/// Single bit for a square.
[[nodiscard]] constexpr Bitboard square_bb(Square sq) noexcept {
    return 1ULL << sq;
}

/// Population count (number of set bits).
[[nodiscard]] constexpr int popcount(Bitboard b) noexcept {
    return std::popcount(b);
}

/// Index of the least significant set bit.
[[nodiscard]] constexpr Square lsb(Bitboard b) noexcept {
    return static_cast<Square>(std::countr_zero(b));
}

/// Pop (return and clear) the least significant bit.
[[nodiscard]] constexpr Square pop_lsb(Bitboard& b) noexcept {
    Square sq = lsb(b);
    b &= b - 1;
    return sq;
}

/// Test if a square is set.
[[nodiscard]] constexpr bool test_bit(Bitboard b, Square sq) noexcept {
    return (b >> sq) & 1;
}

/// Set a square bit.
constexpr void set_bit(Bitboard& b, Square sq) noexcept {
    b |= square_bb(sq);
}

/// Clear a square bit.
constexpr void clear_bit(Bitboard& b, Square sq) noexcept {
    b &= ~square_bb(sq);
}

// ── Row / Column masks ──────────────────────────────────────────────────────

// clang-format off
inline constexpr Bitboard kColumnA = 0x0101010101010101ULL;
inline constexpr Bitboard kColumnH = kColumnA << 7;

inline constexpr Bitboard kRow1 = 0x00000000000000FFULL;
inline constexpr Bitboard kRow8 = kRow1 << 56;
// clang-format on

[[nodiscard]] constexpr Bitboard column_bb(int c) noexcept {
    return kColumnA << c;
}
[[nodiscard]] constexpr Bitboard row_bb(int r) noexcept {
    return kRow1 << (r * 8);
}

// ── Square classes ──────────────────────────────────────────────────────────

inline constexpr Bitboard kCornersBB = square_bb(A1) | square_bb(H1) | square_bb(A8) | square_bb(H8);

/// Border cells that are not corners.
inline constexpr Bitboard kEdgesBB = (kRow1 | kRow8 | kColumnA | kColumnH) & ~kCornersBB;

/// The twelve cells next to a corner. Taking one usually concedes the corner.
inline constexpr Bitboard kUnsafeBB = square_bb(B1) | square_bb(A2) | square_bb(B2) |
                                      square_bb(G1) | square_bb(H2) | square_bb(G2) |
                                      square_bb(A7) | square_bb(B8) | square_bb(B7) |
                                      square_bb(G7) | square_bb(H7) | square_bb(G8);

// ── Directions ──────────────────────────────────────────────────────────────
// North is towards row 0, east is towards column 7.

enum class Direction : std::uint8_t {
    NorthWest,
    West,
    SouthWest,
    North,
    South,
    NorthEast,
    East,
    SouthEast,
};

/// Scan order of the eight rays, matching the capture-list order.
inline constexpr Direction kDirections[] = {
    Direction::NorthWest, Direction::West,      Direction::SouthWest, Direction::North,
    Direction::South,     Direction::NorthEast, Direction::East,      Direction::SouthEast,
};

/// Row delta of a direction.
[[nodiscard]] constexpr int row_step(Direction d) noexcept {
    switch (d) {
        case Direction::NorthWest:
        case Direction::North:
        case Direction::NorthEast:
            return -1;
        case Direction::SouthWest:
        case Direction::South:
        case Direction::SouthEast:
            return 1;
        default:
            return 0;
    }
}

/// Column delta of a direction.
[[nodiscard]] constexpr int col_step(Direction d) noexcept {
    switch (d) {
        case Direction::NorthWest:
        case Direction::West:
        case Direction::SouthWest:
            return -1;
        case Direction::NorthEast:
        case Direction::East:
        case Direction::SouthEast:
            return 1;
        default:
            return 0;
    }
}

// ── Shift helpers ───────────────────────────────────────────────────────────

[[nodiscard]] constexpr Bitboard shift_north(Bitboard b) noexcept {
    return b >> 8;
}
[[nodiscard]] constexpr Bitboard shift_south(Bitboard b) noexcept {
    return b << 8;
}
[[nodiscard]] constexpr Bitboard shift_east(Bitboard b) noexcept {
    return (b << 1) & ~kColumnA;
}
[[nodiscard]] constexpr Bitboard shift_west(Bitboard b) noexcept {
    return (b >> 1) & ~kColumnH;
}
[[nodiscard]] constexpr Bitboard shift_ne(Bitboard b) noexcept {
    return (b >> 7) & ~kColumnA;
}
[[nodiscard]] constexpr Bitboard shift_nw(Bitboard b) noexcept {
    return (b >> 9) & ~kColumnH;
}
[[nodiscard]] constexpr Bitboard shift_se(Bitboard b) noexcept {
    return (b << 9) & ~kColumnA;
}
[[nodiscard]] constexpr Bitboard shift_sw(Bitboard b) noexcept {
    return (b << 7) & ~kColumnH;
}

/// Shift every bit one step in direction `d`; bits leaving the board are dropped.
[[nodiscard]] constexpr Bitboard shift(Bitboard b, Direction d) noexcept {
    switch (d) {
        case Direction::NorthWest:
            return shift_nw(b);
        case Direction::West:
            return shift_west(b);
        case Direction::SouthWest:
            return shift_sw(b);
        case Direction::North:
            return shift_north(b);
        case Direction::South:
            return shift_south(b);
        case Direction::NorthEast:
            return shift_ne(b);
        case Direction::East:
            return shift_east(b);
        case Direction::SouthEast:
            return shift_se(b);
    }
    return kEmptyBB;
}

}  // namespace othello
