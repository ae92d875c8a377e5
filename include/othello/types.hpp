#pragma once

/// @file types.hpp
/// Core type aliases and enumerations for the Othello engine.

#include <cstdint>
#include <string>
#include <string_view>

namespace othello {

// ── Square ──────────────────────────────────────────────────────────────────
// Row-major: (0,0)=0, (0,1)=1, ..., (0,7)=7, (1,0)=8, ..., (7,7)=63
using Square = std::uint8_t;

inline constexpr Square kNoSquare = 64;
inline constexpr int kBoardSize = 8;
inline constexpr int kNumSquares = 64;

[[nodiscard]] constexpr int row_of(Square sq) noexcept {
    return sq >> 3;
}
[[nodiscard]] constexpr int col_of(Square sq) noexcept {
    return sq & 7;
}
[[nodiscard]] constexpr Square make_square(int row, int col) noexcept {
    return static_cast<Square>(row * 8 + col);
}
[[nodiscard]] constexpr bool is_valid_square(int sq) noexcept {
    return sq >= 0 && sq < 64;
}
[[nodiscard]] constexpr bool is_on_board(int row, int col) noexcept {
    return row >= 0 && row < kBoardSize && col >= 0 && col < kBoardSize;
}

/// Column letter then row digit: (2,3) -> "d3".
[[nodiscard]] inline std::string square_name(Square sq) {
    return {static_cast<char>('a' + col_of(sq)), static_cast<char>('1' + row_of(sq))};
}

[[nodiscard]] inline Square parse_square(std::string_view name) {
    if (name.size() != 2)
        return kNoSquare;
    int c = name[0] - 'a';
    int r = name[1] - '1';
    if (!is_on_board(r, c))
        return kNoSquare;
    return make_square(r, c);
}

// ── Color ───────────────────────────────────────────────────────────────────
// Color::None doubles as the "game over" side-to-move marker.
enum class Color : std::uint8_t { Black = 0, White = 1, None = 2 };

[[nodiscard]] constexpr Color opposite(Color c) noexcept {
    switch (c) {
        case Color::Black:
            return Color::White;
        case Color::White:
            return Color::Black;
        default:
            return Color::None;
    }
}
[[nodiscard]] constexpr int color_index(Color c) noexcept {
    return static_cast<int>(c);
}

[[nodiscard]] constexpr char color_char(Color c) noexcept {
    switch (c) {
        case Color::Black:
            return 'b';
        case Color::White:
            return 'w';
        default:
            return '-';
    }
}

// ── Cell ────────────────────────────────────────────────────────────────────
enum class Cell : std::uint8_t { Empty = 0, Black = 1, White = 2 };

[[nodiscard]] constexpr Cell cell_of(Color c) noexcept {
    switch (c) {
        case Color::Black:
            return Cell::Black;
        case Color::White:
            return Cell::White;
        default:
            return Cell::Empty;
    }
}

[[nodiscard]] constexpr Color color_of(Cell cell) noexcept {
    switch (cell) {
        case Cell::Black:
            return Color::Black;
        case Cell::White:
            return Color::White;
        default:
            return Color::None;
    }
}

// ── Wire codes ──────────────────────────────────────────────────────────────
// Integer encoding shared with the Python front end: 1 = Black, -1 = White, 0 = none.

[[nodiscard]] constexpr int color_code(Color c) noexcept {
    switch (c) {
        case Color::Black:
            return 1;
        case Color::White:
            return -1;
        default:
            return 0;
    }
}

/// Decode a wire code. Returns false for values outside {-1, 0, 1}.
[[nodiscard]] constexpr bool decode_color(int code, Color& out) noexcept {
    switch (code) {
        case 1:
            out = Color::Black;
            return true;
        case -1:
            out = Color::White;
            return true;
        case 0:
            out = Color::None;
            return true;
        default:
            return false;
    }
}

// Named squares used by the heuristics and the opening book
// clang-format off
enum SquareConstants : Square {
    A1 = 0,  B1 = 1,  G1 = 6,  H1 = 7,
    A2 = 8,  B2 = 9,  G2 = 14, H2 = 15,
    D3 = 19, E3 = 20,
    A7 = 48, B7 = 49, G7 = 54, H7 = 55,
    A8 = 56, B8 = 57, G8 = 62, H8 = 63,
};
// clang-format on

}  // namespace othello
