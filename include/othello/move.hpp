#pragma once

/// @file move.hpp
/// Move representation, MoveList and CaptureSet containers.

#include <othello/types.hpp>

#include <array>
#include <string>
#include <string_view>

namespace othello {

/// A disc placement. The side playing it travels separately.
struct Move {
    Square sq = kNoSquare;

    [[nodiscard]] constexpr bool operator==(const Move&) const noexcept = default;

    [[nodiscard]] constexpr int row() const noexcept { return row_of(sq); }
    [[nodiscard]] constexpr int col() const noexcept { return col_of(sq); }

    /// Coordinate name, e.g. "d3". Empty for the null move.
    [[nodiscard]] inline std::string name() const {
        return is_null() ? std::string{} : square_name(sq);
    }

    /// Parse a coordinate name. Returns the null move on failure.
    [[nodiscard]] static inline Move from_name(std::string_view name) {
        return Move{parse_square(name)};
    }

    [[nodiscard]] static constexpr Move at(int row, int col) noexcept {
        return is_on_board(row, col) ? Move{make_square(row, col)} : Move{};
    }

    /// Check whether this move is null / invalid.
    [[nodiscard]] constexpr bool is_null() const noexcept { return sq >= kNoSquare; }
};

/// Sentinel for "no move".
inline constexpr Move kNullMove{};

// ── FixedList ───────────────────────────────────────────────────────────────

/// Fixed-capacity list (no heap allocation during search).
template <typename T, int Capacity>
class FixedList {
   public:
    static constexpr int kCapacity = Capacity;

    constexpr void push(T v) noexcept { items_[count_++] = v; }
    [[nodiscard]] constexpr int size() const noexcept { return count_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return count_ == 0; }
    constexpr void clear() noexcept { count_ = 0; }
    constexpr void truncate(int n) noexcept { count_ = n; }

    [[nodiscard]] constexpr T& operator[](int i) noexcept { return items_[i]; }
    [[nodiscard]] constexpr const T& operator[](int i) const noexcept { return items_[i]; }

    // Iterator support
    [[nodiscard]] constexpr T* begin() noexcept { return items_.data(); }
    [[nodiscard]] constexpr T* end() noexcept { return items_.data() + count_; }
    [[nodiscard]] constexpr const T* begin() const noexcept { return items_.data(); }
    [[nodiscard]] constexpr const T* end() const noexcept { return items_.data() + count_; }

   private:
    std::array<T, Capacity> items_{};
    int count_ = 0;
};

/// Candidate moves. An Othello position never has more empty squares than 60.
using MoveList = FixedList<Move, 64>;

/// Opponent discs a move would flip, in ray order. At most 6 per ray.
using CaptureSet = FixedList<Square, 48>;

}  // namespace othello
