#pragma once

/// @file position.hpp
/// Complete game state: board + side-to-move + last move.
///
/// Supports make_move / unmake_move with an internal history stack
/// and incremental Zobrist hashing of the disc layout.

#include <othello/board.hpp>
#include <othello/move.hpp>
#include <othello/zobrist.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace othello {

// ── Constants ───────────────────────────────────────────────────────────────

/// Text form of the standard start: White to move, no last move.
inline constexpr std::string_view kStartingLayout =
    "......../......../......../...OX.../...XO.../......../......../........ w -";

/// Side that opens a new game.
inline constexpr Color kStartingSide = Color::White;

/// Board part of the integer grid form, without a side to move.
/// Throws std::invalid_argument on a shape or value violation.
[[nodiscard]] Board board_from_rows(const std::vector<std::vector<int>>& rows);

// ── Undo info ───────────────────────────────────────────────────────────────

/// Snapshot saved before each move so we can undo it.
struct UndoInfo {
    Square placed;
    Bitboard flipped;
    Color side_to_move;
    Square last_move;
    std::uint64_t key;  ///< Zobrist key before the move
};

// ── Position ────────────────────────────────────────────────────────────────

class Position {
   public:
    /// Construct from explicit fields. Computes the Zobrist hash.
    Position(Board board, Color side, Square last_move = kNoSquare);

    /// Default: empty board, game over, no last move.
    Position();

    // ── Factory ─────────────────────────────────────────────────────────

    /// Standard starting position.
    [[nodiscard]] static Position initial();

    /// Parse the text form. Throws std::invalid_argument on bad input, including
    /// a side to move that contradicts the board (see check_side_to_move).
    [[nodiscard]] static Position from_string(std::string_view text);

    /// Build from the integer grid used by the Python front end
    /// (8 rows of 8 cells, 1 = Black, -1 = White, 0 = Empty; `current` in {1, -1, 0}).
    /// Throws std::invalid_argument on a shape or value violation, or when
    /// `current` contradicts the board.
    [[nodiscard]] static Position from_rows(const std::vector<std::vector<int>>& rows,
                                            int current,
                                            std::optional<std::pair<int, int>> last = std::nullopt);

    /// Throws std::invalid_argument unless `side` is consistent with `board`:
    /// Color::None only when neither side can move, and a colour only while
    /// at least one side still can.
    static void check_side_to_move(const Board& board, Color side);

    // ── Serialization ───────────────────────────────────────────────────

    [[nodiscard]] std::string to_string() const;

    /// Inverse of from_rows (board part only).
    [[nodiscard]] std::vector<std::vector<int>> to_rows() const;

    // ── Move operations ─────────────────────────────────────────────────

    /// Play `sq` for `side` if it is legal. Returns false and leaves the
    /// position untouched when the square is off-board, occupied, or flips nothing.
    bool apply_move(int row, int col, Color side);
    bool apply_move(Square sq, Color side);

    /// Apply a move known to be legal, pushing undo state onto the history stack.
    /// Hands the turn over (or back, or to Color::None) per the passing rule.
    void make_move(Move m, Color side);

    /// Undo the last make_move. History must not be empty.
    void unmake_move();

    /// Caller-side pass after a "no move" answer: hand the turn to the opponent,
    /// ending the game if the opponent cannot move either.
    void pass_turn();

    // ── Accessors ───────────────────────────────────────────────────────

    [[nodiscard]] const Board& board() const noexcept { return board_; }
    [[nodiscard]] Color side_to_move() const noexcept { return side_to_move_; }
    [[nodiscard]] Move last_move() const noexcept { return Move{last_move_}; }
    [[nodiscard]] std::uint64_t key() const noexcept { return key_; }
    [[nodiscard]] bool is_game_over() const noexcept { return side_to_move_ == Color::None; }
    [[nodiscard]] std::size_t ply() const noexcept { return history_.size(); }

    /// Disc tally as (black, white).
    [[nodiscard]] std::pair<int, int> score() const noexcept {
        return {board_.count(Color::Black), board_.count(Color::White)};
    }

    /// Same board, side to move and last move. History is not compared.
    [[nodiscard]] bool operator==(const Position& other) const noexcept {
        return board_ == other.board_ && side_to_move_ == other.side_to_move_ &&
               last_move_ == other.last_move_;
    }

   private:
    void compute_key();
    void hand_over_turn(Color mover);

    Board board_;
    Color side_to_move_ = Color::None;
    Square last_move_ = kNoSquare;
    std::uint64_t key_ = 0;  ///< Hash of the disc layout only
    std::vector<UndoInfo> history_;
};

}  // namespace othello
