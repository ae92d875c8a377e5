/// @file position.cpp
/// Position implementation: constructors, text/grid forms, make/unmake, passing.

#include <othello/position.hpp>

#include <othello/movegen.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace othello {

// ── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// Split a string_view by spaces into its non-empty parts.
auto split_spaces(std::string_view sv) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t i = 0;
    while (i < sv.size()) {
        // Skip leading spaces
        while (i < sv.size() && sv[i] == ' ') ++i;
        if (i >= sv.size()) break;
        std::size_t start = i;
        while (i < sv.size() && sv[i] != ' ') ++i;
        parts.push_back(sv.substr(start, i - start));
    }
    return parts;
}

constexpr char kBlackChar = 'X';
constexpr char kWhiteChar = 'O';
constexpr char kEmptyChar = '.';

}  // namespace

// ── Constructors ────────────────────────────────────────────────────────────

Position::Position(Board board, Color side, Square last_move)
    : board_(board), side_to_move_(side), last_move_(last_move), key_(0) {
    compute_key();
}

Position::Position() : board_(), side_to_move_(Color::None), last_move_(kNoSquare), key_(0) {
    compute_key();
}

// ── Factory ─────────────────────────────────────────────────────────────────

Position Position::initial() {
    return Position(Board::initial(), kStartingSide);
}

Position Position::from_string(std::string_view text) {
    auto parts = split_spaces(text);
    if (parts.size() != 3) {
        throw std::invalid_argument("Invalid position (need 3 fields): " + std::string(text));
    }

    // 1. Disc layout
    std::string_view layout = parts[0];
    Board board;
    int row = 0;
    int col = 0;

    for (char ch : layout) {
        if (ch == '/') {
            if (col != kBoardSize) {
                throw std::invalid_argument("Invalid row width: " + std::string(text));
            }
            ++row;
            col = 0;
            if (row >= kBoardSize) {
                throw std::invalid_argument("Too many rows: " + std::string(text));
            }
            continue;
        }
        if (col >= kBoardSize) {
            throw std::invalid_argument("Invalid row width: " + std::string(text));
        }
        switch (ch) {
            case kBlackChar:
                board.put_disc(make_square(row, col), Color::Black);
                break;
            case kWhiteChar:
                board.put_disc(make_square(row, col), Color::White);
                break;
            case kEmptyChar:
                break;
            default:
                throw std::invalid_argument(std::string("Invalid cell char: ") + ch);
        }
        ++col;
    }
    if (row != kBoardSize - 1 || col != kBoardSize) {
        throw std::invalid_argument("Invalid board layout: " + std::string(text));
    }

    // 2. Side to move
    Color side = Color::None;
    if (parts[1] == "b") {
        side = Color::Black;
    } else if (parts[1] == "w") {
        side = Color::White;
    } else if (parts[1] != "-") {
        throw std::invalid_argument("Invalid side-to-move: " + std::string(parts[1]));
    }

    // 3. Last move
    Square last = kNoSquare;
    if (parts[2] != "-") {
        last = parse_square(parts[2]);
        if (last == kNoSquare) {
            throw std::invalid_argument("Invalid last move: " + std::string(parts[2]));
        }
    }

    check_side_to_move(board, side);
    return Position(board, side, last);
}

Board board_from_rows(const std::vector<std::vector<int>>& rows) {
    if (rows.size() != static_cast<std::size_t>(kBoardSize)) {
        throw std::invalid_argument("Board must have 8 rows, got " + std::to_string(rows.size()));
    }

    Board board;
    for (int r = 0; r < kBoardSize; ++r) {
        const auto& cells = rows[static_cast<std::size_t>(r)];
        if (cells.size() != static_cast<std::size_t>(kBoardSize)) {
            throw std::invalid_argument("Row " + std::to_string(r) + " must have 8 cells, got " +
                                        std::to_string(cells.size()));
        }
        for (int c = 0; c < kBoardSize; ++c) {
            Color owner = Color::None;
            int code = cells[static_cast<std::size_t>(c)];
            if (!decode_color(code, owner)) {
                throw std::invalid_argument("Invalid cell value " + std::to_string(code) + " at (" +
                                            std::to_string(r) + "," + std::to_string(c) + ")");
            }
            if (owner != Color::None) {
                board.put_disc(make_square(r, c), owner);
            }
        }
    }
    return board;
}

Position Position::from_rows(const std::vector<std::vector<int>>& rows, int current,
                             std::optional<std::pair<int, int>> last) {
    Board board = board_from_rows(rows);

    Color side = Color::None;
    if (!decode_color(current, side)) {
        throw std::invalid_argument("Invalid current player " + std::to_string(current));
    }

    Square last_sq = kNoSquare;
    if (last) {
        if (!is_on_board(last->first, last->second)) {
            throw std::invalid_argument("Last move off the board: (" +
                                        std::to_string(last->first) + "," +
                                        std::to_string(last->second) + ")");
        }
        last_sq = make_square(last->first, last->second);
    }

    check_side_to_move(board, side);
    return Position(board, side, last_sq);
}

void Position::check_side_to_move(const Board& board, Color side) {
    const bool black_can = movegen::has_legal_move(board, Color::Black);
    const bool white_can = movegen::has_legal_move(board, Color::White);

    if (side == Color::None && (black_can || white_can)) {
        throw std::invalid_argument("Game marked over but a side can still move");
    }
    if (side != Color::None && !black_can && !white_can) {
        throw std::invalid_argument(std::string("Side to move '") + color_char(side) +
                                    "' given, but neither side can move");
    }
}

// ── Serialization ───────────────────────────────────────────────────────────

std::string Position::to_string() const {
    std::string out;
    out.reserve(80);

    // 1. Disc layout (row 0 → row 7)
    for (int row = 0; row < kBoardSize; ++row) {
        if (row > 0) out += '/';
        for (int col = 0; col < kBoardSize; ++col) {
            switch (board_.cell_at(make_square(row, col))) {
                case Cell::Black:
                    out += kBlackChar;
                    break;
                case Cell::White:
                    out += kWhiteChar;
                    break;
                case Cell::Empty:
                    out += kEmptyChar;
                    break;
            }
        }
    }

    // 2. Side to move
    out += ' ';
    out += color_char(side_to_move_);

    // 3. Last move
    out += ' ';
    out += (last_move_ == kNoSquare) ? std::string("-") : square_name(last_move_);

    return out;
}

std::vector<std::vector<int>> Position::to_rows() const {
    std::vector<std::vector<int>> rows(kBoardSize, std::vector<int>(kBoardSize, 0));
    for (int sq = 0; sq < kNumSquares; ++sq) {
        auto s = static_cast<Square>(sq);
        rows[row_of(s)][col_of(s)] = color_code(color_of(board_.cell_at(s)));
    }
    return rows;
}

// ── Move operations ─────────────────────────────────────────────────────────

bool Position::apply_move(int row, int col, Color side) {
    if (!is_on_board(row, col))
        return false;
    return apply_move(make_square(row, col), side);
}

bool Position::apply_move(Square sq, Color side) {
    if (!is_valid_square(sq) || !board_.is_empty(sq))
        return false;
    if (movegen::flips(board_, sq, side) == kEmptyBB)
        return false;
    make_move(Move{sq}, side);
    return true;
}

void Position::make_move(Move m, Color side) {
    const Bitboard flipped = movegen::flips(board_, m.sq, side);

    // Save undo state
    history_.push_back({m.sq, flipped, side_to_move_, last_move_, key_});

    // Place the disc and record it before flipping
    board_.put_disc(m.sq, side);
    key_ ^= zobrist::disc_key(side, m.sq);
    last_move_ = m.sq;

    board_.flip(flipped);
    const Color them = opposite(side);
    Bitboard bits = flipped;
    while (bits) {
        Square sq = pop_lsb(bits);
        key_ ^= zobrist::disc_key(them, sq) ^ zobrist::disc_key(side, sq);
    }

    hand_over_turn(side);
}

void Position::unmake_move() {
    UndoInfo undo = history_.back();
    history_.pop_back();

    board_.flip(undo.flipped);
    board_.remove_disc(undo.placed);

    side_to_move_ = undo.side_to_move;
    last_move_ = undo.last_move;
    key_ = undo.key;
}

void Position::pass_turn() {
    if (side_to_move_ == Color::None)
        return;
    side_to_move_ = opposite(side_to_move_);
    if (!movegen::has_legal_move(board_, side_to_move_)) {
        side_to_move_ = Color::None;
    }
}

// ── Private helpers ─────────────────────────────────────────────────────────

void Position::hand_over_turn(Color mover) {
    side_to_move_ = opposite(mover);
    if (movegen::has_legal_move(board_, side_to_move_))
        return;

    // Opponent must pass: the turn comes back, unless the mover is stuck too.
    side_to_move_ = mover;
    if (!movegen::has_legal_move(board_, mover)) {
        side_to_move_ = Color::None;
    }
}

void Position::compute_key() {
    key_ = 0;
    for (int sq = 0; sq < kNumSquares; ++sq) {
        auto s = static_cast<Square>(sq);
        Color owner = color_of(board_.cell_at(s));
        if (owner != Color::None) {
            key_ ^= zobrist::disc_key(owner, s);
        }
    }
    history_.clear();
}

}  // namespace othello
