/// @file pybind_module.cpp
/// pybind11 bindings for the C++ Othello engine.
///
/// Exposes the `_othello_engine` Python module. Boards cross the boundary in
/// the front end's own format: 8 lists of 8 ints (1 = Black, -1 = White,
/// 0 = Empty), the current player as 1 / -1 / 0, and the last move as a
/// (row, col) tuple or None.

#include <othello/engine.hpp>
#include <othello/registry.hpp>

#include <optional>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

using Grid = std::vector<std::vector<int>>;
using LastMove = std::optional<std::pair<int, int>>;

othello::Color decode_player(int code) {
    othello::Color c = othello::Color::None;
    if (!othello::decode_color(code, c) || c == othello::Color::None) {
        throw std::invalid_argument("Player must be 1 (black) or -1 (white), got " +
                                    std::to_string(code));
    }
    return c;
}

py::object move_tuple(othello::Move m) {
    if (m.is_null())
        return py::none();
    return py::make_tuple(m.row(), m.col());
}

py::dict state_dict(const othello::Position& pos) {
    py::dict d;
    d["board"] = py::cast(pos.to_rows());
    d["current"] = py::cast(othello::color_code(pos.side_to_move()));
    d["last"] = move_tuple(pos.last_move());
    return d;
}

}  // namespace

PYBIND11_MODULE(_othello_engine, m) {
    m.doc() = "Native C++ Othello engine (pybind11)";

    // ── Game state ──────────────────────────────────────────────────────
    m.def(
        "new_game", []() { return state_dict(othello::Position::initial()); },
        "Standard start as a dict with keys ``board``, ``current`` and ``last``.");

    m.def(
        "legal_moves",
        [](const Grid& board, int player) {
            const othello::Board b = othello::board_from_rows(board);
            std::vector<std::pair<int, int>> out;
            for (const othello::Move& mv : othello::movegen::legal(b, decode_player(player))) {
                out.emplace_back(mv.row(), mv.col());
            }
            return out;
        },
        py::arg("board"), py::arg("player"), "Legal (row, col) moves for *player* in scan order.");

    m.def(
        "apply_move",
        [](const Grid& board, int current, LastMove last, int row, int col,
           int player) -> py::object {
            auto pos = othello::Position::from_rows(board, current, last);
            if (!pos.apply_move(row, col, decode_player(player)))
                return py::none();
            return state_dict(pos);
        },
        py::arg("board"), py::arg("current"), py::arg("last"), py::arg("row"), py::arg("col"),
        py::arg("player"),
        R"doc(Play (row, col) for *player*.

Returns the new state dict, or None if the move is illegal. The input lists are
never modified.)doc");

    m.def(
        "score",
        [](const Grid& board) {
            const othello::Board b = othello::board_from_rows(board);
            return std::make_pair(b.count(othello::Color::Black), b.count(othello::Color::White));
        },
        py::arg("board"), "Disc tally as (black, white).");

    // ── Bots ────────────────────────────────────────────────────────────
    m.def(
        "strategy_names",
        []() {
            std::vector<std::string> names;
            for (std::string_view n : othello::strategy_names()) {
                names.emplace_back(n);
            }
            return names;
        },
        "Registered bot names, weakest first.");

    m.def(
        "bot_move",
        [](const std::string& name, const Grid& board, int current, LastMove last) -> py::object {
            auto strategy = othello::make_strategy(name);
            auto pos = othello::Position::from_rows(board, current, last);
            if (pos.is_game_over())
                return py::none();

            std::optional<othello::Move> choice;
            {
                py::gil_scoped_release release;
                choice = strategy->choose(pos, pos.side_to_move());
            }
            return choice ? move_tuple(*choice) : py::none();
        },
        py::arg("name"), py::arg("board"), py::arg("current"), py::arg("last") = py::none(),
        R"doc(Ask bot *name* for a move for the current player.

Returns ``(row, col)`` or None when the player has no legal move and must pass.
Raises ValueError for an unknown bot or a malformed board.)doc");

    // ── Engine class ────────────────────────────────────────────────────
    py::class_<othello::Engine>(m, "Engine")
        .def(py::init<std::size_t>(), py::arg("tt_mb") = othello::TranspositionTable::kDefaultSizeMB,
             "Create an engine with a transposition table of *tt_mb* megabytes.")

        .def(
            "search",
            [](othello::Engine& self, const Grid& board, int player, int max_depth,
               int64_t time_limit_ms, bool use_book) -> py::tuple {
                const othello::Color side = decode_player(player);
                othello::Position pos(othello::board_from_rows(board), side);
                othello::SearchLimits limits;
                limits.max_depth = max_depth;
                limits.time_limit_ms = time_limit_ms;
                limits.use_book = use_book;

                othello::SearchResult result;
                {
                    // Release the GIL during the search so Python threads
                    // (e.g. the cancel callback) can run concurrently.
                    py::gil_scoped_release release;
                    result = self.search(pos, side, limits);
                }

                return py::make_tuple(move_tuple(result.best_move), result.score, result.depth,
                                      static_cast<int64_t>(result.nodes), result.from_book);
            },
            py::arg("board"), py::arg("player"), py::arg("max_depth") = othello::kDefaultMaxDepth,
            py::arg("time_limit_ms") = -1, py::arg("use_book") = true,
            R"doc(Run an alpha-beta search for *player* on *board*.

Returns a tuple ``(move, score, depth, nodes, from_book)``.
*move* is None when *player* has no legal move.)doc")

        .def("cancel", &othello::Engine::cancel, "Cancel a running search (thread-safe).")

        .def("set_tt_size", &othello::Engine::set_tt_size, py::arg("mb"),
             "Resize the transposition table.");
}
