/// @file match.cpp
/// Turn driver and bot-vs-bot matches.

#include <othello/match.hpp>

#include <stdexcept>
#include <utility>

namespace othello {

bool play_turn(Position& pos, Strategy& strategy) {
    if (pos.is_game_over())
        return false;

    const Color side = pos.side_to_move();
    std::optional<Move> choice = strategy.choose(pos, side);
    if (!choice) {
        pos.pass_turn();
        return true;
    }
    if (!pos.apply_move(choice->sq, side)) {
        throw std::logic_error("Strategy chose illegal move " + choice->name());
    }
    return true;
}

MatchResult play_match(Strategy& black, Strategy& white, Position start) {
    MatchResult result{std::move(start)};
    Position& pos = result.final_position;

    while (!pos.is_game_over()) {
        Strategy& mover = (pos.side_to_move() == Color::Black) ? black : white;
        const std::size_t ply_before = pos.ply();
        play_turn(pos, mover);
        if (pos.ply() > ply_before) {
            ++result.moves;
        } else {
            ++result.passes;
        }
    }

    auto [b, w] = pos.score();
    result.black = b;
    result.white = w;
    return result;
}

}  // namespace othello
