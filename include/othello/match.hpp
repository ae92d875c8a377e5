#pragma once

/// @file match.hpp
/// Turn driver and bot-vs-bot matches.

#include <othello/strategy.hpp>

namespace othello {

struct MatchResult {
    Position final_position;
    int moves = 0;
    int passes = 0;
    int black = 0;
    int white = 0;
};

/// Let `strategy` play for the side to move: apply its move, or pass when it
/// has none. Returns false (and does nothing) once the game is over.
/// Throws std::logic_error if the strategy answers with an illegal move.
bool play_turn(Position& pos, Strategy& strategy);

/// Play from `start` until neither side can move.
[[nodiscard]] MatchResult play_match(Strategy& black, Strategy& white,
                                     Position start = Position::initial());

}  // namespace othello
