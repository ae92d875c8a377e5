/// @file board.cpp
/// Board implementation: initial position factory.

#include <othello/board.hpp>

namespace othello {

Board Board::initial() noexcept {
    Board b;
    constexpr int kMid = kBoardSize / 2;

    b.put_disc(make_square(kMid - 1, kMid - 1), Color::White);
    b.put_disc(make_square(kMid, kMid), Color::White);
    b.put_disc(make_square(kMid - 1, kMid), Color::Black);
    b.put_disc(make_square(kMid, kMid - 1), Color::Black);

    return b;
}

}  // namespace othello
