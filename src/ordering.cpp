/// @file ordering.cpp
/// Move ordering implementation.

#include <othello/ordering.hpp>

#include <othello/movegen.hpp>

#include <algorithm>
#include <array>

namespace othello::ordering {

int priority(Square sq) noexcept {
    if (test_bit(kCornersBB, sq))
        return kCornerPriority;
    if (test_bit(kUnsafeBB, sq))
        return kUnsafePriority;
    if (test_bit(kEdgesBB, sq))
        return kEdgePriority;
    return kInteriorPriority;
}

void order_moves(const Board& board, MoveList& ml, Color side) {
    struct Keyed {
        int priority;
        int flips;  // negated: more flips sorts first
        Move move;
    };

    std::array<Keyed, MoveList::kCapacity> keyed{};
    const int n = ml.size();
    for (int i = 0; i < n; ++i) {
        Square sq = ml[i].sq;
        int p = priority(sq);
        // Corners and unsafe squares are ranked by class alone.
        int f = (p == kCornerPriority || p == kUnsafePriority)
                    ? 0
                    : -popcount(movegen::flips(board, sq, side));
        keyed[i] = {p, f, ml[i]};
    }

    std::stable_sort(keyed.begin(), keyed.begin() + n, [](const Keyed& a, const Keyed& b) {
        if (a.priority != b.priority)
            return a.priority < b.priority;
        return a.flips < b.flips;
    });

    for (int i = 0; i < n; ++i) {
        ml[i] = keyed[i].move;
    }
}

}  // namespace othello::ordering
