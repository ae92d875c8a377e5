/// @file tt.cpp
/// Transposition table implementation.

#include <othello/tt.hpp>

#include <algorithm>
#include <bit>

namespace othello {

namespace {

constexpr std::size_t kBytesPerMB = 1024ULL * 1024ULL;
constexpr std::size_t kMinEntries = 1024;

// hashfull() looks at this many leading slots.
constexpr std::size_t kHashfullSample = 1000;

}  // namespace

// ── TranspositionTable ──────────────────────────────────────────────────────

TranspositionTable::TranspositionTable(std::size_t mb) {
    resize(mb);
}

void TranspositionTable::resize(std::size_t mb) {
    const std::size_t budget = std::max<std::size_t>(mb, 1) * kBytesPerMB;
    const std::size_t slots = std::max(std::bit_floor(budget / sizeof(TTEntry)), kMinEntries);

    table_.assign(slots, TTEntry{});
    mask_ = slots - 1;
}

void TranspositionTable::clear() {
    std::fill(table_.begin(), table_.end(), TTEntry{});
}

bool TranspositionTable::lookup(std::uint64_t key, TTEntry& entry) const noexcept {
    const TTEntry& slot = table_[index(key)];
    if (slot.bound == Bound::None || slot.key != key)
        return false;
    entry = slot;
    return true;
}

void TranspositionTable::store(std::uint64_t key, int depth, int score, Bound bound) noexcept {
    TTEntry& slot = table_[index(key)];

    // Keep a deeper entry for another node, unless we bring an exact score
    // and it only holds a bound.
    const bool occupied_by_other = slot.bound != Bound::None && slot.key != key;
    if (occupied_by_other && depth < slot.depth &&
        !(bound == Bound::Exact && slot.bound != Bound::Exact))
        return;

    slot.key = key;
    slot.score = static_cast<std::int32_t>(score);
    slot.depth = static_cast<std::uint8_t>(depth);
    slot.bound = bound;
}

int TranspositionTable::hashfull() const noexcept {
    const std::size_t sample = std::min(table_.size(), kHashfullSample);
    if (sample == 0)
        return 0;
    const auto used = std::count_if(table_.begin(), table_.begin() + sample,
                                    [](const TTEntry& e) { return e.bound != Bound::None; });
    return static_cast<int>(static_cast<std::size_t>(used) * 1000 / sample);
}

}  // namespace othello
