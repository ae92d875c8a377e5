#pragma once

/// @file tt.hpp
/// Transposition table for caching search results.
///
/// One entry per slot, indexed by the low bits of the node key. The table is
/// owned by one Search and cleared at the start of every search.

#include <othello/types.hpp>

#include <cstdint>
#include <vector>

namespace othello {

// ── Bound type ──────────────────────────────────────────────────────────────

/// The type of score stored in a TT entry.
enum class Bound : std::uint8_t {
    None = 0,   ///< Invalid / empty entry.
    Exact = 1,  ///< Exact minimax score.
    Lower = 2,  ///< Fail-high: true score is at least this.
    Upper = 3,  ///< Fail-low: true score is at most this.
};

// ── TT entry ────────────────────────────────────────────────────────────────

/// A single transposition table entry (16 bytes).
struct TTEntry {
    std::uint64_t key = 0;       ///< Full node key for verification.
    std::int32_t score = 0;      ///< Search score from the root side's perspective.
    std::uint8_t depth = 0;      ///< Remaining depth of the stored search.
    Bound bound = Bound::None;   ///< Type of bound.
    std::uint16_t padding_ = 0;  ///< Padding to 16 bytes.
};

static_assert(sizeof(TTEntry) == 16, "TTEntry must be 16 bytes for cache efficiency");

// ── Transposition table ─────────────────────────────────────────────────────

class TranspositionTable {
   public:
    static constexpr std::size_t kDefaultSizeMB = 4;

    /// Allocate `mb` megabytes. The slot count is the largest power of two
    /// that fits, and never fewer than 1024 slots.
    explicit TranspositionTable(std::size_t mb = kDefaultSizeMB);

    /// Reallocate; every stored entry is lost.
    void resize(std::size_t mb);

    void clear();

    /// Look up a node key. On a hit, copies the slot into `entry` and returns true.
    [[nodiscard]] bool lookup(std::uint64_t key, TTEntry& entry) const noexcept;

    /// Record a score for `key`. A slot holding a deeper entry for a different
    /// node is kept, unless the new score is exact and the old one a bound.
    void store(std::uint64_t key, int depth, int score, Bound bound) noexcept;

    [[nodiscard]] std::size_t entry_count() const noexcept { return table_.size(); }

    /// Share of used slots among the first 1000, in per-mille.
    [[nodiscard]] int hashfull() const noexcept;

   private:
    [[nodiscard]] std::size_t index(std::uint64_t key) const noexcept {
        return static_cast<std::size_t>(key) & mask_;
    }

    std::vector<TTEntry> table_;
    std::size_t mask_ = 0;
};

}  // namespace othello
