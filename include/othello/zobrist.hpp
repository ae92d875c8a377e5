#pragma once

/// @file zobrist.hpp
/// Zobrist hashing keys for incremental board hashing and search-node keys.

#include <othello/types.hpp>

#include <cstdint>

namespace othello::zobrist {

// ── splitmix64 key generator ────────────────────────────────────────────────

inline constexpr std::uint64_t kSeed = 0xA5B3C7D9E1F23412ULL;
inline constexpr std::uint64_t kMask64 = 0xFFFFFFFFFFFFFFFFULL;

/// Largest search depth that gets its own key (one ply per empty square).
inline constexpr int kMaxDepthKeys = 64;

[[nodiscard]] constexpr std::uint64_t splitmix64(std::uint64_t state) noexcept {
    std::uint64_t z = (state + 0x9E3779B97F4A7C15ULL) & kMask64;
    z = ((z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL) & kMask64;
    z = ((z ^ (z >> 27)) * 0x94D049BB133111EBULL) & kMask64;
    return z ^ (z >> 31);
}

[[nodiscard]] constexpr std::uint64_t nth_key(int index) noexcept {
    return splitmix64(kSeed + static_cast<std::uint64_t>(index));
}

// ── Pre-computed key tables ─────────────────────────────────────────────────

namespace detail {

struct ZobristKeys {
    std::uint64_t disc_keys[2][64]{};  // [color_index][square]
    std::uint64_t turn_keys[2]{};      // [color_index]
    std::uint64_t depth_keys[kMaxDepthKeys + 1]{};
};

constexpr ZobristKeys compute_keys() noexcept {
    ZobristKeys keys{};

    // Disc keys: index = color * 64 + sq
    for (int color = 0; color < 2; ++color) {
        for (int sq = 0; sq < 64; ++sq) {
            keys.disc_keys[color][sq] = nth_key(color * 64 + sq);
        }
    }

    // Turn keys: index = 128 + color
    for (int color = 0; color < 2; ++color) {
        keys.turn_keys[color] = nth_key(2 * 64 + color);
    }

    // Depth keys: index = 130 + depth
    for (int depth = 0; depth <= kMaxDepthKeys; ++depth) {
        keys.depth_keys[depth] = nth_key(2 * 64 + 2 + depth);
    }

    return keys;
}

inline constexpr ZobristKeys kKeys = compute_keys();

}  // namespace detail

// ── Public API ──────────────────────────────────────────────────────────────

/// Hash key for a disc of `color` on `sq`.
[[nodiscard]] constexpr std::uint64_t disc_key(Color color, Square sq) noexcept {
    return detail::kKeys.disc_keys[color_index(color)][sq];
}

/// Hash key for the side to move at a search node (Black or White).
[[nodiscard]] constexpr std::uint64_t turn_key(Color color) noexcept {
    return detail::kKeys.turn_keys[color_index(color) & 1];
}

/// Hash key for the remaining search depth. Depths above kMaxDepthKeys share the last key.
[[nodiscard]] constexpr std::uint64_t depth_key(int depth) noexcept {
    return detail::kKeys.depth_keys[depth < 0 ? 0 : (depth > kMaxDepthKeys ? kMaxDepthKeys : depth)];
}

}  // namespace othello::zobrist
