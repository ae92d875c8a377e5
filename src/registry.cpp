/// @file registry.cpp
/// Bot roster.

#include <othello/registry.hpp>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace othello {

namespace {

// clang-format off
constexpr std::array<std::string_view, 6> kNames = {
    "David",         // greedy
    "Roger",         // one-ply lookahead
    "Minnie",        // fixed-depth minimax
    "Sasha intern",  // alpha-beta, depth 4
    "Sasha junior",  // alpha-beta, depth 5
    "Sasha senior",  // alpha-beta, depth 6
};
// clang-format on

}  // namespace

std::span<const std::string_view> strategy_names() noexcept {
    return kNames;
}

bool has_strategy(std::string_view name) noexcept {
    return std::find(kNames.begin(), kNames.end(), name) != kNames.end();
}

std::unique_ptr<Strategy> make_strategy(std::string_view name) {
    if (name == "David")
        return std::make_unique<GreedyStrategy>();
    if (name == "Roger")
        return std::make_unique<LookaheadStrategy>();
    if (name == "Minnie")
        return std::make_unique<MinimaxStrategy>(kMinimaxDepth);
    if (name == "Sasha intern")
        return std::make_unique<AlphaBetaStrategy>(kInternDepth);
    if (name == "Sasha junior")
        return std::make_unique<AlphaBetaStrategy>(kJuniorDepth);
    if (name == "Sasha senior")
        return std::make_unique<AlphaBetaStrategy>(kSeniorDepth);

    throw std::invalid_argument("Unknown strategy: " + std::string(name));
}

}  // namespace othello
