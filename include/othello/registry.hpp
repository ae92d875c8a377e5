#pragma once

/// @file registry.hpp
/// Named bot roster. Each name is bound to one strategy tier.

#include <othello/strategy.hpp>

#include <memory>
#include <span>
#include <string_view>

namespace othello {

// Strong engine depth tiers
inline constexpr int kSeniorDepth = 6;
inline constexpr int kJuniorDepth = 5;
inline constexpr int kInternDepth = 4;

/// All registered names, weakest first.
[[nodiscard]] std::span<const std::string_view> strategy_names() noexcept;

[[nodiscard]] bool has_strategy(std::string_view name) noexcept;

/// Build a fresh strategy for `name`. Throws std::invalid_argument for an unknown name.
[[nodiscard]] std::unique_ptr<Strategy> make_strategy(std::string_view name);

}  // namespace othello
