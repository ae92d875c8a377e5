#pragma once

/// @file engine.hpp
/// High-level engine facade: wraps Search + TranspositionTable.

#include <othello/search.hpp>

#include <cstddef>

namespace othello {

/// Top-level search API used by the bindings and the CLI.
class Engine {
   public:
    explicit Engine(std::size_t tt_mb = TranspositionTable::kDefaultSizeMB);

    /// Run search for `side` and return the result.
    SearchResult search(Position& pos, Color side, const SearchLimits& limits);

    /// Cancel a running search (thread-safe).
    void cancel() noexcept;

    /// Resize the transposition table.
    void set_tt_size(std::size_t mb);

    /// TT fill of the last search, in per-mille.
    [[nodiscard]] int hashfull() const noexcept;

    /// Report each completed iteration (used for verbose output).
    void set_iteration_callback(IterationCallback cb);

   private:
    Search search_;
};

}  // namespace othello
