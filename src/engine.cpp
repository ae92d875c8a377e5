/// @file engine.cpp
/// Engine facade implementation.

#include <othello/engine.hpp>

#include <utility>

namespace othello {

Engine::Engine(std::size_t tt_mb) : search_(tt_mb) {}

SearchResult Engine::search(Position& pos, Color side, const SearchLimits& limits) {
    return search_.search(pos, side, limits);
}

void Engine::cancel() noexcept {
    search_.cancel();
}

void Engine::set_tt_size(std::size_t mb) {
    search_.tt().resize(mb);
}

int Engine::hashfull() const noexcept {
    return search_.tt().hashfull();
}

void Engine::set_iteration_callback(IterationCallback cb) {
    search_.set_iteration_callback(std::move(cb));
}

}  // namespace othello
