/// @file othello_bot.cpp
/// Load a saved position and print the move a bot would play from it.
///
/// Usage: othello_bot [--bot NAME] [--depth N] [--verbose] [--list] FILE|-
///
/// FILE is a saved game: either the web client's JSON (a single state or a
/// {"history": [...]} list, of which the last state is used) or positions in
/// text form, one per line, of which the last non-empty line is used.

#include <othello/engine.hpp>
#include <othello/registry.hpp>
#include <othello/saved_game.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

namespace {

constexpr int kUsageError = 2;
constexpr const char* kDefaultBot = "Sasha senior";

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--bot NAME] [--depth N] [--verbose] [--list] FILE|-\n";
}

std::string read_all(std::istream& in) {
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

/// Strictly positive integer, or -1 when `text` is not one.
int parse_depth(const char* text) {
    errno = 0;
    char* end = nullptr;
    const long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || value <= 0 || value > INT_MAX)
        return -1;
    return static_cast<int>(value);
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string bot = kDefaultBot;
    int depth = -1;
    bool verbose = false;
    const char* path = nullptr;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--bot") == 0 && i + 1 < argc) {
            bot = argv[++i];
        } else if (std::strcmp(argv[i], "--depth") == 0 && i + 1 < argc) {
            depth = parse_depth(argv[++i]);
            if (depth < 0) {
                std::cerr << "error: --depth needs a positive integer, got '" << argv[i] << "'\n";
                return kUsageError;
            }
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--list") == 0) {
            for (std::string_view name : othello::strategy_names()) {
                std::cout << name << "\n";
            }
            return 0;
        } else if (path == nullptr) {
            path = argv[i];
        } else {
            print_usage(argv[0]);
            return kUsageError;
        }
    }

    if (path == nullptr) {
        print_usage(argv[0]);
        return kUsageError;
    }

    try {
        std::string contents;
        if (std::strcmp(path, "-") == 0) {
            contents = read_all(std::cin);
        } else {
            std::ifstream file(path);
            if (!file) {
                std::cerr << "Cannot open " << path << "\n";
                return kUsageError;
            }
            contents = read_all(file);
        }

        othello::Position pos = othello::load_saved_game(contents);
        auto strategy = othello::make_strategy(bot);

        auto* engine_bot = dynamic_cast<othello::AlphaBetaStrategy*>(strategy.get());
        if (depth > 0) {
            if (engine_bot != nullptr) {
                engine_bot->limits().max_depth = depth;
            } else if (dynamic_cast<othello::MinimaxStrategy*>(strategy.get()) != nullptr) {
                strategy = std::make_unique<othello::MinimaxStrategy>(depth);
            } else {
                std::cerr << "warning: --depth has no effect on " << bot << "\n";
            }
        }
        if (engine_bot != nullptr && verbose) {
            othello::Engine& engine = engine_bot->engine();
            engine.set_iteration_callback([&engine](const othello::SearchResult& r) {
                std::cout << "depth " << r.depth << " best " << r.best_move.name() << " score "
                          << r.score << " nodes " << r.nodes << " hashfull " << engine.hashfull()
                          << "\n";
            });
        }

        if (pos.is_game_over()) {
            std::cout << "Game over.\n";
            return 0;
        }

        const othello::Color side = pos.side_to_move();
        auto choice = strategy->choose(pos, side);
        if (!choice) {
            std::cout << "No valid moves available.\n";
            return 0;
        }

        if (verbose && engine_bot != nullptr && engine_bot->last_result().from_book) {
            std::cout << "opening book\n";
        }
        std::cout << "Next move: " << choice->row() << " " << choice->col() << " ("
                  << choice->name() << ")\n";
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return kUsageError;
    }

    return 0;
}
