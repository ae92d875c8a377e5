/// @file saved_game.cpp
/// Saved game loading: JSON state / history and the text form.

#include <othello/saved_game.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace othello {

namespace {

using json = nlohmann::json;

constexpr std::string_view kBlank = " \t\r\n";

Position position_from_state(const json& state) {
    if (!state.is_object())
        throw std::invalid_argument("Saved state is not a JSON object");
    if (!state.contains("board") || !state.contains("current"))
        throw std::invalid_argument("Saved state needs 'board' and 'current'");

    const auto rows = state.at("board").get<std::vector<std::vector<int>>>();
    const int current = state.at("current").get<int>();

    std::optional<std::pair<int, int>> last;
    if (state.contains("last") && !state.at("last").is_null()) {
        const json& l = state.at("last");
        if (!l.is_array() || l.size() != 2)
            throw std::invalid_argument("'last' must be null or [row, col]");
        last = std::make_pair(l.at(0).get<int>(), l.at(1).get<int>());
    }
    return Position::from_rows(rows, current, last);
}

Position load_json(std::string_view contents) {
    const json doc = json::parse(contents.begin(), contents.end(), nullptr, false);
    if (doc.is_discarded())
        throw std::invalid_argument("Saved game is not valid JSON");

    try {
        if (doc.is_object() && doc.contains("history")) {
            const json& history = doc.at("history");
            if (!history.is_array() || history.empty())
                throw std::invalid_argument("'history' must be a non-empty array");
            return position_from_state(history.back());
        }
        return position_from_state(doc);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Bad saved state: ") + e.what());
    }
}

}  // namespace

std::string last_nonempty_line(std::string_view contents) {
    std::string_view last;
    while (!contents.empty()) {
        const auto eol = contents.find('\n');
        const std::string_view line = contents.substr(0, eol);
        const auto begin = line.find_first_not_of(kBlank);
        if (begin != std::string_view::npos)
            last = line.substr(begin, line.find_last_not_of(kBlank) - begin + 1);
        if (eol == std::string_view::npos)
            break;
        contents.remove_prefix(eol + 1);
    }
    return std::string(last);
}

Position load_saved_game(std::string_view contents) {
    const auto first = contents.find_first_not_of(kBlank);
    if (first == std::string_view::npos)
        throw std::invalid_argument("Saved game is empty");
    if (contents[first] == '{')
        return load_json(contents);
    return Position::from_string(last_nonempty_line(contents));
}

}  // namespace othello
