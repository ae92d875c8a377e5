#pragma once

/// @file saved_game.hpp
/// Loading of saved games written by the web client or by hand.
///
/// Two input forms are accepted:
///  - JSON: a single state `{"board": [[...]], "current": 1, "last": [r, c]}`
///    or `{"history": [state, ...]}`, in which case the last state is used;
///  - text: positions in Position::to_string() form, one per line; the last
///    non-empty line is used.

#include <othello/position.hpp>

#include <string>
#include <string_view>

namespace othello {

/// Parse the contents of a saved game file. The JSON form is chosen when the
/// first non-blank character is '{'.
/// Throws std::invalid_argument on malformed input or an invalid position.
[[nodiscard]] Position load_saved_game(std::string_view contents);

/// Last non-blank line of `contents` with surrounding blanks trimmed, or an
/// empty string.
[[nodiscard]] std::string last_nonempty_line(std::string_view contents);

}  // namespace othello
