#pragma once

#include "ParseError.hpp"
#include "Position.hpp"

#include <ostream>
#include <string>
#include <string_view>


// Board diagram text:
//
//   持駒: 飛角2歩          <- Gote's hand ("持駒: なし" when empty)
//   |▽香|▽桂| ... |▽香|   <- nine rows of nine cells, rank 1 first
//   ...
//   持駒: なし             <- Sente's hand
//   手番: 先手             <- side to move
//
// Cells are "・" (empty) or a side marker ("▲" Sente, "▽" Gote) followed by
// a piece symbol. Spaces, tabs and ideographic spaces between tokens are
// ignored.
namespace Notation {

// Throws ParseError on malformed input.
[[nodiscard]] Position decode(std::string_view text);

[[nodiscard]] std::string encode(const Position& pos);

// "持駒: ..." line body for one hand, without a line break.
[[nodiscard]] std::string encode_hand(const Hand& hand);

[[nodiscard]] std::string_view face_symbol(PieceFace face);
[[nodiscard]] std::string_view side_marker(Side side);
[[nodiscard]] std::string_view side_name(Side side);

}

std::ostream& operator<<(std::ostream& os, const Position& pos);
