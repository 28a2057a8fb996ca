#pragma once

#include "Types.hpp"
#include "Piece.hpp"
#include "Position.hpp"

#include <bitset>
#include <vector>


namespace Attacks {

using SquareSet = std::bitset<SQUARE_NB>;

// Square reached by one application of `o` for `side`, or Square::None when
// it falls off the board.
constexpr Square shift(Square from, Offset o, Side side) {
    const Offset d = oriented(o, side);
    const int f = file_index(from) + d.file;
    const int r = rank_index(from) + d.rank;
    if (f < 0 || f >= FILE_NB || r < 0 || r >= RANK_NB) return Square::None;
    return static_cast<Square>(r * FILE_NB + f);
}

// Destinations of the piece standing on `from`. Steps are applied once;
// slides run until the edge, an enemy piece (included) or an own piece.
// Own-occupied squares are reported only when `include_own` is set.
// Nothing is appended for an empty square.
void destinations(const Position& pos, Square from, bool include_own, std::vector<Square>& out);

[[nodiscard]] std::vector<Square> destinations(const Position& pos, Square from, bool include_own);

// Union of destinations of every piece `attacker` has on the board.
[[nodiscard]] SquareSet attacked_squares(const Position& pos, Side attacker, bool include_own);

// Squares of `attacker`'s pieces that can move to `target`.
[[nodiscard]] std::vector<Square> attackers_of(const Position& pos, Side attacker, Square target);

[[nodiscard]] bool is_square_attacked(const Position& pos, Square target, Side attacker);

}
