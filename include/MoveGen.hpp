#pragma once
#include "Position.hpp"
#include "Move.hpp"
#include <span>
#include <vector>

namespace MoveGen {
    // Pseudo-legal moves for the side to move: board moves with promotion
    // choices, and drops. King safety is left to Check.
    void generate_moves(const Position& pos, std::vector<Move>& move_list);

    // Same, restricted to moves whose origin (or drop target) is in `squares`.
    void generate_moves(const Position& pos, std::span<const Square> squares, std::vector<Move>& move_list);

    [[nodiscard]] std::vector<Move> generate(const Position& pos);
}
