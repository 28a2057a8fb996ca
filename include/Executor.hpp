#pragma once

#include "Move.hpp"
#include "Position.hpp"

#include <optional>


namespace Executor {

// Successor of `pos` after `move`, or std::nullopt for a terminal move.
//
// The move must come from MoveGen for this very position. A normal move whose
// origin does not hold the mover's piece of the same base type, a drop with
// nothing in hand, or a drop onto an occupied square is a programming error:
// a diagnostic is written to stderr and the process aborts.
[[nodiscard]] std::optional<Position> apply(const Position& pos, const Move& move);

}
