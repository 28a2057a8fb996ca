#pragma once

#include "Move.hpp"
#include "Position.hpp"

#include <vector>


namespace Check {

// True when a piece of `attacker` can move onto the opposing king's square.
[[nodiscard]] bool is_check(const Position& pos, Side attacker);

// A single Terminal(KingLeftInCheck, winner = mover) when `mover` can capture
// the opposing king, otherwise nothing.
[[nodiscard]] std::vector<Move> king_capture_moves(const Position& pos, Side mover);

// MoveGen output for the side to move, followed by the king capture terminal
// if the opponent left its king en prise.
[[nodiscard]] std::vector<Move> moves_with_terminals(const Position& pos);

// Generated moves after which the mover attacks the opposing king.
[[nodiscard]] std::vector<Move> checking_moves(const Position& pos);

// Generated moves that do not leave the mover's own king capturable.
[[nodiscard]] std::vector<Move> king_safe_moves(const Position& pos);

// King-mobility checkmate test for the side to move: every square the king
// could step to is reachable by the opponent, counting squares the opponent
// defends with its own pieces. Capturing the attacker and interposing are
// not considered, so some escapable positions are reported as mate. A side
// without a king is never mated.
[[nodiscard]] bool is_checkmate(const Position& pos);

}
