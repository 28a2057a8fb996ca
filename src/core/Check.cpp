#include "Check.hpp"
#include "Attacks.hpp"
#include "Executor.hpp"
#include "MoveGen.hpp"


namespace Check {

bool is_check(const Position& pos, Side attacker) {
    std::optional<Square> king = pos.king_square(opposite(attacker));
    if (!king) return false;
    return Attacks::is_square_attacked(pos, *king, attacker);
}

std::vector<Move> king_capture_moves(const Position& pos, Side mover) {
    std::vector<Move> moves;
    if (is_check(pos, mover)) {
        moves.push_back(Move::terminal(TerminalReason::KingLeftInCheck, mover));
    }
    return moves;
}

std::vector<Move> moves_with_terminals(const Position& pos) {
    std::vector<Move> moves = MoveGen::generate(pos);
    for (const Move& m : king_capture_moves(pos, pos.side_to_move())) {
        moves.push_back(m);
    }
    return moves;
}

std::vector<Move> checking_moves(const Position& pos) {
    const Side us = pos.side_to_move();
    std::vector<Move> checks;

    for (const Move& m : MoveGen::generate(pos)) {
        std::optional<Position> next = Executor::apply(pos, m);
        if (next && is_check(*next, us)) checks.push_back(m);
    }
    return checks;
}

std::vector<Move> king_safe_moves(const Position& pos) {
    const Side us = pos.side_to_move();
    std::vector<Move> safe;

    for (const Move& m : MoveGen::generate(pos)) {
        std::optional<Position> next = Executor::apply(pos, m);
        if (next && !is_check(*next, opposite(us))) safe.push_back(m);
    }
    return safe;
}

bool is_checkmate(const Position& pos) {
    const Side us = pos.side_to_move();
    std::optional<Square> king = pos.king_square(us);
    if (!king) return false;

    const Attacks::SquareSet unsafe = Attacks::attacked_squares(pos, opposite(us), true);

    for (Square sq : Attacks::destinations(pos, *king, false)) {
        if (!unsafe.test(static_cast<size_t>(sq))) return false;
    }
    return true;
}

}
