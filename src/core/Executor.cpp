#include "Executor.hpp"
#include "Piece.hpp"

#include <cstdlib>
#include <iostream>


namespace Executor {

namespace {
    [[noreturn]] void contract_violation(const char* what, const Move& move) {
        std::cerr << "Executor: " << what << " [" << move << "]" << std::endl;
        std::abort();
    }
}

std::optional<Position> apply(const Position& pos, const Move& move) {
    if (move.is_terminal()) return std::nullopt;

    Position::Board board = pos.board();
    Hand sente_hand = pos.hand(Side::Sente);
    Hand gote_hand = pos.hand(Side::Gote);

    const Side us = move.side();
    Hand& our_hand = (us == Side::Sente) ? sente_hand : gote_hand;

    if (move.to() == Square::None) contract_violation("destination is off the board", move);
    if (move.is_normal() && move.from() == Square::None) contract_violation("origin is off the board", move);
    if (move.piece() == PieceType::None) contract_violation("move has no piece", move);

    const size_t to = static_cast<size_t>(move.to());

    if (move.is_normal()) {
        const size_t from = static_cast<size_t>(move.from());
        const SquareContent origin = board[from];

        if (!origin.belongs_to(us) || base_type(origin.face) != move.piece()) {
            contract_violation("origin square does not hold the moving piece", move);
        }
        if (move.promote() && !can_promote(move.face())) {
            contract_violation("face cannot promote", move);
        }

        const SquareContent captured = board[to];
        if (captured.belongs_to(us)) {
            contract_violation("destination holds an own piece", move);
        }
        // Captured pieces lose their promotion.
        if (!captured.empty()) {
            our_hand.add(base_type(captured.face));
        }

        board[from] = SquareContent();
        board[to] = SquareContent(us, move.placed_face());
    } else {
        if (our_hand.count(move.piece()) <= 0) {
            contract_violation("dropping a piece that is not in hand", move);
        }
        if (!board[to].empty()) {
            contract_violation("dropping onto an occupied square", move);
        }

        our_hand.remove(move.piece());
        board[to] = SquareContent(us, base_face(move.piece()));
    }

    return Position(board, sente_hand, gote_hand, opposite(pos.side_to_move()));
}

}
