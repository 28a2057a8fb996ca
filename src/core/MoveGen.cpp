#include "Attacks.hpp"
#include "MoveGen.hpp"
#include "Piece.hpp"

#include <vector>


namespace MoveGen {

namespace {
    void generate_drops(const Position& pos, Square to, std::vector<Move>& list) {
        const Side us = pos.side_to_move();
        const Hand& hand = pos.hand(us);
        const int rank = rank_of(to);

        for (int pt = 0; pt < PIECE_TYPE_NB; ++pt) {
            PieceType type = static_cast<PieceType>(pt);
            if (hand.count(type) == 0) continue;

            if (placement_prohibited(base_face(type), us, rank)) continue;

            // Double pawn rule
            if (type == PieceType::Pawn && pos.pawn_count(us, file_of(to)) > 0) continue;

            list.push_back(Move::drop(us, to, type));
        }
    }

    void generate_piece_moves(const Position& pos, Square from, std::vector<Move>& list, std::vector<Square>& targets) {
        const Side us = pos.side_to_move();
        const PieceFace face = pos[from].face;
        const bool from_zone = in_promotion_zone(us, rank_of(from));

        targets.clear();
        Attacks::destinations(pos, from, false, targets);

        for (Square to : targets) {
            const int rank = rank_of(to);

            if ((from_zone || in_promotion_zone(us, rank)) && can_promote(face)) {
                list.push_back(Move::normal(us, from, to, face, true));
            }

            // Forced promotion: the unpromoted variant is simply not produced.
            if (!placement_prohibited(face, us, rank)) {
                list.push_back(Move::normal(us, from, to, face, false));
            }
        }
    }

    void generate_at(const Position& pos, Square sq, std::vector<Move>& list, std::vector<Square>& targets) {
        const SquareContent& content = pos[sq];
        if (content.empty()) {
            generate_drops(pos, sq, list);
        } else if (content.side == pos.side_to_move()) {
            generate_piece_moves(pos, sq, list, targets);
        }
    }
}

void generate_moves(const Position& pos, std::vector<Move>& move_list) {
    std::vector<Square> targets;
    targets.reserve(32);

    for (int sq = 0; sq < SQUARE_NB; ++sq) {
        generate_at(pos, static_cast<Square>(sq), move_list, targets);
    }
}

void generate_moves(const Position& pos, std::span<const Square> squares, std::vector<Move>& move_list) {
    std::vector<Square> targets;
    targets.reserve(32);

    for (Square sq : squares) {
        if (sq == Square::None) continue;
        generate_at(pos, sq, move_list, targets);
    }
}

std::vector<Move> generate(const Position& pos) {
    std::vector<Move> moves;
    moves.reserve(256);
    generate_moves(pos, moves);
    return moves;
}

}
