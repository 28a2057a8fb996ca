#include <gtest/gtest.h>
#include "Move.hpp"

#include <sstream>
#include <unordered_set>

TEST(MoveTest, EqualityIsPerKind) {
    const Move a = Move::normal(Side::Sente, Square::SQ77, Square::SQ76, PieceFace::Pawn, false);
    const Move b = Move::normal(Side::Sente, Square::SQ77, Square::SQ76, PieceFace::Pawn, false);
    const Move promoted = Move::normal(Side::Sente, Square::SQ77, Square::SQ76, PieceFace::Pawn, true);
    const Move drop = Move::drop(Side::Sente, Square::SQ76, PieceType::Pawn);

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_NE(a, promoted);
    EXPECT_NE(a, drop);

    EXPECT_EQ(Move::terminal(TerminalReason::Resignation, Side::Gote),
              Move::terminal(TerminalReason::Resignation, Side::Gote));
    EXPECT_NE(Move::terminal(TerminalReason::Resignation, Side::Gote),
              Move::terminal(TerminalReason::Resignation, Side::Sente));
    EXPECT_NE(Move::terminal(TerminalReason::Repetition, std::nullopt),
              Move::terminal(TerminalReason::Checkmate, std::nullopt));
}

TEST(MoveTest, HashesIntoUnorderedSet) {
    std::unordered_set<Move> set;
    set.insert(Move::drop(Side::Gote, Square::SQ55, PieceType::Bishop));
    set.insert(Move::drop(Side::Gote, Square::SQ55, PieceType::Bishop));
    set.insert(Move::drop(Side::Gote, Square::SQ55, PieceType::Rook));
    set.insert(Move::terminal(TerminalReason::KingLeftInCheck, Side::Sente));
    EXPECT_EQ(set.size(), 3u);
}

TEST(MoveTest, PlacedFace) {
    EXPECT_EQ(Move::normal(Side::Sente, Square::SQ28, Square::SQ22, PieceFace::Rook, true).placed_face(), PieceFace::Dragon);
    EXPECT_EQ(Move::normal(Side::Sente, Square::SQ28, Square::SQ22, PieceFace::Rook, false).placed_face(), PieceFace::Rook);
    EXPECT_EQ(Move::drop(Side::Sente, Square::SQ55, PieceType::Silver).placed_face(), PieceFace::Silver);
    EXPECT_EQ(Move::normal(Side::Gote, Square::SQ53, Square::SQ54, PieceFace::Tokin, false).piece(), PieceType::Pawn);
}

TEST(MoveTest, Printing) {
    std::ostringstream os;
    os << Move::normal(Side::Sente, Square::SQ77, Square::SQ76, PieceFace::Pawn, false);
    EXPECT_EQ(os.str(), "Sente: 77 -> 76 FU");

    os.str("");
    os << Move::terminal(TerminalReason::Resignation, Side::Gote);
    EXPECT_EQ(os.str(), "Gote wins (resignation)");
}
